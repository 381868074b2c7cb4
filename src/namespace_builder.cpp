// File: namespace_builder.cpp
#include "namespace_builder.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "namespace_tables.hpp"
#include "utils.hpp"

NamespaceBuilder::NamespaceBuilder(const BrokenJobSet &broken, RecoverFn recover)
    : broken_(broken), recover_(std::move(recover))
{
}

VirtualPath NamespaceBuilder::DefaultLocation(const std::string &torrentName, const std::vector<RegexRule> &rules)
{
    for (const auto &rule : rules)
    {
        if (rule.matches(torrentName))
            return VirtualPath::Folder(rule.folder);
    }
    return VirtualPath::Folder("default");
}

std::string NamespaceBuilder::MappingKey(const std::string &torrentName, const std::string &leafId)
{
    return "/" + torrentName + "/" + leafId;
}

std::string NamespaceBuilder::TorrentKey(const std::string &torrentName)
{
    return "/" + torrentName + "/";
}

BuildResult NamespaceBuilder::build(const ParsedRules &rules, std::vector<RemoteItem> torrents) const
{
    BuildResult result;

    for (const auto &[key, value] : rules.mappings)
    {
        result.recorded[key] = value;
    }
    std::map<std::string, std::string> &mapping = result.mapping;
    mapping = result.recorded;

    FolderTable folders;

    for (auto &torrent : torrents)
    {
        if (torrent.isDeadOrFailed() || broken_.contains(torrent.id))
        {
            try
            {
                torrent = recover_(torrent);
            }
            catch (const OperationCancelledError &)
            {
                throw;
            }
            catch (const RdfsError &ex)
            {
                Logger::Log(LogLevel::ERROR, "NamespaceBuilder::build: could not recover " + torrent.name + ": " + ex.what());
            }
        }

        VirtualPath defaultFolder = DefaultLocation(torrent.name, rules.regexRules).child(torrent.name);

        for (const auto &link : torrent.links)
        {
            if (link.empty())
                continue;

            TreeEntry file;
            file.type = EntryType::File;
            file.name = last_segment(link);
            file.id = file.name;
            file.mappingId = MappingKey(torrent.name, file.id);
            file.parentId = torrent.id;
            file.torrentHash = torrent.hash;
            file.generated = torrent.generated;
            file.ended = torrent.ended;
            file.originalLink = link;

            std::string destination;
            auto existing = mapping.find(file.mappingId);
            if (existing == mapping.end())
            {
                auto inherited = mapping.find(TorrentKey(torrent.name));
                destination = inherited != mapping.end() ? inherited->second : defaultFolder.str();
                mapping[file.mappingId] = destination;
            }
            else
            {
                destination = existing->second;
            }

            if (ends_with(destination, kTrashMarker))
                continue;

            std::string leaf = DestinationLeaf(destination);
            if (!leaf.empty())
            {
                file.name = leaf;
                file.nameFromRule = true;
            }
            folders.insertUnique(DestinationFolder(destination), file);
        }
    }

    for (const auto &[key, destination] : mapping)
    {
        if (ends_with(destination, kTrashMarker))
            continue;
        folders.ensurePath(DestinationFolder(destination));
    }

    result.folders = folders.snapshot();
    result.torrents = std::move(torrents);

    Logger::Log(LogLevel::DEBUG, "NamespaceBuilder::build: " + std::to_string(result.folders.size()) + " folders, " +
                                     std::to_string(result.mapping.size()) + " mappings from " +
                                     std::to_string(result.torrents.size()) + " torrents");
    return result;
}
