// File: move_engine.cpp
#include "move_engine.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "errors.hpp"
#include "logger.hpp"
#include "namespace_builder.hpp"
#include "utils.hpp"

// Re-roots value from one folder to another; values outside from land on to itself.
static std::string Retarget(const std::string &value, const VirtualPath &from, const VirtualPath &to)
{
    if (from.isPrefixOf(value))
        return to.str() + value.substr(from.str().size());
    return to.str();
}

MoveEngine::MoveEngine(RuleFile &ruleFile,
                       SyncState &sync,
                       MappingTable &recorded,
                       MappingTable &mapping,
                       FolderTable &folders,
                       InventoryFetcher &fetcher,
                       APIClient &client)
    : ruleFile_(ruleFile), sync_(sync), recorded_(recorded), mapping_(mapping),
      folders_(folders), fetcher_(fetcher), client_(client)
{
}

std::vector<MoveEngine::Update> MoveEngine::folderUpdates(const std::string &folderKey,
                                                          const VirtualPath &from,
                                                          const VirtualPath &to) const
{
    std::vector<Update> updates;
    std::set<std::string> seen;

    auto collect = [&](const std::map<std::string, std::string> &table)
    {
        for (const auto &[key, value] : table)
        {
            if (from.isPrefixOf(value) && seen.insert(key).second)
                updates.emplace_back(key, Retarget(value, from, to));
        }
    };
    std::map<std::string, std::string> recorded = recorded_.snapshot();
    collect(recorded);
    collect(mapping_.snapshot());

    // A bare line naming the folder without its trailing slash already declares it
    bool declared = false;
    if (folderKey == from.str())
    {
        for (const auto &[key, value] : recorded)
        {
            if (key == value && key != folderKey && VirtualPath::Folder(key) == from)
            {
                if (seen.insert(key).second)
                    updates.emplace_back(key, to.str());
                declared = true;
            }
        }
    }

    if (!declared && seen.insert(folderKey).second)
    {
        auto current = recorded_.load(folderKey);
        updates.emplace_back(folderKey, current ? Retarget(*current, from, to) : to.str());
    }
    return updates;
}

void MoveEngine::applyUpdates(const std::vector<Update> &updates)
{
    std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);

    std::vector<std::string> lines = ruleFile_.readLines();
    for (const auto &[key, destination] : updates)
    {
        bool replaced = false;
        for (auto &line : lines)
        {
            RuleLine parsed = RuleLine::Parse(line);
            if (parsed.kind == RuleLineKind::Move && parsed.key == key)
            {
                line = key + kMoveSeparator + destination;
                replaced = true;
            }
            else if (parsed.kind == RuleLineKind::Leaf && (parsed.key == key || parsed.value == key))
            {
                // A bare line can only name a folder
                line = ends_with(destination, "/") ? destination : key + kMoveSeparator + destination;
                replaced = true;
            }
        }
        if (!replaced)
            lines.push_back(key + kMoveSeparator + destination);
    }

    ruleFile_.rewrite(lines);

    for (const auto &[key, destination] : updates)
    {
        recorded_.store(key, destination);
        mapping_.store(key, destination);
    }
    sync_.rulesDirty = true;
}

void MoveEngine::move(bool isFile, const std::string &itemKey,
                      const std::string &oldLeaf, const std::string &newLeaf,
                      const VirtualPath &oldDir, const VirtualPath &newDir)
{
    std::vector<Update> updates;
    if (isFile)
    {
        Logger::Log(LogLevel::DEBUG, "MoveEngine::move: moving file " + itemKey + " (" + oldLeaf + ") from " +
                                         oldDir.str() + " to " + newDir.str() + newLeaf);
        updates.emplace_back(itemKey, newDir.str() + newLeaf);
    }
    else
    {
        VirtualPath from = oldDir.child(oldLeaf);
        VirtualPath to = newDir.child(newLeaf);
        Logger::Log(LogLevel::DEBUG, "MoveEngine::move: moving folder " + from.str() + " to " + to.str() + " (key " + itemKey + ")");
        updates = folderUpdates(itemKey, from, to);
    }
    applyUpdates(updates);
}

void MoveEngine::moveFileLocked(const TreeEntry &entry, const VirtualPath &oldDir,
                                const VirtualPath &newDir, const std::string &newLeaf)
{
    if (entry.isFolder() || entry.mappingId.empty())
        throw NotFoundError("not a file: " + oldDir.str() + entry.name);

    move(true, entry.mappingId, entry.name, newLeaf, oldDir, newDir);

    folders_.removeEntry(oldDir, entry.id);

    TreeEntry moved = entry;
    moved.name = newLeaf;
    moved.nameFromRule = true;
    folders_.ensurePath(newDir);
    folders_.insertUnique(newDir, moved);
}

void MoveEngine::moveFile(const TreeEntry &entry, const VirtualPath &oldDir,
                          const VirtualPath &newDir, const std::string &newLeaf)
{
    MoveScope scope(sync_);
    moveFileLocked(entry, oldDir, newDir, newLeaf);
}

void MoveEngine::moveFolder(const VirtualPath &oldParent, const std::string &oldLeaf,
                            const VirtualPath &newParent, const std::string &newLeaf)
{
    MoveScope scope(sync_);

    VirtualPath from = oldParent.child(oldLeaf);
    VirtualPath to = newParent.child(newLeaf);
    if (from.isRoot() || from.isPrefixOf(to.str()))
        throw RdfsError("can't move " + from.str() + " into itself");

    // A job folder is governed by its job-level override key
    std::string folderKey = fetcher_.hasTorrentNamed(oldLeaf) ? NamespaceBuilder::TorrentKey(oldLeaf) : from.str();

    move(false, folderKey, oldLeaf, newLeaf, oldParent, newParent);
    folders_.renameFolder(from, to);
}

void MoveEngine::stripJobLines(const std::vector<std::string> &keys)
{
    std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);

    std::vector<std::string> lines = ruleFile_.readLines();
    std::vector<std::string> kept;
    kept.reserve(lines.size());
    for (const auto &line : lines)
    {
        RuleLine parsed = RuleLine::Parse(line);
        if (parsed.kind == RuleLineKind::Move && std::find(keys.begin(), keys.end(), parsed.key) != keys.end())
            continue;
        kept.push_back(line);
    }
    ruleFile_.rewrite(kept);

    for (const auto &key : keys)
    {
        recorded_.erase(key);
        mapping_.erase(key);
    }
    sync_.rulesDirty = true;
}

void MoveEngine::remove(const TreeEntry &entry, const VirtualPath &dir, std::stop_token stop)
{
    std::string jobId;
    {
        MoveScope scope(sync_);

        auto torrent = fetcher_.torrentById(entry.parentId);
        if (!torrent)
            throw NotFoundError("torrent " + entry.parentId + " of " + entry.name + " is not in the inventory");

        std::vector<std::string> jobKeys;
        for (const auto &link : torrent->links)
        {
            if (!link.empty())
                jobKeys.push_back(NamespaceBuilder::MappingKey(torrent->name, last_segment(link)));
        }

        // The live table only learns about this file once the rule file has it
        std::map<std::string, std::string> recorded = recorded_.snapshot();
        size_t trashed = 0;
        for (const auto &key : jobKeys)
        {
            auto it = recorded.find(key);
            if (key == entry.mappingId || (it != recorded.end() && ends_with(it->second, kTrashMarker)))
                trashed++;
        }

        if (trashed < jobKeys.size())
        {
            Logger::Log(LogLevel::DEBUG, "MoveEngine::remove: moving file: " + entry.mappingId + " to internal trash");
            moveFileLocked(entry, dir, dir, entry.name + kTrashMarker);
            return;
        }

        Logger::Log(LogLevel::DEBUG, "MoveEngine::remove: all files of torrent: " + torrent->id + " are in internal trash");
        std::vector<std::string> stripped = jobKeys;
        stripped.push_back(NamespaceBuilder::TorrentKey(torrent->name));
        stripJobLines(stripped);
        folders_.removeEntry(dir, entry.id);
        jobId = torrent->id;
    }

    Logger::Log(LogLevel::INFO, "MoveEngine::remove: removing realdebrid torrent id: " + jobId);
    client_.deleteTorrent(jobId, stop);
    fetcher_.markStale();
}

VirtualPath MoveEngine::createDir(const VirtualPath &parent, const std::string &leaf)
{
    if (parent.isRoot())
        throw ReservedRootError("can't create directories in root directory. this is reserved for regex folders");

    VirtualPath created = parent.child(leaf);
    {
        std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);
        ruleFile_.appendLine(created.str());
    }
    recorded_.store(created.str(), created.str());
    mapping_.store(created.str(), created.str());
    folders_.ensurePath(created);
    folders_.ensureFolder(created);
    sync_.rulesDirty = true;

    Logger::Log(LogLevel::DEBUG, "MoveEngine::createDir: created " + created.str());
    return created;
}
