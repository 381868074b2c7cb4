// File: namespace_builder.hpp
#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "api_types.hpp"
#include "broken_jobs.hpp"
#include "rule_file.hpp"
#include "virtual_path.hpp"

// Everything a rebuild produces; swapped into the live tables as a whole.
struct BuildResult
{
    std::map<std::string, std::vector<TreeEntry>> folders;
    // Mapping key -> destination, including seeded default locations
    std::map<std::string, std::string> mapping;
    // Mapping lines as written in the rule file
    std::map<std::string, std::string> recorded;
    // Inventory after dead jobs were replaced by their recovered copies
    std::vector<RemoteItem> torrents;
};

// Combines parsed rules and the torrent list into the folder and mapping tables.
// Holds no state of its own, so building twice from the same inputs gives the same tables.
class NamespaceBuilder
{
public:
    using RecoverFn = std::function<RemoteItem(const RemoteItem &)>;

    NamespaceBuilder(const BrokenJobSet &broken, RecoverFn recover);

    BuildResult build(const ParsedRules &rules, std::vector<RemoteItem> torrents) const;

    // First matching regex folder, or /default/.
    static VirtualPath DefaultLocation(const std::string &torrentName, const std::vector<RegexRule> &rules);

    static std::string MappingKey(const std::string &torrentName, const std::string &leafId);
    static std::string TorrentKey(const std::string &torrentName);

private:
    const BrokenJobSet &broken_;
    RecoverFn recover_;
};
