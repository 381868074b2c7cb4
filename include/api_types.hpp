// File: api_types.hpp
#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

inline const std::string kTorrentWaitingSelection = "waiting_files_selection";
inline const std::string kTorrentDownloaded = "downloaded";
inline const std::string kTorrentDead = "dead";
inline const std::string kTorrentError = "error";

struct TorrentFile
{
    int64_t id = 0;
    std::string path;
    int64_t bytes = 0;
    int selected = 0;
};

// A torrent (job) or a download record as returned by the remote service.
//
// Torrents fill status, hash, links and files. Download records fill
// originalLink (the restricted link a torrent lists), link (the resolved URL),
// size and mimeType.
struct RemoteItem
{
    std::string id;
    std::string name;
    int64_t size = 0;
    std::string link;
    std::string originalLink;
    std::string status;
    std::string hash;
    std::string mimeType;
    std::string added;
    std::string ended;
    std::string generated;
    std::vector<std::string> links;
    std::vector<TorrentFile> files;

    bool isDeadOrFailed() const { return status == kTorrentDead || status == kTorrentError; }
};

void from_json(const json &j, TorrentFile &file);
void from_json(const json &j, RemoteItem &item);

enum class EntryType
{
    File,
    Folder
};

// One child of a folder in the synthesized tree.
struct TreeEntry
{
    EntryType type = EntryType::File;
    std::string name;
    // File: the leaf ID of its link. Folder: its canonical path.
    std::string id;
    int64_t size = 0;
    std::string url;
    std::string originalLink;
    std::string parentId;
    std::string torrentHash;
    std::string mappingId;
    std::string mimeType;
    std::string generated;
    std::string ended;
    // Display name was chosen in the rule file and must survive link resolution
    bool nameFromRule = false;

    bool isFolder() const { return type == EntryType::Folder; }
    std::time_t createdAt() const;
};
