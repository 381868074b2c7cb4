// File: api_types.cpp
#include "api_types.hpp"
#include "utils.hpp"

// The service sends null for fields it has not filled yet, json::value() would throw on those.
static std::string stringField(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

static int64_t integerField(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return 0;
    return it->get<int64_t>();
}

void from_json(const json &j, TorrentFile &file)
{
    file.id = integerField(j, "id");
    file.path = stringField(j, "path");
    file.bytes = integerField(j, "bytes");
    file.selected = static_cast<int>(integerField(j, "selected"));
}

void from_json(const json &j, RemoteItem &item)
{
    item.id = stringField(j, "id");
    item.name = stringField(j, "filename");
    item.size = j.contains("filesize") ? integerField(j, "filesize") : integerField(j, "bytes");
    item.link = stringField(j, "download");
    item.originalLink = stringField(j, "link");
    item.status = stringField(j, "status");
    item.hash = stringField(j, "hash");
    item.mimeType = stringField(j, "mimeType");
    item.added = stringField(j, "added");
    item.ended = stringField(j, "ended");
    item.generated = stringField(j, "generated");

    item.links.clear();
    if (j.contains("links") && j["links"].is_array())
    {
        for (const auto &link : j["links"])
        {
            item.links.push_back(link.is_string() ? link.get<std::string>() : "");
        }
    }

    item.files.clear();
    if (j.contains("files") && j["files"].is_array())
    {
        for (const auto &fileJson : j["files"])
        {
            item.files.push_back(fileJson.get<TorrentFile>());
        }
    }
}

std::time_t TreeEntry::createdAt() const
{
    if (!generated.empty())
        return parse_timestamp(generated);
    return parse_timestamp(ended);
}
