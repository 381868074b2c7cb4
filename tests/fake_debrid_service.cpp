// File: fake_debrid_service.cpp
#include "fake_debrid_service.h"
#include <algorithm>
#include "api_types.hpp"
#include "utils.hpp"

static ApiResponse jsonResponse(long status, const std::string &body)
{
    ApiResponse response;
    response.status = status;
    response.body = body;
    response.headers["content-type"] = "application/json";
    return response;
}

static ApiResponse errorResponse(long status, const std::string &error, int code)
{
    json body = {{"error", error}, {"error_code", code}};
    return jsonResponse(status, body.dump());
}

static bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.compare(0, prefix.size(), prefix) == 0;
}

ApiResponse FakeDebridService::perform(const ApiRequest &request, std::stop_token stop)
{
    if (stop.stop_requested())
    {
        ApiResponse cancelled;
        cancelled.transportError = "cancelled";
        return cancelled;
    }

    std::string target = request.rootUrl.empty() ? request.path : request.rootUrl;

    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = hooks_.begin(); it != hooks_.end(); ++it)
        {
            if (startsWith(target, it->first))
            {
                hook = std::move(it->second);
                hooks_.erase(it);
                break;
            }
        }
    }
    if (hook)
        hook();

    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);

    for (auto &[prefix, failure] : failures_)
    {
        if (failure.second > 0 && startsWith(target, prefix))
        {
            failure.second--;
            return errorResponse(failure.first, "injected failure", 99);
        }
    }
    return handle(request);
}

ApiResponse FakeDebridService::handle(const ApiRequest &request)
{
    if (!request.rootUrl.empty())
        return directDownload(request);

    auto authorized = request.parameters.find("auth_token");
    if (authorized == request.parameters.end() || authorized->second.empty())
        return errorResponse(401, "bad_token", 8);

    const std::string &path = request.path;
    if (request.method == "GET" && path == "/torrents")
    {
        std::vector<std::string> items;
        for (const auto &torrent : torrents_)
            items.push_back(torrentJson(torrent));
        return listing(request, items);
    }
    if (request.method == "GET" && path == "/downloads")
    {
        std::vector<std::string> items;
        for (const auto &download : downloads_)
            items.push_back(downloadJson(download));
        return listing(request, items);
    }
    if (request.method == "GET" && startsWith(path, "/torrents/info/"))
    {
        std::string id = path.substr(std::string("/torrents/info/").size());
        for (const auto &torrent : torrents_)
        {
            if (torrent.id == id)
                return jsonResponse(200, torrentJson(torrent));
        }
        return errorResponse(404, "unknown_ressource", 7);
    }
    if (request.method == "POST" && path == "/torrents/addMagnet")
    {
        std::string magnet = request.multipart.count("magnet") ? request.multipart.at("magnet") : "";
        std::string hash = magnet.substr(magnet.rfind(':') + 1);

        FakeTorrent added;
        added.id = "NEW" + std::to_string(nextId_++);
        added.hash = hash;
        added.status = "waiting_files_selection";
        for (const auto &torrent : torrents_)
        {
            if (torrent.hash == hash)
            {
                added.name = torrent.name;
                added.files = torrent.files;
                break;
            }
        }
        for (auto &file : added.files)
            file.selected = 0;
        torrents_.push_back(added);

        json body = {{"id", added.id}, {"uri", "https://rd.example/torrents/" + added.id}};
        return jsonResponse(201, body.dump());
    }
    if (request.method == "POST" && startsWith(path, "/torrents/selectFiles/"))
    {
        std::string id = path.substr(std::string("/torrents/selectFiles/").size());
        std::string wanted = request.multipart.count("files") ? request.multipart.at("files") : "";
        std::vector<std::string> ids = split(wanted, ",");
        for (auto &torrent : torrents_)
        {
            if (torrent.id != id)
                continue;
            torrent.links.clear();
            for (auto &file : torrent.files)
            {
                bool chosen = wanted == "all" || std::find(ids.begin(), ids.end(), std::to_string(file.id)) != ids.end();
                file.selected = chosen ? 1 : 0;
                if (chosen)
                    torrent.links.push_back("https://rd.example/d/" + id + "F" + std::to_string(file.id));
            }
            torrent.status = "downloaded";
            return jsonResponse(204, "");
        }
        return errorResponse(404, "unknown_ressource", 7);
    }
    if (request.method == "DELETE" && startsWith(path, "/torrents/delete/"))
    {
        std::string id = path.substr(std::string("/torrents/delete/").size());
        auto it = std::remove_if(torrents_.begin(), torrents_.end(), [&](const FakeTorrent &torrent)
                                 { return torrent.id == id; });
        if (it == torrents_.end())
            return errorResponse(404, "unknown_ressource", 7);
        torrents_.erase(it, torrents_.end());
        return jsonResponse(204, "");
    }
    if (request.method == "DELETE" && startsWith(path, "/downloads/delete/"))
    {
        std::string id = path.substr(std::string("/downloads/delete/").size());
        auto it = std::remove_if(downloads_.begin(), downloads_.end(), [&](const FakeDownload &download)
                                 { return download.id == id; });
        if (it == downloads_.end())
            return errorResponse(404, "unknown_ressource", 7);
        downloads_.erase(it, downloads_.end());
        return jsonResponse(204, "");
    }
    if (request.method == "POST" && path == "/unrestrict/link")
        return unrestrict(request);

    return errorResponse(404, "unknown_ressource", 7);
}

ApiResponse FakeDebridService::listing(const ApiRequest &request, const std::vector<std::string> &items)
{
    size_t offset = 0;
    size_t limit = 100;
    if (request.parameters.count("offset"))
        offset = std::stoul(request.parameters.at("offset"));
    if (request.parameters.count("limit"))
        limit = std::stoul(request.parameters.at("limit"));

    std::string body = "[";
    for (size_t i = offset; i < items.size() && i < offset + limit; ++i)
    {
        if (body.size() > 1)
            body += ",";
        body += items[i];
    }
    body += "]";

    ApiResponse response = jsonResponse(200, body);
    response.headers["x-total-count"] = std::to_string(items.size());
    return response;
}

ApiResponse FakeDebridService::unrestrict(const ApiRequest &request)
{
    std::string link = request.multipart.count("link") ? request.multipart.at("link") : "";
    if (link.empty())
        return errorResponse(400, "parameter_missing", 2);
    if (deadLinks_.count(link))
        return errorResponse(503, "hoster_unavailable", 19);

    std::string leaf = last_segment(link);
    FakeDownload download;
    download.id = "DL" + std::to_string(nextId_++);
    download.filename = linkNames_.count(link) ? linkNames_.at(link) : leaf + ".mkv";
    download.filesize = 1000;
    download.link = link;
    download.download = "https://dl.example/" + leaf + "/" + download.filename;
    downloads_.push_back(download);

    return jsonResponse(200, downloadJson(download));
}

ApiResponse FakeDebridService::directDownload(const ApiRequest &request)
{
    auto broken = brokenUrls_.find(request.rootUrl);
    if (broken != brokenUrls_.end())
        return errorResponse(broken->second, "unavailable", 19);

    auto it = content_.find(request.rootUrl);
    if (it == content_.end())
        return errorResponse(404, "unknown_ressource", 7);

    const std::string &body = it->second.first;
    ApiResponse response;
    if (!it->second.second || !request.headers.count("Range"))
    {
        response.status = 200;
        response.body = body;
        return response;
    }

    // "bytes=a-b"
    std::string range = request.headers.at("Range").substr(6);
    size_t dash = range.find('-');
    size_t first = std::stoul(range.substr(0, dash));
    size_t last = std::stoul(range.substr(dash + 1));
    if (first >= body.size())
    {
        response.status = 416;
        return response;
    }
    response.status = 206;
    response.body = body.substr(first, last - first + 1);
    return response;
}

std::string FakeDebridService::torrentJson(const FakeTorrent &torrent) const
{
    json files = json::array();
    int64_t bytes = 0;
    for (const auto &file : torrent.files)
    {
        files.push_back({{"id", file.id}, {"path", file.path}, {"bytes", file.bytes}, {"selected", file.selected}});
        bytes += file.bytes;
    }
    json body = {
        {"id", torrent.id},
        {"filename", torrent.name},
        {"hash", torrent.hash},
        {"bytes", bytes},
        {"status", torrent.status},
        {"added", "2024-01-01T00:00:00.000Z"},
        {"ended", torrent.ended},
        {"links", torrent.links},
        {"files", files}};
    return body.dump();
}

std::string FakeDebridService::downloadJson(const FakeDownload &download) const
{
    json body = {
        {"id", download.id},
        {"filename", download.filename},
        {"mimeType", download.mimeType},
        {"filesize", download.filesize},
        {"link", download.link},
        {"download", download.download},
        {"generated", download.generated}};
    return body.dump();
}

void FakeDebridService::addTorrent(FakeTorrent torrent)
{
    std::lock_guard<std::mutex> lock(mutex_);
    torrents_.push_back(std::move(torrent));
}

void FakeDebridService::addDownload(FakeDownload download)
{
    std::lock_guard<std::mutex> lock(mutex_);
    downloads_.push_back(std::move(download));
}

void FakeDebridService::removeTorrent(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    torrents_.erase(std::remove_if(torrents_.begin(), torrents_.end(), [&](const FakeTorrent &torrent)
                                   { return torrent.id == id; }),
                    torrents_.end());
}

void FakeDebridService::setStatus(const std::string &id, const std::string &status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &torrent : torrents_)
    {
        if (torrent.id == id)
            torrent.status = status;
    }
}

void FakeDebridService::killLink(const std::string &link)
{
    std::lock_guard<std::mutex> lock(mutex_);
    deadLinks_.insert(link);
}

void FakeDebridService::breakUrl(const std::string &url, long status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    brokenUrls_[url] = status;
}

void FakeDebridService::setContent(const std::string &url, std::string body, bool honourRange)
{
    std::lock_guard<std::mutex> lock(mutex_);
    content_[url] = {std::move(body), honourRange};
}

void FakeDebridService::setLinkName(const std::string &link, const std::string &filename)
{
    std::lock_guard<std::mutex> lock(mutex_);
    linkNames_[link] = filename;
}

void FakeDebridService::failNext(const std::string &pathPrefix, long status, int times)
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back({pathPrefix, {status, times}});
}

void FakeDebridService::onNext(const std::string &pathPrefix, std::function<void()> action)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.push_back({pathPrefix, std::move(action)});
}

std::vector<ApiRequest> FakeDebridService::requests() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

int FakeDebridService::count(const std::string &method, const std::string &pathPrefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto &request : requests_)
    {
        std::string target = request.rootUrl.empty() ? request.path : request.rootUrl;
        if (request.method == method && startsWith(target, pathPrefix))
            total++;
    }
    return total;
}

std::vector<std::string> FakeDebridService::torrentIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto &torrent : torrents_)
        ids.push_back(torrent.id);
    return ids;
}

bool FakeDebridService::hasTorrent(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(torrents_.begin(), torrents_.end(), [&](const FakeTorrent &torrent)
                       { return torrent.id == id; });
}

FakeTorrent FakeDebridService::torrent(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &torrent : torrents_)
    {
        if (torrent.id == id)
            return torrent;
    }
    return {};
}

std::vector<std::string> FakeDebridService::downloadIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto &download : downloads_)
        ids.push_back(download.id);
    return ids;
}
