// File: inventory_fetcher.cpp
#include "inventory_fetcher.hpp"
#include <algorithm>
#include <mutex>
#include "errors.hpp"
#include "logger.hpp"

InventoryFetcher::InventoryFetcher(APIClient &client, FetcherSettings settings)
    : client_(client), settings_(settings)
{
    if (settings_.pageSize <= 0)
        settings_.pageSize = 2500;
}

bool InventoryFetcher::intervalElapsedLocked(std::chrono::steady_clock::time_point now) const
{
    if (!lastCheck_)
        return true;
    return now - *lastCheck_ >= settings_.refreshInterval;
}

bool InventoryFetcher::intervalElapsed() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return intervalElapsedLocked(std::chrono::steady_clock::now());
}

std::vector<RemoteItem> InventoryFetcher::fetchList(const std::string &path, size_t cachedCount, bool reuse,
                                                    bool &paged, std::stop_token stop)
{
    ApiRequest request;
    request.path = path;
    if (path == "/downloads")
        request.parameters["includebreadcrumbs"] = "false";
    request.parameters["limit"] = "1";

    std::vector<RemoteItem> items;
    size_t total = 0;
    bool first = true;

    while (first || items.size() < total)
    {
        json page;
        ApiResponse response = client_.callJSON(request, page, stop, kRateLimitedOnly);
        if (!response.ok())
        {
            ApiError error = APIClient::ErrorFromResponse(response);
            Logger::Log(LogLevel::ERROR, "InventoryFetcher::fetchList: " + path + " failed: " + error.what());
            throw error;
        }

        std::string totalHeader = response.header("x-total-count");
        try
        {
            total = static_cast<size_t>(std::stoul(totalHeader));
        }
        catch (const std::exception &)
        {
            throw ApiError("missing or invalid X-Total-Count header on " + path, "HTTP " + std::to_string(response.status), response.status);
        }

        if (first && reuse && total == cachedCount)
        {
            Logger::Log(LogLevel::TRACE, "InventoryFetcher::fetchList: " + path + " unchanged at " + std::to_string(total) + " items.");
            paged = false;
            return {};
        }
        first = false;

        if (!page.is_array())
            throw ApiError("unexpected listing body on " + path, "HTTP " + std::to_string(response.status), response.status);

        if (page.empty())
        {
            // The service shrank the list while we were paging
            if (items.size() < total)
                Logger::Log(LogLevel::WARN, "InventoryFetcher::fetchList: " + path + " ended early at " +
                                                std::to_string(items.size()) + " of " + std::to_string(total) + " items.");
            break;
        }

        for (const auto &itemJson : page)
        {
            items.push_back(itemJson.get<RemoteItem>());
        }

        request.parameters["offset"] = std::to_string(items.size());
        request.parameters["limit"] = std::to_string(settings_.pageSize);
    }

    paged = true;
    return items;
}

FetchResult InventoryFetcher::refresh(bool force, bool ruleFileChanged, std::stop_token stop,
                                      RuleFileStamp ruleFileMod)
{
    size_t cachedDownloads = 0;
    size_t cachedTorrents = 0;
    bool reuse = false;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        cachedDownloads = downloads_.size();
        cachedTorrents = torrents_.size();
        reuse = !force && lastCheck_.has_value() && !intervalElapsedLocked(std::chrono::steady_clock::now());
    }

    if (!reuse)
        Logger::Log(LogLevel::DEBUG, "InventoryFetcher::refresh: updating all links and torrents");

    bool downloadsPaged = false;
    bool torrentsPaged = false;
    std::vector<RemoteItem> newDownloads = fetchList("/downloads", cachedDownloads, reuse, downloadsPaged, stop);
    std::vector<RemoteItem> newTorrents = fetchList("/torrents", cachedTorrents, reuse, torrentsPaged, stop);

    FetchResult result;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (downloadsPaged)
            downloads_ = std::move(newDownloads);
        if (torrentsPaged)
            torrents_ = std::move(newTorrents);

        lastCheck_ = std::chrono::steady_clock::now();
        if (ruleFileMod)
            lastRuleFileMod_ = ruleFileMod;

        result.downloads = downloads_;
        result.torrents = torrents_;
    }
    result.updated = ruleFileChanged || downloadsPaged || torrentsPaged;

    Logger::Log(LogLevel::DEBUG, "InventoryFetcher::refresh: " + std::to_string(result.downloads.size()) + " downloads, " +
                                     std::to_string(result.torrents.size()) + " torrents, updated=" + (result.updated ? "true" : "false"));
    return result;
}

std::vector<RemoteItem> InventoryFetcher::downloads() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return downloads_;
}

std::vector<RemoteItem> InventoryFetcher::torrents() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return torrents_;
}

std::optional<RemoteItem> InventoryFetcher::torrentById(const std::string &torrentId) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &torrent : torrents_)
    {
        if (torrent.id == torrentId)
            return torrent;
    }
    return std::nullopt;
}

bool InventoryFetcher::hasTorrentNamed(const std::string &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::any_of(torrents_.begin(), torrents_.end(), [&](const RemoteItem &torrent)
                       { return torrent.name == name; });
}

std::optional<RemoteItem> InventoryFetcher::findDownloadByLink(const std::string &originalLink) const
{
    if (originalLink.empty())
        return std::nullopt;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &download : downloads_)
    {
        if (download.originalLink == originalLink)
            return download;
    }
    return std::nullopt;
}

std::vector<RemoteItem> InventoryFetcher::downloadsForLinks(const std::vector<std::string> &links) const
{
    std::vector<RemoteItem> matches;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &download : downloads_)
    {
        if (download.originalLink.empty())
            continue;
        if (std::find(links.begin(), links.end(), download.originalLink) != links.end())
            matches.push_back(download);
    }
    return matches;
}

void InventoryFetcher::invalidateLinks(const std::vector<std::string> &links)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto &download : downloads_)
    {
        if (!download.originalLink.empty() &&
            std::find(links.begin(), links.end(), download.originalLink) != links.end())
        {
            download.originalLink.clear();
        }
    }
}

void InventoryFetcher::replaceTorrent(const std::string &oldId, const RemoteItem &torrent)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto &existing : torrents_)
    {
        if (existing.id == oldId)
        {
            existing = torrent;
            return;
        }
    }
    torrents_.push_back(torrent);
}

void InventoryFetcher::markStale()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    lastCheck_ = std::chrono::steady_clock::now() - settings_.refreshInterval;
    Logger::Log(LogLevel::DEBUG, "InventoryFetcher::markStale: next refresh pages everything");
}

RuleFileStamp InventoryFetcher::lastRuleFileMod() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lastRuleFileMod_;
}

bool InventoryFetcher::hasSnapshot() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lastCheck_.has_value();
}
