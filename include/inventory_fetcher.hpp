// File: inventory_fetcher.hpp
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>
#include "api_client.hpp"
#include "api_types.hpp"

struct FetcherSettings
{
    std::chrono::seconds refreshInterval{900};
    int pageSize = 2500;
};

struct FetchResult
{
    std::vector<RemoteItem> downloads;
    std::vector<RemoteItem> torrents;
    // True when a list was paged again or the rule file changed
    bool updated = false;
};

using RuleFileStamp = std::optional<std::filesystem::file_time_type>;

// Owns the inventory snapshot (downloads and torrents) and its refresh cadence.
class InventoryFetcher
{
public:
    InventoryFetcher(APIClient &client, FetcherSettings settings = {});

    // Pages both lists unless the cached copy can be reused. Throws ApiError on
    // a failed page; the previous snapshot and watermarks stay untouched then.
    FetchResult refresh(bool force, bool ruleFileChanged, std::stop_token stop,
                        RuleFileStamp ruleFileMod = std::nullopt);

    std::vector<RemoteItem> downloads() const;
    std::vector<RemoteItem> torrents() const;

    std::optional<RemoteItem> torrentById(const std::string &torrentId) const;
    bool hasTorrentNamed(const std::string &name) const;
    std::optional<RemoteItem> findDownloadByLink(const std::string &originalLink) const;

    // Download records whose original link is one of links.
    std::vector<RemoteItem> downloadsForLinks(const std::vector<std::string> &links) const;
    // Stops the snapshot from resolving links through those records again.
    void invalidateLinks(const std::vector<std::string> &links);

    // Swaps one torrent in place. Appends when oldId is not in the snapshot.
    void replaceTorrent(const std::string &oldId, const RemoteItem &torrent);

    // Rewinds lastCheck by one interval so the next refresh pages everything.
    void markStale();
    bool intervalElapsed() const;

    RuleFileStamp lastRuleFileMod() const;
    bool hasSnapshot() const;

private:
    bool intervalElapsedLocked(std::chrono::steady_clock::time_point now) const;
    std::vector<RemoteItem> fetchList(const std::string &path, size_t cachedCount, bool reuse,
                                      bool &paged, std::stop_token stop);

    APIClient &client_;
    FetcherSettings settings_;

    mutable std::shared_mutex mutex_;
    std::vector<RemoteItem> downloads_;
    std::vector<RemoteItem> torrents_;
    std::optional<std::chrono::steady_clock::time_point> lastCheck_;
    RuleFileStamp lastRuleFileMod_;
};
