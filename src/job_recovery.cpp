// File: job_recovery.cpp
#include "job_recovery.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace
{
    // Releases the recovery claim on every exit path.
    class RecoveryClaim
    {
    public:
        RecoveryClaim(BrokenJobSet &broken, const std::string &jobId) : broken_(broken), jobId_(jobId) {}
        ~RecoveryClaim() { broken_.endRecovery(jobId_); }

        RecoveryClaim(const RecoveryClaim &) = delete;
        RecoveryClaim &operator=(const RecoveryClaim &) = delete;

    private:
        BrokenJobSet &broken_;
        std::string jobId_;
    };
}

JobRecovery::JobRecovery(APIClient &client, InventoryFetcher &fetcher, BrokenJobSet &broken, RecoverySettings settings)
    : client_(client), fetcher_(fetcher), broken_(broken), settings_(settings)
{
}

RemoteItem JobRecovery::recover(const RemoteItem &torrent, std::stop_token stop)
{
    if (!broken_.tryBeginRecovery(torrent.id))
    {
        throw BrokenLinkError(torrent.id, "recovery of job " + torrent.id + " is already running");
    }
    RecoveryClaim claim(broken_, torrent.id);

    Logger::Log(LogLevel::INFO, "JobRecovery::recover: redownloading dead torrent: " + torrent.name);
    RemoteItem recovered = resubmit(torrent, stop);

    broken_.erase(torrent.id);
    fetcher_.replaceTorrent(torrent.id, recovered);
    fetcher_.markStale();

    Logger::Log(LogLevel::INFO, "JobRecovery::recover: " + torrent.name + " re-submitted as " + recovered.id);
    return recovered;
}

RemoteItem JobRecovery::resubmit(const RemoteItem &torrent, std::stop_token stop)
{
    const std::string deadId = torrent.id;
    RemoteItem info = client_.torrentInfo(deadId, stop);
    if (info.hash.empty())
        info.hash = torrent.hash;
    if (info.name.empty())
        info.name = torrent.name;

    std::string selected;
    for (const auto &file : info.files)
    {
        if (file.selected == 1)
        {
            if (!selected.empty())
                selected += ",";
            selected += std::to_string(file.id);
        }
    }

    std::vector<std::string> links = info.links.empty() ? torrent.links : info.links;
    for (const auto &download : fetcher_.downloadsForLinks(links))
    {
        try
        {
            client_.deleteDownload(download.id, stop);
        }
        catch (const ApiError &ex)
        {
            Logger::Log(LogLevel::WARN, "JobRecovery::resubmit: could not delete download " + download.id + ": " + ex.what());
        }
    }
    fetcher_.invalidateLinks(links);

    std::string newId = client_.addMagnet(info.hash, stop);

    // From here on the new job exists remotely: later failures are logged so
    // the dead job is not submitted a second time.
    RemoteItem fresh;
    fresh.id = newId;
    try
    {
        fresh = client_.torrentInfo(newId, stop);
        int tries = 0;
        while (fresh.status != kTorrentWaitingSelection && tries < settings_.pollAttempts)
        {
            if (!sleep_for(settings_.pollInterval, stop))
                throw OperationCancelledError();
            fresh = client_.torrentInfo(newId, stop);
            tries++;
        }
        if (fresh.status != kTorrentWaitingSelection)
        {
            Logger::Log(LogLevel::WARN, "JobRecovery::resubmit: " + newId + " is " + fresh.status + ", selecting files anyway");
        }
    }
    catch (const ApiError &ex)
    {
        Logger::Log(LogLevel::WARN, "JobRecovery::resubmit: polling " + newId + " failed: " + ex.what());
    }

    try
    {
        client_.selectFiles(newId, selected.empty() ? "all" : selected, stop);
    }
    catch (const ApiError &ex)
    {
        Logger::Log(LogLevel::ERROR, "JobRecovery::resubmit: selecting files on " + newId + " failed: " + ex.what());
    }

    try
    {
        client_.deleteTorrent(deadId, stop);
    }
    catch (const ApiError &ex)
    {
        Logger::Log(LogLevel::ERROR, "JobRecovery::resubmit: deleting dead torrent " + deadId + " failed: " + ex.what());
    }

    try
    {
        fresh = client_.torrentInfo(newId, stop);
    }
    catch (const ApiError &ex)
    {
        Logger::Log(LogLevel::WARN, "JobRecovery::resubmit: re-reading " + newId + " failed: " + ex.what());
    }

    fresh.id = newId;
    if (fresh.name.empty())
        fresh.name = info.name;
    if (fresh.hash.empty())
        fresh.hash = info.hash;
    fresh.status = kTorrentDownloaded;
    return fresh;
}
