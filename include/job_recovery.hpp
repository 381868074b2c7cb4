// File: job_recovery.hpp
#pragma once
#include <chrono>
#include <stop_token>
#include <string>
#include "api_client.hpp"
#include "broken_jobs.hpp"
#include "inventory_fetcher.hpp"

struct RecoverySettings
{
    int pollAttempts = 5;
    std::chrono::milliseconds pollInterval{1000};
};

// Re-submits a dead job by its content hash with the same file selection.
class JobRecovery
{
public:
    JobRecovery(APIClient &client, InventoryFetcher &fetcher, BrokenJobSet &broken, RecoverySettings settings = {});

    // Returns the replacement job, already swapped into the inventory snapshot.
    // Throws ApiError when the job could not be re-submitted, and BrokenLinkError
    // when another caller is recovering the same job.
    RemoteItem recover(const RemoteItem &torrent, std::stop_token stop);

private:
    RemoteItem resubmit(const RemoteItem &torrent, std::stop_token stop);

    APIClient &client_;
    InventoryFetcher &fetcher_;
    BrokenJobSet &broken_;
    RecoverySettings settings_;
};
