// File: link_resolver.hpp
#pragma once
#include <cstdint>
#include <stop_token>
#include <string>
#include "api_client.hpp"
#include "api_types.hpp"
#include "broken_jobs.hpp"
#include "inventory_fetcher.hpp"
#include "job_recovery.hpp"

// Turns the restricted link of a file into a live download URL.
class LinkResolver
{
public:
    LinkResolver(APIClient &client, InventoryFetcher &fetcher, BrokenJobSet &broken, JobRecovery &recovery);

    // Fills url, size and mime type of entry, and its name unless the rule file chose it.
    // Returns true when entry now carries a live URL.
    // Throws BrokenLinkError when the link is dead and its job is already broken.
    bool resolve(TreeEntry &entry, std::stop_token stop);

    // Reads size bytes at offset from the resolved URL of entry.
    // A dead link queues the job for recovery and throws BrokenLinkError.
    std::string openRange(const TreeEntry &entry, int64_t offset, int64_t size, std::stop_token stop);

private:
    static bool IsBrokenStatus(long status) { return status == 503 || status == 404; }
    static void Apply(TreeEntry &entry, const RemoteItem &download);

    APIClient &client_;
    InventoryFetcher &fetcher_;
    BrokenJobSet &broken_;
    JobRecovery &recovery_;
};
