// File: sync_state.hpp
#pragma once
#include <atomic>
#include <mutex>
#include <shared_mutex>

// Locks binding the rule file, the rebuild and structural moves together.
//
// Lock order: moveMutex, then refreshMutex, then ruleFileMutex.
struct SyncState
{
    // Shared for reading the rule file, exclusive for rewrites and table swaps
    std::shared_mutex ruleFileMutex;
    // One rebuild at a time
    std::mutex refreshMutex;
    // One move, rename or trash at a time, end to end
    std::mutex moveMutex;
    // Rebuilds are skipped while set
    std::atomic<bool> moving{false};
    // Set after every rule-file write so the next browse rebuilds without waiting for the mtime check
    std::atomic<bool> rulesDirty{false};
};

// Holds moveMutex and raises the moving flag for its lifetime.
class MoveScope
{
public:
    explicit MoveScope(SyncState &sync) : sync_(sync), lock_(sync.moveMutex)
    {
        sync_.moving = true;
    }

    ~MoveScope()
    {
        sync_.moving = false;
    }

    MoveScope(const MoveScope &) = delete;
    MoveScope &operator=(const MoveScope &) = delete;

private:
    SyncState &sync_;
    std::unique_lock<std::mutex> lock_;
};
