#pragma once
#include <mutex>
#include <set>
#include <string>

// Job IDs known to be dead or erroring, plus the ones whose recovery is running.
class BrokenJobSet
{
public:
    // Returns false when the job was already listed.
    bool add(const std::string &jobId);
    bool contains(const std::string &jobId) const;
    void erase(const std::string &jobId);
    std::set<std::string> snapshot() const;

    // Claims the job for recovery. Returns false when another caller holds it.
    bool tryBeginRecovery(const std::string &jobId);
    void endRecovery(const std::string &jobId);

private:
    mutable std::mutex mutex_;
    std::set<std::string> broken_;
    std::set<std::string> recovering_;
};
