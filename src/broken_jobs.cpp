#include "broken_jobs.hpp"
#include "logger.hpp"

bool BrokenJobSet::add(const std::string &jobId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = broken_.insert(jobId).second;
    if (inserted)
        Logger::Log(LogLevel::DEBUG, "BrokenJobSet::add: job " + jobId + " marked broken");
    return inserted;
}

bool BrokenJobSet::contains(const std::string &jobId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return broken_.count(jobId) > 0;
}

void BrokenJobSet::erase(const std::string &jobId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    broken_.erase(jobId);
}

std::set<std::string> BrokenJobSet::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return broken_;
}

bool BrokenJobSet::tryBeginRecovery(const std::string &jobId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return recovering_.insert(jobId).second;
}

void BrokenJobSet::endRecovery(const std::string &jobId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    recovering_.erase(jobId);
}
