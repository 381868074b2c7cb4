// File: dir_cache.cpp
#include "dir_cache.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

DirCache::DirCache(IDirLister &lister, std::string rootId)
    : lister_(lister), rootId_(std::move(rootId))
{
}

std::string DirCache::Clean(const std::string &remote)
{
    size_t start = remote.find_first_not_of('/');
    if (start == std::string::npos)
        return "";
    size_t end = remote.find_last_not_of('/');
    return remote.substr(start, end - start + 1);
}

std::optional<std::string> DirCache::get(const std::string &remote) const
{
    std::string clean = Clean(remote);
    if (clean.empty())
        return rootId_;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(clean);
    if (it == cache_.end())
        return std::nullopt;
    return it->second;
}

void DirCache::put(const std::string &remote, const std::string &id)
{
    std::string clean = Clean(remote);
    if (clean.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[clean] = id;
}

std::optional<std::string> DirCache::findLeaf(const std::string &parentId, const std::string &leaf, std::stop_token stop)
{
    std::vector<TreeEntry> entries = lister_.listDir(VirtualPath::Folder(parentId), stop);

    // Exact names win over case-insensitive matches
    for (const auto &entry : entries)
    {
        if (entry.isFolder() && entry.name == leaf)
            return entry.id;
    }
    std::string lowered = to_lower(leaf);
    for (const auto &entry : entries)
    {
        if (entry.isFolder() && to_lower(entry.name) == lowered)
            return entry.id;
    }
    return std::nullopt;
}

std::string DirCache::findDir(const std::string &remote, bool create, std::stop_token stop)
{
    std::string clean = Clean(remote);
    if (auto cached = get(clean))
        return *cached;

    auto [parent, leaf] = SplitRemote(clean);
    std::string parentId = findDir(parent, create, stop);

    std::string id;
    if (auto found = findLeaf(parentId, leaf, stop))
    {
        id = *found;
    }
    else if (create)
    {
        id = lister_.makeDir(VirtualPath::Folder(parentId), leaf).str();
        Logger::Log(LogLevel::DEBUG, "DirCache::findDir: created " + clean + " as " + id);
    }
    else
    {
        throw DirNotFoundError("directory not found: " + clean);
    }

    put(clean, id);
    return id;
}

std::pair<std::string, std::string> DirCache::findPath(const std::string &remote, bool create, std::stop_token stop)
{
    auto [parent, leaf] = SplitRemote(Clean(remote));
    return {leaf, findDir(parent, create, stop)};
}

void DirCache::flushDir(const std::string &remote)
{
    std::string clean = Clean(remote);
    if (clean.empty())
    {
        resetRoot();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = cache_.begin(); it != cache_.end();)
    {
        if (it->first == clean || it->first.compare(0, clean.size() + 1, clean + "/") == 0)
            it = cache_.erase(it);
        else
            ++it;
    }
}

void DirCache::resetRoot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

std::string DirCache::findRoot(std::stop_token stop)
{
    lister_.listDir(VirtualPath::Folder(rootId_), stop);
    return rootId_;
}
