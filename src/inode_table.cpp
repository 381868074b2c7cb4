// File: inode_table.cpp
#include "inode_table.hpp"
#include <vector>
#include "logger.hpp"

InodeTable::InodeTable()
{
    pathToInode_[""] = kRootInode;
    inodes_[kRootInode] = InodeInfo{"", true, 0, 0};
}

bool InodeTable::isWithin(const std::string &path, const std::string &dir)
{
    if (path == dir)
        return true;
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

uint64_t InodeTable::assign(const std::string &path, bool isDir, int64_t size, std::time_t mtime)
{
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t ino;
    auto it = pathToInode_.find(path);
    if (it == pathToInode_.end())
    {
        ino = nextInode_++;
        pathToInode_[path] = ino;
        Logger::Log(LogLevel::TRACE, "InodeTable::assign: created inode " + std::to_string(ino) + " for path: " + path);
    }
    else
    {
        ino = it->second;
    }

    if (ino != kRootInode)
        inodes_[ino] = InodeInfo{path, isDir, size, mtime};
    return ino;
}

std::optional<InodeInfo> InodeTable::info(uint64_t ino) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inodes_.find(ino);
    if (it == inodes_.end())
        return std::nullopt;
    return it->second;
}

std::optional<uint64_t> InodeTable::find(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pathToInode_.find(path);
    if (it == pathToInode_.end())
        return std::nullopt;
    return it->second;
}

void InodeTable::rename(const std::string &from, const std::string &to)
{
    if (from.empty() || from == to)
        return;

    std::lock_guard<std::mutex> lock(mutex_);

    // A target that already had inodes is replaced by the moved subtree
    for (auto it = pathToInode_.begin(); it != pathToInode_.end();)
    {
        if (isWithin(it->first, to))
        {
            inodes_.erase(it->second);
            it = pathToInode_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    std::vector<std::pair<std::string, uint64_t>> moved;
    for (auto it = pathToInode_.begin(); it != pathToInode_.end();)
    {
        if (isWithin(it->first, from))
        {
            moved.emplace_back(to + it->first.substr(from.size()), it->second);
            it = pathToInode_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto &[path, ino] : moved)
    {
        pathToInode_[path] = ino;
        inodes_[ino].path = path;
    }
}

void InodeTable::remove(const std::string &path)
{
    if (path.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pathToInode_.begin(); it != pathToInode_.end();)
    {
        if (isWithin(it->first, path))
        {
            inodes_.erase(it->second);
            it = pathToInode_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}
