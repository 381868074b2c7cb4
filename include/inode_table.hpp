// File: inode_table.hpp
#pragma once
#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct InodeInfo
{
    // Mount-relative path, "" for the root
    std::string path;
    bool isDir = false;
    int64_t size = 0;
    std::time_t mtime = 0;
};

// Stable inode numbers for mount-relative paths.
class InodeTable
{
public:
    static constexpr uint64_t kRootInode = 1;

    InodeTable();

    // Returns the inode for path, creating one when needed, and refreshes its attributes.
    uint64_t assign(const std::string &path, bool isDir, int64_t size = 0, std::time_t mtime = 0);

    std::optional<InodeInfo> info(uint64_t ino) const;
    std::optional<uint64_t> find(const std::string &path) const;

    // Moves path and everything below it to the new location, keeping inode numbers.
    void rename(const std::string &from, const std::string &to);
    // Drops path and everything below it.
    void remove(const std::string &path);

private:
    static bool isWithin(const std::string &path, const std::string &dir);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> pathToInode_;
    std::unordered_map<uint64_t, InodeInfo> inodes_;
    uint64_t nextInode_ = 2;
};
