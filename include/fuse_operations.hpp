#pragma once
#define FUSE_USE_VERSION 35

#include <fuse3/fuse_lowlevel.h> // For low-level FUSE operations
#include <sys/stat.h>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include "directory_operations.hpp"
#include "errors.hpp"
#include "file_operations.hpp"
#include "inode_table.hpp"
#include "logger.hpp"
#include "lookup_operations.hpp"
#include "util_operations.hpp"
#include "virtualfs.hpp"

// An open file. Reads on one handle are serialized so a late link resolution
// only happens once.
struct OpenFile
{
    explicit OpenFile(VirtualObject obj) : object(std::move(obj)) {}

    std::mutex mutex;
    VirtualObject object;
};

// A directory listing captured at opendir and paged out by readdir.
struct DirListing
{
    struct Item
    {
        std::string name;
        uint64_t ino;
        bool isDir;
    };
    std::vector<Item> items;
};

// State shared by the FUSE callbacks, passed as the session userdata.
class FuseContext
{
public:
    explicit FuseContext(VirtualFS &fs) : fs_(fs) {}

    VirtualFS &fs() { return fs_; }
    InodeTable &inodes() { return inodes_; }

    // Cancelled at shutdown so in-flight API calls return promptly.
    std::stop_token stopToken() const { return stop_.get_token(); }
    void requestStop() { stop_.request_stop(); }

    uint64_t addFile(std::unique_ptr<OpenFile> file);
    OpenFile *file(uint64_t fh);
    void releaseFile(uint64_t fh);

    uint64_t addListing(std::unique_ptr<DirListing> listing);
    DirListing *listing(uint64_t fh);
    void releaseListing(uint64_t fh);

    // Records the attributes of a listed entry and returns its inode.
    uint64_t remember(const std::string &path, const TreeEntry &entry);

    // Throws NotFoundError for an inode the kernel should have forgotten.
    InodeInfo infoOf(fuse_ino_t ino) const;
    // Mount-relative path of name inside the directory parent.
    std::string childPath(fuse_ino_t parent, const char *name) const;

private:
    VirtualFS &fs_;
    InodeTable inodes_;
    std::stop_source stop_;

    std::mutex handlesMutex_;
    uint64_t nextHandle_ = 1;
    std::unordered_map<uint64_t, std::unique_ptr<OpenFile>> files_;
    std::unordered_map<uint64_t, std::unique_ptr<DirListing>> listings_;
};

FuseContext &ContextFor(fuse_req_t req);

// Fills st for an inode record.
void FillStat(uint64_t ino, const InodeInfo &info, struct stat &st);

// Runs op and answers the request with the errno matching any exception it throws.
// op must reply itself on success.
template <typename Fn>
void Guarded(fuse_req_t req, const char *name, Fn op)
{
    try
    {
        op();
    }
    catch (const std::exception &ex)
    {
        int err = ErrnoFor(ex);
        Logger::Log(err == ENOENT ? LogLevel::DEBUG : LogLevel::ERROR,
                    std::string(name) + ": " + ex.what());
        fuse_reply_err(req, err);
    }
}
