// File: util_operations.cpp
#include "util_operations.hpp"
#include <unistd.h>
#include <cstring>
#include <ctime>
#include "fuse_operations.hpp"

uint64_t FuseContext::addFile(std::unique_ptr<OpenFile> file)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    uint64_t fh = nextHandle_++;
    files_[fh] = std::move(file);
    return fh;
}

OpenFile *FuseContext::file(uint64_t fh)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    auto it = files_.find(fh);
    return it == files_.end() ? nullptr : it->second.get();
}

void FuseContext::releaseFile(uint64_t fh)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    files_.erase(fh);
}

uint64_t FuseContext::addListing(std::unique_ptr<DirListing> listing)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    uint64_t fh = nextHandle_++;
    listings_[fh] = std::move(listing);
    return fh;
}

DirListing *FuseContext::listing(uint64_t fh)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    auto it = listings_.find(fh);
    return it == listings_.end() ? nullptr : it->second.get();
}

void FuseContext::releaseListing(uint64_t fh)
{
    std::lock_guard<std::mutex> lock(handlesMutex_);
    listings_.erase(fh);
}

uint64_t FuseContext::remember(const std::string &path, const TreeEntry &entry)
{
    if (entry.isFolder())
        return inodes_.assign(path, true);

    std::time_t mtime = entry.createdAt();
    return inodes_.assign(path, false, entry.size, mtime != 0 ? mtime : std::time(nullptr));
}

InodeInfo FuseContext::infoOf(fuse_ino_t ino) const
{
    auto info = inodes_.info(ino);
    if (!info)
        throw NotFoundError("unknown inode " + std::to_string(ino));
    return *info;
}

std::string FuseContext::childPath(fuse_ino_t parent, const char *name) const
{
    return JoinRemote(infoOf(parent).path, name);
}

FuseContext &ContextFor(fuse_req_t req)
{
    return *static_cast<FuseContext *>(fuse_req_userdata(req));
}

void FillStat(uint64_t ino, const InodeInfo &info, struct stat &st)
{
    st = {};
    st.st_ino = ino;
    if (info.isDir)
    {
        st.st_mode = S_IFDIR | 0755;
        st.st_nlink = 2;
    }
    else
    {
        st.st_mode = S_IFREG | 0444;
        st.st_nlink = 1;
        st.st_size = info.size;
    }
    st.st_mtime = info.mtime;
    st.st_ctime = info.mtime;
    st.st_atime = info.mtime;
    st.st_uid = getuid();
    st.st_gid = getgid();
}

void fs_getxattr(fuse_req_t req, fuse_ino_t ino, const char *name, size_t size)
{
    Logger::Log(LogLevel::DEBUG, "fs_getxattr: Inode: " + std::to_string(ino) + ", Name: " + std::string(name));

    if (std::strcmp(name, kLinkXattr) != 0)
    {
        fuse_reply_err(req, ENOTSUP);
        return;
    }

    Guarded(req, "fs_getxattr", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        InodeInfo info = ctx.infoOf(ino);
        std::string link = ctx.fs().publicLink(info.path, ctx.stopToken());

        if (size == 0)
            fuse_reply_xattr(req, link.size());
        else if (size < link.size())
            fuse_reply_err(req, ERANGE);
        else
            fuse_reply_buf(req, link.data(), link.size()); });
}
