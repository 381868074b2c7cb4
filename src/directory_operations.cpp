// File: directory_operations.cpp
#include "directory_operations.hpp"
#include <cstdlib>
#include "fuse_operations.hpp"

// Opendir callback: captures the listing so readdir can page through it
void fs_opendir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi)
{
    Logger::Log(LogLevel::DEBUG, "fs_opendir: Inode: " + std::to_string(ino));

    Guarded(req, "fs_opendir", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        InodeInfo info = ctx.infoOf(ino);
        if (!info.isDir)
        {
            fuse_reply_err(req, ENOTDIR);
            return;
        }

        auto listing = std::make_unique<DirListing>();
        for (const auto &item : ctx.fs().list(info.path, ctx.stopToken()))
        {
            uint64_t childIno = ctx.remember(item.remote, item.entry);
            listing->items.push_back({item.entry.name, childIno, item.entry.isFolder()});
        }

        fi->fh = ctx.addListing(std::move(listing));
        fuse_reply_open(req, fi); });
}

// Readdir callback
void fs_readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi)
{
    Logger::Log(LogLevel::DEBUG, "fs_readdir: Inode: " + std::to_string(ino) + ", Offset: " + std::to_string(off));

    FuseContext &ctx = ContextFor(req);
    DirListing *listing = ctx.listing(fi->fh);
    if (!listing)
    {
        Logger::Log(LogLevel::ERROR, "fs_readdir: No listing for handle: " + std::to_string(fi->fh));
        fuse_reply_err(req, EBADF);
        return;
    }

    char *buf = static_cast<char *>(calloc(1, size));
    if (!buf)
    {
        fuse_reply_err(req, ENOMEM);
        return;
    }
    size_t bufSize = 0;

    auto addDirEntry = [&](const std::string &name, fuse_ino_t inode, mode_t mode, off_t next)
    {
        struct stat st = {};
        st.st_ino = inode;
        st.st_mode = mode;

        size_t entrySize = fuse_add_direntry(req, buf + bufSize, size - bufSize, name.c_str(), &st, next);
        if (entrySize > size - bufSize)
            return false;

        bufSize += entrySize;
        return true;
    };

    // Offsets 0 and 1 are "." and "..", entry i sits at offset i + 2
    off_t total = static_cast<off_t>(listing->items.size()) + 2;
    for (off_t pos = off; pos < total; ++pos)
    {
        bool added;
        if (pos == 0)
        {
            added = addDirEntry(".", ino, S_IFDIR, pos + 1);
        }
        else if (pos == 1)
        {
            added = addDirEntry("..", FUSE_ROOT_ID, S_IFDIR, pos + 1);
        }
        else
        {
            const auto &item = listing->items[static_cast<size_t>(pos - 2)];
            added = addDirEntry(item.name, item.ino, item.isDir ? S_IFDIR : S_IFREG, pos + 1);
        }
        if (!added)
            break;
    }

    Logger::Log(LogLevel::TRACE, "fs_readdir: Returning buffer of size: " + std::to_string(bufSize));
    fuse_reply_buf(req, buf, bufSize);
    free(buf);
}

// Releasedir callback
void fs_releasedir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi)
{
    Logger::Log(LogLevel::DEBUG, "fs_releasedir: Inode: " + std::to_string(ino));
    ContextFor(req).releaseListing(fi->fh);
    fuse_reply_err(req, 0);
}

void fs_mkdir(fuse_req_t req, fuse_ino_t parent, const char *name, mode_t mode)
{
    (void)mode;
    Guarded(req, "fs_mkdir", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        std::string path = ctx.childPath(parent, name);
        Logger::Log(LogLevel::INFO, "fs_mkdir: Creating directory /" + path);

        ctx.fs().mkdir(path, ctx.stopToken());

        struct fuse_entry_param e = {};
        e.ino = ctx.inodes().assign(path, true, 0, std::time(nullptr));
        FillStat(e.ino, ctx.infoOf(e.ino), e.attr);
        e.attr_timeout = 1.0;
        e.entry_timeout = 1.0;
        fuse_reply_entry(req, &e); });
}

void fs_rmdir(fuse_req_t req, fuse_ino_t parent, const char *name)
{
    Guarded(req, "fs_rmdir", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        std::string path = ctx.childPath(parent, name);
        Logger::Log(LogLevel::INFO, "fs_rmdir: Removing directory /" + path);

        ctx.fs().rmdir(path, ctx.stopToken());
        ctx.inodes().remove(path);
        fuse_reply_err(req, 0); });
}
