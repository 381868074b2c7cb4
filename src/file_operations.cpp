// File: file_operations.cpp
#include "file_operations.hpp"
#include <fcntl.h>
#include <cstdio>
#include "fuse_operations.hpp"

// Open callback
void fs_open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi)
{
    if ((fi->flags & O_ACCMODE) != O_RDONLY)
    {
        Logger::Log(LogLevel::DEBUG, "fs_open: Refusing write access to inode " + std::to_string(ino));
        fuse_reply_err(req, EROFS);
        return;
    }

    Guarded(req, "fs_open", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        InodeInfo info = ctx.infoOf(ino);
        Logger::Log(LogLevel::DEBUG, "fs_open: Inode: " + std::to_string(ino) + ", Path: /" + info.path);
        if (info.isDir)
        {
            fuse_reply_err(req, EISDIR);
            return;
        }

        VirtualObject object = ctx.fs().newObject(info.path, ctx.stopToken());
        fi->fh = ctx.addFile(std::make_unique<OpenFile>(std::move(object)));
        fi->keep_cache = 1;
        fuse_reply_open(req, fi); });
}

void fs_read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info *fi)
{
    Logger::Log(LogLevel::TRACE, "fs_read: Inode: " + std::to_string(ino) + ", Offset: " + std::to_string(off) +
                                     ", Size: " + std::to_string(size));

    Guarded(req, "fs_read", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        OpenFile *file = ctx.file(fi->fh);
        if (!file)
        {
            fuse_reply_err(req, EBADF);
            return;
        }

        std::string data;
        {
            std::lock_guard<std::mutex> lock(file->mutex);
            if (off >= file->object.size())
            {
                fuse_reply_buf(req, nullptr, 0);
                return;
            }
            data = file->object.open(off, static_cast<int64_t>(size), ctx.stopToken());
        }
        fuse_reply_buf(req, data.data(), data.size()); });
}

// Release callback
void fs_release(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi)
{
    Logger::Log(LogLevel::DEBUG, "fs_release: Inode: " + std::to_string(ino));
    ContextFor(req).releaseFile(fi->fh);
    fuse_reply_err(req, 0);
}

// Unlink callback: trashes the file's job
void fs_unlink(fuse_req_t req, fuse_ino_t parent, const char *name)
{
    Guarded(req, "fs_unlink", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        std::string path = ctx.childPath(parent, name);
        Logger::Log(LogLevel::INFO, "fs_unlink: Removing /" + path);

        VirtualObject object = ctx.fs().newObject(path, ctx.stopToken());
        ctx.fs().remove(object, ctx.stopToken());
        ctx.inodes().remove(path);
        fuse_reply_err(req, 0); });
}

void fs_rename(fuse_req_t req, fuse_ino_t parent, const char *name,
               fuse_ino_t newparent, const char *newname, unsigned int flags)
{
    if (flags & RENAME_EXCHANGE)
    {
        fuse_reply_err(req, EINVAL);
        return;
    }

    Guarded(req, "fs_rename", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        std::string from = ctx.childPath(parent, name);
        std::string to = ctx.childPath(newparent, newname);
        Logger::Log(LogLevel::INFO, "fs_rename: /" + from + " -> /" + to);

        bool isDir = false;
        if (auto ino = ctx.inodes().find(from))
        {
            isDir = ctx.infoOf(*ino).isDir;
        }
        else
        {
            for (const auto &item : ctx.fs().list(ctx.infoOf(parent).path, ctx.stopToken()))
            {
                if (item.entry.name == name)
                    isDir = item.entry.isFolder();
            }
        }

        if (isDir)
        {
            ctx.fs().dirMove(from, to, ctx.stopToken());
        }
        else
        {
            VirtualObject object = ctx.fs().newObject(from, ctx.stopToken());
            ctx.fs().move(object, to, ctx.stopToken());
        }

        ctx.inodes().rename(from, to);
        fuse_reply_err(req, 0); });
}
