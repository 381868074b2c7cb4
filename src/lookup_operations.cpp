// File: lookup_operations.cpp
#include "lookup_operations.hpp"
#include "fuse_operations.hpp"

static constexpr double kAttrTimeout = 1.0;

// Lookup callback
void fs_lookup(fuse_req_t req, fuse_ino_t parent, const char *name)
{
    Guarded(req, "fs_lookup", [&]()
            {
        FuseContext &ctx = ContextFor(req);
        std::string parentPath = ctx.infoOf(parent).path;
        Logger::Log(LogLevel::DEBUG, "fs_lookup: Resolving " + std::string(name) + " in /" + parentPath);

        for (const auto &item : ctx.fs().list(parentPath, ctx.stopToken()))
        {
            if (item.entry.name != name)
                continue;

            struct fuse_entry_param e = {};
            e.ino = ctx.remember(item.remote, item.entry);
            FillStat(e.ino, ctx.infoOf(e.ino), e.attr);
            e.attr_timeout = kAttrTimeout;
            e.entry_timeout = kAttrTimeout;
            fuse_reply_entry(req, &e);
            return;
        }

        throw NotFoundError("path not found: " + JoinRemote(parentPath, name)); });
}

// Getattr callback
void fs_getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi)
{
    (void)fi;
    Logger::Log(LogLevel::TRACE, "fs_getattr: Inode: " + std::to_string(ino));

    Guarded(req, "fs_getattr", [&]()
            {
        InodeInfo info = ContextFor(req).infoOf(ino);
        if (ino == FUSE_ROOT_ID)
            info.mtime = std::time(nullptr);

        struct stat st;
        FillStat(ino, info, st);
        fuse_reply_attr(req, &st, kAttrTimeout); });
}
