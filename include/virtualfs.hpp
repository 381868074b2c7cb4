#pragma once

#include <ctime>
#include <stop_token>
#include <string>
#include <vector>
#include "api_types.hpp"
#include "dir_cache.hpp"
#include "namespace_engine.hpp"

class VirtualFS;

// A file in the mounted tree
class VirtualObject
{
public:
    VirtualObject(VirtualFS &fs, std::string remote, TreeEntry entry, VirtualPath parentDir);

    const std::string &remote() const { return remote_; }
    const std::string &id() const { return entry_.id; }
    const std::string &mimeType() const { return entry_.mimeType; }
    const std::string &url() const { return entry_.url; }
    int64_t size() const { return entry_.size; }
    std::time_t modTime() const;

    const TreeEntry &entry() const { return entry_; }
    const VirtualPath &parentDir() const { return parentDir_; }

    // Reads size bytes at offset, resolving the link first when needed.
    std::string open(int64_t offset, int64_t size, std::stop_token stop);

private:
    VirtualFS &fs_;
    std::string remote_;
    TreeEntry entry_;
    VirtualPath parentDir_;
};

struct DirEntry
{
    std::string remote;
    TreeEntry entry;
};

// Path-addressed surface over the namespace engine. Remote paths are relative
// to the mount root without leading or trailing slashes ("" is the root).
class VirtualFS : public IDirLister
{
public:
    explicit VirtualFS(NamespaceEngine &engine);

    std::vector<DirEntry> list(const std::string &dir, std::stop_token stop);

    // Throws NotFoundError when nothing lives at remote.
    VirtualObject newObject(const std::string &remote, std::stop_token stop);

    void mkdir(const std::string &dir, std::stop_token stop);
    void rmdir(const std::string &dir, std::stop_token stop);
    void purge(const std::string &dir, std::stop_token stop);

    VirtualObject move(const VirtualObject &src, const std::string &remote, std::stop_token stop);
    // Throws DirExistsError when dstRemote is already a directory.
    void dirMove(const std::string &srcRemote, const std::string &dstRemote, std::stop_token stop);

    // Resolved URL of a file. Directories can't be shared.
    std::string publicLink(const std::string &remote, std::stop_token stop);

    void remove(const VirtualObject &object, std::stop_token stop);

    std::vector<TreeEntry> listDir(const VirtualPath &dir, std::stop_token stop) override;
    VirtualPath makeDir(const VirtualPath &parent, const std::string &leaf) override;

    DirCache &dirCache() { return dirCache_; }
    NamespaceEngine &engine() { return engine_; }

private:
    void purgeCheck(const std::string &dir, std::stop_token stop);

    NamespaceEngine &engine_;
    DirCache dirCache_;
};
