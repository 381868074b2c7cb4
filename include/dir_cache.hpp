// File: dir_cache.hpp
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>
#include "api_types.hpp"
#include "virtual_path.hpp"

// What the directory cache needs from the namespace to resolve unknown paths.
class IDirLister
{
public:
    virtual std::vector<TreeEntry> listDir(const VirtualPath &dir, std::stop_token stop) = 0;
    virtual VirtualPath makeDir(const VirtualPath &parent, const std::string &leaf) = 0;
    virtual ~IDirLister() = default;
};

// Host-side path ("a/b", "" for the root) -> directory ID (a canonical folder path).
class DirCache
{
public:
    explicit DirCache(IDirLister &lister, std::string rootId = "/");

    std::optional<std::string> get(const std::string &remote) const;
    void put(const std::string &remote, const std::string &id);

    // ID of the directory at remote. Missing directories are created when create
    // is set, otherwise DirNotFoundError is thrown.
    std::string findDir(const std::string &remote, bool create, std::stop_token stop);

    // Splits remote into its leaf and the ID of its parent directory.
    std::pair<std::string, std::string> findPath(const std::string &remote, bool create, std::stop_token stop);

    // Forgets remote and everything below it.
    void flushDir(const std::string &remote);
    // Forgets everything except the root.
    void resetRoot();

    // Lists the root once so the namespace is built before the first lookup.
    std::string findRoot(std::stop_token stop);
    const std::string &rootId() const { return rootId_; }

private:
    static std::string Clean(const std::string &remote);
    std::optional<std::string> findLeaf(const std::string &parentId, const std::string &leaf, std::stop_token stop);

    IDirLister &lister_;
    std::string rootId_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> cache_;
};
