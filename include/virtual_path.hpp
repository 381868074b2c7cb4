// File: virtual_path.hpp
#pragma once
#include <string>
#include <utility>
#include <vector>

// A folder path in canonical form: one leading and one trailing '/', no empty
// segments. The root is "/". Every folder path that crosses a component
// boundary (rule file, folder table, directory cache, move requests) goes
// through this type.
class VirtualPath
{
public:
    VirtualPath() : path_("/") {}

    // Accepts "a/b", "/a/b", "a/b/", "//a//b/" and returns "/a/b/".
    static VirtualPath Folder(const std::string &raw);
    static VirtualPath Root() { return VirtualPath(); }

    const std::string &str() const { return path_; }
    bool isRoot() const { return path_ == "/"; }

    // "/a/b/" -> "/a/"; the root is its own parent.
    VirtualPath parent() const;
    // "/a/b/" -> "b"; empty for the root.
    std::string leaf() const;
    VirtualPath child(const std::string &leaf) const;
    std::vector<std::string> segments() const;

    // Host-side form without slashes at either end ("/a/b/" -> "a/b", root -> "").
    std::string remote() const;

    bool isPrefixOf(const std::string &path) const;

    bool operator==(const VirtualPath &other) const { return path_ == other.path_; }
    bool operator!=(const VirtualPath &other) const { return path_ != other.path_; }
    bool operator<(const VirtualPath &other) const { return path_ < other.path_; }

private:
    explicit VirtualPath(std::string normalized) : path_(std::move(normalized)) {}

    std::string path_;
};

// Folder part of a mapping destination. "/a/b/" stays "/a/b/", "/a/b/file.mkv" gives "/a/b/".
VirtualPath DestinationFolder(const std::string &destination);

// Leaf part of a mapping destination, empty when the destination is a folder.
std::string DestinationLeaf(const std::string &destination);

// Joins host-side remote paths the way the directory cache expects ("" + "a" -> "a").
std::string JoinRemote(const std::string &dir, const std::string &leaf);

// Splits a host-side remote path into (parent, leaf): "a/b/c" -> ("a/b", "c").
std::pair<std::string, std::string> SplitRemote(const std::string &remote);
