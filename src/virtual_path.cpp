// File: virtual_path.cpp
#include "virtual_path.hpp"
#include "utils.hpp"

VirtualPath VirtualPath::Folder(const std::string &raw)
{
    std::string normalized = "/";
    for (const auto &segment : split(raw, "/"))
    {
        if (segment.empty())
            continue;
        normalized += segment;
        normalized += '/';
    }
    return VirtualPath(normalized);
}

VirtualPath VirtualPath::parent() const
{
    if (isRoot())
        return *this;

    auto pos = path_.rfind('/', path_.size() - 2);
    return VirtualPath(path_.substr(0, pos + 1));
}

std::string VirtualPath::leaf() const
{
    if (isRoot())
        return "";

    auto pos = path_.rfind('/', path_.size() - 2);
    return path_.substr(pos + 1, path_.size() - pos - 2);
}

VirtualPath VirtualPath::child(const std::string &leaf) const
{
    return Folder(path_ + leaf);
}

std::vector<std::string> VirtualPath::segments() const
{
    std::vector<std::string> result;
    for (const auto &segment : split(path_, "/"))
    {
        if (!segment.empty())
            result.push_back(segment);
    }
    return result;
}

std::string VirtualPath::remote() const
{
    if (isRoot())
        return "";
    return path_.substr(1, path_.size() - 2);
}

bool VirtualPath::isPrefixOf(const std::string &path) const
{
    return path.compare(0, path_.size(), path_) == 0;
}

VirtualPath DestinationFolder(const std::string &destination)
{
    if (destination.empty() || destination.back() == '/')
        return VirtualPath::Folder(destination);

    auto pos = destination.rfind('/');
    if (pos == std::string::npos)
        return VirtualPath::Root();
    return VirtualPath::Folder(destination.substr(0, pos));
}

std::string DestinationLeaf(const std::string &destination)
{
    if (destination.empty() || destination.back() == '/')
        return "";
    return last_segment(destination);
}

std::string JoinRemote(const std::string &dir, const std::string &leaf)
{
    if (dir.empty())
        return leaf;
    if (leaf.empty())
        return dir;
    return dir + "/" + leaf;
}

std::pair<std::string, std::string> SplitRemote(const std::string &remote)
{
    auto pos = remote.rfind('/');
    if (pos == std::string::npos)
        return {"", remote};
    return {remote.substr(0, pos), remote.substr(pos + 1)};
}
