#include "virtualfs.hpp"
#include <cctype>
#include <tuple>
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

static std::string CleanRemote(const std::string &remote)
{
    size_t start = remote.find_first_not_of('/');
    if (start == std::string::npos)
        return "";
    size_t end = remote.find_last_not_of('/');
    return remote.substr(start, end - start + 1);
}

// Job IDs are 13 upper-case characters
static bool LooksLikeJobId(const std::string &leaf)
{
    if (leaf.size() != 13)
        return false;
    for (char c : leaf)
    {
        if (std::islower(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

VirtualObject::VirtualObject(VirtualFS &fs, std::string remote, TreeEntry entry, VirtualPath parentDir)
    : fs_(fs), remote_(std::move(remote)), entry_(std::move(entry)), parentDir_(std::move(parentDir))
{
}

std::time_t VirtualObject::modTime() const
{
    std::time_t created = entry_.createdAt();
    return created != 0 ? created : std::time(nullptr);
}

std::string VirtualObject::open(int64_t offset, int64_t size, std::stop_token stop)
{
    if (entry_.url.empty())
        fs_.engine().resolve(entry_, parentDir_, stop);
    return fs_.engine().read(entry_, offset, size, stop);
}

VirtualFS::VirtualFS(NamespaceEngine &engine)
    : engine_(engine), dirCache_(*this)
{
}

std::vector<TreeEntry> VirtualFS::listDir(const VirtualPath &dir, std::stop_token stop)
{
    return engine_.list(dir, stop);
}

VirtualPath VirtualFS::makeDir(const VirtualPath &parent, const std::string &leaf)
{
    return engine_.createDir(parent, leaf);
}

std::vector<DirEntry> VirtualFS::list(const std::string &dir, std::stop_token stop)
{
    std::string clean = CleanRemote(dir);
    std::string dirId = dirCache_.findDir(clean, false, stop);

    std::vector<DirEntry> result;
    for (auto &entry : engine_.list(VirtualPath::Folder(dirId), stop))
    {
        std::string remote = JoinRemote(clean, entry.name);
        if (entry.isFolder())
            dirCache_.put(remote, entry.id);
        result.push_back({remote, std::move(entry)});
    }
    return result;
}

VirtualObject VirtualFS::newObject(const std::string &remote, std::stop_token stop)
{
    std::string clean = CleanRemote(remote);
    std::string leaf;
    std::string dirId;
    try
    {
        std::tie(leaf, dirId) = dirCache_.findPath(clean, false, stop);
    }
    catch (const DirNotFoundError &)
    {
        throw NotFoundError("object not found: " + clean);
    }

    VirtualPath dir = VirtualPath::Folder(dirId);
    std::vector<TreeEntry> entries = engine_.list(dir, stop);

    const TreeEntry *match = nullptr;
    for (const auto &entry : entries)
    {
        if (!entry.isFolder() && entry.name == leaf)
        {
            match = &entry;
            break;
        }
    }
    if (!match)
    {
        std::string lowered = to_lower(leaf);
        for (const auto &entry : entries)
        {
            if (!entry.isFolder() && to_lower(entry.name) == lowered)
            {
                match = &entry;
                break;
            }
        }
    }
    if (!match)
        throw NotFoundError("object not found: " + clean);

    return VirtualObject(*this, JoinRemote(SplitRemote(clean).first, match->name), *match, dir);
}

void VirtualFS::mkdir(const std::string &dir, std::stop_token stop)
{
    dirCache_.findDir(CleanRemote(dir), true, stop);
}

void VirtualFS::purgeCheck(const std::string &dir, std::stop_token stop)
{
    std::string clean = CleanRemote(dir);
    if (clean.empty())
        throw RdfsError("can't purge root directory");

    std::string dirId = dirCache_.findDir(clean, false, stop);
    std::string leaf = VirtualPath::Folder(dirId).leaf();
    if (LooksLikeJobId(leaf) || engine_.isTorrentId(leaf))
    {
        // Remote deletion stays disabled here; removing the files trashes the job
        Logger::Log(LogLevel::DEBUG, "VirtualFS::purgeCheck: not deleting realdebrid torrent id: " + leaf);
        engine_.markStale();
    }
    dirCache_.flushDir(clean);
}

void VirtualFS::rmdir(const std::string &dir, std::stop_token stop)
{
    purgeCheck(dir, stop);
}

void VirtualFS::purge(const std::string &dir, std::stop_token stop)
{
    purgeCheck(dir, stop);
}

VirtualObject VirtualFS::move(const VirtualObject &src, const std::string &remote, std::stop_token stop)
{
    auto [leaf, dirId] = dirCache_.findPath(CleanRemote(remote), true, stop);
    VirtualPath newDir = VirtualPath::Folder(dirId);

    engine_.moveFile(src.entry(), src.parentDir(), newDir, leaf);

    TreeEntry moved = src.entry();
    moved.name = leaf;
    moved.nameFromRule = true;
    return VirtualObject(*this, CleanRemote(remote), moved, newDir);
}

void VirtualFS::dirMove(const std::string &srcRemote, const std::string &dstRemote, std::stop_token stop)
{
    std::string src = CleanRemote(srcRemote);
    std::string dst = CleanRemote(dstRemote);
    if (src.empty())
        throw RdfsError("can't move the root directory");

    VirtualPath srcDir = VirtualPath::Folder(dirCache_.findDir(src, false, stop));

    bool exists = true;
    try
    {
        dirCache_.findDir(dst, false, stop);
    }
    catch (const DirNotFoundError &)
    {
        exists = false;
    }
    if (exists)
        throw DirExistsError("directory already exists: " + dst);

    auto [dstParent, dstLeaf] = SplitRemote(dst);
    VirtualPath dstParentDir = VirtualPath::Folder(dirCache_.findDir(dstParent, true, stop));

    engine_.moveFolder(srcDir.parent(), srcDir.leaf(), dstParentDir, dstLeaf);

    // List again so the moved content is visible at its new location at once
    dirCache_.flushDir(src);
    dirCache_.put(dst, dstParentDir.child(dstLeaf).str());
    list(dst, stop);
}

std::string VirtualFS::publicLink(const std::string &remote, std::stop_token stop)
{
    bool isDir = true;
    try
    {
        dirCache_.findDir(CleanRemote(remote), false, stop);
    }
    catch (const DirNotFoundError &)
    {
        isDir = false;
    }
    if (isDir)
        throw RdfsError("can't share directories");

    VirtualObject object = newObject(remote, stop);
    if (object.url().empty())
        throw NotFoundError("no link for " + object.remote());
    return object.url();
}

void VirtualFS::remove(const VirtualObject &object, std::stop_token stop)
{
    engine_.removeFile(object.entry(), object.parentDir(), stop);
}
