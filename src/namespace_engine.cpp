// File: namespace_engine.cpp
#include "namespace_engine.hpp"
#include "errors.hpp"
#include "logger.hpp"

NamespaceEngine::NamespaceEngine(std::shared_ptr<IApiTransport> transport, EngineSettings settings)
    : settings_(std::move(settings)),
      ruleFile_(settings_.sortFile, settings_.strictRules),
      client_(std::move(transport), settings_.apiKey, settings_.retry),
      fetcher_(client_, settings_.fetcher),
      recovery_(client_, fetcher_, broken_, settings_.recovery),
      resolver_(client_, fetcher_, broken_, recovery_),
      moves_(ruleFile_, sync_, recorded_, mapping_, folders_, fetcher_, client_)
{
    std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);
    ruleFile_.ensureExists();
}

bool NamespaceEngine::ruleFileChanged(RuleFileStamp &stamp)
{
    if (sync_.rulesDirty)
    {
        stamp = ruleFile_.modifiedAt();
        return true;
    }

    std::lock_guard<std::mutex> lock(statMutex_);
    auto now = std::chrono::steady_clock::now();
    if (rulesLoaded_ && lastRuleStat_ && now - *lastRuleStat_ < settings_.ruleDebounce)
        return false;
    lastRuleStat_ = now;

    stamp = ruleFile_.modifiedAt();
    return !rulesLoaded_ || stamp != fetcher_.lastRuleFileMod();
}

bool NamespaceEngine::refresh(bool force, std::stop_token stop)
{
    RuleFileStamp stamp;
    bool changed = ruleFileChanged(stamp);
    return rebuild(force, changed, stamp, stop);
}

bool NamespaceEngine::rebuild(bool force, bool rulesChanged, RuleFileStamp stamp, std::stop_token stop)
{
    std::lock_guard<std::mutex> refreshLock(sync_.refreshMutex);
    if (sync_.moving)
    {
        Logger::Log(LogLevel::DEBUG, "NamespaceEngine::rebuild: move in progress, serving current tables");
        return false;
    }

    if (rulesChanged || !rules_)
    {
        if (!ruleFile_.modifiedAt())
        {
            std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);
            ruleFile_.ensureExists();
        }

        sync_.rulesDirty = false;
        try
        {
            std::shared_lock<std::shared_mutex> lock(sync_.ruleFileMutex);
            rules_ = ruleFile_.load();
            stamp = ruleFile_.modifiedAt();
            rulesLoaded_ = true;
        }
        catch (const RuleFileError &)
        {
            sync_.rulesDirty = true;
            throw;
        }
        rulesChanged = true;
        Logger::Log(LogLevel::DEBUG, "NamespaceEngine::rebuild: reading updated sorting file");
    }

    FetchResult fetched = fetcher_.refresh(force, rulesChanged, stop, stamp);
    if (!fetched.updated)
        return false;

    NamespaceBuilder builder(broken_, [&](const RemoteItem &torrent)
                             { return recovery_.recover(torrent, stop); });
    return swapTables(builder.build(*rules_, std::move(fetched.torrents)));
}

bool NamespaceEngine::swapTables(BuildResult built)
{
    std::unique_lock<std::shared_mutex> lock(sync_.ruleFileMutex);

    // A move that ran during the build patched the live tables and wrote rules
    // this build never saw. Keep the patches; rulesDirty rebuilds on the next browse.
    if (sync_.moving || sync_.rulesDirty)
    {
        Logger::Log(LogLevel::DEBUG, "NamespaceEngine::swapTables: move happened during the rebuild, dropping it");
        return false;
    }

    folders_.replaceAll(std::move(built.folders));
    recorded_.replaceAll(std::move(built.recorded));

    // Only touch keys whose destination actually changed
    mapping_.mutate([&](std::map<std::string, std::string> &current)
                    {
        for (auto it = current.begin(); it != current.end();)
        {
            if (built.mapping.count(it->first) == 0)
                it = current.erase(it);
            else
                ++it;
        }
        for (auto &[key, destination] : built.mapping)
        {
            auto existing = current.find(key);
            if (existing == current.end() || existing->second != destination)
                current[key] = destination;
        } });
    return true;
}

std::vector<TreeEntry> NamespaceEngine::list(const VirtualPath &dir, std::stop_token stop)
{
    RuleFileStamp stamp;
    bool changed = ruleFileChanged(stamp);

    if ((dir.isRoot() || !folders_.contains(dir) || changed) && !sync_.moving)
    {
        try
        {
            rebuild(false, changed, stamp, stop);
        }
        catch (const ApiError &ex)
        {
            Logger::Log(LogLevel::ERROR, "NamespaceEngine::list: couldn't list files: " + std::string(ex.what()));
        }
        catch (const RuleFileError &ex)
        {
            Logger::Log(LogLevel::ERROR, "NamespaceEngine::list: sorting file not applied: " + std::string(ex.what()));
        }
    }

    std::vector<TreeEntry> entries = folders_.children(dir);
    for (auto &entry : entries)
    {
        if (entry.isFolder())
            continue;
        try
        {
            resolve(entry, dir, stop);
        }
        catch (const BrokenLinkError &ex)
        {
            Logger::Log(LogLevel::WARN, "NamespaceEngine::list: " + std::string(ex.what()));
        }
    }
    return entries;
}

bool NamespaceEngine::resolve(TreeEntry &entry, const VirtualPath &dir, std::stop_token stop)
{
    if (!resolver_.resolve(entry, stop))
        return false;

    folders_.updateEntry(dir, entry.id, [&](TreeEntry &stored)
                         {
        stored.url = entry.url;
        stored.size = entry.size;
        stored.mimeType = entry.mimeType;
        stored.generated = entry.generated;
        if (!stored.nameFromRule)
            stored.name = entry.name; });
    return true;
}

std::string NamespaceEngine::read(const TreeEntry &entry, int64_t offset, int64_t size, std::stop_token stop)
{
    return resolver_.openRange(entry, offset, size, stop);
}

void NamespaceEngine::moveFile(const TreeEntry &entry, const VirtualPath &oldDir, const VirtualPath &newDir, const std::string &newLeaf)
{
    moves_.moveFile(entry, oldDir, newDir, newLeaf);
}

void NamespaceEngine::moveFolder(const VirtualPath &oldParent, const std::string &oldLeaf,
                                 const VirtualPath &newParent, const std::string &newLeaf)
{
    moves_.moveFolder(oldParent, oldLeaf, newParent, newLeaf);
}

void NamespaceEngine::removeFile(const TreeEntry &entry, const VirtualPath &dir, std::stop_token stop)
{
    moves_.remove(entry, dir, stop);
}

VirtualPath NamespaceEngine::createDir(const VirtualPath &parent, const std::string &leaf)
{
    return moves_.createDir(parent, leaf);
}

bool NamespaceEngine::isTorrentId(const std::string &id) const
{
    return fetcher_.torrentById(id).has_value();
}
