// File: namespace_engine.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include "api_client.hpp"
#include "broken_jobs.hpp"
#include "i_api_transport.hpp"
#include "inventory_fetcher.hpp"
#include "job_recovery.hpp"
#include "link_resolver.hpp"
#include "move_engine.hpp"
#include "namespace_builder.hpp"
#include "namespace_tables.hpp"
#include "rule_file.hpp"
#include "sync_state.hpp"

struct EngineSettings
{
    std::string apiKey;
    std::string sortFile;
    bool strictRules = false;
    std::chrono::seconds ruleDebounce{5};
    RetryPolicy retry;
    FetcherSettings fetcher;
    RecoverySettings recovery;
};

// The virtual namespace: inventory, rule file, derived tables and the
// operations that browse and reshape them. One instance per mount.
class NamespaceEngine
{
public:
    NamespaceEngine(std::shared_ptr<IApiTransport> transport, EngineSettings settings);

    NamespaceEngine(const NamespaceEngine &) = delete;
    NamespaceEngine &operator=(const NamespaceEngine &) = delete;

    // Children of dir with their links resolved. Rebuilds first when dir is the
    // root, unknown, or the rule file changed, unless a move is running.
    std::vector<TreeEntry> list(const VirtualPath &dir, std::stop_token stop);

    // Fetches and, when anything changed, rebuilds the tables. Returns true on rebuild.
    bool refresh(bool force, std::stop_token stop);

    bool folderExists(const VirtualPath &dir) const { return folders_.contains(dir); }
    std::vector<TreeEntry> children(const VirtualPath &dir) const { return folders_.children(dir); }

    bool resolve(TreeEntry &entry, const VirtualPath &dir, std::stop_token stop);
    std::string read(const TreeEntry &entry, int64_t offset, int64_t size, std::stop_token stop);

    void moveFile(const TreeEntry &entry, const VirtualPath &oldDir, const VirtualPath &newDir, const std::string &newLeaf);
    void moveFolder(const VirtualPath &oldParent, const std::string &oldLeaf,
                    const VirtualPath &newParent, const std::string &newLeaf);
    void removeFile(const TreeEntry &entry, const VirtualPath &dir, std::stop_token stop);
    VirtualPath createDir(const VirtualPath &parent, const std::string &leaf);

    bool isTorrentId(const std::string &id) const;
    void markStale() { fetcher_.markStale(); }

    std::optional<std::string> mappingFor(const std::string &key) const { return mapping_.load(key); }
    std::optional<std::string> recordedFor(const std::string &key) const { return recorded_.load(key); }

    RuleFile &ruleFile() { return ruleFile_; }
    InventoryFetcher &fetcher() { return fetcher_; }
    JobRecovery &recovery() { return recovery_; }
    SyncState &sync() { return sync_; }
    APIClient &client() { return client_; }

private:
    bool ruleFileChanged(RuleFileStamp &stamp);
    bool rebuild(bool force, bool rulesChanged, RuleFileStamp stamp, std::stop_token stop);
    // Returns false when a move overtook the build and the tables were kept.
    bool swapTables(BuildResult built);

    EngineSettings settings_;
    SyncState sync_;
    RuleFile ruleFile_;
    APIClient client_;
    InventoryFetcher fetcher_;
    BrokenJobSet broken_;
    JobRecovery recovery_;
    LinkResolver resolver_;

    MappingTable recorded_;
    MappingTable mapping_;
    FolderTable folders_;

    MoveEngine moves_;

    std::optional<ParsedRules> rules_;
    std::atomic<bool> rulesLoaded_{false};

    std::mutex statMutex_;
    std::optional<std::chrono::steady_clock::time_point> lastRuleStat_;
};
