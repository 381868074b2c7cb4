// File: move_engine.hpp
#pragma once
#include <stop_token>
#include <string>
#include <utility>
#include <vector>
#include "api_client.hpp"
#include "inventory_fetcher.hpp"
#include "namespace_tables.hpp"
#include "rule_file.hpp"
#include "sync_state.hpp"
#include "virtual_path.hpp"

// Persists moves, renames and deletes into the rule file and patches the live
// tables so the change is visible before the next rebuild.
class MoveEngine
{
public:
    MoveEngine(RuleFile &ruleFile,
               SyncState &sync,
               MappingTable &recorded,
               MappingTable &mapping,
               FolderTable &folders,
               InventoryFetcher &fetcher,
               APIClient &client);

    // Rewrites the rule file for one move. For a file itemKey is its mapping
    // key; for a folder it is the folder key (the job key for a job folder).
    // The caller holds moveMutex.
    void move(bool isFile, const std::string &itemKey,
              const std::string &oldLeaf, const std::string &newLeaf,
              const VirtualPath &oldDir, const VirtualPath &newDir);

    void moveFile(const TreeEntry &entry, const VirtualPath &oldDir,
                  const VirtualPath &newDir, const std::string &newLeaf);

    void moveFolder(const VirtualPath &oldParent, const std::string &oldLeaf,
                    const VirtualPath &newParent, const std::string &newLeaf);

    // Logical delete. The job is deleted remotely once all its files are trashed.
    void remove(const TreeEntry &entry, const VirtualPath &dir, std::stop_token stop);

    // Throws ReservedRootError under the root.
    VirtualPath createDir(const VirtualPath &parent, const std::string &leaf);

private:
    using Update = std::pair<std::string, std::string>;

    void moveFileLocked(const TreeEntry &entry, const VirtualPath &oldDir,
                        const VirtualPath &newDir, const std::string &newLeaf);
    std::vector<Update> folderUpdates(const std::string &folderKey, const VirtualPath &from, const VirtualPath &to) const;
    void applyUpdates(const std::vector<Update> &updates);
    void stripJobLines(const std::vector<std::string> &keys);

    RuleFile &ruleFile_;
    SyncState &sync_;
    MappingTable &recorded_;
    MappingTable &mapping_;
    FolderTable &folders_;
    InventoryFetcher &fetcher_;
    APIClient &client_;
};
