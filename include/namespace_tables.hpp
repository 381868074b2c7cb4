#pragma once
#include <map>
#include <string>
#include <vector>
#include "api_types.hpp"
#include "concurrent_map.hpp"
#include "virtual_path.hpp"

// Mapping key -> destination path ("/folder/" or "/folder/leaf").
using MappingTable = ConcurrentMap<std::string, std::string>;

// Folder path -> children, in insertion order, unique by name.
class FolderTable
{
public:
    // Empty for an unknown folder.
    std::vector<TreeEntry> children(const VirtualPath &folder) const;
    bool contains(const VirtualPath &folder) const;

    // First write wins: returns false when a child with the same name exists.
    bool insertUnique(const VirtualPath &folder, const TreeEntry &entry);

    // Adds the folder key with no children when it is missing.
    void ensureFolder(const VirtualPath &folder);

    // Links every segment of folder into its parent, creating the parents as needed.
    // The folder itself only gets a key once something is inserted into it.
    void ensurePath(const VirtualPath &folder);

    // Re-keys from and every folder below it to to, and moves the folder entry
    // from its old parent into the new one.
    void renameFolder(const VirtualPath &from, const VirtualPath &to);

    bool removeEntry(const VirtualPath &folder, const std::string &entryId);

    // Applies fn to the child with the given id. Returns false when not found.
    template <typename Fn>
    bool updateEntry(const VirtualPath &folder, const std::string &entryId, Fn fn)
    {
        bool found = false;
        if (!folders_.contains(folder.str()))
            return false;
        folders_.update(folder.str(), [&](std::vector<TreeEntry> &entries, bool)
                        {
            for (auto &entry : entries)
            {
                if (entry.id == entryId)
                {
                    fn(entry);
                    found = true;
                    break;
                }
            } });
        return found;
    }

    std::map<std::string, std::vector<TreeEntry>> snapshot() const { return folders_.snapshot(); }
    void replaceAll(std::map<std::string, std::vector<TreeEntry>> contents) { folders_.replaceAll(std::move(contents)); }
    void clear() { folders_.clear(); }
    size_t size() const { return folders_.size(); }

private:
    ConcurrentMap<std::string, std::vector<TreeEntry>> folders_;
};
