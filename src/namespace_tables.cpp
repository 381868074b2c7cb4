#include "namespace_tables.hpp"
#include <algorithm>

std::vector<TreeEntry> FolderTable::children(const VirtualPath &folder) const
{
    auto entries = folders_.load(folder.str());
    if (!entries)
        return {};
    return *entries;
}

bool FolderTable::contains(const VirtualPath &folder) const
{
    return folders_.contains(folder.str());
}

bool FolderTable::insertUnique(const VirtualPath &folder, const TreeEntry &entry)
{
    bool inserted = false;
    folders_.update(folder.str(), [&](std::vector<TreeEntry> &entries, bool)
                    {
        auto sameName = std::find_if(entries.begin(), entries.end(), [&](const TreeEntry &existing)
                                     { return existing.name == entry.name; });
        if (sameName == entries.end())
        {
            entries.push_back(entry);
            inserted = true;
        } });
    return inserted;
}

void FolderTable::ensureFolder(const VirtualPath &folder)
{
    folders_.update(folder.str(), [](std::vector<TreeEntry> &, bool) {});
}

bool FolderTable::removeEntry(const VirtualPath &folder, const std::string &entryId)
{
    bool removed = false;
    if (!folders_.contains(folder.str()))
        return false;

    folders_.update(folder.str(), [&](std::vector<TreeEntry> &entries, bool)
                    {
        auto it = std::remove_if(entries.begin(), entries.end(), [&](const TreeEntry &existing)
                                 { return existing.id == entryId; });
        removed = it != entries.end();
        entries.erase(it, entries.end()); });
    return removed;
}

void FolderTable::ensurePath(const VirtualPath &folder)
{
    VirtualPath current = VirtualPath::Root();
    for (const auto &segment : folder.segments())
    {
        VirtualPath next = current.child(segment);

        TreeEntry entry;
        entry.type = EntryType::Folder;
        entry.name = segment;
        entry.id = next.str();
        insertUnique(current, entry);

        current = next;
    }
}

void FolderTable::renameFolder(const VirtualPath &from, const VirtualPath &to)
{
    if (from.isRoot() || from == to)
        return;

    folders_.mutate([&](std::map<std::string, std::vector<TreeEntry>> &folders)
                    {
        std::map<std::string, std::vector<TreeEntry>> moved;
        for (auto it = folders.begin(); it != folders.end();)
        {
            if (from.isPrefixOf(it->first))
            {
                std::string newKey = to.str() + it->first.substr(from.str().size());
                for (auto &child : it->second)
                {
                    if (child.isFolder() && from.isPrefixOf(child.id))
                        child.id = to.str() + child.id.substr(from.str().size());
                }
                moved[newKey] = std::move(it->second);
                it = folders.erase(it);
            }
            else
            {
                ++it;
            }
        }
        for (auto &[key, children] : moved)
        {
            auto &target = folders[key];
            for (auto &child : children)
            {
                bool duplicate = std::any_of(target.begin(), target.end(), [&](const TreeEntry &existing)
                                             { return existing.name == child.name; });
                if (!duplicate)
                    target.push_back(std::move(child));
            }
        }

        auto oldParent = folders.find(from.parent().str());
        if (oldParent != folders.end())
        {
            auto &siblings = oldParent->second;
            siblings.erase(std::remove_if(siblings.begin(), siblings.end(), [&](const TreeEntry &existing)
                                          { return existing.isFolder() && existing.id == from.str(); }),
                           siblings.end());
        } });

    ensurePath(to);
}
