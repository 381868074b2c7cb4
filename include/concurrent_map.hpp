#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>

// Ordered map guarded by a reader/writer lock. Each member call is atomic on
// its own; sequences of calls that must stay consistent need an outer lock.
template <typename Key, typename Value>
class ConcurrentMap
{
public:
    std::optional<Value> load(const Key &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = items_.find(key);
        if (it == items_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const Key &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return items_.find(key) != items_.end();
    }

    void store(const Key &key, Value value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        items_[key] = std::move(value);
    }

    void erase(const Key &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        items_.erase(key);
    }

    // Runs fn(value, existed) under the write lock; a missing key starts value-initialized.
    template <typename Fn>
    void update(const Key &key, Fn fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = items_.find(key);
        bool existed = it != items_.end();
        if (!existed)
            it = items_.emplace(key, Value{}).first;
        fn(it->second, existed);
    }

    // Runs fn(map) under the write lock for changes spanning several keys.
    template <typename Fn>
    void mutate(Fn fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        fn(items_);
    }

    std::map<Key, Value> snapshot() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return items_;
    }

    void replaceAll(std::map<Key, Value> contents)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        items_.swap(contents);
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        items_.clear();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<Key, Value> items_;
};
