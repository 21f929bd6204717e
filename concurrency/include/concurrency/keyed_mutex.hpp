/**
 * KeyedMutex - one exclusive lock per key, created on demand
 *
 * Callers that use different keys never block each other; callers that use the
 * same key are fully serialized. Each key maps to an Entry (mutex + reference
 * count) that lives only while somebody holds or waits for that key. Entries
 * whose count drops to zero go back to a bounded free list and are reused for
 * the next key, so steady-state allocation stays flat under key churn.
 *
 * The table mutex (mu_) guards the map and the free list only. It is never held
 * while a caller blocks on an entry mutex, so a slow critical section on one key
 * cannot delay bookkeeping for another.
 *
 * Usage Pattern:
 *   concurrency::KeyedMutex<std::string> locks;
 *   auto r = locks.WithLock(path, [&] { return WriteFile(path); });
 *
 * Unlock must come from the thread that took the lock. Unlocking a key that is
 * not locked throws std::logic_error: it is a bug in the caller, not a runtime
 * condition.
 */
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace concurrency {

template <typename Key, typename Hash = std::hash<Key>>
class KeyedMutex {
public:
    static constexpr std::size_t kDefaultMaxPooled = 64;

    explicit KeyedMutex(std::size_t max_pooled = kDefaultMaxPooled)
        : max_pooled_(max_pooled) {}

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    void Lock(const Key& key) {
        Entry* entry = nullptr;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                entry = it->second.get();
                ++entry->refs;
            } else {
                auto fresh = TakeFromPool_();
                fresh->refs = 1;
                entry = fresh.get();
                entries_.emplace(key, std::move(fresh));
            }
        }
        // entry stays alive: our reference keeps it in the map
        entry->mu.lock();
    }

    // Never blocks. Returns false if another holder owns the key.
    bool TryLock(const Key& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            auto fresh = TakeFromPool_();
            fresh->refs = 1;
            Entry* entry = fresh.get();
            entries_.emplace(key, std::move(fresh));
            // mu_ is still held, so nobody can reach the new entry before we own it
            entry->mu.lock();
            return true;
        }
        Entry& entry = *it->second;
        if (!entry.mu.try_lock()) {
            return false;
        }
        ++entry.refs;
        return true;
    }

    void Unlock(const Key& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw std::logic_error("KeyedMutex: unlock of a key that is not locked");
        }
        Entry& entry = *it->second;
        entry.mu.unlock();
        if (--entry.refs == 0) {
            ReturnToPool_(std::move(it->second));
            entries_.erase(it);
        }
    }

    // Runs fn() while holding the key and returns whatever fn returns.
    template <typename Fn>
    auto WithLock(const Key& key, Fn&& fn) -> decltype(std::forward<Fn>(fn)()) {
        Lock(key);
        ScopedUnlock release{*this, key};
        return std::forward<Fn>(fn)();
    }

    // Keys currently held or waited on
    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.size();
    }

    // Released entries waiting for reuse
    std::size_t pooled() const {
        std::lock_guard<std::mutex> lk(mu_);
        return pool_.size();
    }

private:
    struct Entry {
        std::mutex mu;
        int refs{0};
    };

    struct ScopedUnlock {
        KeyedMutex& owner;
        const Key& key;
        ~ScopedUnlock() { owner.Unlock(key); }
    };

    // mu_ must be held
    std::unique_ptr<Entry> TakeFromPool_() {
        if (pool_.empty()) {
            return std::make_unique<Entry>();
        }
        auto e = std::move(pool_.back());
        pool_.pop_back();
        return e;
    }

    // mu_ must be held; entry is unlocked with refs == 0
    void ReturnToPool_(std::unique_ptr<Entry> e) {
        if (pool_.size() < max_pooled_) {
            pool_.push_back(std::move(e));
        }
    }

    const std::size_t max_pooled_;
    mutable std::mutex mu_;
    std::unordered_map<Key, std::unique_ptr<Entry>, Hash> entries_;
    std::vector<std::unique_ptr<Entry>> pool_;
};

} // namespace concurrency
