#pragma once

#include "lru.hpp"
#include "types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rangeio {

/**
 * Bounded key -> window buffer store. Implementations own their eviction
 * policy; callers only rely on Get/Put and the entry bound. An instance
 * shared between streams must be safe for concurrent Get/Put.
 */
class WindowCache {
public:
    virtual ~WindowCache() = default;

    // Returns nullptr on a miss.
    virtual WindowBuffer Get(const std::string& key) = 0;
    virtual void Put(const std::string& key, WindowBuffer data) = 0;

    virtual std::size_t MaxEntries() const = 0;
    virtual std::size_t Size() const = 0;
};

// Least-recently-used WindowCache. Get refreshes recency; Put evicts from the
// LRU end once MaxEntries() is exceeded. Internally synchronized.
class LruWindowCache final : public WindowCache {
public:
    explicit LruWindowCache(std::size_t max_entries);

    WindowBuffer Get(const std::string& key) override;
    void Put(const std::string& key, WindowBuffer data) override;

    std::size_t MaxEntries() const override { return max_entries_; }
    std::size_t Size() const override;

    // Number of entries dropped to stay within MaxEntries().
    std::size_t Evictions() const;

private:
    const std::size_t max_entries_;

    mutable std::mutex mutex_;
    LRUTracker lru_;
    std::unordered_map<std::string, WindowBuffer> entries_;
    std::size_t evictions_ = 0;
};

} // namespace rangeio
