#include "rangeio/window_cache.hpp"

#include <stdexcept>

namespace rangeio {

LruWindowCache::LruWindowCache(std::size_t max_entries) : max_entries_(max_entries) {
    if (max_entries_ == 0) {
        throw std::invalid_argument("LruWindowCache needs room for at least one entry");
    }
}

WindowBuffer LruWindowCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    lru_.Touch(key);
    return it->second;
}

void LruWindowCache::Put(const std::string& key, WindowBuffer data) {
    if (!data) {
        throw std::invalid_argument("LruWindowCache::Put with a null buffer");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(data);
    lru_.Touch(key);

    while (lru_.Size() > max_entries_) {
        auto victim = lru_.Evict();
        if (!victim) {
            break;
        }
        entries_.erase(*victim);
        ++evictions_;
    }
}

std::size_t LruWindowCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t LruWindowCache::Evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

} // namespace rangeio
