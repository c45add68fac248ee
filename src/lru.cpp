#include "rangeio/lru.hpp"

#include <utility>

namespace rangeio {

void LRUTracker::Touch(const std::string& key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        order_.splice(order_.begin(), order_, it->second);
        return;
    }
    order_.push_front(key);
    index_.emplace(key, order_.begin());
}

void LRUTracker::Remove(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return;
    }
    order_.erase(it->second);
    index_.erase(it);
}

std::optional<std::string> LRUTracker::Evict() {
    if (order_.empty()) {
        return std::nullopt;
    }
    std::string victim = std::move(order_.back());
    order_.pop_back();
    index_.erase(victim);
    return victim;
}

bool LRUTracker::Contains(const std::string& key) const {
    return index_.count(key) != 0;
}

bool LRUTracker::IsEmpty() const {
    return index_.empty();
}

std::size_t LRUTracker::Size() const {
    return index_.size();
}

} // namespace rangeio
