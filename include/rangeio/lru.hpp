#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace rangeio {

/**
 * @class LRUTracker
 * @brief Recency order of window keys, most recently used first.
 *
 * Not thread-safe. LruWindowCache serializes access to it.
 */
class LRUTracker {
public:
    LRUTracker() = default;

    /**
     * @brief Moves a key to the most recently used position, inserting it
     * if it is not tracked yet.
     */
    void Touch(const std::string& key);

    /**
     * @brief Stops tracking a key. Unknown keys are ignored.
     */
    void Remove(const std::string& key);

    /**
     * @brief Removes and returns the least recently used key.
     * @return The evicted key, or std::nullopt if nothing is tracked.
     */
    std::optional<std::string> Evict();

    bool Contains(const std::string& key) const;
    bool IsEmpty() const;
    std::size_t Size() const;

private:
    std::list<std::string> order_; // front = MRU, back = LRU
    std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

} // namespace rangeio
