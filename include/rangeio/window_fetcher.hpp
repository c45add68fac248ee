#pragma once

#include "range_client.hpp"
#include "types.hpp"
#include "window_cache.hpp"

#include <cstdint>
#include <memory>

namespace rangeio {

/**
 * Maps stream offsets onto fixed-size windows of the remote resource and
 * keeps the one window a stream is currently reading from.
 *
 * Windows partition [0, length): window i covers
 * [i * window_size, min((i + 1) * window_size, length) - 1].
 */
class WindowFetcher {
public:
    // cache may be null (caching disabled).
    WindowFetcher(std::shared_ptr<RangeClient> client,
                  std::uint64_t length,
                  std::uint32_t window_size,
                  std::shared_ptr<WindowCache> cache);

    std::int64_t WindowIndex(std::int64_t position) const;
    ByteRange RangeFor(std::int64_t window_index) const;
    std::int64_t WindowCount() const;

    // Resolves one window through the cache, then the client. Exactly one
    // client request on a miss; failures propagate.
    WindowBuffer Fetch(const ByteRange& range);

    // Loads the window holding cursor.position if it is not the loaded one,
    // then realigns cursor.buffer_offset. Leaves both untouched on failure.
    void PrepareWindow(Cursor& cursor);

    const Window& Loaded() const { return window_; }
    const FetchStats& Stats() const { return stats_; }

    std::uint64_t Length() const { return length_; }
    std::uint32_t WindowSize() const { return window_size_; }
    const std::shared_ptr<WindowCache>& Cache() const { return cache_; }

    // Drops the loaded window and the client and cache references.
    void Release();

private:
    Bytes Download(const ByteRange& range);

    std::shared_ptr<RangeClient> client_;
    std::shared_ptr<WindowCache> cache_;
    std::string resource_id_;
    const std::uint64_t length_;
    const std::uint32_t window_size_;

    Window window_;
    FetchStats stats_;
};

} // namespace rangeio
