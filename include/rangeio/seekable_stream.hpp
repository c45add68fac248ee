#pragma once

#include "range_client.hpp"
#include "span_compat.hpp"
#include "types.hpp"
#include "window_cache.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace rangeio {

class SeekableStreamImpl;

/**
 * Random-access reader over a remote resource, fetched one window at a time
 * with ranged requests.
 *
 * Not thread-safe: one stream belongs to one caller. A WindowCache passed in
 * may be shared by any number of streams.
 */
class SeekableStream {
public:
    // Probes the client for range support and the resource length.
    // Throws RangesNotSupportedError or MetadataParseError.
    explicit SeekableStream(std::shared_ptr<RangeClient> client,
                            const StreamOptions& options = {},
                            std::shared_ptr<WindowCache> shared_cache = nullptr);

    // Length already known, no probe request is sent.
    SeekableStream(std::shared_ptr<RangeClient> client,
                   std::uint64_t length,
                   const StreamOptions& options = {},
                   std::shared_ptr<WindowCache> shared_cache = nullptr);

    ~SeekableStream();

    // Next byte, or std::nullopt at end of stream.
    std::optional<std::uint8_t> ReadByte();

    // Copies up to `length` bytes into buffer[offset...] without crossing a
    // window boundary. Returns the count copied, or kEndOfStream.
    std::int64_t ReadInto(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length);

    // Fills buffer[offset, offset + length) exactly, looping over windows.
    // Throws EndOfStreamError if the resource ends first.
    void ReadFully(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length);

    // Moves the cursor forward by up to n bytes; returns the distance moved.
    std::int64_t SkipBytes(std::int64_t n);

    // Cursor-only; the window is reloaded by the next read if needed.
    // Positions past the end clamp to Length().
    void Seek(std::int64_t position);

    std::int64_t Tell() const;
    std::uint64_t Length() const;
    std::uint32_t WindowSize() const;
    std::size_t MaxCacheEntries() const;
    FetchStats Stats() const;

    // Releases the window buffer, the client and the cache. Idempotent.
    void Close();
    bool IsClosed() const;

private:
    std::unique_ptr<SeekableStreamImpl> p_impl;

    SeekableStream(const SeekableStream&) = delete;
    SeekableStream& operator=(const SeekableStream&) = delete;
};

} // namespace rangeio
