#include "rangeio/seekable_stream.hpp"
#include "rangeio/capability_probe.hpp"
#include "rangeio/errors.hpp"
#include "rangeio/window_fetcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace rangeio {

namespace {

constexpr double kMegabyte = 1024.0 * 1024.0;

std::shared_ptr<WindowCache> MakeCache(const StreamOptions& options,
                                       std::shared_ptr<WindowCache> shared_cache) {
    if (shared_cache) {
        return shared_cache;
    }
    if (options.window_size == 0) {
        return nullptr; // rejected by WindowFetcher
    }
    const std::uint64_t entries = options.max_cache_bytes / options.window_size;
    if (entries == 0) {
        if (options.max_cache_bytes > 0) {
            spdlog::warn("cache budget of {} bytes is below one window ({} bytes), caching disabled",
                         options.max_cache_bytes, options.window_size);
        }
        return nullptr;
    }
    return std::make_shared<LruWindowCache>(static_cast<std::size_t>(entries));
}

std::shared_ptr<RangeClient> RequireClient(std::shared_ptr<RangeClient> client) {
    if (!client) {
        throw std::invalid_argument("SeekableStream requires a client");
    }
    return client;
}

} // namespace

class SeekableStreamImpl {
public:
    SeekableStreamImpl(std::shared_ptr<RangeClient> client,
                       std::uint64_t length,
                       const StreamOptions& options,
                       std::shared_ptr<WindowCache> shared_cache)
        : fetcher_(std::move(client), length, options.window_size,
                   MakeCache(options, std::move(shared_cache))) {
        max_cache_entries_ = fetcher_.Cache() ? fetcher_.Cache()->MaxEntries() : 0;
    }

    std::optional<std::uint8_t> ReadByte();
    std::int64_t ReadInto(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length);
    void ReadFully(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length);
    std::int64_t SkipBytes(std::int64_t n);
    void Seek(std::int64_t position);
    void Close();

    std::int64_t Tell() const { return cursor_.position; }
    std::uint64_t Length() const { return fetcher_.Length(); }
    std::uint32_t WindowSize() const { return fetcher_.WindowSize(); }
    std::size_t MaxCacheEntries() const { return max_cache_entries_; }
    FetchStats Stats() const { return fetcher_.Stats(); }
    bool IsClosed() const { return closed_; }

private:
    void EnsureOpen() const {
        if (closed_) {
            throw StreamClosedError();
        }
    }

    std::int64_t SignedLength() const { return static_cast<std::int64_t>(fetcher_.Length()); }

    static void CheckBounds(const mutable_bytes_view& buffer, std::int64_t offset,
                            std::int64_t length);

    WindowFetcher fetcher_;
    Cursor cursor_;
    std::size_t max_cache_entries_ = 0;
    bool closed_ = false;
};

void SeekableStreamImpl::CheckBounds(const mutable_bytes_view& buffer, std::int64_t offset,
                                     std::int64_t length) {
    if (offset < 0) {
        throw BoundsError("negative offset");
    }
    if (length < 0) {
        throw BoundsError("negative length");
    }
    if (static_cast<std::uint64_t>(offset) + static_cast<std::uint64_t>(length) > buffer.size()) {
        throw BoundsError("offset + length > buffer length");
    }
}

std::optional<std::uint8_t> SeekableStreamImpl::ReadByte() {
    EnsureOpen();
    if (cursor_.position >= SignedLength()) {
        return std::nullopt;
    }
    fetcher_.PrepareWindow(cursor_);

    const std::uint8_t b = (*fetcher_.Loaded().data)[static_cast<std::size_t>(cursor_.buffer_offset)];
    cursor_.buffer_offset++;
    cursor_.position++;
    return b;
}

std::int64_t SeekableStreamImpl::ReadInto(mutable_bytes_view buffer, std::int64_t offset,
                                          std::int64_t length) {
    EnsureOpen();
    CheckBounds(buffer, offset, length);

    if (cursor_.position >= SignedLength()) {
        return kEndOfStream;
    }
    length = std::min(length, SignedLength() - cursor_.position);
    if (length == 0) {
        return 0;
    }

    fetcher_.PrepareWindow(cursor_);

    const Bytes& window = *fetcher_.Loaded().data;
    const std::int64_t available = static_cast<std::int64_t>(window.size()) - cursor_.buffer_offset;
    const std::int64_t filled = std::min(length, available);

    std::memcpy(buffer.data() + offset, window.data() + cursor_.buffer_offset,
                static_cast<std::size_t>(filled));

    cursor_.buffer_offset += filled;
    cursor_.position += filled;
    return filled;
}

void SeekableStreamImpl::ReadFully(mutable_bytes_view buffer, std::int64_t offset,
                                   std::int64_t length) {
    EnsureOpen();
    CheckBounds(buffer, offset, length);

    while (length > 0) {
        const std::int64_t n = ReadInto(buffer, offset, length);
        if (n == kEndOfStream) {
            throw EndOfStreamError("end of stream with " + std::to_string(length) +
                                   " bytes still requested");
        }
        offset += n;
        length -= n;
    }
}

std::int64_t SeekableStreamImpl::SkipBytes(std::int64_t n) {
    EnsureOpen();
    if (n < 0) {
        throw BoundsError("negative skip");
    }
    const std::int64_t moved = std::min(n, SignedLength() - cursor_.position);
    Seek(cursor_.position + moved);
    return moved;
}

void SeekableStreamImpl::Seek(std::int64_t position) {
    EnsureOpen();
    if (position < 0) {
        throw BoundsError("negative position");
    }
    // Past the end is not an error; the next read reports end of stream.
    position = std::min(position, SignedLength());
    cursor_.position = position;
    cursor_.buffer_offset = position % static_cast<std::int64_t>(fetcher_.WindowSize());
}

void SeekableStreamImpl::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    const FetchStats& stats = fetcher_.Stats();
    spdlog::debug("close(): {} windows fetched ({:.2f}MB of {:.2f}MB); {} cache hits",
                  stats.downloads, stats.bytes_downloaded / kMegabyte,
                  fetcher_.Length() / kMegabyte, stats.cache_hits);

    fetcher_.Release();
}

// --- SeekableStream Public API (forwarding to PIMPL) ---

SeekableStream::SeekableStream(std::shared_ptr<RangeClient> client,
                               const StreamOptions& options,
                               std::shared_ptr<WindowCache> shared_cache) {
    client = RequireClient(std::move(client));
    if (options.window_size == 0) {
        throw std::invalid_argument("window size must be positive");
    }
    const std::uint64_t length = ProbeResourceLength(*client);
    p_impl = std::make_unique<SeekableStreamImpl>(std::move(client), length, options,
                                                  std::move(shared_cache));
}

SeekableStream::SeekableStream(std::shared_ptr<RangeClient> client,
                               std::uint64_t length,
                               const StreamOptions& options,
                               std::shared_ptr<WindowCache> shared_cache)
    : p_impl(std::make_unique<SeekableStreamImpl>(RequireClient(std::move(client)), length,
                                                  options, std::move(shared_cache))) {}

SeekableStream::~SeekableStream() {
    if (p_impl) {
        p_impl->Close();
    }
}

std::optional<std::uint8_t> SeekableStream::ReadByte() { return p_impl->ReadByte(); }
std::int64_t SeekableStream::ReadInto(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length) {
    return p_impl->ReadInto(buffer, offset, length);
}
void SeekableStream::ReadFully(mutable_bytes_view buffer, std::int64_t offset, std::int64_t length) {
    p_impl->ReadFully(buffer, offset, length);
}
std::int64_t SeekableStream::SkipBytes(std::int64_t n) { return p_impl->SkipBytes(n); }
void SeekableStream::Seek(std::int64_t position) { p_impl->Seek(position); }
std::int64_t SeekableStream::Tell() const { return p_impl->Tell(); }
std::uint64_t SeekableStream::Length() const { return p_impl->Length(); }
std::uint32_t SeekableStream::WindowSize() const { return p_impl->WindowSize(); }
std::size_t SeekableStream::MaxCacheEntries() const { return p_impl->MaxCacheEntries(); }
FetchStats SeekableStream::Stats() const { return p_impl->Stats(); }
void SeekableStream::Close() { p_impl->Close(); }
bool SeekableStream::IsClosed() const { return p_impl->IsClosed(); }

} // namespace rangeio
