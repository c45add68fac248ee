#include "rangeio/window_fetcher.hpp"
#include "rangeio/errors.hpp"
#include "rangeio/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rangeio {

WindowFetcher::WindowFetcher(std::shared_ptr<RangeClient> client,
                             std::uint64_t length,
                             std::uint32_t window_size,
                             std::shared_ptr<WindowCache> cache)
    : client_(std::move(client)),
      cache_(std::move(cache)),
      length_(length),
      window_size_(window_size) {
    if (!client_) {
        throw std::invalid_argument("WindowFetcher requires a client");
    }
    if (window_size_ == 0) {
        throw std::invalid_argument("window size must be positive");
    }
    resource_id_ = client_->ResourceId();
}

std::int64_t WindowFetcher::WindowIndex(std::int64_t position) const {
    return position / static_cast<std::int64_t>(window_size_);
}

ByteRange WindowFetcher::RangeFor(std::int64_t window_index) const {
    if (window_index < 0 || window_index >= WindowCount()) {
        throw std::out_of_range("window index " + std::to_string(window_index) +
                                " outside resource of length " + std::to_string(length_));
    }
    ByteRange range;
    range.start = static_cast<std::uint64_t>(window_index) * window_size_;
    range.end = std::min<std::uint64_t>(range.start + window_size_, length_) - 1;
    range.total_length = length_;
    return range;
}

std::int64_t WindowFetcher::WindowCount() const {
    return static_cast<std::int64_t>((length_ + window_size_ - 1) / window_size_);
}

Bytes WindowFetcher::Download(const ByteRange& range) {
    spdlog::trace("{}: downloading {}", resource_id_, range.ToContentRange());
    Bytes body = client_->FetchRange(range);

    stats_.downloads++;
    stats_.bytes_downloaded += body.size();

    if (body.size() != range.Length()) {
        throw TransportError("expected " + std::to_string(range.Length()) + " bytes for " +
                             range.ToContentRange() + ", got " + std::to_string(body.size()));
    }
    return body;
}

WindowBuffer WindowFetcher::Fetch(const ByteRange& range) {
    if (!client_) {
        throw StreamClosedError();
    }

    std::string key;
    if (cache_) {
        key = MakeWindowKey(resource_id_, range);
        if (WindowBuffer hit = cache_->Get(key)) {
            spdlog::trace("{}: cache hit for {}", resource_id_, range.ToContentRange());
            stats_.cache_hits++;
            return hit;
        }
    }

    auto data = std::make_shared<const Bytes>(Download(range));
    if (cache_) {
        cache_->Put(key, data);
    }
    return data;
}

void WindowFetcher::PrepareWindow(Cursor& cursor) {
    const std::int64_t index = WindowIndex(cursor.position);
    if (index == window_.index && window_.data) {
        return;
    }

    WindowBuffer data = Fetch(RangeFor(index));

    window_.data = std::move(data);
    window_.index = index;
    cursor.buffer_offset = cursor.position % static_cast<std::int64_t>(window_size_);
}

void WindowFetcher::Release() {
    window_ = Window{};
    client_.reset();
    cache_.reset();
}

} // namespace rangeio
