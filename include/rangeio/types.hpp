#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rangeio {

using Bytes = std::vector<std::uint8_t>;
using WindowBuffer = std::shared_ptr<const Bytes>;

// Lower-cased header name -> value.
using HeaderMap = std::map<std::string, std::string>;

constexpr std::uint32_t kDefaultWindowSize = 1u << 19; // 512 KiB
constexpr std::int64_t kNoWindow = -1;
constexpr std::int64_t kEndOfStream = -1;

struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;          // inclusive
    std::uint64_t total_length = 0; // resource length when the range was made

    std::uint64_t Length() const { return end - start + 1; }

    // "bytes=start-end", the value of a Range request header.
    std::string ToHeaderValue() const;
    // "bytes start-end/total", Content-Range form, used in log lines.
    std::string ToContentRange() const;
};

inline bool operator==(const ByteRange& a, const ByteRange& b) {
    return a.start == b.start && a.end == b.end;
}
inline bool operator!=(const ByteRange& a, const ByteRange& b) { return !(a == b); }

struct Window {
    std::int64_t index = kNoWindow;
    WindowBuffer data;
};

struct Cursor {
    std::int64_t position = 0;
    std::int64_t buffer_offset = 0;
};

struct ProbeResponse {
    int status = 0;
    HeaderMap headers;
};

struct FetchStats {
    std::uint64_t downloads = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t bytes_downloaded = 0;
};

struct StreamOptions {
    std::uint32_t window_size = kDefaultWindowSize;
    std::uint64_t max_cache_bytes = 0; // 0 disables the per-stream cache
};

struct HttpClientConfig {
    std::string url;
    long connect_timeout_ms = 0; // 0 keeps the SDK default
    long request_timeout_ms = 0;
    bool verify_tls = true;
    std::string user_agent = "rangeio/1.0";
    HeaderMap extra_headers;
};

struct S3ClientConfig {
    std::string bucket;
    std::string key;

    std::string endpoint;
    std::string region;
    std::string access_key_id;
    std::string secret_access_key;
    bool use_path_style = true;
};

} // namespace rangeio
