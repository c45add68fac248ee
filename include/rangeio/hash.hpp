#pragma once

#include "types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace rangeio {

using WindowDigest = std::array<std::uint8_t, 16>;

// Digest of (resource_id, range.start, range.end). total_length is not part
// of the identity of a window.
WindowDigest MakeWindowDigest(const std::string& resource_id, const ByteRange& range);

std::string ToHex(const WindowDigest& digest);

// Cache key for one window of one resource.
inline std::string MakeWindowKey(const std::string& resource_id, const ByteRange& range) {
    return ToHex(MakeWindowDigest(resource_id, range));
}

} // namespace rangeio
