#include "rangeio/hash.hpp"

#include <xxhash.h>

#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rangeio {

namespace {

constexpr std::uint8_t kKeyVersion = 1;

// Helper to append little-endian data to a vector
template <typename T>
void append_le(std::vector<std::uint8_t>& buf, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

} // namespace

WindowDigest MakeWindowDigest(const std::string& resource_id, const ByteRange& range) {
    if (resource_id.length() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("Resource id is too long.");
    }

    std::vector<std::uint8_t> buf;
    buf.reserve(1 + sizeof(std::uint32_t) + resource_id.length() + 2 * sizeof(std::uint64_t));

    // 1. Version
    buf.push_back(kKeyVersion);

    // 2. Resource id, length-prefixed so "ab"+"c" and "a"+"bc" differ
    append_le(buf, static_cast<std::uint32_t>(resource_id.length()));
    buf.insert(buf.end(), resource_id.begin(), resource_id.end());

    // 3. Inclusive range
    append_le(buf, range.start);
    append_le(buf, range.end);

    XXH128_hash_t hash = XXH3_128bits(buf.data(), buf.size());

    WindowDigest digest;
    std::memcpy(digest.data(), &hash, sizeof(hash));
    return digest;
}

std::string ToHex(const WindowDigest& digest) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : digest) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace rangeio
