#pragma once

#include "range_client.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rangeio {

constexpr char kAcceptRangesHeader[] = "accept-ranges";
constexpr char kContentLengthHeader[] = "content-length";
constexpr char kBytesRangeUnit[] = "bytes";

// Issues exactly one ProbeMetadata() request and returns the resource length.
// Throws RangesNotSupportedError when the response does not advertise
// "Accept-Ranges: bytes", MetadataParseError when Content-Length is missing
// or not a plain decimal number.
std::uint64_t ProbeResourceLength(RangeClient& client);

// Strict unsigned decimal parse; std::nullopt on anything else.
std::optional<std::uint64_t> ParseContentLength(const std::string& value);

} // namespace rangeio
