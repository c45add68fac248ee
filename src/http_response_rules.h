#pragma once

#include "rangeio/types.hpp"

#include <cstddef>
#include <string>

namespace rangeio {

constexpr int kStatusOk = 200;
constexpr int kStatusPartialContent = 206;

// HEAD must answer 200. Throws TransportError carrying the status otherwise.
void CheckProbeStatus(int status, const std::string& url);

// A ranged GET must answer 206, or 200 when the body is exactly the requested
// range (the server ignored Range but the range was the whole resource).
// Throws TransportError carrying the status otherwise.
void CheckRangeResponse(int status, std::size_t body_size, const ByteRange& range,
                        const std::string& url);

} // namespace rangeio
