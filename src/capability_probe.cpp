#include "rangeio/capability_probe.hpp"
#include "rangeio/errors.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

namespace rangeio {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<std::uint64_t> ParseContentLength(const std::string& value) {
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    for (char c : trimmed) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    std::uint64_t out = 0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return out;
}

std::uint64_t ProbeResourceLength(RangeClient& client) {
    ProbeResponse response = client.ProbeMetadata();

    auto accept_ranges = FindHeader(response.headers, kAcceptRangesHeader);
    if (!accept_ranges || Trim(*accept_ranges) != kBytesRangeUnit) {
        spdlog::warn("{}: Accept-Ranges is '{}', ranged reads are not possible",
                     client.ResourceId(), accept_ranges ? *accept_ranges : "<missing>");
        throw RangesNotSupportedError();
    }

    auto content_length = FindHeader(response.headers, kContentLengthHeader);
    if (!content_length) {
        throw MetadataParseError("probe response has no Content-Length header");
    }
    auto length = ParseContentLength(*content_length);
    if (!length) {
        throw MetadataParseError("unparseable Content-Length: '" + *content_length + "'");
    }

    spdlog::debug("{}: ranges supported, length {}", client.ResourceId(), *length);
    return *length;
}

} // namespace rangeio
