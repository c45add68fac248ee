#pragma once

#include "types.hpp"

#include <optional>
#include <string>

namespace rangeio {

/**
 * Transport used by a SeekableStream. Implementations report every failure
 * by throwing (TransportError for network and status failures) and do not
 * retry.
 */
class RangeClient {
public:
    virtual ~RangeClient() = default;

    // Metadata-only request (HEAD or equivalent). Header names in the
    // response must be lower-cased.
    virtual ProbeResponse ProbeMetadata() = 0;

    // Body of the inclusive span [range.start, range.end].
    virtual Bytes FetchRange(const ByteRange& range) = 0;

    // Identity of the remote resource, used to scope keys in shared caches.
    virtual std::string ResourceId() const = 0;
};

// Case-insensitive header lookup.
std::optional<std::string> FindHeader(const HeaderMap& headers, const std::string& name);

std::string ToLowerAscii(std::string s);

} // namespace rangeio
