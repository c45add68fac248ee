#include "rangeio/range_client.hpp"

#include <algorithm>
#include <cctype>

namespace rangeio {

std::string ByteRange::ToHeaderValue() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

std::string ByteRange::ToContentRange() const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" +
           std::to_string(total_length);
}

std::string ToLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> FindHeader(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(ToLowerAscii(name));
    if (it != headers.end()) {
        return it->second;
    }
    // Fall back to a scan for maps built without lower-casing.
    for (const auto& kv : headers) {
        if (ToLowerAscii(kv.first) == ToLowerAscii(name)) {
            return kv.second;
        }
    }
    return std::nullopt;
}

} // namespace rangeio
