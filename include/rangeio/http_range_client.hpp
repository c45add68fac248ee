#pragma once

#include "range_client.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace rangeio {

// RangeClient for a plain HTTP(S) URL: HEAD for the probe, GET with a Range
// header per window. Built on the AWS SDK HTTP client; no retries.
class HttpRangeClient final : public RangeClient {
public:
    explicit HttpRangeClient(const HttpClientConfig& cfg);
    ~HttpRangeClient() override;

    ProbeResponse ProbeMetadata() override;
    Bytes FetchRange(const ByteRange& range) override;
    std::string ResourceId() const override;

private:
    struct HttpRangeClientImpl;
    std::unique_ptr<HttpRangeClientImpl> p_impl;
};

} // namespace rangeio
