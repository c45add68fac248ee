#pragma once

#include "range_client.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace rangeio {

// RangeClient for one object in an S3-compatible store: HeadObject for the
// probe, GetObject with a Range per window. SDK retries are disabled.
class S3RangeClient final : public RangeClient {
public:
    explicit S3RangeClient(const S3ClientConfig& cfg);
    ~S3RangeClient() override;

    ProbeResponse ProbeMetadata() override;
    Bytes FetchRange(const ByteRange& range) override;
    std::string ResourceId() const override;

private:
    struct S3RangeClientImpl;
    std::unique_ptr<S3RangeClientImpl> p_impl;
};

} // namespace rangeio
