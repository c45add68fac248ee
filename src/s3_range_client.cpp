#include "rangeio/s3_range_client.hpp"
#include "rangeio/capability_probe.hpp"
#include "rangeio/errors.hpp"
#include "rangeio/settings.hpp"
#include "aws_runtime.h"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>

#include <iterator>
#include <stdexcept>

namespace rangeio {

// PIMPL for hiding AWS SDK headers
struct S3RangeClient::S3RangeClientImpl {
    std::shared_ptr<AwsApiHandle> aws;
    std::unique_ptr<Aws::S3::S3Client> s3;
    S3ClientConfig cfg;
};

S3RangeClient::S3RangeClient(const S3ClientConfig& cfg)
    : p_impl(std::make_unique<S3RangeClientImpl>()) {
    p_impl->cfg = cfg;
    ApplyS3ConfigDefaults(p_impl->cfg);
    if (p_impl->cfg.bucket.empty() || p_impl->cfg.key.empty()) {
        throw std::invalid_argument("S3RangeClient requires a bucket and a key");
    }
    p_impl->aws = AwsApiHandle::Acquire();

    Aws::Client::ClientConfiguration aws_cfg;
    if (!p_impl->cfg.region.empty()) {
        aws_cfg.region = p_impl->cfg.region.c_str();
    }
    if (!p_impl->cfg.endpoint.empty()) {
        aws_cfg.endpointOverride = p_impl->cfg.endpoint.c_str();
    }
    aws_cfg.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(0);

    Aws::Auth::AWSCredentials creds;
    if (!p_impl->cfg.access_key_id.empty() && !p_impl->cfg.secret_access_key.empty()) {
        creds.SetAWSAccessKeyId(p_impl->cfg.access_key_id.c_str());
        creds.SetAWSSecretKey(p_impl->cfg.secret_access_key.c_str());
    }

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    bool useVirtualAddressing = !p_impl->cfg.use_path_style;

    p_impl->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);
}

S3RangeClient::~S3RangeClient() {
    p_impl->s3.reset();
}

ProbeResponse S3RangeClient::ProbeMetadata() {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(p_impl->cfg.bucket.c_str());
    request.SetKey(p_impl->cfg.key.c_str());

    auto outcome = p_impl->s3->HeadObject(request);
    if (!outcome.IsSuccess()) {
        const auto& err = outcome.GetError();
        throw TransportError(ResourceId() + ": HeadObject failed: " + err.GetMessage().c_str(),
                             static_cast<int>(err.GetResponseCode()));
    }

    const auto& result = outcome.GetResult();
    ProbeResponse out;
    out.status = 200;
    if (!result.GetAcceptRanges().empty()) {
        out.headers[kAcceptRangesHeader] = result.GetAcceptRanges().c_str();
    }
    out.headers[kContentLengthHeader] = std::to_string(result.GetContentLength());
    return out;
}

Bytes S3RangeClient::FetchRange(const ByteRange& range) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(p_impl->cfg.bucket.c_str());
    request.SetKey(p_impl->cfg.key.c_str());
    request.SetRange(range.ToHeaderValue().c_str());

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& err = outcome.GetError();
        throw TransportError(ResourceId() + ": GetObject " + range.ToHeaderValue() + " failed: " +
                                 err.GetMessage().c_str(),
                             static_cast<int>(err.GetResponseCode()));
    }

    auto& body = outcome.GetResult().GetBody();
    return Bytes((std::istreambuf_iterator<char>(body)), std::istreambuf_iterator<char>());
}

std::string S3RangeClient::ResourceId() const {
    return "s3://" + p_impl->cfg.bucket + "/" + p_impl->cfg.key;
}

} // namespace rangeio
