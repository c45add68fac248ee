#include "rangeio/http_range_client.hpp"
#include "rangeio/errors.hpp"
#include "rangeio/settings.hpp"
#include "aws_runtime.h"
#include "http_response_rules.h"

#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpClient.h>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/URI.h>
#include <aws/core/utils/stream/ResponseStream.h>

#include <spdlog/spdlog.h>

#include <iterator>
#include <stdexcept>
#include <string>

namespace rangeio {

void CheckProbeStatus(int status, const std::string& url) {
    if (status != kStatusOk) {
        throw TransportError(url + ": HEAD returned " + std::to_string(status), status);
    }
}

void CheckRangeResponse(int status, std::size_t body_size, const ByteRange& range,
                        const std::string& url) {
    if (status != kStatusPartialContent && status != kStatusOk) {
        throw TransportError(url + ": GET " + range.ToHeaderValue() + " returned " +
                             std::to_string(status), status);
    }
    if (status == kStatusOk && body_size != range.Length()) {
        throw TransportError(url + ": server ignored " + range.ToHeaderValue() + ", sent " +
                             std::to_string(body_size) + " bytes", status);
    }
}

// PIMPL for hiding AWS SDK headers
struct HttpRangeClient::HttpRangeClientImpl {
    std::shared_ptr<AwsApiHandle> aws;
    std::shared_ptr<Aws::Http::HttpClient> http;
    HttpClientConfig cfg;

    std::shared_ptr<Aws::Http::HttpResponse> Send(Aws::Http::HttpMethod method,
                                                  const std::string* range_header) const;
};

std::shared_ptr<Aws::Http::HttpResponse> HttpRangeClient::HttpRangeClientImpl::Send(
    Aws::Http::HttpMethod method, const std::string* range_header) const {
    auto request = Aws::Http::CreateHttpRequest(Aws::String(cfg.url.c_str()), method,
                                                Aws::Utils::Stream::DefaultResponseStreamFactoryMethod);
    request->SetUserAgent(cfg.user_agent.c_str());
    for (const auto& kv : cfg.extra_headers) {
        request->SetHeaderValue(kv.first.c_str(), kv.second.c_str());
    }
    if (range_header) {
        request->SetHeaderValue("Range", range_header->c_str());
    }

    auto response = http->MakeRequest(request);
    if (!response) {
        throw TransportError(cfg.url + ": no response");
    }
    if (response->HasClientError()) {
        throw TransportError(cfg.url + ": " + std::string(response->GetClientErrorMessage().c_str()));
    }
    return response;
}

HttpRangeClient::HttpRangeClient(const HttpClientConfig& cfg)
    : p_impl(std::make_unique<HttpRangeClientImpl>()) {
    if (cfg.url.empty()) {
        throw std::invalid_argument("HttpRangeClient requires a URL");
    }
    p_impl->cfg = cfg;
    ApplyHttpConfigDefaults(p_impl->cfg);
    p_impl->aws = AwsApiHandle::Acquire();

    Aws::Client::ClientConfiguration aws_cfg;
    if (p_impl->cfg.connect_timeout_ms > 0) {
        aws_cfg.connectTimeoutMs = p_impl->cfg.connect_timeout_ms;
    }
    if (p_impl->cfg.request_timeout_ms > 0) {
        aws_cfg.requestTimeoutMs = p_impl->cfg.request_timeout_ms;
    }
    aws_cfg.verifySSL = p_impl->cfg.verify_tls;
    aws_cfg.userAgent = p_impl->cfg.user_agent.c_str();

    p_impl->http = Aws::Http::CreateHttpClient(aws_cfg);
}

HttpRangeClient::~HttpRangeClient() {
    // The HTTP client must go before the SDK is shut down.
    p_impl->http.reset();
}

ProbeResponse HttpRangeClient::ProbeMetadata() {
    auto response = p_impl->Send(Aws::Http::HttpMethod::HTTP_HEAD, nullptr);

    ProbeResponse out;
    out.status = static_cast<int>(response->GetResponseCode());
    CheckProbeStatus(out.status, p_impl->cfg.url);
    for (const auto& kv : response->GetHeaders()) {
        out.headers[ToLowerAscii(kv.first.c_str())] = kv.second.c_str();
    }
    return out;
}

Bytes HttpRangeClient::FetchRange(const ByteRange& range) {
    const std::string header = range.ToHeaderValue();
    auto response = p_impl->Send(Aws::Http::HttpMethod::HTTP_GET, &header);

    const int status = static_cast<int>(response->GetResponseCode());
    // Fail before draining an error body.
    if (status != kStatusPartialContent && status != kStatusOk) {
        CheckRangeResponse(status, 0, range, p_impl->cfg.url);
    }

    auto& body = response->GetResponseBody();
    Bytes data((std::istreambuf_iterator<char>(body)), std::istreambuf_iterator<char>());
    CheckRangeResponse(status, data.size(), range, p_impl->cfg.url);
    spdlog::trace("{}: {} -> {} bytes", p_impl->cfg.url, header, data.size());
    return data;
}

std::string HttpRangeClient::ResourceId() const {
    return p_impl->cfg.url;
}

} // namespace rangeio
