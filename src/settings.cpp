#include "rangeio/settings.hpp"
#include "rangeio/capability_probe.hpp"

#include <limits>
#include <stdexcept>

namespace rangeio {

namespace {

long GetEnvMillis(const char* name) {
    const std::uint64_t value = GetEnvUInt64(name, 0);
    if (value > static_cast<std::uint64_t>(std::numeric_limits<long>::max())) {
        throw std::invalid_argument(std::string(name) + " out of range: " + std::to_string(value));
    }
    return static_cast<long>(value);
}

} // namespace

std::uint64_t GetEnvUInt64(const char* name, std::uint64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    auto parsed = ParseContentLength(value);
    if (!parsed) {
        throw std::invalid_argument(std::string(name) + " is not an unsigned integer: '" + value + "'");
    }
    return *parsed;
}

StreamOptions StreamOptionsFromEnv() {
    StreamOptions options;

    const std::uint64_t window = GetEnvUInt64("RANGEIO_WINDOW_SIZE", options.window_size);
    if (window == 0 || window > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("RANGEIO_WINDOW_SIZE out of range: " + std::to_string(window));
    }
    options.window_size = static_cast<std::uint32_t>(window);
    options.max_cache_bytes = GetEnvUInt64("RANGEIO_MAX_CACHE_BYTES", options.max_cache_bytes);
    return options;
}

void ApplyHttpConfigDefaults(HttpClientConfig& cfg) {
    if (cfg.connect_timeout_ms == 0)
        cfg.connect_timeout_ms = GetEnvMillis("RANGEIO_CONNECT_TIMEOUT_MS");
    if (cfg.request_timeout_ms == 0)
        cfg.request_timeout_ms = GetEnvMillis("RANGEIO_REQUEST_TIMEOUT_MS");
    if (std::getenv("RANGEIO_VERIFY_TLS"))
        cfg.verify_tls = GetEnvBool("RANGEIO_VERIFY_TLS", cfg.verify_tls);
}

void ApplyS3ConfigDefaults(S3ClientConfig& cfg) {
    if (cfg.endpoint.empty())
        cfg.endpoint = GetEnv("RANGEIO_S3_ENDPOINT", s3_defaults::kEndpoint);
    if (cfg.region.empty())
        cfg.region = GetEnv("RANGEIO_S3_REGION", s3_defaults::kRegion);
    if (cfg.bucket.empty())
        cfg.bucket = GetEnv("RANGEIO_S3_BUCKET", "");
    if (cfg.access_key_id.empty())
        cfg.access_key_id = GetEnv("RANGEIO_AWS_ACCESS_KEY_ID", s3_defaults::kAccessKeyId);
    if (cfg.secret_access_key.empty())
        cfg.secret_access_key = GetEnv("RANGEIO_AWS_SECRET_ACCESS_KEY", s3_defaults::kSecretAccessKey);
    if (std::getenv("RANGEIO_S3_USE_PATH_STYLE"))
        cfg.use_path_style = GetEnvBool("RANGEIO_S3_USE_PATH_STYLE", s3_defaults::kUsePathStyle);
}

} // namespace rangeio
