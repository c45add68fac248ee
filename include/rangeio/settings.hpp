#pragma once

#include "types.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

namespace rangeio {

namespace s3_defaults {
    constexpr char kEndpoint[] = "http://127.0.0.1:9000";
    constexpr char kRegion[] = "us-east-1";
    constexpr char kAccessKeyId[] = "minioadmin";
    constexpr char kSecretAccessKey[] = "minioadmin";
    constexpr bool kUsePathStyle = true;
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Unsigned decimal from the environment. Throws std::invalid_argument when
// the variable is set but malformed.
std::uint64_t GetEnvUInt64(const char* name, std::uint64_t defaultValue);

// Defaults overlaid with RANGEIO_WINDOW_SIZE and RANGEIO_MAX_CACHE_BYTES.
StreamOptions StreamOptionsFromEnv();

// Fills unset (zero) timeouts from RANGEIO_CONNECT_TIMEOUT_MS and
// RANGEIO_REQUEST_TIMEOUT_MS; RANGEIO_VERIFY_TLS overrides verify_tls when set.
void ApplyHttpConfigDefaults(HttpClientConfig& cfg);

// Fills empty S3 connection fields from RANGEIO_S3_* / RANGEIO_AWS_* or the
// local MinIO defaults; RANGEIO_S3_USE_PATH_STYLE overrides use_path_style
// when set.
void ApplyS3ConfigDefaults(S3ClientConfig& cfg);

} // namespace rangeio
