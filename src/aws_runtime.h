#pragma once

#include <memory>

namespace rangeio {

// Aws::InitAPI runs once, on the first Acquire(), and the handle stays pinned
// for the rest of the process: the SDK cannot be initialized again after
// Aws::ShutdownAPI. ShutdownAPI runs from an atexit handler, so AWS-backed
// clients must not outlive main().
class AwsApiHandle {
public:
    static std::shared_ptr<AwsApiHandle> Acquire();

private:
    AwsApiHandle() = default;
};

} // namespace rangeio
