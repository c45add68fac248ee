#include "aws_runtime.h"

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/LogLevel.h>

#include <cstdlib>
#include <mutex>

namespace rangeio {

namespace {

struct AwsRuntimeState {
    std::mutex mutex;
    Aws::SDKOptions options;
    std::shared_ptr<AwsApiHandle> pinned;
    bool shut_down = false;
};

// Never destroyed, so the atexit handler and late callers see live state.
AwsRuntimeState& State() {
    static AwsRuntimeState* state = new AwsRuntimeState();
    return *state;
}

void ShutdownAwsAtExit() {
    AwsRuntimeState& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.shut_down) {
        Aws::ShutdownAPI(state.options);
        state.shut_down = true;
    }
}

} // namespace

std::shared_ptr<AwsApiHandle> AwsApiHandle::Acquire() {
    AwsRuntimeState& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.pinned) {
        state.options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
        Aws::InitAPI(state.options);
        state.pinned = std::shared_ptr<AwsApiHandle>(new AwsApiHandle());
        std::atexit(ShutdownAwsAtExit);
    }
    return state.pinned;
}

} // namespace rangeio
