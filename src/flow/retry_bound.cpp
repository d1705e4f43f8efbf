// src/flow/retry_bound.cpp
#include "codeflow/flow/retry_bound.h"

namespace codeflow {

RetryResolution resolve_bounded_loop(const LoopBound& bound,
                                     const StepName& routed,
                                     int retry_count,
                                     int max_retries) {
    if (routed != bound.retry_target) {
        return RetryResolution{.next = routed};
    }
    if (retry_count < max_retries) {
        return RetryResolution{.next = routed, .retried = true};
    }
    return RetryResolution{.next = bound.exit_target, .forced = true};
}

} // namespace codeflow
