#ifndef CODEFLOW_FLOW_RETRY_BOUND_H
#define CODEFLOW_FLOW_RETRY_BOUND_H

#include "codeflow/flow/graph.h"

namespace codeflow {

struct RetryResolution {
    StepName next;
    bool retried = false; // retry edge taken; caller increments retry_count
    bool forced = false;  // router wanted a retry but the bound was reached
};

// Pure: applies the loop bound to the router's choice.
// At most max_retries traversals of bound.retry_target are allowed per run.
RetryResolution resolve_bounded_loop(const LoopBound& bound,
                                     const StepName& routed,
                                     int retry_count,
                                     int max_retries);

} // namespace codeflow

#endif // CODEFLOW_FLOW_RETRY_BOUND_H
