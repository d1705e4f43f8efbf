#ifndef CODEFLOW_FLOW_RUN_POOL_H
#define CODEFLOW_FLOW_RUN_POOL_H

#include "codeflow/flow/engine.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace codeflow {

// Fixed set of worker threads executing independent runs on one engine.
class RunPool {
public:
    struct Submission {
        std::string run_id;
        std::future<RunResult> result;
    };

    RunPool(WorkflowEngine& engine, int workers);
    ~RunPool();

    RunPool(const RunPool&) = delete;
    RunPool& operator=(const RunPool&) = delete;

    // Empty run_id -> generated. Throws std::runtime_error after shutdown().
    Submission submit(const std::string& task_description, const RunConfig& config = {},
                      std::string run_id = {});
    Submission submit_resume(const std::string& run_id, const RunConfig& config = {});

    // Flips the run's cancel token; false if the run is unknown or already finished.
    bool cancel(const std::string& run_id);

    // Queued and running run ids.
    std::vector<std::string> active() const;

    // Queued runs still execute; blocks until workers exit.
    void shutdown();

    int worker_count() const { return static_cast<int>(workers_.size()); }

private:
    using Job = std::function<RunResult(const CancelToken&)>;

    struct Entry {
        std::string run_id;
        std::shared_ptr<CancelToken> cancel;
        std::packaged_task<RunResult()> task;
    };

    WorkflowEngine& engine_;
    std::vector<std::thread> workers_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex mutex_;
    std::condition_variable job_available_;
    std::queue<Entry> queue_;
    std::unordered_map<std::string, std::shared_ptr<CancelToken>> tokens_;

    Submission enqueue(std::string run_id, Job job);
    void worker_loop(int worker_id);
    void release(const std::string& run_id);
};

} // namespace codeflow

#endif // CODEFLOW_FLOW_RUN_POOL_H
