// src/flow/run_pool.cpp
#include "codeflow/flow/run_pool.h"
#include "codeflow/common/utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace codeflow {

RunPool::RunPool(WorkflowEngine& engine, int workers) : engine_(engine) {
    if (workers <= 0) {
        throw std::invalid_argument("RunPool needs at least one worker");
    }
    workers_.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back(&RunPool::worker_loop, this, i);
    }
    spdlog::debug("run pool started with {} workers", workers);
}

RunPool::~RunPool() {
    shutdown();
}

RunPool::Submission RunPool::enqueue(std::string run_id, Job job) {
    auto token = std::make_shared<CancelToken>();
    auto body = [this, run_id, job = std::move(job), token] {
        // token 在 future 就绪之前释放
        struct Release {
            RunPool* pool;
            const std::string& id;
            ~Release() { pool->release(id); }
        } release{this, run_id};
        return job(*token);
    };
    Entry entry{run_id, token, std::packaged_task<RunResult()>(std::move(body))};
    Submission submission{run_id, entry.task.get_future()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load()) {
            throw std::runtime_error("RunPool is shut down");
        }
        if (tokens_.count(run_id) > 0) {
            throw std::invalid_argument("Run " + run_id + " is already active");
        }
        tokens_.emplace(run_id, token);
        queue_.push(std::move(entry));
    }
    job_available_.notify_one();
    spdlog::debug("[{}] queued", run_id);
    return submission;
}

RunPool::Submission RunPool::submit(const std::string& task_description, const RunConfig& config,
                                    std::string run_id) {
    if (run_id.empty()) {
        run_id = generate_run_id();
    }
    return enqueue(run_id, [this, run_id, task_description, config](const CancelToken& cancel) {
        return engine_.run_as(run_id, task_description, config, &cancel);
    });
}

RunPool::Submission RunPool::submit_resume(const std::string& run_id, const RunConfig& config) {
    return enqueue(run_id, [this, run_id, config](const CancelToken& cancel) {
        return engine_.resume(run_id, config, &cancel);
    });
}

bool RunPool::cancel(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(run_id);
    if (it == tokens_.end()) {
        return false;
    }
    it->second->cancel();
    spdlog::info("[{}] cancellation requested", run_id);
    return true;
}

std::vector<std::string> RunPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(tokens_.size());
    for (const auto& [id, _] : tokens_) ids.push_back(id);
    return ids;
}

void RunPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.exchange(true)) {
            return;
        }
    }
    job_available_.notify_all();
    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("run pool stopped");
}

void RunPool::worker_loop(int worker_id) {
    while (true) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_available_.wait(lock, [this] { return !queue_.empty() || shutdown_.load(); });
            // 关闭后仍然排空队列
            if (queue_.empty()) {
                break;
            }
            entry = std::move(queue_.front());
            queue_.pop();
        }

        spdlog::debug("worker-{} claimed run {}", worker_id, entry.run_id);
        // engine 将失败转换为 RunResult；其他异常存入 future
        entry.task();
    }
}

void RunPool::release(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(run_id);
}

} // namespace codeflow
