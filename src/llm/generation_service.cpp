// src/llm/generation_service.cpp
#include "codeflow/llm/generation_service.h"
#include <functional>
#include <stdexcept>

namespace codeflow {

namespace {

struct SlotGuard {
    std::function<void()> on_exit;
    ~SlotGuard() { on_exit(); }
};

} // namespace

LimitedGenerationService::LimitedGenerationService(GenerationService& inner, int max_concurrent)
    : inner_(inner), max_concurrent_(max_concurrent) {
    if (max_concurrent_ <= 0) {
        throw std::invalid_argument("max_concurrent must be positive");
    }
}

void LimitedGenerationService::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_freed_.wait(lock, [this] { return in_flight_ < max_concurrent_; });
    ++in_flight_;
}

void LimitedGenerationService::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    slot_freed_.notify_one();
}

int LimitedGenerationService::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::string LimitedGenerationService::complete(const std::string& system_instruction,
                                               const std::string& user_text,
                                               const GenerationOptions& options) {
    acquire();
    SlotGuard guard{[this] { release(); }};
    return inner_.complete(system_instruction, user_text, options);
}

} // namespace codeflow
