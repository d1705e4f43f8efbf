#ifndef CODEFLOW_LLM_GENERATION_SERVICE_H
#define CODEFLOW_LLM_GENERATION_SERVICE_H

#include <condition_variable>
#include <mutex>
#include <string>

namespace codeflow {

struct GenerationOptions {
    std::string model;          // empty = backend default
    float temperature = 0.1f;
};

// Text completion backend used by the agent steps.
// Implementations throw ServiceError on failure and must be safe to call
// from several runs at once.
class GenerationService {
public:
    virtual ~GenerationService() = default;

    virtual std::string complete(const std::string& system_instruction,
                                 const std::string& user_text,
                                 const GenerationOptions& options) = 0;
};

// Caps the number of in-flight calls to the wrapped service; callers over
// the cap block until a slot frees up.
class LimitedGenerationService : public GenerationService {
public:
    LimitedGenerationService(GenerationService& inner, int max_concurrent);

    std::string complete(const std::string& system_instruction,
                         const std::string& user_text,
                         const GenerationOptions& options) override;

    int max_concurrent() const { return max_concurrent_; }
    int in_flight() const;

private:
    GenerationService& inner_;
    int max_concurrent_;
    int in_flight_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;

    void acquire();
    void release();
};

} // namespace codeflow

#endif // CODEFLOW_LLM_GENERATION_SERVICE_H
