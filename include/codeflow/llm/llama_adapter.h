#ifndef CODEFLOW_LLM_LLAMA_ADAPTER_H
#define CODEFLOW_LLM_LLAMA_ADAPTER_H

#include "codeflow/llm/generation_service.h"
#include <llama.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace codeflow {

// Local GenerationService backed by a llama.cpp model.
// One model/context per adapter; calls are serialized on that context.
class LlamaAdapter : public GenerationService {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 4096;
        int n_threads = 4;
        float temperature = 0.1f;
        float min_p = 0.05f;
        int n_predict = 1024;
    };

    // Throws ServiceError when the model or context cannot be created.
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    std::string complete(const std::string& system_instruction,
                         const std::string& user_text,
                         const GenerationOptions& options) override;

    bool is_loaded() const;
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::mutex mutex_;

    std::string apply_chat_template(const std::string& system_instruction, const std::string& user_text) const;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> make_sampler(float temperature) const;
    std::string generate(const std::string& prompt, float temperature);
    std::vector<llama_token> tokenize(const std::string& text, bool add_bos) const;
    std::string detokenize(llama_token token) const;
};

} // namespace codeflow

#endif // CODEFLOW_LLM_LLAMA_ADAPTER_H
