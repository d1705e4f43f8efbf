// src/llm/llama_adapter.cpp
#include "codeflow/llm/llama_adapter.h"
#include "codeflow/core/errors.h"
#include <spdlog/spdlog.h>
#include <mutex>
#include <vector>

namespace codeflow {

namespace {

std::once_flag g_backend_once;

} // namespace

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free) {

    std::call_once(g_backend_once, [] { llama_backend_init(); });

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw ServiceError(ServiceErrorKind::OTHER, "Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config_.n_ctx);
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw ServiceError(ServiceErrorKind::OTHER, "Failed to create llama context");
    }
    ctx_.reset(raw_ctx);

    spdlog::info("Loaded model {} (n_ctx={}, threads={})", config_.model_path, config_.n_ctx, config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr;
}

std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> LlamaAdapter::make_sampler(float temperature) const {
    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return {raw_sampler, llama_sampler_free};
}

std::string LlamaAdapter::apply_chat_template(const std::string& system_instruction,
                                              const std::string& user_text) const {
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        // 模型没有内置模板：退回纯文本拼接
        return system_instruction + "\n\n" + user_text + "\n";
    }

    std::vector<llama_chat_message> messages = {
        {"system", system_instruction.c_str()},
        {"user", user_text.c_str()},
    };
    std::vector<char> buf(system_instruction.size() + user_text.size() + 1024);
    int32_t n = llama_chat_apply_template(tmpl, messages.data(), messages.size(), true,
                                          buf.data(), static_cast<int32_t>(buf.size()));
    if (n < 0) {
        throw ServiceError(ServiceErrorKind::OTHER, "Failed to apply chat template");
    }
    if (static_cast<size_t>(n) > buf.size()) {
        buf.resize(static_cast<size_t>(n));
        n = llama_chat_apply_template(tmpl, messages.data(), messages.size(), true,
                                      buf.data(), static_cast<int32_t>(buf.size()));
    }
    return std::string(buf.data(), static_cast<size_t>(n));
}

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(static_cast<size_t>(n_tokens));
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, static_cast<size_t>(n));
}

std::string LlamaAdapter::generate(const std::string& prompt, float temperature) {
    // Requests are independent: drop whatever the previous call left in the KV cache
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw ServiceError(ServiceErrorKind::OTHER, "Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) + config_.n_predict > config_.n_ctx) {
        throw ServiceError(ServiceErrorKind::OTHER,
                           "Prompt of " + std::to_string(tokens.size()) + " tokens exceeds context window");
    }

    auto sampler = make_sampler(temperature);
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw ServiceError(ServiceErrorKind::OTHER, "Prompt evaluation failed");
    }

    std::string response;
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            throw ServiceError(ServiceErrorKind::OTHER, "Token decode failed after " + std::to_string(i) + " tokens");
        }
    }
    return response;
}

std::string LlamaAdapter::complete(const std::string& system_instruction,
                                   const std::string& user_text,
                                   const GenerationOptions& options) {
    if (!is_loaded()) {
        throw ServiceError(ServiceErrorKind::OTHER, "Model not loaded");
    }
    if (!options.model.empty() && options.model != config_.model_path) {
        throw ServiceError(ServiceErrorKind::OTHER,
                           "Model '" + options.model + "' is not loaded (loaded: " + config_.model_path + ")");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string prompt = apply_chat_template(system_instruction, user_text);
    spdlog::debug("llama: prompt {} chars, temperature {}", prompt.size(), options.temperature);
    return generate(prompt, options.temperature);
}

} // namespace codeflow
