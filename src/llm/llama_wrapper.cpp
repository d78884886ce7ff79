#include "llama_wrapper.hpp"
#include <iostream>
#include <algorithm>
#include <thread>

namespace llm {

LlamaWrapper::LlamaWrapper() {
    std::cout << "[LlamaWrapper] Created" << std::endl;
}

LlamaWrapper::~LlamaWrapper() {
    cleanup();
}

bool LlamaWrapper::initialize() {
    std::lock_guard<std::mutex> lock(mtx);
    initializeLocked();
    return true;
}

void LlamaWrapper::initializeLocked() {
    if (initialized) {
        return;
    }

    llama_backend_init();

    initialized = true;
    std::cout << "[LlamaWrapper] Initialized llama backend" << std::endl;
}

bool LlamaWrapper::loadModel(const std::string& modelPath, int contextSize, int threads, bool useGpu) {
    std::lock_guard<std::mutex> lock(mtx);

    initializeLocked();

    // Clean up existing model if any
    freeModelLocked();

    llama_model_params model_params = llama_model_default_params();
    if (useGpu) {
        model_params.n_gpu_layers = -1;  // offload every layer
        std::cout << "[LlamaWrapper] GPU acceleration enabled for model" << std::endl;
    }

    model = llama_model_load_from_file(modelPath.c_str(), model_params);
    if (!model) {
        std::cerr << "[LlamaWrapper] Failed to load model from: " << modelPath << std::endl;
        return false;
    }

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = contextSize;
    ctx_params.n_batch = 512;  // Batch size for prompt processing

    if (threads <= 0) {
        ctx_params.n_threads = std::min(8, static_cast<int>(std::thread::hardware_concurrency()));
    } else {
        ctx_params.n_threads = threads;
    }

    ctx = llama_init_from_model(model, ctx_params);
    if (!ctx) {
        std::cerr << "[LlamaWrapper] Failed to create context for model" << std::endl;
        llama_model_free(model);
        model = nullptr;
        return false;
    }
    this->contextSize = contextSize;

    std::cout << "[LlamaWrapper] Loaded model from: " << modelPath
              << " (ctx " << contextSize << ", threads " << ctx_params.n_threads
              << ", gpu " << (useGpu ? "yes" : "no") << ")" << std::endl;

    return true;
}

std::string LlamaWrapper::generate(const std::string& prompt, const GenerationParams& params) {
    std::lock_guard<std::mutex> lock(mtx);

    if (!ctx || !model) {
        throw InferenceError("model not loaded");
    }

    resetContext();

    std::vector<llama_token> tokens = tokenize(prompt);
    if (tokens.empty()) {
        throw InferenceError("failed to tokenize prompt");
    }

    // Keep the tail so the role cue at the end of the prompt survives truncation.
    int inputLimit = params.maxInputTokens;
    if (contextSize > 0) {
        inputLimit = std::min(inputLimit, contextSize - params.maxNewTokens);
    }
    if (inputLimit <= 0) {
        throw InferenceError("no room for input tokens in context");
    }
    if (static_cast<int>(tokens.size()) > inputLimit) {
        tokens.erase(tokens.begin(), tokens.end() - inputLimit);
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx, batch) != 0) {
        throw InferenceError("failed to process prompt");
    }

    auto sparams = llama_sampler_chain_default_params();
    llama_sampler* smpl = llama_sampler_chain_init(sparams);
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(params.temperature));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    const llama_vocab* vocab = llama_model_get_vocab(model);
    std::string result;
    llama_token id = 0;

    for (int i = 0; i < params.maxNewTokens; ++i) {
        id = llama_sampler_sample(smpl, ctx, -1);

        if (llama_vocab_is_eog(vocab, id)) {
            break;
        }

        result += tokenToPiece(id);

        batch = llama_batch_get_one(&id, 1);
        if (llama_decode(ctx, batch) != 0) {
            std::cerr << "[LlamaWrapper] Decode failed after " << i << " tokens" << std::endl;
            break;
        }
    }

    llama_sampler_free(smpl);

    // maxNewTokens can land between the pieces of one character
    return dropIncompleteUtf8Tail(result);
}

bool LlamaWrapper::isModelLoaded() const {
    return (model != nullptr && ctx != nullptr);
}

void LlamaWrapper::cleanup() {
    std::lock_guard<std::mutex> lock(mtx);

    freeModelLocked();

    if (initialized) {
        llama_backend_free();
        initialized = false;
    }
}

void LlamaWrapper::freeModelLocked() {
    if (ctx) {
        llama_free(ctx);
        ctx = nullptr;
    }

    if (model) {
        llama_model_free(model);
        model = nullptr;
    }
}

void LlamaWrapper::resetContext() {
    if (ctx) {
        llama_kv_cache_clear(ctx);
    }
}

std::vector<llama_token> LlamaWrapper::tokenize(const std::string& text) {
    if (!ctx) {
        return {};
    }

    const llama_vocab* vocab = llama_model_get_vocab(model);
    std::vector<llama_token> tokens(text.length() + 2);
    int n_tokens = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.length()),
                                  tokens.data(), static_cast<int32_t>(tokens.size()), true, true);
    if (n_tokens < 0) {
        tokens.resize(-n_tokens);
        n_tokens = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.length()),
                                  tokens.data(), static_cast<int32_t>(tokens.size()), true, true);
        if (n_tokens < 0) {
            return {};
        }
    }
    tokens.resize(n_tokens);
    return tokens;
}

std::string LlamaWrapper::tokenToPiece(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model);
    char buf[256];
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
    if (n < 0) {
        std::string piece(static_cast<size_t>(-n), '\0');
        n = llama_token_to_piece(vocab, token, &piece[0], static_cast<int32_t>(piece.size()), 0, false);
        return n < 0 ? std::string() : piece.substr(0, n);
    }
    return std::string(buf, n);
}

} // namespace llm
