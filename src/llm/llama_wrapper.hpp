#ifndef LLAMA_WRAPPER_HPP
#define LLAMA_WRAPPER_HPP

#include <string>
#include <vector>
#include <mutex>
#include <llama.h>
#include "inference_engine.hpp"

namespace llm {

class LlamaWrapper : public InferenceEngine {
public:
    LlamaWrapper();
    ~LlamaWrapper() override;

    // Initialize the library
    bool initialize();

    // Load model from a file
    bool loadModel(const std::string& modelPath, int contextSize = 2048, int threads = 0, bool useGpu = false);

    // Generate a continuation of the prompt. Throws InferenceError.
    std::string generate(const std::string& prompt, const GenerationParams& params) override;

    // Check if a model is loaded
    bool isModelLoaded() const;

    // Free resources
    void cleanup();

private:
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    std::mutex mtx;  // llama_context is not reentrant
    bool initialized = false;
    int contextSize = 0;

    void initializeLocked();
    void freeModelLocked();

    // Reset the KV cache
    void resetContext();

    // Tokenize input text
    std::vector<llama_token> tokenize(const std::string& text);

    std::string tokenToPiece(llama_token token);
};

} // namespace llm

#endif // LLAMA_WRAPPER_HPP
