#include "response_pipeline.hpp"
#include <iostream>
#include <future>
#include <memory>
#include <stdexcept>
#include <boost/asio/post.hpp>
#include "prompt_classifier.hpp"
#include "response_templates.hpp"

namespace worker {

namespace {

const std::string SEEK_HELP_SUFFIX =
    " I encourage you to keep exploring these feelings and consider reaching out to a mental health "
    "professional for personalized support.";
const std::string EMPATHY_PREFIX = "I understand this is challenging for you. ";

std::string trim(const std::string &text) {
    const char *whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

class GenerationTimeout : public std::runtime_error {
public:
    GenerationTimeout() : std::runtime_error("generation timed out") {}
};

class GenerationBacklog : public std::runtime_error {
public:
    GenerationBacklog() : std::runtime_error("generation backlog full") {}
};

} // namespace

const char *sourceName(ResponseSource source) {
    switch (source) {
        case ResponseSource::Cache: return "cached";
        case ResponseSource::Crisis: return "crisis";
        case ResponseSource::Template: return "template";
        case ResponseSource::Generated: return "generated";
        case ResponseSource::Fallback: return "fallback";
    }
    return "fallback";
}

ResponsePipeline::ResponsePipeline(llm::InferenceEngine &engine, ResponsePipelineOptions options)
    : engine(engine),
      options(options),
      responseCache(options.cacheMaxSize),
      gate(options.quality),
      generationPool(options.maxWorkers > 0 ? options.maxWorkers : 1) {}

ResponsePipeline::~ResponsePipeline() {
    // Queued generations are dropped, running ones are waited for
    generationPool.stop();
    generationPool.join();
}

PipelineResult ResponsePipeline::respond(const std::string &prompt) {
    std::string key;
    try {
        key = cacheKey(prompt);
    } catch (const std::exception &e) {
        std::cerr << "[ResponsePipeline] Failed to compute cache key: " << e.what() << std::endl;
        return {safeFallbackResponse(), ResponseSource::Fallback};
    }

    bool crisis = isCrisis(prompt);

    // Crisis prompts only ever hit entries the crisis path itself wrote
    if (options.cacheEnabled && (!crisis || options.cacheCrisisResponses)) {
        if (auto cached = responseCache.lookup(key)) {
            return {*cached, ResponseSource::Cache};
        }
    }

    if (crisis) {
        std::cout << "[ResponsePipeline] Crisis keywords detected, returning crisis resources" << std::endl;
        if (options.cacheEnabled && options.cacheCrisisResponses) {
            responseCache.insert(key, crisisResponse());
        }
        return {crisisResponse(), ResponseSource::Crisis};
    }

    try {
        Category category = classifyCategory(prompt);
        if (category != Category::General) {
            std::string templated = buildTemplateResponse(category);
            if (gate.passes(templated)) {
                if (options.cacheEnabled) {
                    responseCache.insert(key, templated);
                }
                return {templated, ResponseSource::Template};
            }
            std::cout << "[ResponsePipeline] Template for " << categoryName(category)
                      << " failed quality gate, generating" << std::endl;
        }

        return {generateOnPool(prompt, key), ResponseSource::Generated};
    } catch (const GenerationTimeout &) {
        std::cerr << "[ResponsePipeline] Generation exceeded "
                  << options.generationTimeout.count() << "ms, returning fallback" << std::endl;
    } catch (const GenerationBacklog &) {
        std::cerr << "[ResponsePipeline] " << pendingGenerations.load()
                  << " generations already pending, returning fallback" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "[ResponsePipeline] Error generating response: " << e.what() << std::endl;
    }
    return {safeFallbackResponse(), ResponseSource::Fallback};
}

std::string ResponsePipeline::generateOnPool(const std::string &prompt, const std::string &key) {
    // Timed-out generations keep their pool slot, so the queue is bounded here
    size_t workers = options.maxWorkers > 0 ? options.maxWorkers : 1;
    size_t limit = workers * (1 + QUEUED_GENERATIONS_PER_WORKER);
    if (pendingGenerations.fetch_add(1) >= limit) {
        --pendingGenerations;
        throw GenerationBacklog();
    }

    // A generation that outlives the wait still lands in the cache
    auto task = std::make_shared<std::packaged_task<std::string()>>([this, prompt, key]() {
        try {
            std::string text = generateModelResponse(prompt);
            if (options.cacheEnabled) {
                responseCache.insert(key, text);
            }
            return text;
        } catch (const std::exception &e) {
            std::cerr << "[ResponsePipeline] Model generation error: " << e.what() << std::endl;
            throw;
        }
    });
    std::future<std::string> result = task->get_future();
    boost::asio::post(generationPool, [this, task]() {
        (*task)();
        --pendingGenerations;
    });

    if (result.wait_for(options.generationTimeout) != std::future_status::ready) {
        throw GenerationTimeout();
    }
    return result.get();
}

std::string ResponsePipeline::generateModelResponse(const std::string &prompt) {
    std::string input = therapistSystemPrompt() + "\n\nUser: " + prompt + "\n\nTherapist:";
    std::string raw = llm::dropIncompleteUtf8Tail(engine.generate(input, options.generation));
    return postProcess(raw);
}

std::string ResponsePipeline::postProcess(const std::string &raw) {
    std::string response = raw;

    // The model may run on into the next user turn
    size_t nextTurn = response.find("User:");
    if (nextTurn != std::string::npos) {
        response.erase(nextTurn);
    }

    const std::string rolePrefix = "Therapist:";
    size_t pos;
    while ((pos = response.find(rolePrefix)) != std::string::npos) {
        response.erase(pos, rolePrefix.size());
    }
    response = trim(response);

    std::vector<std::string> words = splitWords(response);
    if (words.size() > GENERATED_MAX_WORDS) {
        std::string cut;
        for (size_t i = 0; i < GENERATED_MAX_WORDS; ++i) {
            if (i > 0) {
                cut += " ";
            }
            cut += words[i];
        }
        response = cut + "...";
    } else if (words.size() < GENERATED_MIN_WORDS) {
        response += SEEK_HELP_SUFFIX;
    }

    if (!hasEmpathyMarker(response)) {
        response = EMPATHY_PREFIX + response;
    }

    return trim(response);
}

} // namespace worker
