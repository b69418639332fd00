#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cache_manager.hpp"
#include "engine_config.hpp"

namespace rag_engine {

// Injected embedding capability.
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;

    // Default: one call per text.
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

    virtual int dimension() const = 0;
};

// OpenAI-compatible /v1/embeddings endpoint, with an LRU cache in front.
class RemoteEmbeddingService : public EmbeddingModel {
public:
    RemoteEmbeddingService(EndpointConfig endpoint, int dimension);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    int dimension() const override { return dimension_; }

    const EmbeddingCache& cache() const { return cache_; }

private:
    nlohmann::json post(const nlohmann::json& body) const;

    EndpointConfig endpoint_;
    int dimension_;
    EmbeddingCache cache_;
};

// Generation parameters forwarded to the completion endpoint. Unknown keys are
// passed through untouched.
struct LlmParams {
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    nlohmann::json extra = nlohmann::json::object();

    // Throws InvalidRequestError on a temperature outside [0, 1] or a non-positive max_tokens.
    static LlmParams from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

using CompletionFunction = std::function<std::string(const std::string& prompt, const LlmParams& params)>;

// OpenAI-compatible /v1/completions or /v1/chat/completions, picked from the URL.
class RemoteCompletionClient {
public:
    explicit RemoteCompletionClient(EndpointConfig endpoint);

    std::string complete(const std::string& prompt, const LlmParams& params) const;
    CompletionFunction as_function() const;

    bool is_chat() const { return chat_; }

private:
    EndpointConfig endpoint_;
    bool chat_;
};

} // namespace rag_engine
