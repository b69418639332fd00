#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace rag_engine {

enum class BackendType { Faiss, Qdrant };

struct RetrievalConfig {
    int max_results = 10;
    double candidate_multiplier = 3.0;
    double vector_weight = 0.7;
    double text_weight = 0.3;
};

struct ContextConfig {
    int context_window = 8192;
    double chars_per_token = 3.0;
    int prompt_overhead_tokens = 150;
    int response_token_buffer = 1000;
    std::optional<double> similarity_threshold;
};

struct ChunkingConfig {
    int chunk_size = 1024;     // tokens
    int chunk_overlap = 200;   // tokens
    int code_max_chars = 1500;
};

// Defaults for LLM reranking when a query asks for it without full parameters.
struct RerankConfig {
    int choice_batch_size = 10;
    int top_n = 10;
};

struct EndpointConfig {
    std::string url;
    std::string api_key;
    std::string model;
    int timeout_ms = 30000;
};

struct EngineConfig {
    BackendType backend = BackendType::Faiss;
    std::string persist_dir = "storage";
    std::string vector_db_url;          // empty => in-memory Qdrant when backend == Qdrant
    std::string vector_db_api_key;
    int embedding_dimension = 384;
    int worker_threads = 4;
    bool auto_restore = true;
    std::string log_level = "info";

    RetrievalConfig retrieval;
    ContextConfig context;
    ChunkingConfig chunking;
    RerankConfig rerank;
    EndpointConfig embedding;
    EndpointConfig completion;

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Applies the deployment environment variables on top of the current values.
    void apply_env_overrides();
};

// Loads `path` if given, else searches the usual locations for ragengine.json.
// A missing file yields defaults; a malformed file throws InvalidRequestError.
EngineConfig load_config(const std::string& path = "");

void init_logging(const std::string& level);

BackendType parse_backend_type(const std::string& name);
const char* backend_type_name(BackendType type);

} // namespace rag_engine
