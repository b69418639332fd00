#include "engine_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace rag_engine {

using json = nlohmann::json;

namespace {

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

EndpointConfig endpoint_from_json(const json& j) {
    EndpointConfig e;
    e.url = j.value("url", "");
    e.api_key = j.value("api_key", "");
    e.model = j.value("model", "");
    e.timeout_ms = j.value("timeout_ms", 30000);
    return e;
}

json endpoint_to_json(const EndpointConfig& e) {
    return json{{"url", e.url}, {"model", e.model}, {"timeout_ms", e.timeout_ms}};
}

} // namespace

BackendType parse_backend_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "faiss") return BackendType::Faiss;
    if (lower == "qdrant") return BackendType::Qdrant;
    throw InvalidRequestError("Unknown vector backend: " + name);
}

const char* backend_type_name(BackendType type) {
    return type == BackendType::Qdrant ? "qdrant" : "faiss";
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig c;
    c.backend = parse_backend_type(j.value("backend", "faiss"));
    c.persist_dir = j.value("persist_dir", c.persist_dir);
    c.vector_db_url = j.value("vector_db_url", "");
    c.vector_db_api_key = j.value("vector_db_api_key", "");
    c.embedding_dimension = j.value("embedding_dimension", c.embedding_dimension);
    c.worker_threads = std::max(1, j.value("worker_threads", c.worker_threads));
    c.auto_restore = j.value("auto_restore", true);
    c.log_level = j.value("log_level", c.log_level);

    if (j.contains("retrieval")) {
        const auto& r = j["retrieval"];
        c.retrieval.max_results = r.value("max_results", c.retrieval.max_results);
        c.retrieval.candidate_multiplier = r.value("candidate_multiplier", c.retrieval.candidate_multiplier);
        c.retrieval.vector_weight = r.value("vector_weight", c.retrieval.vector_weight);
        c.retrieval.text_weight = r.value("text_weight", c.retrieval.text_weight);
    }
    if (j.contains("context")) {
        const auto& x = j["context"];
        c.context.context_window = x.value("context_window", c.context.context_window);
        c.context.chars_per_token = x.value("chars_per_token", c.context.chars_per_token);
        c.context.prompt_overhead_tokens = x.value("prompt_overhead_tokens", c.context.prompt_overhead_tokens);
        c.context.response_token_buffer = x.value("response_token_buffer", c.context.response_token_buffer);
        if (x.contains("similarity_threshold") && x["similarity_threshold"].is_number()) {
            c.context.similarity_threshold = x["similarity_threshold"].get<double>();
        }
    }
    if (j.contains("chunking")) {
        const auto& ch = j["chunking"];
        c.chunking.chunk_size = ch.value("chunk_size", c.chunking.chunk_size);
        c.chunking.chunk_overlap = ch.value("chunk_overlap", c.chunking.chunk_overlap);
        c.chunking.code_max_chars = ch.value("code_max_chars", c.chunking.code_max_chars);
    }
    if (j.contains("rerank")) {
        const auto& rr = j["rerank"];
        c.rerank.choice_batch_size = rr.value("choice_batch_size", c.rerank.choice_batch_size);
        c.rerank.top_n = rr.value("top_n", c.rerank.top_n);
    }
    if (j.contains("embedding")) c.embedding = endpoint_from_json(j["embedding"]);
    if (j.contains("completion")) c.completion = endpoint_from_json(j["completion"]);

    if (c.retrieval.vector_weight < 0 || c.retrieval.text_weight < 0 ||
        c.retrieval.vector_weight + c.retrieval.text_weight <= 0) {
        throw InvalidRequestError("retrieval weights must be non-negative and not both zero");
    }
    if (c.chunking.chunk_overlap >= c.chunking.chunk_size) {
        throw InvalidRequestError("chunk_overlap must be smaller than chunk_size");
    }
    if (c.rerank.choice_batch_size <= 0 || c.rerank.top_n <= 0) {
        throw InvalidRequestError("rerank choice_batch_size and top_n must be positive");
    }
    return c;
}

json EngineConfig::to_json() const {
    json ctx = {
        {"context_window", context.context_window},
        {"chars_per_token", context.chars_per_token},
        {"prompt_overhead_tokens", context.prompt_overhead_tokens},
        {"response_token_buffer", context.response_token_buffer}
    };
    if (context.similarity_threshold) ctx["similarity_threshold"] = *context.similarity_threshold;

    // Secrets are never written back out.
    return json{
        {"backend", backend_type_name(backend)},
        {"persist_dir", persist_dir},
        {"vector_db_url", vector_db_url},
        {"embedding_dimension", embedding_dimension},
        {"worker_threads", worker_threads},
        {"auto_restore", auto_restore},
        {"log_level", log_level},
        {"retrieval", {
            {"max_results", retrieval.max_results},
            {"candidate_multiplier", retrieval.candidate_multiplier},
            {"vector_weight", retrieval.vector_weight},
            {"text_weight", retrieval.text_weight}
        }},
        {"context", ctx},
        {"chunking", {
            {"chunk_size", chunking.chunk_size},
            {"chunk_overlap", chunking.chunk_overlap},
            {"code_max_chars", chunking.code_max_chars}
        }},
        {"rerank", {
            {"choice_batch_size", rerank.choice_batch_size},
            {"top_n", rerank.top_n}
        }},
        {"embedding", endpoint_to_json(embedding)},
        {"completion", endpoint_to_json(completion)}
    };
}

void EngineConfig::apply_env_overrides() {
    if (auto v = env("VECTOR_DB_TYPE")) backend = parse_backend_type(*v);
    if (auto v = env("VECTOR_DB_URL")) vector_db_url = *v;
    if (auto v = env("VECTOR_DB_ACCESS_SECRET")) vector_db_api_key = *v;
    if (auto v = env("VECTOR_DB_PERSIST_DIR")) persist_dir = *v;
    if (auto v = env("LLM_INFERENCE_URL")) completion.url = *v;
    if (auto v = env("LLM_ACCESS_SECRET")) completion.api_key = *v;
    if (auto v = env("REMOTE_EMBEDDING_URL")) embedding.url = *v;
    if (auto v = env("REMOTE_EMBEDDING_ACCESS_SECRET")) embedding.api_key = *v;
    if (auto v = env("LLM_RERANKER_BATCH_SIZE")) {
        try {
            rerank.choice_batch_size = std::stoi(*v);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric LLM_RERANKER_BATCH_SIZE '{}'", *v);
        }
    }
    if (auto v = env("LLM_RERANKER_TOP_N")) {
        try {
            rerank.top_n = std::stoi(*v);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric LLM_RERANKER_TOP_N '{}'", *v);
        }
    }
    if (auto v = env("LLM_CONTEXT_WINDOW")) {
        try {
            context.context_window = std::stoi(*v);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric LLM_CONTEXT_WINDOW '{}'", *v);
        }
    }
}

EngineConfig load_config(const std::string& path) {
    std::vector<std::string> search_paths;
    if (!path.empty()) {
        search_paths.push_back(path);
    } else {
        search_paths = {
            "ragengine.json",
            "../ragengine.json",
            "config/ragengine.json",
            "../../ragengine.json"
        };
    }

    std::ifstream f;
    std::string found_path;
    for (const auto& p : search_paths) {
        f.open(p);
        if (f.is_open()) {
            found_path = p;
            break;
        }
        f.clear();
    }

    EngineConfig config;
    if (found_path.empty()) {
        if (!path.empty()) throw InvalidRequestError("Config file not found: " + path);
        spdlog::warn("⚠️ ragengine.json not found, using defaults");
    } else {
        try {
            config = EngineConfig::from_json(json::parse(f));
            spdlog::info("Loaded config from {}", found_path);
        } catch (const json::exception& e) {
            throw InvalidRequestError("Malformed config " + found_path + ": " + e.what());
        }
    }
    config.apply_env_overrides();
    return config;
}

void init_logging(const std::string& level) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace rag_engine
