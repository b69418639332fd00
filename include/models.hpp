#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace rag_engine {

// Ordered so rendered metadata (prompts, snapshots) is deterministic.
using Metadata = std::map<std::string, std::string>;

struct Document {
    std::string text;
    Metadata metadata;
};

struct StoredDocument {
    std::string doc_id;
    std::string text;
    std::string hash;
    Metadata metadata;
    bool is_truncated = false;

    nlohmann::json to_json() const;
    static StoredDocument from_json(const nlohmann::json& j);
};

// One chunk of a document as handed to a vector backend.
struct IndexedNode {
    std::string node_id;
    std::vector<float> embedding;
    std::string source_doc_id;
    std::string text;
    Metadata metadata;
    int chunk_index = 0;
    // Full source text, carried on chunk 0 only, for backends that rebuild documents on startup.
    std::string document_text;
};

// Distance: lower is better (raw L2 from a backend).
// Similarity: higher is better (raw cosine / inner product from a backend).
// Fused: higher is better (weighted relevance from the hybrid retriever).
enum class ScoreKind { Distance, Similarity, Fused };

struct RankedResult {
    std::string node_id;
    std::string doc_id;
    std::string text;
    double score = 0.0;
    ScoreKind kind = ScoreKind::Similarity;
    Metadata metadata;

    nlohmann::json to_json() const;
};

// Raw hit coming back from a VectorIndexBackend, before hydration.
struct VectorHit {
    std::string node_id;
    float score = 0.0f;
    ScoreKind kind = ScoreKind::Similarity;
};

struct UpdateRequestItem {
    std::string doc_id;
    std::string text;
    Metadata metadata;
};

struct UpdateResult {
    std::vector<StoredDocument> updated;
    std::vector<StoredDocument> unchanged;
    std::vector<std::string> not_found;
};

struct DeleteResult {
    std::vector<std::string> deleted;
    std::vector<std::string> not_found;
};

struct DocumentPage {
    std::vector<StoredDocument> documents;
    size_t count = 0;
    std::optional<size_t> next_offset;
};

// Documents gathered across every index, in registry order.
struct AggregatedPage {
    std::vector<std::pair<std::string, std::vector<StoredDocument>>> indexes;
    size_t count = 0;
    std::optional<size_t> next_offset;
};

struct QueryResponse {
    std::string response;
    std::vector<RankedResult> source_nodes;
};

const char* score_kind_name(ScoreKind kind);

// True when `a` is more relevant than `b` under the given score semantics.
inline bool more_relevant(double a, double b, ScoreKind kind) {
    return kind == ScoreKind::Distance ? a < b : a > b;
}

} // namespace rag_engine
