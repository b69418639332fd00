#include "models.hpp"

namespace rag_engine {

using json = nlohmann::json;

json StoredDocument::to_json() const {
    return json{
        {"doc_id", doc_id},
        {"text", text},
        {"hash_value", hash},
        {"metadata", metadata},
        {"is_truncated", is_truncated}
    };
}

StoredDocument StoredDocument::from_json(const json& j) {
    StoredDocument doc;
    doc.doc_id = j.at("doc_id").get<std::string>();
    doc.text = j.at("text").get<std::string>();
    doc.hash = j.value("hash_value", "");
    if (j.contains("metadata") && j["metadata"].is_object()) {
        doc.metadata = j["metadata"].get<Metadata>();
    }
    doc.is_truncated = j.value("is_truncated", false);
    return doc;
}

json RankedResult::to_json() const {
    return json{
        {"node_id", node_id},
        {"doc_id", doc_id},
        {"text", text},
        {"score", score},
        {"score_kind", score_kind_name(kind)},
        {"metadata", metadata}
    };
}

const char* score_kind_name(ScoreKind kind) {
    switch (kind) {
        case ScoreKind::Distance: return "distance";
        case ScoreKind::Similarity: return "similarity";
        case ScoreKind::Fused: return "fused";
    }
    return "unknown";
}

} // namespace rag_engine
