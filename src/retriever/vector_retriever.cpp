#include "retriever/vector_retriever.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace rag_engine {

std::vector<RankedResult> VectorRetriever::retrieve(const QueryBundle& query, size_t top_k) const {
    if (query.embedding.empty()) {
        throw InvalidRequestError("Vector retrieval requires a query embedding");
    }
    if (top_k == 0) return {};

    // With a filter the survivors are unknown up front, so rank the whole index.
    size_t k = top_k;
    if (!query.filter.empty()) k = std::max(top_k, backend_.node_count(index_name_));

    auto hits = backend_.search(index_name_, query.embedding, k);

    std::vector<RankedResult> out;
    out.reserve(std::min(hits.size(), top_k));
    for (const auto& hit : hits) {
        auto node = store_.node(hit.node_id);
        if (!node) {
            spdlog::debug("Vector hit {} has no stored node, skipping", hit.node_id);
            continue;
        }
        if (!query.filter.empty() && !query.filter.matches(node->metadata)) continue;
        out.push_back({node->node_id, node->doc_id, node->text, hit.score, hit.kind, node->metadata});
        if (out.size() == top_k) break;
    }
    return out;
}

} // namespace rag_engine
