#pragma once
#include "engine_config.hpp"
#include "retriever/bm25_retriever.hpp"
#include "retriever/retriever.hpp"

namespace rag_engine {

// Weighted fusion of semantic and keyword search.
//
// Both retrievers are asked for a candidate pool of
//   int(max_results * max(1, candidate_multiplier))
// nodes, capped at the corpus size when the corpus is non-empty. Each node then
// scores
//   vector_weight * vector_score + text_weight * 1 / (1 + keyword_rank)
// where a side that did not return the node contributes 0. Weights are
// normalised to sum to 1.
class HybridRetriever : public Retriever {
public:
    HybridRetriever(const Retriever& vector, const BM25Retriever& keyword, const RetrievalConfig& config);

    // top_k plays the role of max_results.
    std::vector<RankedResult> retrieve(const QueryBundle& query, size_t top_k) const override;

    size_t candidate_pool_size(size_t max_results) const;
    double vector_weight() const { return vector_weight_; }
    double text_weight() const { return text_weight_; }

private:
    const Retriever& vector_;
    const BM25Retriever& keyword_;
    double candidate_multiplier_;
    double vector_weight_;
    double text_weight_;
};

} // namespace rag_engine
