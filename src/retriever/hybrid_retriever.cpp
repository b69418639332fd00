#include "retriever/hybrid_retriever.hpp"
#include "errors.hpp"
#include <algorithm>
#include <unordered_map>

namespace rag_engine {

HybridRetriever::HybridRetriever(const Retriever& vector, const BM25Retriever& keyword,
                                 const RetrievalConfig& config)
    : vector_(vector), keyword_(keyword),
      candidate_multiplier_(std::max(1.0, config.candidate_multiplier)) {
    double total = config.vector_weight + config.text_weight;
    if (total <= 0.0) throw InvalidRequestError("vector_weight + text_weight must be positive");
    vector_weight_ = config.vector_weight / total;
    text_weight_ = config.text_weight / total;
}

size_t HybridRetriever::candidate_pool_size(size_t max_results) const {
    return static_cast<size_t>(static_cast<double>(max_results) * candidate_multiplier_);
}

std::vector<RankedResult> HybridRetriever::retrieve(const QueryBundle& query, size_t top_k) const {
    size_t pool = candidate_pool_size(top_k);
    size_t available = keyword_.corpus_size();
    if (available > 0) pool = std::min(pool, available);

    auto vector_nodes = vector_.retrieve(query, pool);
    auto keyword_nodes = keyword_.retrieve(query, pool);

    struct Candidate {
        RankedResult node;
        double vector_score = 0.0;
        double text_score = 0.0;
    };
    std::vector<Candidate> candidates;
    std::unordered_map<std::string, size_t> slot;

    auto candidate_for = [&](const RankedResult& r) -> Candidate& {
        auto [it, inserted] = slot.emplace(r.node_id, candidates.size());
        if (inserted) candidates.push_back({r});
        return candidates[it->second];
    };

    for (const auto& r : vector_nodes) {
        candidate_for(r).vector_score = r.score;
    }
    for (size_t rank = 0; rank < keyword_nodes.size(); ++rank) {
        candidate_for(keyword_nodes[rank]).text_score = 1.0 / (1.0 + static_cast<double>(rank));
    }

    std::vector<RankedResult> fused;
    fused.reserve(candidates.size());
    for (auto& c : candidates) {
        c.node.score = vector_weight_ * c.vector_score + text_weight_ * c.text_score;
        c.node.kind = ScoreKind::Fused;
        fused.push_back(std::move(c.node));
    }

    std::stable_sort(fused.begin(), fused.end(),
                     [](const RankedResult& a, const RankedResult& b) { return a.score > b.score; });
    if (fused.size() > top_k) fused.resize(top_k);
    return fused;
}

} // namespace rag_engine
