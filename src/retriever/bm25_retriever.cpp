#include "retriever/bm25_retriever.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace rag_engine {

BM25Retriever::BM25Retriever(const DocumentStore& store, double k1, double b)
    : store_(store), k1_(k1), b_(b) {}

std::shared_ptr<const BM25Retriever::Corpus> BM25Retriever::build(const DocumentStore& store) {
    auto c = std::make_shared<Corpus>();
    // Read the generation first: a write racing the snapshot only causes one extra rebuild.
    c->generation = store.generation();
    c->nodes = store.nodes();
    c->term_freqs.reserve(c->nodes.size());
    c->lengths.reserve(c->nodes.size());

    size_t total_length = 0;
    for (const auto& node : c->nodes) {
        std::unordered_map<std::string, size_t> tf;
        auto tokens = tokenize(node.text);
        for (const auto& t : tokens) ++tf[t];
        for (const auto& [term, _] : tf) ++c->doc_freq[term];
        c->lengths.push_back(tokens.size());
        total_length += tokens.size();
        c->term_freqs.push_back(std::move(tf));
    }
    if (!c->nodes.empty()) {
        c->avg_length = static_cast<double>(total_length) / static_cast<double>(c->nodes.size());
    }
    spdlog::debug("BM25 corpus rebuilt: {} chunks, {} terms", c->nodes.size(), c->doc_freq.size());
    return c;
}

std::shared_ptr<const BM25Retriever::Corpus> BM25Retriever::corpus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_ || cached_->generation != store_.generation()) {
        cached_ = build(store_);
    }
    return cached_;
}

size_t BM25Retriever::corpus_size() const {
    return corpus()->nodes.size();
}

std::vector<RankedResult> BM25Retriever::retrieve(const QueryBundle& query, size_t top_k) const {
    auto c = corpus();
    auto terms = tokenize(query.query_str);
    if (terms.empty() || c->nodes.empty() || top_k == 0) return {};

    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

    const double n = static_cast<double>(c->nodes.size());
    std::vector<std::pair<size_t, double>> scored;

    for (size_t i = 0; i < c->nodes.size(); ++i) {
        if (!query.filter.empty() && !query.filter.matches(c->nodes[i].metadata)) continue;

        double score = 0.0;
        const auto& tf = c->term_freqs[i];
        for (const auto& term : terms) {
            auto it = tf.find(term);
            if (it == tf.end()) continue;
            double df = static_cast<double>(c->doc_freq.at(term));
            double idf = std::log((n - df + 0.5) / (df + 0.5) + 1.0);
            double freq = static_cast<double>(it->second);
            double norm = c->avg_length > 0.0 ? static_cast<double>(c->lengths[i]) / c->avg_length : 1.0;
            score += idf * (freq * (k1_ + 1.0)) / (freq + k1_ * (1.0 - b_ + b_ * norm));
        }
        if (score > 0.0) scored.emplace_back(i, score);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (scored.size() > top_k) scored.resize(top_k);

    std::vector<RankedResult> out;
    out.reserve(scored.size());
    for (const auto& [i, score] : scored) {
        const auto& node = c->nodes[i];
        out.push_back({node.node_id, node.doc_id, node.text, score, ScoreKind::Similarity, node.metadata});
    }
    return out;
}

} // namespace rag_engine
