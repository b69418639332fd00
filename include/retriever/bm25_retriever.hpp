#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "document_store.hpp"
#include "retriever/retriever.hpp"

namespace rag_engine {

// Okapi BM25 over the chunk texts of one DocumentStore.
//
// The inverted index is rebuilt lazily whenever the store generation moves, so
// the retriever can be kept alongside the store without explicit invalidation.
class BM25Retriever : public Retriever {
public:
    explicit BM25Retriever(const DocumentStore& store, double k1 = 1.5, double b = 0.75);

    std::vector<RankedResult> retrieve(const QueryBundle& query, size_t top_k) const override;

    // Number of chunks in the current corpus.
    size_t corpus_size() const;

private:
    struct Corpus {
        uint64_t generation = 0;
        std::vector<NodeRecord> nodes;
        std::vector<std::unordered_map<std::string, size_t>> term_freqs;
        std::vector<size_t> lengths;
        std::unordered_map<std::string, size_t> doc_freq;
        double avg_length = 0.0;
    };

    std::shared_ptr<const Corpus> corpus() const;
    static std::shared_ptr<const Corpus> build(const DocumentStore& store);

    const DocumentStore& store_;
    double k1_;
    double b_;
    mutable std::mutex mutex_;
    mutable std::shared_ptr<const Corpus> cached_;
};

} // namespace rag_engine
