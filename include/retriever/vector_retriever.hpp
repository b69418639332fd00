#pragma once
#include <string>
#include "document_store.hpp"
#include "retriever/retriever.hpp"
#include "vector_index_backend.hpp"

namespace rag_engine {

// Nearest-neighbour search against one backend index, hydrated from the
// document store. Hits the store no longer knows about are dropped.
class VectorRetriever : public Retriever {
public:
    VectorRetriever(const VectorIndexBackend& backend, std::string index_name, const DocumentStore& store)
        : backend_(backend), index_name_(std::move(index_name)), store_(store) {}

    std::vector<RankedResult> retrieve(const QueryBundle& query, size_t top_k) const override;

private:
    const VectorIndexBackend& backend_;
    std::string index_name_;
    const DocumentStore& store_;
};

} // namespace rag_engine
