#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models.hpp"

namespace rag_engine {

// Exact-match key/value predicates over document metadata. All must hold.
class MetadataFilter {
public:
    MetadataFilter() = default;

    // Accepts null (no filter) or an object whose values are strings, numbers or
    // booleans. Anything else throws InvalidRequestError.
    static MetadataFilter from_json(const nlohmann::json& j);

    void require(const std::string& key, const std::string& value) { equals_[key] = value; }
    bool matches(const Metadata& metadata) const;
    bool empty() const { return equals_.empty(); }

private:
    Metadata equals_;
};

struct QueryBundle {
    std::string query_str;
    std::vector<float> embedding;
    MetadataFilter filter;
};

class Retriever {
public:
    virtual ~Retriever() = default;
    // Best first, at most top_k.
    virtual std::vector<RankedResult> retrieve(const QueryBundle& query, size_t top_k) const = 0;
};

} // namespace rag_engine
