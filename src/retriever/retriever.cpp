#include "retriever/retriever.hpp"
#include "errors.hpp"

namespace rag_engine {

MetadataFilter MetadataFilter::from_json(const nlohmann::json& j) {
    MetadataFilter filter;
    if (j.is_null()) return filter;
    if (!j.is_object()) {
        throw InvalidRequestError("Metadata filter must be a JSON object, got: " + j.dump());
    }
    for (const auto& [key, value] : j.items()) {
        if (value.is_string()) {
            filter.require(key, value.get<std::string>());
        } else if (value.is_number() || value.is_boolean()) {
            filter.require(key, value.dump());
        } else {
            throw InvalidRequestError("Metadata filter value for '" + key + "' must be a scalar");
        }
    }
    return filter;
}

bool MetadataFilter::matches(const Metadata& metadata) const {
    for (const auto& [key, value] : equals_) {
        auto it = metadata.find(key);
        if (it == metadata.end() || it->second != value) return false;
    }
    return true;
}

} // namespace rag_engine
