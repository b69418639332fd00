#include "qdrant_vector_store.hpp"
#include "document_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <spdlog/spdlog.h>

namespace rag_engine {

using json = nlohmann::json;

namespace {

json metadata_to_json(const Metadata& metadata) {
    json j = json::object();
    for (const auto& [k, v] : metadata) j[k] = v;
    return j;
}

Metadata metadata_from_json(const json& j) {
    Metadata out;
    if (!j.is_object()) return out;
    for (const auto& [k, v] : j.items()) {
        out[k] = v.is_string() ? v.get<std::string>() : v.dump();
    }
    return out;
}

// Points written by other tools keep their node in a serialised `_node_content`
// string; fall back to it when the flat fields are missing.
json node_content(const json& payload) {
    auto it = payload.find("_node_content");
    if (it == payload.end() || !it->is_string()) return json::object();
    try {
        auto j = json::parse(it->get<std::string>());
        return j.is_object() ? j : json::object();
    } catch (const json::exception&) {
        return json::object();
    }
}

struct PartialDocument {
    std::string doc_text;
    Metadata metadata;
    std::map<int, IndexedNode> chunks;
};

} // namespace

QdrantVectorStore::QdrantVectorStore(std::shared_ptr<qdrant::CollectionService> service, int dimension)
    : service_(std::move(service)), dimension_(dimension) {}

void QdrantVectorStore::create_index(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (known_.count(name)) return;
    }
    if (!service_->collection_exists(name)) {
        service_->create_collection(name, static_cast<size_t>(dimension_));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    known_.insert(name);
}

bool QdrantVectorStore::has_index(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_.count(name) > 0;
}

std::vector<std::string> QdrantVectorStore::add(const std::string& name,
                                                const std::vector<IndexedNode>& nodes) {
    if (!has_index(name)) throw NotFoundError("No such index: '" + name + "' exists.");

    std::vector<qdrant::PointRecord> points;
    std::vector<std::string> ids;
    points.reserve(nodes.size());
    for (const auto& node : nodes) {
        if (node.embedding.size() != static_cast<size_t>(dimension_)) {
            throw InvalidRequestError("Embedding dimension " + std::to_string(node.embedding.size()) +
                                      " does not match index dimension " + std::to_string(dimension_));
        }
        json payload = {
            {"node_id", node.node_id},
            {"ref_doc_id", node.source_doc_id},
            {"doc_id", node.source_doc_id},
            {"text", node.text},
            {"chunk_index", node.chunk_index},
            {"metadata", metadata_to_json(node.metadata)}
        };
        if (node.chunk_index == 0) payload["doc_text"] = node.document_text;
        points.push_back({node.node_id, node.embedding, std::move(payload)});
        ids.push_back(node.node_id);
    }
    service_->upsert(name, points);
    return ids;
}

size_t QdrantVectorStore::remove(const std::string& name, const std::vector<std::string>& node_ids) {
    if (!has_index(name) || node_ids.empty()) return 0;
    size_t before = service_->count(name);
    service_->delete_points(name, node_ids);
    size_t after = service_->count(name);
    return before > after ? before - after : 0;
}

std::vector<VectorHit> QdrantVectorStore::search(const std::string& name,
                                                 const std::vector<float>& query,
                                                 size_t top_k) const {
    if (!has_index(name) || top_k == 0) return {};
    auto points = service_->search(name, query, top_k);
    std::vector<VectorHit> hits;
    hits.reserve(points.size());
    for (const auto& p : points) {
        hits.push_back({p.id, p.score, ScoreKind::Similarity});
    }
    return hits;
}

size_t QdrantVectorStore::node_count(const std::string& name) const {
    if (!has_index(name)) return 0;
    return service_->count(name);
}

void QdrantVectorStore::persist(const std::string& name, const std::filesystem::path&) {
    spdlog::debug("Qdrant collection '{}' is persisted by the service", name);
}

void QdrantVectorStore::load(const std::string& name, const std::filesystem::path&) {
    spdlog::debug("Qdrant collection '{}' is loaded from the service", name);
}

RecoveredIndex QdrantVectorStore::scroll_collection(const std::string& name) {
    // Keyed by ref_doc_id; insertion order of first sighting decides listing order.
    std::vector<std::string> order;
    std::map<std::string, PartialDocument> partial;

    json offset;
    do {
        auto page = service_->scroll(name, kScrollBatch, offset);
        for (const auto& point : page.points) {
            const json& payload = point.payload;
            if (!payload.is_object()) {
                throw CorruptionError("Point " + point.id + " in collection '" + name +
                                      "' has no payload object");
            }
            json content = node_content(payload);

            std::string doc_id = payload.value("ref_doc_id", payload.value("doc_id", std::string()));
            if (doc_id.empty()) {
                throw CorruptionError("Point " + point.id + " in collection '" + name +
                                      "' carries no ref_doc_id");
            }
            std::string text = payload.value("text", content.value("text", std::string()));
            Metadata metadata = metadata_from_json(
                payload.contains("metadata") ? payload["metadata"] : content.value("metadata", json::object()));
            int chunk_index = payload.value("chunk_index", 0);

            auto [it, inserted] = partial.try_emplace(doc_id);
            if (inserted) order.push_back(doc_id);
            auto& doc = it->second;
            if (payload.contains("doc_text") && payload["doc_text"].is_string()) {
                doc.doc_text = payload["doc_text"].get<std::string>();
            }
            if (doc.metadata.empty()) doc.metadata = metadata;

            IndexedNode node;
            node.node_id = payload.value("node_id", point.id);
            node.source_doc_id = doc_id;
            node.text = std::move(text);
            node.metadata = std::move(metadata);
            node.chunk_index = chunk_index;
            doc.chunks.emplace(chunk_index, std::move(node));
        }
        offset = page.next_offset;
    } while (!offset.is_null());

    RecoveredIndex recovered;
    recovered.name = name;
    for (const auto& doc_id : order) {
        auto& doc = partial[doc_id];
        std::string text = doc.doc_text;
        if (text.empty()) {
            for (const auto& [idx, node] : doc.chunks) text += node.text;
        }

        RecoveredDocument rd;
        rd.document = make_stored_document(Document{text, doc.metadata});
        rd.document.doc_id = doc_id;
        for (auto& [idx, node] : doc.chunks) rd.nodes.push_back(std::move(node));
        recovered.documents.push_back(std::move(rd));
    }
    return recovered;
}

std::optional<RecoveredIndex> QdrantVectorStore::recover(const std::string& name) {
    if (!service_->collection_exists(name)) {
        throw NotFoundError("Qdrant collection '" + name + "' does not exist");
    }
    auto recovered = scroll_collection(name);
    std::lock_guard<std::mutex> lock(mutex_);
    known_.insert(name);
    return recovered;
}

std::vector<RecoveredIndex> QdrantVectorStore::discover() {
    std::vector<RecoveredIndex> out;
    for (const auto& name : service_->list_collections()) {
        try {
            auto recovered = scroll_collection(name);
            spdlog::info("♻️ Restored collection '{}' ({} documents)", name, recovered.documents.size());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                known_.insert(name);
            }
            out.push_back(std::move(recovered));
        } catch (const RagError& e) {
            spdlog::error("❌ Failed to restore collection '{}': {}", name, e.what());
        } catch (const json::exception& e) {
            spdlog::error("❌ Failed to restore collection '{}': {}", name, e.what());
        }
    }
    return out;
}

void QdrantVectorStore::drop_index(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        known_.erase(name);
    }
    try {
        service_->delete_collection(name);
    } catch (const RagError& e) {
        spdlog::warn("⚠️ Could not delete Qdrant collection '{}': {}", name, e.what());
    }
}

std::vector<std::string> QdrantVectorStore::list_indexes() const {
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names = known_;
    }
    try {
        for (auto& n : service_->list_collections()) names.insert(std::move(n));
    } catch (const RagError& e) {
        spdlog::warn("⚠️ Could not list Qdrant collections: {}", e.what());
    }
    return {names.begin(), names.end()};
}

} // namespace rag_engine
