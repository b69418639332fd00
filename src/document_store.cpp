#include "document_store.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <mutex>

namespace rag_engine {

using json = nlohmann::json;

StoredDocument make_stored_document(const Document& doc) {
    StoredDocument stored;
    stored.doc_id = generate_doc_id(doc.text);
    stored.text = doc.text;
    stored.metadata = doc.metadata;
    stored.hash = sha256_hex(doc.text + "\n" + json(doc.metadata).dump());
    return stored;
}

bool DocumentStore::put(const StoredDocument& doc, const std::vector<NodeRecord>& nodes) {
    std::unique_lock lock(mutex_);
    if (docs_.count(doc.doc_id)) return false;

    Entry entry;
    entry.seq = next_seq_++;
    entry.doc = doc;
    entry.doc.is_truncated = false;
    for (const auto& n : nodes) entry.node_ids.push_back(n.node_id);

    order_.emplace(entry.seq, doc.doc_id);
    docs_.emplace(doc.doc_id, std::move(entry));
    insert_nodes_locked(nodes);
    ++generation_;
    return true;
}

bool DocumentStore::replace(const StoredDocument& doc, const std::vector<NodeRecord>& nodes) {
    std::unique_lock lock(mutex_);
    auto it = docs_.find(doc.doc_id);
    if (it == docs_.end()) return false;

    erase_nodes_locked(it->second.node_ids);
    it->second.doc = doc;
    it->second.doc.is_truncated = false;
    it->second.node_ids.clear();
    for (const auto& n : nodes) it->second.node_ids.push_back(n.node_id);
    insert_nodes_locked(nodes);
    ++generation_;
    return true;
}

std::optional<std::vector<std::string>> DocumentStore::remove(const std::string& doc_id) {
    std::unique_lock lock(mutex_);
    auto it = docs_.find(doc_id);
    if (it == docs_.end()) return std::nullopt;

    std::vector<std::string> removed = std::move(it->second.node_ids);
    erase_nodes_locked(removed);
    order_.erase(it->second.seq);
    docs_.erase(it);
    ++generation_;
    return removed;
}

bool DocumentStore::contains(const std::string& doc_id) const {
    std::shared_lock lock(mutex_);
    return docs_.count(doc_id) > 0;
}

std::optional<StoredDocument> DocumentStore::get(const std::string& doc_id) const {
    std::shared_lock lock(mutex_);
    auto it = docs_.find(doc_id);
    if (it == docs_.end()) return std::nullopt;
    return it->second.doc;
}

std::vector<std::string> DocumentStore::node_ids(const std::string& doc_id) const {
    std::shared_lock lock(mutex_);
    auto it = docs_.find(doc_id);
    if (it == docs_.end()) return {};
    return it->second.node_ids;
}

std::optional<NodeRecord> DocumentStore::node(const std::string& node_id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeRecord> DocumentStore::nodes() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeRecord> out;
    out.reserve(nodes_.size());
    for (const auto& [seq, doc_id] : order_) {
        const auto& entry = docs_.at(doc_id);
        for (const auto& nid : entry.node_ids) {
            auto it = nodes_.find(nid);
            if (it != nodes_.end()) out.push_back(it->second);
        }
    }
    return out;
}

std::vector<StoredDocument> DocumentStore::list(size_t offset, size_t limit,
                                                std::optional<size_t> max_text_length) const {
    std::shared_lock lock(mutex_);
    std::vector<StoredDocument> page;
    if (limit == 0 || offset >= order_.size()) return page;

    auto it = order_.begin();
    std::advance(it, offset);
    for (; it != order_.end() && page.size() < limit; ++it) {
        StoredDocument view = docs_.at(it->second).doc;
        if (max_text_length && view.text.size() > *max_text_length) {
            view.text = utf8_safe_substr(view.text, *max_text_length);
            view.is_truncated = true;
        }
        page.push_back(std::move(view));
    }
    return page;
}

size_t DocumentStore::size() const {
    std::shared_lock lock(mutex_);
    return docs_.size();
}

size_t DocumentStore::node_count() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

json DocumentStore::to_json() const {
    std::shared_lock lock(mutex_);
    json documents = json::array();
    for (const auto& [seq, doc_id] : order_) {
        const auto& entry = docs_.at(doc_id);
        json j_doc = entry.doc.to_json();
        j_doc.erase("is_truncated");
        json j_nodes = json::array();
        for (const auto& nid : entry.node_ids) {
            const auto& n = nodes_.at(nid);
            j_nodes.push_back({
                {"node_id", n.node_id},
                {"text", n.text},
                {"chunk_index", n.chunk_index},
                {"metadata", n.metadata}
            });
        }
        j_doc["nodes"] = std::move(j_nodes);
        documents.push_back(std::move(j_doc));
    }
    return json{{"version", 1}, {"documents", documents}};
}

void DocumentStore::load_json(const json& j) {
    std::vector<std::pair<StoredDocument, std::vector<NodeRecord>>> parsed;
    try {
        if (!j.is_object() || !j.contains("documents") || !j["documents"].is_array()) {
            throw CorruptionError("docstore snapshot has no documents array");
        }
        for (const auto& j_doc : j["documents"]) {
            StoredDocument doc = StoredDocument::from_json(j_doc);
            std::vector<NodeRecord> nodes;
            for (const auto& j_node : j_doc.value("nodes", json::array())) {
                NodeRecord n;
                n.node_id = j_node.at("node_id").get<std::string>();
                n.doc_id = doc.doc_id;
                n.text = j_node.at("text").get<std::string>();
                n.chunk_index = j_node.value("chunk_index", 0);
                if (j_node.contains("metadata")) n.metadata = j_node["metadata"].get<Metadata>();
                nodes.push_back(std::move(n));
            }
            parsed.emplace_back(std::move(doc), std::move(nodes));
        }
    } catch (const json::exception& e) {
        throw CorruptionError(std::string("docstore snapshot is malformed: ") + e.what());
    }

    clear();
    for (const auto& [doc, nodes] : parsed) put(doc, nodes);
}

void DocumentStore::clear() {
    std::unique_lock lock(mutex_);
    order_.clear();
    docs_.clear();
    nodes_.clear();
    next_seq_ = 0;
    ++generation_;
}

void DocumentStore::insert_nodes_locked(const std::vector<NodeRecord>& nodes) {
    for (const auto& n : nodes) nodes_[n.node_id] = n;
}

void DocumentStore::erase_nodes_locked(const std::vector<std::string>& node_ids) {
    for (const auto& nid : node_ids) nodes_.erase(nid);
}

} // namespace rag_engine
