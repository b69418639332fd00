#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "models.hpp"

namespace rag_engine {

// Chunk text kept next to the document so keyword search and result hydration
// never have to go back to the vector backend.
struct NodeRecord {
    std::string node_id;
    std::string doc_id;
    std::string text;
    Metadata metadata;
    int chunk_index = 0;
};

// Builds the stored form of an input document: doc_id is the content hash of
// the text alone, `hash` also covers the metadata.
StoredDocument make_stored_document(const Document& doc);

// Content-addressed document records in insertion order.
// Every method is safe to call concurrently.
class DocumentStore {
public:
    DocumentStore() = default;
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // Returns false (and changes nothing) when doc.doc_id is already stored.
    bool put(const StoredDocument& doc, const std::vector<NodeRecord>& nodes);

    // Swaps body, metadata and nodes of an existing record in place, keeping its
    // position in the listing order. Returns false if the id is unknown.
    bool replace(const StoredDocument& doc, const std::vector<NodeRecord>& nodes);

    // Returns the node ids that belonged to the document, or nullopt if unknown.
    std::optional<std::vector<std::string>> remove(const std::string& doc_id);

    bool contains(const std::string& doc_id) const;
    std::optional<StoredDocument> get(const std::string& doc_id) const;
    std::vector<std::string> node_ids(const std::string& doc_id) const;
    std::optional<NodeRecord> node(const std::string& node_id) const;
    std::vector<NodeRecord> nodes() const;

    std::vector<StoredDocument> list(size_t offset, size_t limit,
                                     std::optional<size_t> max_text_length = std::nullopt) const;

    size_t size() const;
    size_t node_count() const;

    // Bumped on every successful write; lets readers cache derived structures.
    uint64_t generation() const { return generation_.load(); }

    nlohmann::json to_json() const;
    // Throws CorruptionError on malformed input.
    void load_json(const nlohmann::json& j);
    void clear();

private:
    struct Entry {
        uint64_t seq = 0;
        StoredDocument doc;
        std::vector<std::string> node_ids;
    };

    void insert_nodes_locked(const std::vector<NodeRecord>& nodes);
    void erase_nodes_locked(const std::vector<std::string>& node_ids);

    mutable std::shared_mutex mutex_;
    uint64_t next_seq_ = 0;
    std::map<uint64_t, std::string> order_;
    std::unordered_map<std::string, Entry> docs_;
    std::unordered_map<std::string, NodeRecord> nodes_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace rag_engine
