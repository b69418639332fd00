#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

namespace rag_engine {

// A document rebuilt from a backend that owns its own durability.
struct RecoveredDocument {
    StoredDocument document;
    std::vector<IndexedNode> nodes;   // embeddings left empty
};

struct RecoveredIndex {
    std::string name;
    std::vector<RecoveredDocument> documents;
};

// Dense-vector storage keyed by node id. Implementations translate node ids to
// whatever handle their engine needs.
class VectorIndexBackend {
public:
    virtual ~VectorIndexBackend() = default;

    virtual const char* kind() const = 0;

    // True when callers must serialise writers against readers themselves.
    virtual bool requires_local_lock() const = 0;

    // True when the backend keeps its own durable copy of every index, so the
    // engine needs no local snapshot to come back after a restart.
    virtual bool persists_remotely() const = 0;

    // Creates the index if it does not exist yet.
    virtual void create_index(const std::string& name) = 0;
    virtual bool has_index(const std::string& name) const = 0;

    // Upserts: a node id that is already present has its vector replaced.
    // Returns the node ids written, in input order.
    virtual std::vector<std::string> add(const std::string& name,
                                         const std::vector<IndexedNode>& nodes) = 0;

    // Returns how many of the given node ids were present and removed.
    virtual size_t remove(const std::string& name, const std::vector<std::string>& node_ids) = 0;

    // Best match first.
    virtual std::vector<VectorHit> search(const std::string& name,
                                          const std::vector<float>& query,
                                          size_t top_k) const = 0;

    virtual size_t node_count(const std::string& name) const = 0;

    virtual void persist(const std::string& name, const std::filesystem::path& dir) = 0;
    virtual void load(const std::string& name, const std::filesystem::path& dir) = 0;

    // Rebuilds one index from backend-owned state. nullopt means the backend
    // keeps no such state and the caller must load a local snapshot instead.
    virtual std::optional<RecoveredIndex> recover(const std::string& name) = 0;

    // Rediscovers every index the backend can see without local files.
    // Indexes that fail to parse are logged and left out.
    virtual std::vector<RecoveredIndex> discover() = 0;

    virtual void drop_index(const std::string& name) = 0;
    virtual std::vector<std::string> list_indexes() const = 0;
};

} // namespace rag_engine
