#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "qdrant/collection_service.hpp"
#include "vector_index_backend.hpp"

namespace rag_engine {

// Server-resident backend: each index is a Qdrant collection holding one point
// per chunk. Point payloads carry enough of the source document to rebuild the
// local stores after a restart, so this backend needs no snapshot files.
class QdrantVectorStore : public VectorIndexBackend {
public:
    QdrantVectorStore(std::shared_ptr<qdrant::CollectionService> service, int dimension);

    const char* kind() const override { return "qdrant"; }
    bool requires_local_lock() const override { return false; }
    bool persists_remotely() const override { return true; }

    void create_index(const std::string& name) override;
    bool has_index(const std::string& name) const override;

    std::vector<std::string> add(const std::string& name,
                                 const std::vector<IndexedNode>& nodes) override;
    size_t remove(const std::string& name, const std::vector<std::string>& node_ids) override;
    std::vector<VectorHit> search(const std::string& name,
                                  const std::vector<float>& query,
                                  size_t top_k) const override;
    size_t node_count(const std::string& name) const override;

    // The service owns durability; both are no-ops apart from a log line.
    void persist(const std::string& name, const std::filesystem::path& dir) override;
    void load(const std::string& name, const std::filesystem::path& dir) override;

    std::optional<RecoveredIndex> recover(const std::string& name) override;
    std::vector<RecoveredIndex> discover() override;

    void drop_index(const std::string& name) override;
    std::vector<std::string> list_indexes() const override;

    static constexpr size_t kScrollBatch = 100;

private:
    RecoveredIndex scroll_collection(const std::string& name);

    std::shared_ptr<qdrant::CollectionService> service_;
    int dimension_;
    mutable std::mutex mutex_;
    std::set<std::string> known_;
};

} // namespace rag_engine
