#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <faiss/MetricType.h>
#include "vector_index_backend.hpp"

namespace faiss { struct IndexIDMap2; }

namespace rag_engine {

// In-process backend: one FAISS flat inner-product index per name, wrapped in
// an id map so vectors can be removed by handle.
//
// FAISS only knows 64-bit ids, so each index keeps a translation table between
// node ids and handles. Handles come from a per-index counter and are never
// reused, which keeps surviving vectors addressable after deletions.
//
// Not internally synchronised: requires_local_lock() is true and the engine
// holds its process-wide reader/writer lock around every call.
class FaissVectorStore : public VectorIndexBackend {
public:
    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore() override;

    const char* kind() const override { return "faiss"; }
    bool requires_local_lock() const override { return true; }
    bool persists_remotely() const override { return false; }

    void create_index(const std::string& name) override;
    bool has_index(const std::string& name) const override;

    std::vector<std::string> add(const std::string& name,
                                 const std::vector<IndexedNode>& nodes) override;
    size_t remove(const std::string& name, const std::vector<std::string>& node_ids) override;
    std::vector<VectorHit> search(const std::string& name,
                                  const std::vector<float>& query,
                                  size_t top_k) const override;
    size_t node_count(const std::string& name) const override;

    void persist(const std::string& name, const std::filesystem::path& dir) override;
    void load(const std::string& name, const std::filesystem::path& dir) override;

    std::optional<RecoveredIndex> recover(const std::string&) override { return std::nullopt; }
    std::vector<RecoveredIndex> discover() override { return {}; }

    void drop_index(const std::string& name) override;
    std::vector<std::string> list_indexes() const override;

    int dimension() const { return dimension_; }

    // Exposed for tests: handle currently assigned to a node id, or -1.
    faiss::idx_t handle_of(const std::string& name, const std::string& node_id) const;

private:
    struct Slot {
        std::unique_ptr<faiss::IndexIDMap2> index;
        std::unordered_map<std::string, faiss::idx_t> node_to_handle;
        std::unordered_map<faiss::idx_t, std::string> handle_to_node;
        faiss::idx_t next_handle = 0;
    };

    Slot& slot(const std::string& name);
    const Slot& slot(const std::string& name) const;
    std::unique_ptr<faiss::IndexIDMap2> make_index() const;
    void remove_handles(Slot& s, const std::vector<faiss::idx_t>& handles);

    int dimension_;
    std::unordered_map<std::string, Slot> slots_;
};

} // namespace rag_engine
