#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace rag_engine::qdrant {

// Name of the dense vector inside every collection.
inline constexpr const char* kDenseVectorName = "text-dense";

struct PointRecord {
    std::string id;
    std::vector<float> vector;
    nlohmann::json payload;
};

struct ScoredPoint {
    std::string id;
    float score = 0.0f;
    nlohmann::json payload;
};

struct ScrollPage {
    std::vector<PointRecord> points;
    nlohmann::json next_offset;   // null when the scroll is exhausted
};

// The subset of the Qdrant collection API the engine relies on.
class CollectionService {
public:
    virtual ~CollectionService() = default;

    virtual std::vector<std::string> list_collections() = 0;
    virtual bool collection_exists(const std::string& name) = 0;
    virtual void create_collection(const std::string& name, size_t dimension) = 0;
    virtual void delete_collection(const std::string& name) = 0;

    virtual void upsert(const std::string& name, const std::vector<PointRecord>& points) = 0;
    virtual void delete_points(const std::string& name, const std::vector<std::string>& ids) = 0;
    virtual std::vector<ScoredPoint> search(const std::string& name,
                                            const std::vector<float>& vector,
                                            size_t limit) = 0;
    virtual ScrollPage scroll(const std::string& name, size_t limit, const nlohmann::json& offset) = 0;
    virtual size_t count(const std::string& name) = 0;
};

// Process-local stand-in with the same semantics (cosine similarity, scroll
// ordered by point id). Used when no server URL is configured; its contents
// are lost with the process.
class InMemoryCollectionService : public CollectionService {
public:
    std::vector<std::string> list_collections() override;
    bool collection_exists(const std::string& name) override;
    void create_collection(const std::string& name, size_t dimension) override;
    void delete_collection(const std::string& name) override;

    void upsert(const std::string& name, const std::vector<PointRecord>& points) override;
    void delete_points(const std::string& name, const std::vector<std::string>& ids) override;
    std::vector<ScoredPoint> search(const std::string& name,
                                    const std::vector<float>& vector,
                                    size_t limit) override;
    ScrollPage scroll(const std::string& name, size_t limit, const nlohmann::json& offset) override;
    size_t count(const std::string& name) override;

private:
    struct Collection {
        size_t dimension = 0;
        std::map<std::string, PointRecord> points;
    };

    Collection& collection_locked(const std::string& name);

    std::mutex mutex_;
    std::map<std::string, Collection> collections_;
};

std::shared_ptr<CollectionService> make_in_memory_collection_service();

} // namespace rag_engine::qdrant
