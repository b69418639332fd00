#pragma once
#include <string>
#include <cpr/cpr.h>
#include "qdrant/collection_service.hpp"

namespace rag_engine::qdrant {

// REST client for a Qdrant server. Transport failures and 5xx answers raise
// BackendUnavailableError; nothing is retried here.
class QdrantClient : public CollectionService {
public:
    QdrantClient(std::string base_url, std::string api_key, int timeout_ms = 30000);

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

    const std::string& base_url() const { return base_url_; }

private:
    enum class Method { Get, Put, Post, Delete };

    nlohmann::json request(Method method, const std::string& path,
                           const nlohmann::json& body = nullptr);
    std::string collection_path(const std::string& name) const;

    std::string base_url_;
    std::string api_key_;
    int timeout_ms_;
};

// Point ids come back as strings (UUID) or unsigned integers.
std::string point_id_to_string(const nlohmann::json& id);

} // namespace rag_engine::qdrant
