#include "qdrant/qdrant_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace rag_engine::qdrant {

using json = nlohmann::json;

std::string point_id_to_string(const json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_unsigned() || id.is_number_integer()) return id.dump();
    throw CorruptionError("Unsupported point id: " + id.dump());
}

QdrantClient::QdrantClient(std::string base_url, std::string api_key, int timeout_ms)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string QdrantClient::collection_path(const std::string& name) const {
    return "/collections/" + cpr::util::urlEncode(name);
}

json QdrantClient::request(Method method, const std::string& path, const json& body) {
    cpr::Url url{base_url_ + path};
    cpr::Header header{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) header["api-key"] = api_key_;
    cpr::Timeout timeout{timeout_ms_};
    cpr::Body payload{body.is_null() ? std::string() : body.dump()};

    cpr::Response r;
    switch (method) {
        case Method::Get:    r = cpr::Get(url, header, timeout); break;
        case Method::Put:    r = cpr::Put(url, header, payload, timeout); break;
        case Method::Post:   r = cpr::Post(url, header, payload, timeout); break;
        case Method::Delete: r = cpr::Delete(url, header, timeout); break;
    }

    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) {
        throw BackendUnavailableError("Qdrant at " + base_url_ + " unreachable: " + r.error.message);
    }
    if (r.status_code >= 500) {
        throw BackendUnavailableError("Qdrant error [" + std::to_string(r.status_code) + "] on " +
                                      path + ": " + r.text);
    }
    if (r.status_code == 404) {
        throw NotFoundError("Qdrant: " + path + " not found");
    }
    if (r.status_code >= 400) {
        throw RagError("Qdrant rejected " + path + " [" + std::to_string(r.status_code) + "]: " + r.text);
    }

    try {
        auto j = json::parse(r.text);
        return j.contains("result") ? j["result"] : json();
    } catch (const json::exception& e) {
        throw CorruptionError("Qdrant returned unparsable body for " + path + ": " + e.what());
    }
}

std::vector<std::string> QdrantClient::list_collections() {
    auto result = request(Method::Get, "/collections");
    std::vector<std::string> names;
    for (const auto& c : result.value("collections", json::array())) {
        names.push_back(c.at("name").get<std::string>());
    }
    return names;
}

bool QdrantClient::collection_exists(const std::string& name) {
    auto result = request(Method::Get, collection_path(name) + "/exists");
    return result.value("exists", false);
}

void QdrantClient::create_collection(const std::string& name, size_t dimension) {
    json body = {
        {"vectors", {
            {kDenseVectorName, {{"size", dimension}, {"distance", "Cosine"}}}
        }}
    };
    request(Method::Put, collection_path(name), body);
    spdlog::info("Created Qdrant collection '{}' with named vector '{}' (dim={})",
                 name, kDenseVectorName, dimension);
}

void QdrantClient::delete_collection(const std::string& name) {
    request(Method::Delete, collection_path(name));
}

void QdrantClient::upsert(const std::string& name, const std::vector<PointRecord>& points) {
    if (points.empty()) return;
    json j_points = json::array();
    for (const auto& p : points) {
        j_points.push_back({
            {"id", p.id},
            {"vector", {{kDenseVectorName, p.vector}}},
            {"payload", p.payload}
        });
    }
    request(Method::Put, collection_path(name) + "/points?wait=true", json{{"points", j_points}});
}

void QdrantClient::delete_points(const std::string& name, const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    request(Method::Post, collection_path(name) + "/points/delete?wait=true", json{{"points", ids}});
}

std::vector<ScoredPoint> QdrantClient::search(const std::string& name,
                                              const std::vector<float>& vector,
                                              size_t limit) {
    json body = {
        {"vector", {{"name", kDenseVectorName}, {"vector", vector}}},
        {"limit", limit},
        {"with_payload", true}
    };
    auto result = request(Method::Post, collection_path(name) + "/points/search", body);

    std::vector<ScoredPoint> out;
    for (const auto& hit : result) {
        out.push_back({
            point_id_to_string(hit.at("id")),
            hit.value("score", 0.0f),
            hit.value("payload", json::object())
        });
    }
    return out;
}

ScrollPage QdrantClient::scroll(const std::string& name, size_t limit, const json& offset) {
    json body = {
        {"limit", limit},
        {"with_payload", true},
        {"with_vector", false}
    };
    if (!offset.is_null()) body["offset"] = offset;
    auto result = request(Method::Post, collection_path(name) + "/points/scroll", body);

    ScrollPage page;
    for (const auto& p : result.value("points", json::array())) {
        page.points.push_back({point_id_to_string(p.at("id")), {}, p.value("payload", json())});
    }
    page.next_offset = result.value("next_page_offset", json());
    return page;
}

size_t QdrantClient::count(const std::string& name) {
    auto result = request(Method::Post, collection_path(name) + "/points/count", json{{"exact", true}});
    return result.value("count", size_t{0});
}

} // namespace rag_engine::qdrant
