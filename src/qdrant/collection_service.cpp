#include "qdrant/collection_service.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace rag_engine::qdrant {

namespace {

float cosine(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

} // namespace

InMemoryCollectionService::Collection& InMemoryCollectionService::collection_locked(const std::string& name) {
    auto it = collections_.find(name);
    if (it == collections_.end()) throw NotFoundError("Collection `" + name + "` doesn't exist!");
    return it->second;
}

std::vector<std::string> InMemoryCollectionService::list_collections() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, c] : collections_) names.push_back(name);
    return names;
}

bool InMemoryCollectionService::collection_exists(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.count(name) > 0;
}

void InMemoryCollectionService::create_collection(const std::string& name, size_t dimension) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (collections_.count(name)) {
        throw InvalidRequestError("Collection `" + name + "` already exists!");
    }
    collections_[name].dimension = dimension;
}

void InMemoryCollectionService::delete_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_.erase(name);
}

void InMemoryCollectionService::upsert(const std::string& name, const std::vector<PointRecord>& points) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = collection_locked(name);
    for (const auto& p : points) {
        if (p.vector.size() != c.dimension) {
            throw InvalidRequestError("Wrong input: Vector dimension error: expected dim: " +
                                      std::to_string(c.dimension) + ", got " +
                                      std::to_string(p.vector.size()));
        }
    }
    for (const auto& p : points) c.points[p.id] = p;
}

void InMemoryCollectionService::delete_points(const std::string& name, const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = collection_locked(name);
    for (const auto& id : ids) c.points.erase(id);
}

std::vector<ScoredPoint> InMemoryCollectionService::search(const std::string& name,
                                                           const std::vector<float>& vector,
                                                           size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = collection_locked(name);
    std::vector<ScoredPoint> scored;
    scored.reserve(c.points.size());
    for (const auto& [id, p] : c.points) {
        scored.push_back({id, cosine(vector, p.vector), p.payload});
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredPoint& a, const ScoredPoint& b) { return a.score > b.score; });
    if (scored.size() > limit) scored.resize(limit);
    return scored;
}

ScrollPage InMemoryCollectionService::scroll(const std::string& name, size_t limit,
                                             const nlohmann::json& offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& c = collection_locked(name);
    ScrollPage page;
    auto it = offset.is_string() ? c.points.lower_bound(offset.get<std::string>()) : c.points.begin();
    for (; it != c.points.end() && page.points.size() < limit; ++it) {
        PointRecord p = it->second;
        p.vector.clear();
        page.points.push_back(std::move(p));
    }
    if (it != c.points.end()) page.next_offset = it->first;
    return page;
}

size_t InMemoryCollectionService::count(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return collection_locked(name).points.size();
}

std::shared_ptr<CollectionService> make_in_memory_collection_service() {
    return std::make_shared<InMemoryCollectionService>();
}

} // namespace rag_engine::qdrant
