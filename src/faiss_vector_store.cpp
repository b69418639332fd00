#include "faiss_vector_store.hpp"
#include "errors.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace rag_engine {

FaissVectorStore::FaissVectorStore(int dimension) : dimension_(dimension) {
    if (dimension <= 0) throw InvalidRequestError("embedding dimension must be positive");
}

FaissVectorStore::~FaissVectorStore() {
}

std::unique_ptr<faiss::IndexIDMap2> FaissVectorStore::make_index() const {
    auto flat = new faiss::IndexFlatIP(dimension_);
    auto idx = std::make_unique<faiss::IndexIDMap2>(flat);
    idx->own_fields = true;
    return idx;
}

FaissVectorStore::Slot& FaissVectorStore::slot(const std::string& name) {
    auto it = slots_.find(name);
    if (it == slots_.end()) throw NotFoundError("No such index: '" + name + "' exists.");
    return it->second;
}

const FaissVectorStore::Slot& FaissVectorStore::slot(const std::string& name) const {
    auto it = slots_.find(name);
    if (it == slots_.end()) throw NotFoundError("No such index: '" + name + "' exists.");
    return it->second;
}

void FaissVectorStore::create_index(const std::string& name) {
    if (slots_.count(name)) return;
    Slot s;
    s.index = make_index();
    slots_.emplace(name, std::move(s));
    spdlog::info("Created FAISS index '{}' (dim={})", name, dimension_);
}

bool FaissVectorStore::has_index(const std::string& name) const {
    return slots_.count(name) > 0;
}

void FaissVectorStore::remove_handles(Slot& s, const std::vector<faiss::idx_t>& handles) {
    if (handles.empty()) return;
    faiss::IDSelectorBatch selector(handles.size(), handles.data());
    s.index->remove_ids(selector);
    for (auto h : handles) {
        auto it = s.handle_to_node.find(h);
        if (it != s.handle_to_node.end()) {
            s.node_to_handle.erase(it->second);
            s.handle_to_node.erase(it);
        }
    }
}

std::vector<std::string> FaissVectorStore::add(const std::string& name,
                                               const std::vector<IndexedNode>& nodes) {
    Slot& s = slot(name);
    if (nodes.empty()) return {};

    std::vector<float> vectors_flat;
    std::vector<faiss::idx_t> ids;
    std::vector<faiss::idx_t> replaced;
    std::vector<std::string> written;
    vectors_flat.reserve(nodes.size() * dimension_);

    for (const auto& node : nodes) {
        if (static_cast<int>(node.embedding.size()) != dimension_) {
            throw InvalidRequestError("Node " + node.node_id + " has embedding dimension " +
                                      std::to_string(node.embedding.size()) + ", expected " +
                                      std::to_string(dimension_));
        }
        auto existing = s.node_to_handle.find(node.node_id);
        if (existing != s.node_to_handle.end()) replaced.push_back(existing->second);

        vectors_flat.insert(vectors_flat.end(), node.embedding.begin(), node.embedding.end());
        ids.push_back(s.next_handle++);
        written.push_back(node.node_id);
    }

    remove_handles(s, replaced);

    faiss::fvec_renorm_L2(dimension_, ids.size(), vectors_flat.data());
    s.index->add_with_ids(static_cast<faiss::idx_t>(ids.size()), vectors_flat.data(), ids.data());

    for (size_t i = 0; i < ids.size(); ++i) {
        s.node_to_handle[written[i]] = ids[i];
        s.handle_to_node[ids[i]] = written[i];
    }

    spdlog::debug("Added {} vectors to FAISS index '{}'. Total: {}", ids.size(), name, s.index->ntotal);
    return written;
}

size_t FaissVectorStore::remove(const std::string& name, const std::vector<std::string>& node_ids) {
    Slot& s = slot(name);
    std::vector<faiss::idx_t> handles;
    for (const auto& nid : node_ids) {
        auto it = s.node_to_handle.find(nid);
        if (it != s.node_to_handle.end()) handles.push_back(it->second);
    }
    remove_handles(s, handles);
    return handles.size();
}

std::vector<VectorHit> FaissVectorStore::search(const std::string& name,
                                                const std::vector<float>& query,
                                                size_t top_k) const {
    const Slot& s = slot(name);
    if (s.index->ntotal == 0 || top_k == 0) return {};
    if (static_cast<int>(query.size()) != dimension_) {
        throw InvalidRequestError("Query embedding dimension " + std::to_string(query.size()) +
                                  " does not match index dimension " + std::to_string(dimension_));
    }

    const faiss::idx_t k = std::min<faiss::idx_t>(static_cast<faiss::idx_t>(top_k), s.index->ntotal);
    std::vector<float> query_copy = query;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> scores(k);
    std::vector<faiss::idx_t> labels(k);
    s.index->search(1, query_copy.data(), k, scores.data(), labels.data());

    std::vector<VectorHit> hits;
    hits.reserve(k);
    for (faiss::idx_t i = 0; i < k; ++i) {
        if (labels[i] == -1) continue;
        auto it = s.handle_to_node.find(labels[i]);
        if (it != s.handle_to_node.end()) {
            hits.push_back({it->second, scores[i], ScoreKind::Similarity});
        }
    }
    return hits;
}

size_t FaissVectorStore::node_count(const std::string& name) const {
    auto it = slots_.find(name);
    return it == slots_.end() ? 0 : static_cast<size_t>(it->second.index->ntotal);
}

void FaissVectorStore::persist(const std::string& name, const fs::path& dir) {
    const Slot& s = slot(name);
    fs::create_directories(dir);

    faiss::write_index(s.index.get(), (dir / "faiss.index").string().c_str());

    json handles = json::object();
    for (const auto& [node_id, handle] : s.node_to_handle) handles[node_id] = handle;
    json map = {
        {"dimension", dimension_},
        {"next_handle", s.next_handle},
        {"handles", handles}
    };
    std::ofstream out(dir / "vector_map.json");
    out << map.dump(2);
    if (!out) throw RagError("Failed to write " + (dir / "vector_map.json").string());
}

void FaissVectorStore::load(const std::string& name, const fs::path& dir) {
    const fs::path index_path = dir / "faiss.index";
    const fs::path map_path = dir / "vector_map.json";
    if (!fs::exists(index_path) || !fs::exists(map_path)) {
        throw NotFoundError("No FAISS snapshot for '" + name + "' at " + dir.string());
    }

    Slot s;
    try {
        std::unique_ptr<faiss::Index> raw(faiss::read_index(index_path.string().c_str()));
        auto* id_map = dynamic_cast<faiss::IndexIDMap2*>(raw.get());
        if (!id_map) throw CorruptionError("Snapshot " + index_path.string() + " is not an id-mapped index");
        raw.release();
        s.index.reset(id_map);
    } catch (const faiss::FaissException& e) {
        throw CorruptionError("Failed to read " + index_path.string() + ": " + e.what());
    }
    if (s.index->d != dimension_) {
        throw CorruptionError("Snapshot dimension " + std::to_string(s.index->d) +
                              " does not match configured " + std::to_string(dimension_));
    }

    try {
        std::ifstream in(map_path);
        json map = json::parse(in);
        s.next_handle = map.at("next_handle").get<faiss::idx_t>();
        for (const auto& [node_id, handle] : map.at("handles").items()) {
            auto h = handle.get<faiss::idx_t>();
            s.node_to_handle[node_id] = h;
            s.handle_to_node[h] = node_id;
        }
    } catch (const json::exception& e) {
        throw CorruptionError("Failed to parse " + map_path.string() + ": " + e.what());
    }

    if (static_cast<size_t>(s.index->ntotal) != s.node_to_handle.size()) {
        throw CorruptionError("Handle table for '" + name + "' lists " +
                              std::to_string(s.node_to_handle.size()) + " nodes but index holds " +
                              std::to_string(s.index->ntotal));
    }

    slots_[name] = std::move(s);
    spdlog::info("✅ Loaded FAISS index '{}' with {} vectors from {}", name, slots_[name].index->ntotal, dir.string());
}

void FaissVectorStore::drop_index(const std::string& name) {
    slots_.erase(name);
}

std::vector<std::string> FaissVectorStore::list_indexes() const {
    std::vector<std::string> names;
    for (const auto& [name, s] : slots_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

faiss::idx_t FaissVectorStore::handle_of(const std::string& name, const std::string& node_id) const {
    auto it = slots_.find(name);
    if (it == slots_.end()) return -1;
    auto h = it->second.node_to_handle.find(node_id);
    return h == it->second.node_to_handle.end() ? -1 : h->second;
}

} // namespace rag_engine
