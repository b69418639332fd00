#include "retrieval_engine.hpp"
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "qdrant/qdrant_client.hpp"
#include "qdrant_vector_store.hpp"
#include "retriever/hybrid_retriever.hpp"
#include "retriever/vector_retriever.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <future>
#include <limits>
#include <set>
#include <spdlog/spdlog.h>

namespace rag_engine {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw NotFoundError("Missing snapshot file " + path.string());
    try {
        return json::parse(in);
    } catch (const json::exception& e) {
        throw CorruptionError("Cannot parse " + path.string() + ": " + e.what());
    }
}

void write_json_file(const fs::path& path, const json& j) {
    fs::create_directories(path.parent_path());
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        out << j.dump(2);
        if (!out) throw RagError("Failed to write " + tmp.string());
    }
    fs::rename(tmp, path);
}

} // namespace

RetrievalEngine::RetrievalEngine(EngineConfig config,
                                 std::shared_ptr<VectorIndexBackend> backend,
                                 std::shared_ptr<EmbeddingModel> embedder,
                                 CompletionFunction completion)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      embedder_(std::move(embedder)),
      completion_(std::move(completion)),
      reranker_(completion_),
      chunker_(config_.chunking, config_.context.chars_per_token),
      context_filter_(config_.context),
      pool_(static_cast<size_t>(std::max(1, config_.worker_threads))) {
    if (!backend_) throw InvalidRequestError("RetrievalEngine requires a vector backend");
    if (!embedder_) throw InvalidRequestError("RetrievalEngine requires an embedding model");
    if (embedder_->dimension() != config_.embedding_dimension) {
        throw InvalidRequestError("Embedding model dimension " + std::to_string(embedder_->dimension()) +
                                  " does not match configured " + std::to_string(config_.embedding_dimension));
    }
    initialize();
    spdlog::info("🚀 RetrievalEngine ready: backend={}, dim={}, workers={}",
                 backend_->kind(), config_.embedding_dimension, pool_.size());
}

RetrievalEngine::~RetrievalEngine() = default;

std::unique_lock<std::shared_mutex> RetrievalEngine::write_lock() const {
    if (backend_->requires_local_lock()) return std::unique_lock<std::shared_mutex>(rw_mutex_);
    return std::unique_lock<std::shared_mutex>(rw_mutex_, std::defer_lock);
}

std::shared_lock<std::shared_mutex> RetrievalEngine::read_lock() const {
    if (backend_->requires_local_lock()) return std::shared_lock<std::shared_mutex>(rw_mutex_);
    return std::shared_lock<std::shared_mutex>(rw_mutex_, std::defer_lock);
}

std::shared_ptr<RetrievalEngine::Index> RetrievalEngine::find_index(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = indexes_.find(name);
    if (it == indexes_.end()) throw NotFoundError("No such index: '" + name + "' exists.");
    return it->second;
}

// False once delete_index (or a restore) has replaced the entry.
bool RetrievalEngine::is_registered(const std::shared_ptr<Index>& idx) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = indexes_.find(idx->name);
    return it != indexes_.end() && it->second == idx;
}

std::shared_ptr<RetrievalEngine::Index> RetrievalEngine::find_or_create_index(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = indexes_.find(name);
        if (it != indexes_.end()) return it->second;
    }
    if (name.empty()) throw InvalidRequestError("Index name must not be empty");

    {
        auto lock = write_lock();
        backend_->create_index(name);
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto [it, inserted] = indexes_.emplace(name, std::make_shared<Index>(name));
    if (inserted) spdlog::info("📁 Created index '{}'", name);
    return it->second;
}

fs::path RetrievalEngine::index_dir(const std::string& name) const {
    return fs::path(config_.persist_dir) / name;
}

std::vector<std::string> RetrievalEngine::registry_names() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : indexes_) names.push_back(name);
    return names;
}

void RetrievalEngine::write_registry() const {
    json j = {{"version", 1}, {"indexes", registry_names()}};
    write_json_file(fs::path(config_.persist_dir) / "store.json", j);
}

// ---------------------------------------------------------------------------
// Indexing
// ---------------------------------------------------------------------------

RetrievalEngine::PreparedDocument RetrievalEngine::prepare(const Document& doc) {
    PreparedDocument p;
    p.doc = make_stored_document(doc);

    auto chunks = chunker_.split(doc);
    auto embeddings = embedder_->embed_batch(chunks);
    if (embeddings.size() != chunks.size()) {
        throw RagError("Embedding model returned " + std::to_string(embeddings.size()) +
                       " vectors for " + std::to_string(chunks.size()) + " chunks");
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        int chunk_index = static_cast<int>(i);
        std::string node_id = make_node_id(p.doc.doc_id, chunk_index);

        IndexedNode node;
        node.node_id = node_id;
        node.embedding = std::move(embeddings[i]);
        node.source_doc_id = p.doc.doc_id;
        node.text = chunks[i];
        node.metadata = doc.metadata;
        node.chunk_index = chunk_index;
        if (i == 0) node.document_text = doc.text;
        p.nodes.push_back(std::move(node));

        p.records.push_back({node_id, p.doc.doc_id, chunks[i], doc.metadata, chunk_index});
    }
    return p;
}

std::optional<StoredDocument> RetrievalEngine::insert(Index& idx, PreparedDocument prepared) {
    auto lock = write_lock();
    if (idx.store.contains(prepared.doc.doc_id)) return std::nullopt;
    if (!prepared.nodes.empty()) backend_->add(idx.name, prepared.nodes);
    // Without a local lock two identical documents can race to here; the
    // backend upsert is idempotent and only one put wins.
    if (!idx.store.put(prepared.doc, prepared.records)) return std::nullopt;
    return prepared.doc;
}

std::vector<StoredDocument> RetrievalEngine::index(const std::string& index_name,
                                                   const std::vector<Document>& documents) {
    auto idx = find_or_create_index(index_name);
    if (documents.empty()) return {};

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<std::future<std::optional<StoredDocument>>> futures;
    futures.reserve(documents.size());
    for (const auto& doc : documents) {
        futures.push_back(pool_.enqueue([this, idx, &doc]() -> std::optional<StoredDocument> {
            if (idx->store.contains(generate_doc_id(doc.text))) return std::nullopt;
            return insert(*idx, prepare(doc));
        }));
    }

    std::vector<StoredDocument> written;
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            if (auto doc = f.get()) written.push_back(std::move(*doc));
        } catch (const std::exception& e) {
            spdlog::error("❌ Indexing into '{}' failed: {}", index_name, e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }

    if (!written.empty() && !backend_->persists_remotely()) {
        auto lock = write_lock();
        if (is_registered(idx)) persist_locked(*idx, index_dir(index_name));
    }

    auto end = std::chrono::high_resolution_clock::now();
    spdlog::info("📥 Indexed {}/{} documents into '{}' in {:.2f} ms", written.size(), documents.size(),
                 index_name, std::chrono::duration<double, std::milli>(end - start).count());

    if (first_error) std::rethrow_exception(first_error);
    return written;
}

// ---------------------------------------------------------------------------
// Retrieval
// ---------------------------------------------------------------------------

std::vector<RankedResult> RetrievalEngine::retrieve(const std::string& index_name,
                                                    const std::string& query,
                                                    size_t top_k,
                                                    const json& metadata_filter) {
    if (trim(query).empty()) throw InvalidRequestError("Query must not be empty");
    auto idx = find_index(index_name);
    if (top_k == 0) top_k = static_cast<size_t>(std::max(1, config_.retrieval.max_results));

    auto start = std::chrono::high_resolution_clock::now();

    QueryBundle bundle;
    bundle.query_str = query;
    bundle.filter = MetadataFilter::from_json(metadata_filter);
    bundle.embedding = embedder_->embed(query);

    std::vector<RankedResult> results;
    {
        auto lock = read_lock();
        VectorRetriever vector(*backend_, index_name, idx->store);
        HybridRetriever hybrid(vector, idx->keyword, config_.retrieval);
        results = hybrid.retrieve(bundle, top_k);
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("⏱️ Retrieval Pipeline Time: {:.2f} ms ({} results from '{}')",
                 duration, results.size(), index_name);
    return results;
}

std::string build_query_prompt(const std::vector<RankedResult>& nodes, const std::string& query) {
    std::string context;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) context += "\n\n";
        std::string meta;
        for (const auto& [k, v] : nodes[i].metadata) meta += k + ": " + v + "\n";
        if (!meta.empty()) context += meta + "\n";
        context += nodes[i].text;
    }
    return "Context information is below.\n"
           "---------------------\n" +
           context +
           "\n---------------------\n"
           "Given the context information and not prior knowledge, answer the query.\n"
           "Query: " + query + "\n"
           "Answer: ";
}

QueryResponse RetrievalEngine::query(const std::string& index_name,
                                     const std::string& query,
                                     size_t top_k,
                                     const json& llm_params,
                                     const json& metadata_filter,
                                     const json& rerank_params) {
    LlmParams params = LlmParams::from_json(llm_params);
    if (top_k == 0) top_k = static_cast<size_t>(std::max(1, config_.retrieval.max_results));
    auto rerank = RerankParams::from_json(rerank_params, top_k, config_.rerank);
    if (!completion_) {
        throw InvalidRequestError("No completion endpoint configured (LLM_INFERENCE_URL)");
    }

    auto nodes = retrieve(index_name, query, top_k, metadata_filter);
    if (rerank) nodes = reranker_.rerank(nodes, query, *rerank, params);
    auto selected = context_filter_.select(std::move(nodes), query, params.max_tokens);

    QueryResponse response;
    response.response = completion_(build_query_prompt(selected, query), params);
    response.source_nodes = std::move(selected);
    return response;
}

// ---------------------------------------------------------------------------
// Update / delete
// ---------------------------------------------------------------------------

UpdateResult RetrievalEngine::update(const std::string& index_name, const std::vector<UpdateRequestItem>& items) {
    auto idx = find_index(index_name);
    UpdateResult result;

    struct Pending {
        std::string old_id;
        PreparedDocument prepared;
    };
    std::vector<Pending> pending;

    // Chunking and embedding happen before the writer lock is taken.
    for (const auto& item : items) {
        auto existing = idx->store.get(item.doc_id);
        if (!existing) {
            result.not_found.push_back(item.doc_id);
            continue;
        }
        Document doc{item.text, item.metadata};
        if (make_stored_document(doc).hash == existing->hash) {
            result.unchanged.push_back(*existing);
            continue;
        }
        pending.push_back({item.doc_id, prepare(doc)});
    }

    std::exception_ptr first_error;
    {
        auto lock = write_lock();
        for (auto& p : pending) {
            try {
                if (!idx->store.contains(p.old_id)) {
                    result.not_found.push_back(p.old_id);
                    continue;
                }
                const std::string& new_id = p.prepared.doc.doc_id;
                auto old_nodes = idx->store.node_ids(p.old_id);

                if (new_id == p.old_id) {
                    // Same text, new metadata: node ids are stable, so upsert and drop leftovers.
                    if (!p.prepared.nodes.empty()) backend_->add(index_name, p.prepared.nodes);
                    std::set<std::string> keep;
                    for (const auto& r : p.prepared.records) keep.insert(r.node_id);
                    std::vector<std::string> stale;
                    for (const auto& nid : old_nodes) {
                        if (!keep.count(nid)) stale.push_back(nid);
                    }
                    if (!stale.empty()) backend_->remove(index_name, stale);
                    idx->store.replace(p.prepared.doc, p.prepared.records);
                } else {
                    // Insert the new body before dropping the old one.
                    if (!idx->store.contains(new_id)) {
                        if (!p.prepared.nodes.empty()) backend_->add(index_name, p.prepared.nodes);
                        idx->store.put(p.prepared.doc, p.prepared.records);
                    }
                    if (!old_nodes.empty()) backend_->remove(index_name, old_nodes);
                    idx->store.remove(p.old_id);
                }
                result.updated.push_back(p.prepared.doc);
            } catch (const std::exception& e) {
                spdlog::error("❌ Update of '{}' in '{}' failed: {}", p.old_id, index_name, e.what());
                first_error = std::current_exception();
                break;
            }
        }
        if (!result.updated.empty() && !backend_->persists_remotely() && is_registered(idx)) {
            persist_locked(*idx, index_dir(index_name));
        }
    }

    spdlog::info("✏️ Update on '{}': {} updated, {} unchanged, {} not found", index_name,
                 result.updated.size(), result.unchanged.size(), result.not_found.size());
    if (first_error) std::rethrow_exception(first_error);
    return result;
}

DeleteResult RetrievalEngine::remove(const std::string& index_name, const std::vector<std::string>& doc_ids) {
    auto idx = find_index(index_name);
    DeleteResult result;

    auto lock = write_lock();
    std::exception_ptr first_error;
    for (const auto& doc_id : doc_ids) {
        if (!idx->store.contains(doc_id)) {
            result.not_found.push_back(doc_id);
            continue;
        }
        try {
            auto node_ids = idx->store.node_ids(doc_id);
            if (!node_ids.empty()) backend_->remove(index_name, node_ids);
            idx->store.remove(doc_id);
            result.deleted.push_back(doc_id);
        } catch (const std::exception& e) {
            spdlog::error("❌ Delete of '{}' from '{}' failed: {}", doc_id, index_name, e.what());
            first_error = std::current_exception();
            break;
        }
    }
    if (!result.deleted.empty() && !backend_->persists_remotely() && is_registered(idx)) {
        persist_locked(*idx, index_dir(index_name));
    }

    spdlog::info("🗑️ Deleted {} documents from '{}' ({} not found)", result.deleted.size(),
                 index_name, result.not_found.size());
    if (first_error) std::rethrow_exception(first_error);
    return result;
}

// ---------------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------------

DocumentPage RetrievalEngine::list_documents(const std::string& index_name, size_t limit, size_t offset,
                                             std::optional<size_t> max_text_length) const {
    auto idx = find_index(index_name);
    auto lock = read_lock();

    // One extra row tells whether another page exists.
    limit = std::min(limit, std::numeric_limits<size_t>::max() - 1);
    DocumentPage page;
    page.documents = idx->store.list(offset, limit + 1, max_text_length);
    bool has_more = page.documents.size() > limit;
    if (has_more) page.documents.resize(limit);
    page.count = page.documents.size();
    if (has_more) page.next_offset = offset + limit;
    return page;
}

AggregatedPage RetrievalEngine::list_all_documents(size_t limit, size_t offset,
                                                   std::optional<size_t> max_text_length) const {
    AggregatedPage page;
    auto names = registry_names();
    if (names.empty() || limit == 0) return page;

    // Every index gets an equal share of the page and of the offset; the
    // first `remainder` indexes take one extra.
    const size_t n = names.size();
    const size_t per_index = limit / n;
    const size_t remainder = limit % n;
    const size_t offset_per_index = offset / n;
    const size_t offset_remainder = offset % n;

    auto lock = read_lock();
    size_t remaining = limit;
    bool has_more = false;
    for (size_t i = 0; i < n; ++i) {
        size_t index_limit = per_index + (i < remainder ? 1 : 0);
        size_t index_offset = offset_per_index + (i < offset_remainder ? 1 : 0);

        std::shared_ptr<Index> idx;
        try {
            idx = find_index(names[i]);
        } catch (const NotFoundError&) {
            continue;   // deleted since the names were read
        }

        size_t available = idx->store.size();
        if (available > index_offset && available - index_offset > index_limit) has_more = true;
        if (remaining == 0 || index_limit == 0) continue;

        auto docs = idx->store.list(index_offset, std::min(index_limit, remaining), max_text_length);
        if (docs.empty()) continue;
        remaining -= docs.size();
        page.count += docs.size();
        page.indexes.emplace_back(names[i], std::move(docs));
    }

    if (has_more) page.next_offset = offset + limit;
    return page;
}

StoredDocument RetrievalEngine::get_document(const std::string& index_name, const std::string& doc_id) const {
    auto idx = find_index(index_name);
    auto lock = read_lock();
    auto doc = idx->store.get(doc_id);
    if (!doc) throw NotFoundError("Document '" + doc_id + "' not found in index '" + index_name + "'");
    return *doc;
}

bool RetrievalEngine::document_exists(const std::string& index_name, const std::string& doc_id) const {
    std::shared_ptr<Index> idx;
    try {
        idx = find_index(index_name);
    } catch (const NotFoundError&) {
        spdlog::warn("⚠️ No such index: '{}' exists in vector store.", index_name);
        return false;
    }
    auto lock = read_lock();
    return idx->store.contains(doc_id);
}

size_t RetrievalEngine::document_count(const std::string& index_name) const {
    return find_index(index_name)->store.size();
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void RetrievalEngine::persist_locked(const Index& idx, const fs::path& dir) {
    backend_->persist(idx.name, dir);
    write_json_file(dir / "docstore.json", idx.store.to_json());
    write_registry();
}

void RetrievalEngine::persist(const std::string& index_name, std::optional<fs::path> path) {
    auto idx = find_index(index_name);
    fs::path dir = path ? *path : index_dir(index_name);
    auto lock = write_lock();
    persist_locked(*idx, dir);
    spdlog::info("💾 Persisted index '{}' to {}", index_name, dir.string());
}

void RetrievalEngine::persist_all() {
    spdlog::info("💾 Persisting all indexes.");
    auto lock = write_lock();
    for (const auto& name : registry_names()) {
        persist_locked(*find_index(name), index_dir(name));
    }
    write_registry();
}

void RetrievalEngine::adopt(const RecoveredIndex& recovered) {
    auto idx = std::make_shared<Index>(recovered.name);
    for (const auto& rd : recovered.documents) {
        std::vector<NodeRecord> records;
        for (const auto& node : rd.nodes) {
            records.push_back({node.node_id, rd.document.doc_id, node.text, node.metadata, node.chunk_index});
        }
        idx->store.put(rd.document, records);
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    indexes_[recovered.name] = std::move(idx);
}

void RetrievalEngine::restore(const std::string& index_name, const fs::path& path) {
    auto lock = write_lock();

    if (auto recovered = backend_->recover(index_name)) {
        adopt(*recovered);
        spdlog::info("♻️ Restored index '{}' from {} ({} documents)", index_name, backend_->kind(),
                     recovered->documents.size());
        return;
    }

    // Parse the document snapshot first so an unreadable file leaves the live index untouched.
    auto fresh = std::make_shared<Index>(index_name);
    fresh->store.load_json(read_json_file(path / "docstore.json"));
    backend_->load(index_name, path);

    size_t vectors = backend_->node_count(index_name);
    if (vectors != fresh->store.node_count()) {
        backend_->drop_index(index_name);
        {
            std::lock_guard<std::mutex> registry_lock(registry_mutex_);
            indexes_.erase(index_name);
        }
        throw CorruptionError("Snapshot of '" + index_name + "' holds " + std::to_string(vectors) +
                              " vectors but " + std::to_string(fresh->store.node_count()) + " chunks");
    }

    {
        std::lock_guard<std::mutex> registry_lock(registry_mutex_);
        indexes_[index_name] = fresh;
    }
    spdlog::info("♻️ Restored index '{}' from {} ({} documents)", index_name, path.string(),
                 fresh->store.size());
}

void RetrievalEngine::initialize() {
    if (!config_.auto_restore) return;

    if (backend_->persists_remotely()) {
        auto discovered = backend_->discover();
        auto lock = write_lock();
        for (const auto& recovered : discovered) adopt(recovered);
        spdlog::info("♻️ Rediscovered {} indexes from {}", discovered.size(), backend_->kind());
        return;
    }

    fs::path registry = fs::path(config_.persist_dir) / "store.json";
    if (!fs::exists(registry)) {
        spdlog::info("No persisted indexes under {}", config_.persist_dir);
        return;
    }

    std::vector<std::string> names;
    try {
        auto j = read_json_file(registry);
        names = j.at("indexes").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        spdlog::error("❌ Index registry {} is malformed: {}", registry.string(), e.what());
        return;
    } catch (const RagError& e) {
        spdlog::error("❌ Index registry {} unreadable: {}", registry.string(), e.what());
        return;
    }

    for (const auto& name : names) {
        try {
            restore(name, index_dir(name));
        } catch (const RagError& e) {
            spdlog::error("❌ Failed to restore index '{}': {}", name, e.what());
        }
    }
}

void RetrievalEngine::delete_index(const std::string& index_name) {
    auto lock = write_lock();
    {
        std::lock_guard<std::mutex> registry_lock(registry_mutex_);
        if (!indexes_.erase(index_name)) {
            throw NotFoundError("No such index: '" + index_name + "' exists.");
        }
    }
    backend_->drop_index(index_name);

    if (!backend_->persists_remotely()) {
        std::error_code ec;
        fs::remove_all(index_dir(index_name), ec);
        if (ec) spdlog::warn("⚠️ Could not remove {}: {}", index_dir(index_name).string(), ec.message());
        write_registry();
    }
    spdlog::info("🗑️ Deleted index '{}'", index_name);
}

std::vector<std::string> RetrievalEngine::list_indexes() const {
    std::set<std::string> names;
    for (auto& n : registry_names()) names.insert(std::move(n));
    {
        auto lock = read_lock();
        for (auto& n : backend_->list_indexes()) names.insert(std::move(n));
    }
    return {names.begin(), names.end()};
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

std::shared_ptr<qdrant::CollectionService> make_collection_service(const EngineConfig& config) {
    if (config.vector_db_url.empty()) {
        spdlog::warn("⚠️ VECTOR_DB_URL not set, Qdrant runs in memory and loses data on exit");
        return qdrant::make_in_memory_collection_service();
    }
    return std::make_shared<qdrant::QdrantClient>(config.vector_db_url, config.vector_db_api_key);
}

std::shared_ptr<VectorIndexBackend> make_backend(const EngineConfig& config) {
    switch (config.backend) {
        case BackendType::Faiss:
            return std::make_shared<FaissVectorStore>(config.embedding_dimension);
        case BackendType::Qdrant:
            return std::make_shared<QdrantVectorStore>(make_collection_service(config),
                                                       config.embedding_dimension);
    }
    throw InvalidRequestError("Unknown backend type");
}

std::shared_ptr<EmbeddingModel> make_embedding_model(const EngineConfig& config) {
    return std::make_shared<RemoteEmbeddingService>(config.embedding, config.embedding_dimension);
}

CompletionFunction make_completion_function(const EngineConfig& config) {
    if (config.completion.url.empty()) return {};
    return RemoteCompletionClient(config.completion).as_function();
}

} // namespace rag_engine
