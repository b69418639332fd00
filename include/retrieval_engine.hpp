#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ThreadPool.hpp"
#include "chunking/chunking_transformer.hpp"
#include "context_budget_filter.hpp"
#include "document_store.hpp"
#include "embedding_service.hpp"
#include "engine_config.hpp"
#include "llm_reranker.hpp"
#include "models.hpp"
#include "qdrant/collection_service.hpp"
#include "retriever/bm25_retriever.hpp"
#include "vector_index_backend.hpp"

namespace rag_engine {

// Orchestrates named indexes over one vector backend.
//
// Every index owns a DocumentStore (document bodies, chunk texts, listing
// order) and a BM25 retriever over it; vectors live in the backend under the
// same name. When the backend is not internally synchronised, writers
// (index, update, remove, restore, delete_index, persist) take the engine
// lock exclusively and readers take it shared.
class RetrievalEngine {
public:
    // With `auto_restore` set, the engine is returned only after every index
    // has been rebuilt from the persist directory (FAISS) or rediscovered from
    // the vector service (Qdrant). Indexes that fail to restore are logged and
    // skipped.
    RetrievalEngine(EngineConfig config,
                    std::shared_ptr<VectorIndexBackend> backend,
                    std::shared_ptr<EmbeddingModel> embedder,
                    CompletionFunction completion = {});
    ~RetrievalEngine();

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    // Returns the documents that were newly written; duplicates are skipped.
    std::vector<StoredDocument> index(const std::string& index_name, const std::vector<Document>& documents);

    std::vector<RankedResult> retrieve(const std::string& index_name,
                                       const std::string& query,
                                       size_t top_k = 0,
                                       const nlohmann::json& metadata_filter = nullptr);

    // Retrieve, optionally rerank with the completion model, fit the context
    // budget, then complete. `rerank_params` takes `top_n` and
    // `choice_batch_size`; null or {} skips reranking.
    QueryResponse query(const std::string& index_name,
                        const std::string& query,
                        size_t top_k = 0,
                        const nlohmann::json& llm_params = nullptr,
                        const nlohmann::json& metadata_filter = nullptr,
                        const nlohmann::json& rerank_params = nullptr);

    UpdateResult update(const std::string& index_name, const std::vector<UpdateRequestItem>& items);
    DeleteResult remove(const std::string& index_name, const std::vector<std::string>& doc_ids);

    DocumentPage list_documents(const std::string& index_name, size_t limit, size_t offset,
                                std::optional<size_t> max_text_length = std::nullopt) const;
    AggregatedPage list_all_documents(size_t limit, size_t offset,
                                      std::optional<size_t> max_text_length = std::nullopt) const;

    StoredDocument get_document(const std::string& index_name, const std::string& doc_id) const;
    bool document_exists(const std::string& index_name, const std::string& doc_id) const;

    void persist(const std::string& index_name, std::optional<std::filesystem::path> path = std::nullopt);
    void persist_all();
    void restore(const std::string& index_name, const std::filesystem::path& path);
    void delete_index(const std::string& index_name);
    std::vector<std::string> list_indexes() const;

    size_t document_count(const std::string& index_name) const;
    const EngineConfig& config() const { return config_; }
    const VectorIndexBackend& backend() const { return *backend_; }

private:
    struct Index {
        explicit Index(std::string n) : name(std::move(n)), keyword(store) {}
        std::string name;
        DocumentStore store;
        BM25Retriever keyword;
    };

    struct PreparedDocument {
        StoredDocument doc;
        std::vector<IndexedNode> nodes;
        std::vector<NodeRecord> records;
    };

    void initialize();

    std::shared_ptr<Index> find_index(const std::string& name) const;
    std::shared_ptr<Index> find_or_create_index(const std::string& name);
    bool is_registered(const std::shared_ptr<Index>& idx) const;

    PreparedDocument prepare(const Document& doc);
    std::optional<StoredDocument> insert(Index& idx, PreparedDocument prepared);
    void adopt(const RecoveredIndex& recovered);

    std::unique_lock<std::shared_mutex> write_lock() const;
    std::shared_lock<std::shared_mutex> read_lock() const;

    std::filesystem::path index_dir(const std::string& name) const;
    void persist_locked(const Index& idx, const std::filesystem::path& dir);
    void write_registry() const;
    std::vector<std::string> registry_names() const;

    EngineConfig config_;
    std::shared_ptr<VectorIndexBackend> backend_;
    std::shared_ptr<EmbeddingModel> embedder_;
    CompletionFunction completion_;
    LlmReranker reranker_;

    ChunkingTransformer chunker_;
    ContextBudgetFilter context_filter_;

    mutable std::shared_mutex rw_mutex_;
    mutable std::mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<Index>> indexes_;

    ThreadPool pool_;
};

// Renders retrieved nodes and the question into the completion prompt.
std::string build_query_prompt(const std::vector<RankedResult>& nodes, const std::string& query);

std::shared_ptr<qdrant::CollectionService> make_collection_service(const EngineConfig& config);
std::shared_ptr<VectorIndexBackend> make_backend(const EngineConfig& config);
std::shared_ptr<EmbeddingModel> make_embedding_model(const EngineConfig& config);
// Empty when no completion endpoint is configured.
CompletionFunction make_completion_function(const EngineConfig& config);

} // namespace rag_engine
