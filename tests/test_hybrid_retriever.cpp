#include <catch2/catch.hpp>
#include "document_store.hpp"
#include "retriever/hybrid_retriever.hpp"
#include "text_utils.hpp"

using namespace rag_engine;

namespace {

// Returns a canned similarity ranking and remembers the pool it was asked for.
class CannedVectorRetriever : public Retriever {
public:
    explicit CannedVectorRetriever(std::vector<RankedResult> results) : results_(std::move(results)) {}

    std::vector<RankedResult> retrieve(const QueryBundle&, size_t top_k) const override {
        last_top_k = top_k;
        auto out = results_;
        if (out.size() > top_k) out.resize(top_k);
        return out;
    }

    mutable size_t last_top_k = 0;

private:
    std::vector<RankedResult> results_;
};

NodeRecord add(DocumentStore& store, const std::string& text) {
    auto doc = make_stored_document(Document{text, {}});
    NodeRecord node{make_node_id(doc.doc_id, 0), doc.doc_id, text, {}, 0};
    store.put(doc, {node});
    return node;
}

RankedResult similarity(const NodeRecord& node, double score) {
    return {node.node_id, node.doc_id, node.text, score, ScoreKind::Similarity, {}};
}

QueryBundle query(const std::string& q) {
    QueryBundle b;
    b.query_str = q;
    b.embedding = {1.0f};
    return b;
}

} // namespace

TEST_CASE("Hybrid fusion weighs similarity and keyword rank", "[hybrid]") {
    DocumentStore store;
    auto a = add(store, "alpha beta");
    auto b = add(store, "gamma delta");
    BM25Retriever keyword(store);
    CannedVectorRetriever vector({similarity(a, 0.9), similarity(b, 0.4)});

    RetrievalConfig config;
    config.vector_weight = 0.7;
    config.text_weight = 0.3;
    HybridRetriever hybrid(vector, keyword, config);

    auto results = hybrid.retrieve(query("alpha"), 10);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].node_id == a.node_id);
    REQUIRE(results[0].score == Approx(0.93));
    REQUIRE(results[0].kind == ScoreKind::Fused);
    REQUIRE(results[1].node_id == b.node_id);
    REQUIRE(results[1].score == Approx(0.28));
}

TEST_CASE("Hybrid weights are normalised to sum to one", "[hybrid]") {
    DocumentStore store;
    auto a = add(store, "alpha beta");
    BM25Retriever keyword(store);
    CannedVectorRetriever vector({similarity(a, 0.9)});

    RetrievalConfig config;
    config.vector_weight = 7.0;
    config.text_weight = 3.0;
    HybridRetriever hybrid(vector, keyword, config);
    REQUIRE(hybrid.vector_weight() == Approx(0.7));
    REQUIRE(hybrid.text_weight() == Approx(0.3));
    REQUIRE(hybrid.retrieve(query("alpha"), 10)[0].score == Approx(0.93));
}

TEST_CASE("Keyword-only hits score by reciprocal rank", "[hybrid]") {
    DocumentStore store;
    add(store, "needle needle needle");
    add(store, "needle in a haystack of hay");
    BM25Retriever keyword(store);
    CannedVectorRetriever vector({});

    HybridRetriever hybrid(vector, keyword, RetrievalConfig{});
    auto results = hybrid.retrieve(query("needle"), 10);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].score == Approx(0.3 * 1.0));
    REQUIRE(results[1].score == Approx(0.3 * 0.5));
}

TEST_CASE("Candidate pool follows the multiplier and the corpus size", "[hybrid]") {
    DocumentStore store;
    for (int i = 0; i < 20; ++i) add(store, "entry number " + std::to_string(i));
    BM25Retriever keyword(store);
    CannedVectorRetriever vector({});

    RetrievalConfig config;
    config.candidate_multiplier = 2.5;
    HybridRetriever hybrid(vector, keyword, config);
    REQUIRE(hybrid.candidate_pool_size(3) == 7);

    hybrid.retrieve(query("entry"), 3);
    REQUIRE(vector.last_top_k == 7);

    // Pool is clamped to the 20 chunks available.
    hybrid.retrieve(query("entry"), 10);
    REQUIRE(vector.last_top_k == 20);

    SECTION("multipliers below one behave like one") {
        config.candidate_multiplier = 0.2;
        HybridRetriever narrow(vector, keyword, config);
        REQUIRE(narrow.candidate_pool_size(4) == 4);
    }
}

TEST_CASE("Hybrid output is truncated to max_results", "[hybrid]") {
    DocumentStore store;
    std::vector<RankedResult> canned;
    for (int i = 0; i < 6; ++i) {
        auto n = add(store, "row " + std::to_string(i));
        canned.push_back(similarity(n, 0.9 - 0.1 * i));
    }
    BM25Retriever keyword(store);
    CannedVectorRetriever vector(canned);
    HybridRetriever hybrid(vector, keyword, RetrievalConfig{});

    auto results = hybrid.retrieve(query("unrelated"), 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].score >= results[1].score);
}
