#include <catch2/catch.hpp>
#include <cstdio>
#include "errors.hpp"
#include "qdrant/collection_service.hpp"
#include "qdrant_vector_store.hpp"
#include "retrieval_engine.hpp"
#include "test_support.hpp"
#include "text_utils.hpp"

using namespace rag_engine;
using rag_engine::testing::HashingEmbedder;
using rag_engine::testing::TempDir;
using rag_engine::testing::make_test_config;
using rag_engine::testing::unit_vector;
using json = nlohmann::json;

namespace {

// Engines built here share one collection service, standing in for a Qdrant
// server that outlives the process.
struct QdrantFixture {
    TempDir dir;
    EngineConfig config = make_test_config(dir.path(), BackendType::Qdrant);
    std::shared_ptr<qdrant::InMemoryCollectionService> service =
        std::make_shared<qdrant::InMemoryCollectionService>();
    std::shared_ptr<HashingEmbedder> embedder = std::make_shared<HashingEmbedder>(64);

    std::unique_ptr<RetrievalEngine> make_engine() {
        return std::make_unique<RetrievalEngine>(
            config, std::make_shared<QdrantVectorStore>(service, 64), embedder);
    }
};

std::vector<Document> notes() {
    return {
        {"Qdrant stores vectors inside named collections.", {{"topic", "qdrant"}}},
        {"FAISS keeps its index in process memory.", {{"topic", "faiss"}}},
        {"BM25 ranks documents by keyword overlap.", {{"topic", "bm25"}}},
    };
}

} // namespace

TEST_CASE_METHOD(QdrantFixture, "A restarted engine rediscovers collections on construction", "[qdrant]") {
    auto first = make_engine();
    auto written = first->index("notes", notes());
    REQUIRE(written.size() == 3);
    first.reset();

    // Retrieval is the first thing the new engine is asked to do.
    auto second = make_engine();
    auto results = second->retrieve("notes", "keyword overlap ranking", 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].doc_id == written[2].doc_id);
    REQUIRE(second->document_count("notes") == 3);

    auto restored = second->get_document("notes", written[1].doc_id);
    REQUIRE(restored.text == written[1].text);
    REQUIRE(restored.hash == written[1].hash);
    REQUIRE(restored.metadata.at("topic") == "faiss");

    // Hashes survive the round trip, so re-indexing is still a no-op.
    REQUIRE(second->index("notes", notes()).empty());
}

TEST_CASE_METHOD(QdrantFixture, "Startup discovery can be switched off", "[qdrant]") {
    make_engine()->index("notes", notes());

    config.auto_restore = false;
    auto engine = make_engine();
    REQUIRE_THROWS_AS(engine->document_count("notes"), NotFoundError);
    // The collection is still visible on the service.
    REQUIRE(engine->list_indexes() == std::vector<std::string>{"notes"});
}

TEST_CASE_METHOD(QdrantFixture, "Indexing against Qdrant writes no snapshot files", "[qdrant]") {
    auto engine = make_engine();
    engine->index("notes", notes());
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "store.json"));
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "notes"));
}

TEST_CASE_METHOD(QdrantFixture, "Unreadable collections are skipped during discovery", "[qdrant]") {
    make_engine()->index("good", notes());

    service->create_collection("no_payload", 64);
    service->upsert("no_payload", {{"00000000-0000-0000-0000-000000000001", unit_vector(64, 1), json::array()}});
    service->create_collection("no_ref", 64);
    service->upsert("no_ref", {{"00000000-0000-0000-0000-000000000002", unit_vector(64, 2),
                                {{"text", "orphan chunk"}}}});

    auto engine = make_engine();
    REQUIRE(engine->document_count("good") == 3);
    REQUIRE_THROWS_AS(engine->document_count("no_payload"), NotFoundError);
    REQUIRE_THROWS_AS(engine->document_count("no_ref"), NotFoundError);

    // The collections still exist on the service, so they are listed.
    auto names = engine->list_indexes();
    REQUIRE(names == std::vector<std::string>{"good", "no_payload", "no_ref"});
}

TEST_CASE_METHOD(QdrantFixture, "Points written by other tools are rebuilt from _node_content", "[qdrant]") {
    service->create_collection("foreign", 64);
    json content = {{"text", "Imported chunk."}, {"metadata", {{"source", "import"}}}};
    service->upsert("foreign", {{"00000000-0000-0000-0000-00000000000a", unit_vector(64, 3),
                                 {{"_node_content", content.dump()}, {"ref_doc_id", "imported-doc"}}}});

    QdrantVectorStore store(service, 64);
    auto recovered = store.recover("foreign");
    REQUIRE(recovered);
    REQUIRE(recovered->documents.size() == 1);
    const auto& doc = recovered->documents[0];
    REQUIRE(doc.document.doc_id == "imported-doc");
    REQUIRE(doc.document.text == "Imported chunk.");
    REQUIRE(doc.document.metadata.at("source") == "import");
    REQUIRE(doc.nodes.size() == 1);
    REQUIRE(doc.nodes[0].node_id == "00000000-0000-0000-0000-00000000000a");

    REQUIRE_THROWS_AS(store.recover("missing"), NotFoundError);
}

TEST_CASE_METHOD(QdrantFixture, "Multi-chunk documents are reassembled in chunk order", "[qdrant]") {
    service->create_collection("chunks", 64);
    std::vector<qdrant::PointRecord> points;
    // Ids sort in the opposite order to chunk_index.
    for (int i = 0; i < 3; ++i) {
        points.push_back({"00000000-0000-0000-0000-00000000000" + std::to_string(9 - i), unit_vector(64, i),
                          {{"ref_doc_id", "doc"}, {"text", "part" + std::to_string(i) + " "},
                           {"chunk_index", i}, {"metadata", json::object()}}});
    }
    service->upsert("chunks", points);

    QdrantVectorStore store(service, 64);
    auto recovered = store.recover("chunks");
    REQUIRE(recovered->documents.size() == 1);
    REQUIRE(recovered->documents[0].document.text == "part0 part1 part2 ");
    REQUIRE(recovered->documents[0].nodes.front().chunk_index == 0);
}

TEST_CASE_METHOD(QdrantFixture, "Recovery scrolls past the first page", "[qdrant]") {
    const size_t total = QdrantVectorStore::kScrollBatch * 2 + 50;
    std::vector<Document> docs;
    for (size_t i = 0; i < total; ++i) docs.push_back({"Scrolled document " + std::to_string(i), {}});
    make_engine()->index("big", docs);
    REQUIRE(service->count("big") == total);

    auto engine = make_engine();
    REQUIRE(engine->document_count("big") == total);
}

TEST_CASE_METHOD(QdrantFixture, "Deletes and updates reach the collection", "[qdrant]") {
    auto engine = make_engine();
    auto written = engine->index("notes", notes());
    REQUIRE(service->count("notes") == 3);

    engine->remove("notes", {written[0].doc_id});
    REQUIRE(service->count("notes") == 2);

    auto result = engine->update("notes", {{written[1].doc_id, "FAISS can also memory-map its index.", {}}});
    REQUIRE(result.updated.size() == 1);
    REQUIRE(service->count("notes") == 2);

    auto restarted = make_engine();
    REQUIRE_FALSE(restarted->document_exists("notes", written[0].doc_id));
    REQUIRE_FALSE(restarted->document_exists("notes", written[1].doc_id));
    REQUIRE(restarted->document_exists("notes", result.updated[0].doc_id));
}

TEST_CASE_METHOD(QdrantFixture, "delete_index drops the collection", "[qdrant]") {
    auto engine = make_engine();
    engine->index("notes", notes());
    engine->delete_index("notes");
    REQUIRE_FALSE(service->collection_exists("notes"));
    REQUIRE(engine->list_indexes().empty());
}

TEST_CASE_METHOD(QdrantFixture, "Writes to an unknown collection do not create it", "[qdrant]") {
    QdrantVectorStore store(service, 64);
    IndexedNode node;
    node.node_id = "00000000-0000-0000-0000-0000000000ff";
    node.embedding = unit_vector(64, 0);
    node.source_doc_id = "doc";
    REQUIRE_THROWS_AS(store.add("ghost", {node}), NotFoundError);
    REQUIRE_FALSE(service->collection_exists("ghost"));
    REQUIRE(store.list_indexes().empty());

    store.create_index("ghost");
    REQUIRE(store.add("ghost", {node}).size() == 1);
    REQUIRE(service->count("ghost") == 1);
}

TEST_CASE("In-memory collections rank by cosine similarity", "[qdrant]") {
    qdrant::InMemoryCollectionService service;
    service.create_collection("c", 4);
    service.upsert("c", {
        {"a", {1, 0, 0, 0}, json::object()},
        {"b", {0.6f, 0.8f, 0, 0}, json::object()},
        {"c", {0, 0, 0, 5}, json::object()},
    });

    auto hits = service.search("c", {2, 0, 0, 0}, 2);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].id == "a");
    REQUIRE(hits[0].score == Approx(1.0f));
    REQUIRE(hits[1].id == "b");
    REQUIRE(hits[1].score == Approx(0.6f));

    REQUIRE_THROWS_AS(service.upsert("c", {{"d", {1, 0}, json::object()}}), InvalidRequestError);
}

TEST_CASE("In-memory scroll pages through every point once", "[qdrant]") {
    qdrant::InMemoryCollectionService service;
    service.create_collection("c", 2);
    std::vector<qdrant::PointRecord> points;
    for (int i = 0; i < 25; ++i) {
        char id[8];
        std::snprintf(id, sizeof(id), "p%03d", i);
        points.push_back({id, {1, 0}, {{"i", i}}});
    }
    service.upsert("c", points);

    std::vector<std::string> seen;
    json offset;
    int pages = 0;
    do {
        auto page = service.scroll("c", 10, offset);
        for (const auto& p : page.points) seen.push_back(p.id);
        offset = page.next_offset;
        ++pages;
    } while (!offset.is_null());

    REQUIRE(pages == 3);
    REQUIRE(seen.size() == 25);
    REQUIRE(seen.front() == "p000");
    REQUIRE(seen.back() == "p024");
}
