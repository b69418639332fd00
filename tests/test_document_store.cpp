#include <catch2/catch.hpp>
#include "document_store.hpp"
#include "errors.hpp"
#include "text_utils.hpp"

using namespace rag_engine;

namespace {

StoredDocument stored(const std::string& text, Metadata metadata = {}) {
    return make_stored_document(Document{text, std::move(metadata)});
}

std::vector<NodeRecord> nodes_for(const StoredDocument& doc, int count = 1) {
    std::vector<NodeRecord> out;
    for (int i = 0; i < count; ++i) {
        out.push_back({make_node_id(doc.doc_id, i), doc.doc_id, doc.text + "#" + std::to_string(i),
                       doc.metadata, i});
    }
    return out;
}

} // namespace

TEST_CASE("make_stored_document derives identity from the text only", "[document_store]") {
    auto a = stored("same body", {{"author", "a"}});
    auto b = stored("same body", {{"author", "b"}});
    REQUIRE(a.doc_id == generate_doc_id("same body"));
    REQUIRE(a.doc_id == b.doc_id);
    REQUIRE(a.hash != b.hash);
    REQUIRE_FALSE(a.is_truncated);
}

TEST_CASE("DocumentStore put is at-most-once per doc id", "[document_store]") {
    DocumentStore store;
    auto doc = stored("hello world");
    REQUIRE(store.put(doc, nodes_for(doc, 2)));
    REQUIRE_FALSE(store.put(doc, nodes_for(doc, 2)));
    REQUIRE(store.size() == 1);
    REQUIRE(store.node_count() == 2);
    REQUIRE(store.contains(doc.doc_id));
    REQUIRE(store.get(doc.doc_id)->text == "hello world");
}

TEST_CASE("DocumentStore pages follow insertion order", "[document_store]") {
    DocumentStore store;
    std::vector<std::string> ids;
    for (int i = 0; i < 7; ++i) {
        auto doc = stored("document " + std::to_string(i));
        ids.push_back(doc.doc_id);
        store.put(doc, nodes_for(doc));
    }

    SECTION("consecutive pages cover every document exactly once") {
        std::vector<std::string> seen;
        for (size_t offset = 0; offset < 7; offset += 3) {
            for (const auto& d : store.list(offset, 3)) seen.push_back(d.doc_id);
        }
        REQUIRE(seen == ids);
    }

    SECTION("offset past the end yields an empty page") {
        REQUIRE(store.list(7, 3).empty());
        REQUIRE(store.list(0, 0).empty());
    }

    SECTION("removing a document does not reorder the rest") {
        store.remove(ids[1]);
        auto page = store.list(0, 3);
        REQUIRE(page.size() == 3);
        REQUIRE(page[0].doc_id == ids[0]);
        REQUIRE(page[1].doc_id == ids[2]);
        REQUIRE(page[2].doc_id == ids[3]);
    }
}

TEST_CASE("DocumentStore truncates only the returned view", "[document_store]") {
    DocumentStore store;
    auto doc = stored("abcdefghij");
    store.put(doc, nodes_for(doc));

    auto page = store.list(0, 10, 4);
    REQUIRE(page.size() == 1);
    REQUIRE(page[0].text == "abcd");
    REQUIRE(page[0].is_truncated);

    auto full = store.get(doc.doc_id);
    REQUIRE(full->text == "abcdefghij");
    REQUIRE_FALSE(full->is_truncated);

    auto untouched = store.list(0, 10, 100);
    REQUIRE_FALSE(untouched[0].is_truncated);
}

TEST_CASE("DocumentStore remove returns every node of the document", "[document_store]") {
    DocumentStore store;
    auto doc = stored("multi chunk");
    auto nodes = nodes_for(doc, 3);
    store.put(doc, nodes);

    auto removed = store.remove(doc.doc_id);
    REQUIRE(removed);
    REQUIRE(removed->size() == 3);
    REQUIRE(store.node_count() == 0);
    for (const auto& n : nodes) REQUIRE_FALSE(store.node(n.node_id));
    REQUIRE_FALSE(store.remove(doc.doc_id));
}

TEST_CASE("DocumentStore replace keeps the listing position", "[document_store]") {
    DocumentStore store;
    auto first = stored("first");
    auto second = stored("second");
    store.put(first, nodes_for(first));
    store.put(second, nodes_for(second));

    auto relabelled = stored("first", {{"tag", "new"}});
    REQUIRE(store.replace(relabelled, nodes_for(relabelled, 2)));
    auto page = store.list(0, 10);
    REQUIRE(page[0].doc_id == first.doc_id);
    REQUIRE(page[0].metadata.at("tag") == "new");
    REQUIRE(store.node_ids(first.doc_id).size() == 2);

    REQUIRE_FALSE(store.replace(stored("unknown"), {}));
}

TEST_CASE("DocumentStore generation moves on every write", "[document_store]") {
    DocumentStore store;
    auto g0 = store.generation();
    auto doc = stored("x");
    store.put(doc, nodes_for(doc));
    auto g1 = store.generation();
    REQUIRE(g1 > g0);
    store.put(doc, nodes_for(doc));
    REQUIRE(store.generation() == g1);
    store.remove(doc.doc_id);
    REQUIRE(store.generation() > g1);
}

TEST_CASE("DocumentStore snapshot round trip", "[document_store]") {
    DocumentStore store;
    auto a = stored("alpha", {{"k", "v"}});
    auto b = stored("beta");
    store.put(a, nodes_for(a, 2));
    store.put(b, nodes_for(b));

    DocumentStore copy;
    copy.load_json(store.to_json());
    REQUIRE(copy.size() == 2);
    REQUIRE(copy.node_count() == 3);
    REQUIRE(copy.list(0, 10)[0].doc_id == a.doc_id);
    REQUIRE(copy.get(a.doc_id)->hash == a.hash);
    REQUIRE(copy.get(a.doc_id)->metadata.at("k") == "v");
    REQUIRE(copy.node(make_node_id(a.doc_id, 1))->chunk_index == 1);
}

TEST_CASE("DocumentStore rejects malformed snapshots", "[document_store]") {
    DocumentStore store;
    auto doc = stored("keep me");
    store.put(doc, nodes_for(doc));

    REQUIRE_THROWS_AS(store.load_json(nlohmann::json::array()), CorruptionError);
    REQUIRE_THROWS_AS(store.load_json(nlohmann::json::parse(R"({"documents":[{"text":"no id"}]})")), CorruptionError);
    // A failed load leaves the current contents alone.
    REQUIRE(store.contains(doc.doc_id));
}
