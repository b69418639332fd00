#include <catch2/catch.hpp>
#include <fstream>
#include "cli.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace rag_engine;
using rag_engine::testing::HashingEmbedder;
using rag_engine::testing::TempDir;
using rag_engine::testing::make_test_config;
using json = nlohmann::json;

namespace {

struct CliFixture {
    TempDir dir;
    EngineConfig config = make_test_config(dir.path() / "storage");
    RagEngineCli cli{std::make_unique<RetrievalEngine>(
        config, make_backend(config), std::make_shared<HashingEmbedder>(64))};

    std::string write_file(const std::string& name, const std::string& text) {
        auto path = dir.path() / name;
        std::ofstream out(path);
        out << text;
        return path.string();
    }

    json run(const std::vector<std::string>& argv) { return cli.run(Args::parse(argv)); }
};

} // namespace

TEST_CASE("Arguments split into positionals and options", "[cli]") {
    auto args = Args::parse(std::vector<std::string>{"list", "docs", "--limit", "5", "--offset", "2"});
    REQUIRE(args.positional == std::vector<std::string>{"list", "docs"});
    REQUIRE(args.opt_size("limit", 10) == 5);
    REQUIRE(args.opt_size("offset", 0) == 2);
    REQUIRE(args.opt("missing", "fallback") == "fallback");

    REQUIRE_THROWS_AS(Args::parse(std::vector<std::string>{"list", "--limit"}), InvalidRequestError);
    REQUIRE_THROWS_AS(Args::parse(std::vector<std::string>{"x", "--limit", "many"}).opt_size("limit", 0),
                      InvalidRequestError);
    REQUIRE_THROWS_AS(Args::parse(std::vector<std::string>{"x", "--filter", "{nope"}).opt_json("filter"),
                      InvalidRequestError);
}

TEST_CASE_METHOD(CliFixture, "The update command replaces a document from a file", "[cli]") {
    auto written = run({"index", "notes", write_file("a.txt", "The first draft of the notes.")});
    REQUIRE(written.size() == 1);
    const std::string old_id = written[0]["doc_id"];

    auto result = run({"update", "notes", old_id, write_file("b.txt", "The second draft of the notes."),
                       "--metadata", R"({"author": "sam"})"});
    REQUIRE(result["updated_documents"].size() == 1);
    REQUIRE(result["unchanged_documents"].empty());
    REQUIRE(result["not_found_documents"].empty());

    const auto& updated = result["updated_documents"][0];
    REQUIRE(updated["doc_id"] != old_id);
    REQUIRE(updated["text"] == "The second draft of the notes.");
    REQUIRE(updated["metadata"]["author"] == "sam");

    auto fetched = run({"get", "notes", updated["doc_id"].get<std::string>()});
    REQUIRE(fetched["text"] == "The second draft of the notes.");
    REQUIRE_THROWS_AS(run({"get", "notes", old_id}), NotFoundError);

    auto listing = run({"list", "notes"});
    REQUIRE(listing["count"] == 1);
}

TEST_CASE_METHOD(CliFixture, "The update command reports unknown doc ids", "[cli]") {
    run({"index", "notes", write_file("a.txt", "Some indexed text.")});

    auto result = run({"update", "notes", "no-such-doc", write_file("b.txt", "Replacement text.")});
    REQUIRE(result["updated_documents"].empty());
    REQUIRE(result["not_found_documents"] == json::array({"no-such-doc"}));

    SECTION("missing arguments and files are errors") {
        REQUIRE_THROWS_AS(run({"update", "notes", "no-such-doc"}), InvalidRequestError);
        REQUIRE_THROWS_AS(run({"update", "notes", "no-such-doc", (dir.path() / "absent.txt").string()}),
                          NotFoundError);
        REQUIRE_THROWS_AS(run({"update", "notes", "no-such-doc", write_file("c.txt", "x"), "--metadata", "[1]"}),
                          InvalidRequestError);
    }
}

TEST_CASE_METHOD(CliFixture, "Unknown commands are rejected", "[cli]") {
    REQUIRE_THROWS_AS(run({"frobnicate"}), InvalidRequestError);
    REQUIRE_THROWS_AS(run({}), InvalidRequestError);
}
