#include <catch2/catch.hpp>
#include "errors.hpp"
#include "llm_reranker.hpp"
#include "retrieval_engine.hpp"
#include "test_support.hpp"

using namespace rag_engine;
using json = nlohmann::json;

namespace {

RankedResult node(const std::string& id, const std::string& text, double score) {
    RankedResult r;
    r.node_id = id;
    r.doc_id = "doc-" + id;
    r.text = text;
    r.score = score;
    return r;
}

std::vector<RankedResult> three_nodes() {
    return {node("a", "Apples are red.", 0.9), node("b", "Bananas are yellow.", 0.8),
            node("c", "Cherries are small.", 0.7)};
}

} // namespace

TEST_CASE("Choice-select answers are parsed leniently", "[rerank]") {
    SECTION("well-formed lines") {
        auto choices = parse_choice_select_answer("Doc: 2, Relevance: 9\nDoc: 1, Relevance: 4\n", 3);
        REQUIRE(choices.size() == 2);
        REQUIRE(choices[0].first == 2);
        REQUIRE(choices[0].second == Approx(9.0));
        REQUIRE(choices[1].first == 1);
        REQUIRE(choices[1].second == Approx(4.0));
    }

    SECTION("malformed and out-of-range lines are skipped") {
        auto choices = parse_choice_select_answer(
            "Sure, here you go:\n"
            "Doc: 7, Relevance: 8\n"
            "Doc: 0, Relevance: 8\n"
            "Doc: two, Relevance: 8\n"
            "Doc: 1, Relevance: high\n"
            "Doc: 3, Relevance: 5, extra\n"
            "Doc: 3, Relevance: 6\n",
            3);
        REQUIRE(choices.size() == 1);
        REQUIRE(choices[0].first == 3);
        REQUIRE(choices[0].second == Approx(6.0));
    }

    SECTION("the first digit run is the relevance") {
        auto choices = parse_choice_select_answer("Doc: 1, Relevance: 7/10", 1);
        REQUIRE(choices.size() == 1);
        REQUIRE(choices[0].second == Approx(7.0));
    }

    SECTION("an enormous relevance is skipped rather than thrown") {
        std::string huge(400, '9');
        REQUIRE(parse_choice_select_answer("Doc: 1, Relevance: " + huge, 1).empty());
    }
}

TEST_CASE("Rerank parameters", "[rerank]") {
    RerankConfig defaults;
    defaults.top_n = 10;
    defaults.choice_batch_size = 5;

    SECTION("null or an empty object disables reranking") {
        REQUIRE_FALSE(RerankParams::from_json(nullptr, 5, defaults));
        REQUIRE_FALSE(RerankParams::from_json(json::object(), 5, defaults));
    }

    SECTION("defaults come from config with top_n capped by top_k") {
        auto p = RerankParams::from_json({{"choice_batch_size", 2}}, 3, defaults);
        REQUIRE(p);
        REQUIRE(p->choice_batch_size == 2);
        REQUIRE(p->top_n == 3);
    }

    SECTION("explicit values win") {
        auto p = RerankParams::from_json({{"top_n", 7}}, 3, defaults);
        REQUIRE(p->top_n == 7);
        REQUIRE(p->choice_batch_size == 5);
    }

    SECTION("invalid values are rejected") {
        REQUIRE_THROWS_AS(RerankParams::from_json({{"top_n", 0}}, 3, defaults), InvalidRequestError);
        REQUIRE_THROWS_AS(RerankParams::from_json({{"top_n", -2}}, 3, defaults), InvalidRequestError);
        REQUIRE_THROWS_AS(RerankParams::from_json({{"choice_batch_size", "4"}}, 3, defaults), InvalidRequestError);
        REQUIRE_THROWS_AS(RerankParams::from_json({{"top_m", 4}}, 3, defaults), InvalidRequestError);
        REQUIRE_THROWS_AS(RerankParams::from_json(json::array(), 3, defaults), InvalidRequestError);
    }
}

TEST_CASE("Reranking orders nodes by model relevance", "[rerank]") {
    std::vector<std::string> prompts;
    LlmReranker reranker([&prompts](const std::string& prompt, const LlmParams&) {
        prompts.push_back(prompt);
        return std::string("Doc: 3, Relevance: 8\nDoc: 1, Relevance: 5\n");
    });

    RerankParams params;
    params.top_n = 10;
    params.choice_batch_size = 10;

    auto out = reranker.rerank(three_nodes(), "Which fruit is small?", params, LlmParams{});
    REQUIRE(prompts.size() == 1);
    REQUIRE(prompts[0].find("Document 3:\nCherries are small.") != std::string::npos);
    REQUIRE(prompts[0].find("Question: Which fruit is small?") != std::string::npos);

    REQUIRE(out.size() == 2);
    REQUIRE(out[0].node_id == "c");
    REQUIRE(out[0].score == Approx(8.0));
    REQUIRE(out[0].kind == ScoreKind::Fused);
    REQUIRE(out[1].node_id == "a");

    SECTION("top_n truncates") {
        params.top_n = 1;
        auto top = reranker.rerank(three_nodes(), "q", params, LlmParams{});
        REQUIRE(top.size() == 1);
        REQUIRE(top[0].node_id == "c");
    }
}

TEST_CASE("Reranking numbers choices within each batch", "[rerank]") {
    int calls = 0;
    LlmReranker reranker([&calls](const std::string&, const LlmParams&) {
        ++calls;
        // Each batch holds one node, so only choice 1 is in range.
        return "Doc: 1, Relevance: " + std::to_string(calls) + "\nDoc: 2, Relevance: 10";
    });

    RerankParams params;
    params.top_n = 3;
    params.choice_batch_size = 1;

    auto out = reranker.rerank(three_nodes(), "q", params, LlmParams{});
    REQUIRE(calls == 3);
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].node_id == "c");
    REQUIRE(out[1].node_id == "b");
    REQUIRE(out[2].node_id == "a");
}

TEST_CASE("Reranking fails on an empty model answer", "[rerank]") {
    RerankParams params;
    LlmReranker empty([](const std::string&, const LlmParams&) { return std::string("Empty Response"); });
    REQUIRE_THROWS_AS(empty.rerank(three_nodes(), "q", params, LlmParams{}), InvalidRequestError);

    LlmReranker blank([](const std::string&, const LlmParams&) { return std::string("  \n"); });
    REQUIRE_THROWS_AS(blank.rerank(three_nodes(), "q", params, LlmParams{}), InvalidRequestError);

    LlmReranker none{CompletionFunction{}};
    REQUIRE_THROWS_AS(none.rerank(three_nodes(), "q", params, LlmParams{}), InvalidRequestError);
    REQUIRE(none.rerank({}, "q", params, LlmParams{}).empty());
}

TEST_CASE("Queries can rerank before answering", "[rerank][engine]") {
    rag_engine::testing::TempDir dir;
    auto config = rag_engine::testing::make_test_config(dir.path());
    auto embedder = std::make_shared<rag_engine::testing::HashingEmbedder>(64);

    int rerank_calls = 0;
    int answer_calls = 0;
    auto completion = [&](const std::string& prompt, const LlmParams&) {
        if (prompt.find("A list of documents is shown below") != std::string::npos) {
            ++rerank_calls;
            return std::string("Doc: 2, Relevance: 9\nDoc: 1, Relevance: 4");
        }
        ++answer_calls;
        return std::string("answer");
    };
    RetrievalEngine engine(config, make_backend(config), embedder, completion);
    engine.index("fruit", {{"Apples are red fruit.", {}},
                           {"Bananas are yellow fruit.", {}},
                           {"Cherries are small red fruit.", {}}});

    auto response = engine.query("fruit", "red fruit", 3, nullptr, nullptr,
                                 {{"top_n", 2}, {"choice_batch_size", 5}});
    REQUIRE(response.response == "answer");
    REQUIRE(rerank_calls == 1);
    REQUIRE(answer_calls == 1);
    REQUIRE(response.source_nodes.size() == 2);
    REQUIRE(response.source_nodes[0].score == Approx(9.0));
    REQUIRE(response.source_nodes[1].score == Approx(4.0));

    SECTION("without rerank_params the model is asked once") {
        engine.query("fruit", "red fruit", 3);
        REQUIRE(rerank_calls == 1);
        REQUIRE(answer_calls == 2);
    }

    SECTION("bad rerank_params are rejected before retrieval") {
        REQUIRE_THROWS_AS(engine.query("fruit", "red fruit", 3, nullptr, nullptr, {{"top_n", 0}}),
                          InvalidRequestError);
        REQUIRE(rerank_calls == 1);
    }
}
