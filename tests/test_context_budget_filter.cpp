#include <catch2/catch.hpp>
#include "context_budget_filter.hpp"

using namespace rag_engine;

namespace {

// chars_per_token is 3, so `tokens` tokens take 3 * tokens characters.
RankedResult node(const std::string& id, double score, int tokens, ScoreKind kind = ScoreKind::Similarity) {
    return {id, "doc-" + id, std::string(static_cast<size_t>(tokens) * 3, 'x'), score, kind, {}};
}

ContextConfig window(int context_window) {
    ContextConfig c;
    c.context_window = context_window;
    c.chars_per_token = 3.0;
    c.prompt_overhead_tokens = 150;
    c.response_token_buffer = 1000;
    return c;
}

} // namespace

TEST_CASE("Budget of 600 tokens admits two 250-token nodes", "[context]") {
    ContextBudgetFilter filter(window(1000));
    REQUIRE(filter.available_tokens(50, 200) == 600);

    auto selected = filter.select({node("a", 0.9, 250), node("b", 0.8, 250), node("c", 0.7, 250)}, 50, 200);
    REQUIRE(selected.size() == 2);
    REQUIRE(selected[0].node_id == "a");
    REQUIRE(selected[1].node_id == "b");
}

TEST_CASE("Non-positive budget yields nothing", "[context]") {
    ContextBudgetFilter filter(window(300));
    REQUIRE(filter.select({node("a", 0.9, 1)}, 50, 200).empty());
    REQUIRE(filter.select({}, 0, 0).empty());
}

TEST_CASE("Oversized nodes are skipped and the walk continues", "[context]") {
    ContextBudgetFilter filter(window(1000));
    auto selected = filter.select({node("huge", 0.99, 700), node("small", 0.5, 100), node("tiny", 0.4, 50)}, 50, 200);
    REQUIRE(selected.size() == 2);
    REQUIRE(selected[0].node_id == "small");
    REQUIRE(selected[1].node_id == "tiny");
}

TEST_CASE("Nodes are walked most relevant first for each score kind", "[context]") {
    ContextBudgetFilter filter(window(1000));

    SECTION("similarity: highest first") {
        auto selected = filter.select({node("low", 0.1, 300), node("high", 0.9, 300), node("mid", 0.5, 300)}, 50, 200);
        REQUIRE(selected.size() == 2);
        REQUIRE(selected[0].node_id == "high");
        REQUIRE(selected[1].node_id == "mid");
    }

    SECTION("distance: lowest first") {
        auto selected = filter.select({node("far", 2.0, 300, ScoreKind::Distance),
                                       node("near", 0.1, 300, ScoreKind::Distance),
                                       node("mid", 1.0, 300, ScoreKind::Distance)}, 50, 200);
        REQUIRE(selected.size() == 2);
        REQUIRE(selected[0].node_id == "near");
        REQUIRE(selected[1].node_id == "mid");
    }
}

TEST_CASE("Similarity threshold drops weak nodes", "[context]") {
    auto config = window(5000);

    SECTION("similarity scores below the threshold") {
        config.similarity_threshold = 0.5;
        ContextBudgetFilter filter(config);
        auto selected = filter.select({node("strong", 0.8, 10), node("weak", 0.3, 10)}, 0, 0);
        REQUIRE(selected.size() == 1);
        REQUIRE(selected[0].node_id == "strong");
    }

    SECTION("distances above the threshold") {
        config.similarity_threshold = 1.0;
        ContextBudgetFilter filter(config);
        auto selected = filter.select({node("near", 0.4, 10, ScoreKind::Distance),
                                       node("far", 1.5, 10, ScoreKind::Distance)}, 0, 0);
        REQUIRE(selected.size() == 1);
        REQUIRE(selected[0].node_id == "near");
    }
}

TEST_CASE("max_tokens caps the reserved response budget", "[context]") {
    ContextBudgetFilter filter(window(1000));
    std::vector<RankedResult> nodes = {node("a", 0.9, 250), node("b", 0.8, 250), node("c", 0.7, 250)};

    // Without max_tokens the default 1000-token reservation exhausts the window.
    REQUIRE(filter.select(nodes, std::string()).empty());

    // 1000 - 0 - 150 - 100 = 750 tokens: all three fit.
    REQUIRE(filter.select(nodes, std::string(), 100).size() == 3);

    // A 150-character query costs 50 tokens: 700 left, two fit.
    REQUIRE(filter.select(nodes, std::string(150, 'q'), 100).size() == 2);
}
