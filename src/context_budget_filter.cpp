#include "context_budget_filter.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace rag_engine {

int ContextBudgetFilter::estimate(const std::string& text) const {
    return estimate_tokens(text, config_.chars_per_token);
}

int ContextBudgetFilter::available_tokens(int query_tokens, int reserved_response_tokens) const {
    return config_.context_window - query_tokens - config_.prompt_overhead_tokens - reserved_response_tokens;
}

std::vector<RankedResult> ContextBudgetFilter::select(std::vector<RankedResult> nodes,
                                                      int query_tokens,
                                                      int reserved_response_tokens) const {
    if (nodes.empty()) return {};

    int remaining = available_tokens(query_tokens, reserved_response_tokens);
    if (remaining <= 0) {
        spdlog::warn("⚠️ No context budget left (window={}, query={}, reserved={})",
                     config_.context_window, query_tokens, reserved_response_tokens);
        return {};
    }

    // A list mixes kinds only if a caller hands us one; rank by the first node's kind.
    const ScoreKind kind = nodes.front().kind;
    std::stable_sort(nodes.begin(), nodes.end(), [kind](const RankedResult& a, const RankedResult& b) {
        return more_relevant(a.score, b.score, kind);
    });

    std::vector<RankedResult> selected;
    for (auto& node : nodes) {
        if (config_.similarity_threshold &&
            more_relevant(*config_.similarity_threshold, node.score, kind)) {
            continue;
        }
        int cost = estimate(node.text);
        if (cost > remaining) continue;
        remaining -= cost;
        selected.push_back(std::move(node));
    }

    spdlog::debug("Context filter kept {}/{} nodes, {} tokens left",
                  selected.size(), nodes.size(), remaining);
    return selected;
}

std::vector<RankedResult> ContextBudgetFilter::select(std::vector<RankedResult> nodes,
                                                      const std::string& query,
                                                      std::optional<int> max_tokens) const {
    int reserved = config_.response_token_buffer;
    if (max_tokens) reserved = std::min(*max_tokens, reserved);
    return select(std::move(nodes), estimate(query), reserved);
}

} // namespace rag_engine
