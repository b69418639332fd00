#pragma once
#include <optional>
#include <string>
#include <vector>
#include "engine_config.hpp"
#include "models.hpp"

namespace rag_engine {

// Trims a ranked list so the prompt fits in the model's context window.
//
//   available = context_window - query_tokens - prompt_overhead - reserved_response
//
// Nodes are walked most relevant first; a node whose estimate exceeds what is
// left is skipped and the walk continues with the next one.
class ContextBudgetFilter {
public:
    explicit ContextBudgetFilter(ContextConfig config) : config_(std::move(config)) {}

    std::vector<RankedResult> select(std::vector<RankedResult> nodes,
                                     int query_tokens,
                                     int reserved_response_tokens) const;

    // Estimates the query's tokens and reserves min(max_tokens, response_token_buffer).
    std::vector<RankedResult> select(std::vector<RankedResult> nodes,
                                     const std::string& query,
                                     std::optional<int> max_tokens = std::nullopt) const;

    int available_tokens(int query_tokens, int reserved_response_tokens) const;
    int estimate(const std::string& text) const;

    const ContextConfig& config() const { return config_; }

private:
    ContextConfig config_;
};

} // namespace rag_engine
