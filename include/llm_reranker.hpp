#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "embedding_service.hpp"
#include "engine_config.hpp"
#include "models.hpp"

namespace rag_engine {

struct RerankParams {
    size_t top_n = 10;
    size_t choice_batch_size = 10;

    // nullopt for null or an empty object (no reranking). Missing keys fall
    // back to `defaults`, with top_n capped at top_k.
    static std::optional<RerankParams> from_json(const nlohmann::json& j,
                                                 size_t top_k,
                                                 const RerankConfig& defaults);
};

// Asks the completion model which retrieved nodes are relevant.
//
// Nodes are shown to the model in batches of `choice_batch_size`, numbered
// from 1 within each batch. The model answers one "Doc: N, Relevance: R" line
// per useful node; the answers of every batch are pooled, sorted by relevance
// and cut to `top_n`. The relevance becomes the node's score.
class LlmReranker {
public:
    explicit LlmReranker(CompletionFunction completion) : completion_(std::move(completion)) {}

    std::vector<RankedResult> rerank(const std::vector<RankedResult>& nodes,
                                     const std::string& query,
                                     const RerankParams& params,
                                     const LlmParams& llm_params) const;

private:
    CompletionFunction completion_;
};

std::string build_choice_select_prompt(const std::vector<RankedResult>& batch, const std::string& query);

// (1-based choice, relevance) pairs. Malformed lines and out-of-range choices are skipped.
std::vector<std::pair<size_t, double>> parse_choice_select_answer(const std::string& answer, size_t num_choices);

} // namespace rag_engine
