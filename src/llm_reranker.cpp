#include "llm_reranker.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace rag_engine {

using json = nlohmann::json;

namespace {

const char* kChoiceSelectPrompt =
    "A list of documents is shown below. Each document has a number next to it along "
    "with a summary of the document. A question is also provided. \n"
    "Respond with the numbers of the documents you should consult to answer the question, "
    "in order of relevance, as well as the relevance score. The relevance score is a number "
    "from 1-10 based on how relevant you think the document is to the question.\n"
    "Do not include any documents that are not relevant to the question. \n"
    "Example format: \n"
    "Document 1:\n<summary of document 1>\n\n"
    "Document 2:\n<summary of document 2>\n\n"
    "...\n\n"
    "Document 10:\n<summary of document 10>\n\n"
    "Question: <question>\n"
    "Answer:\n"
    "Doc: 9, Relevance: 7\n"
    "Doc: 3, Relevance: 4\n"
    "Doc: 7, Relevance: 3\n\n"
    "Let's try this now: \n\n";

size_t positive_size(const json& value, const char* key) {
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw InvalidRequestError(std::string("rerank_params.") + key + " must be a positive integer");
    }
    return value.get<size_t>();
}

// Value after the first ':' in `field`, trimmed.
std::optional<std::string> field_value(const std::string& field) {
    auto colon = field.find(':');
    if (colon == std::string::npos) return std::nullopt;
    return trim(field.substr(colon + 1));
}

} // namespace

std::optional<RerankParams> RerankParams::from_json(const json& j, size_t top_k, const RerankConfig& defaults) {
    if (j.is_null()) return std::nullopt;
    if (!j.is_object()) throw InvalidRequestError("rerank_params must be a JSON object");
    if (j.empty()) return std::nullopt;

    RerankParams p;
    p.choice_batch_size = static_cast<size_t>(std::max(1, defaults.choice_batch_size));
    p.top_n = std::min(static_cast<size_t>(std::max(1, defaults.top_n)), std::max<size_t>(1, top_k));
    for (const auto& [key, value] : j.items()) {
        if (key == "top_n") {
            p.top_n = positive_size(value, "top_n");
        } else if (key == "choice_batch_size") {
            p.choice_batch_size = positive_size(value, "choice_batch_size");
        } else {
            throw InvalidRequestError("Unknown rerank parameter: " + key);
        }
    }
    return p;
}

std::string build_choice_select_prompt(const std::vector<RankedResult>& batch, const std::string& query) {
    std::string context;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i > 0) context += "\n\n";
        context += "Document " + std::to_string(i + 1) + ":\n" + batch[i].text;
    }
    return kChoiceSelectPrompt + context + "\nQuestion: " + query + "\nAnswer:\n";
}

std::vector<std::pair<size_t, double>> parse_choice_select_answer(const std::string& answer, size_t num_choices) {
    std::vector<std::pair<size_t, double>> choices;
    std::istringstream lines(answer);
    std::string line;
    while (std::getline(lines, line)) {
        auto comma = line.find(',');
        if (comma == std::string::npos || line.find(',', comma + 1) != std::string::npos) continue;

        auto doc = field_value(line.substr(0, comma));
        auto relevance = field_value(line.substr(comma + 1));
        if (!doc || !relevance) continue;

        size_t choice = 0;
        try {
            size_t used = 0;
            long long n = std::stoll(*doc, &used);
            if (used != doc->size() || n <= 0) continue;
            choice = static_cast<size_t>(n);
        } catch (const std::exception&) {
            continue;
        }
        if (choice > num_choices) continue;

        // First run of digits, so "7/10" or "7." still reads as 7.
        auto first = std::find_if(relevance->begin(), relevance->end(),
                                  [](unsigned char c) { return std::isdigit(c); });
        if (first == relevance->end()) continue;
        auto last = std::find_if(first, relevance->end(),
                                 [](unsigned char c) { return !std::isdigit(c); });
        try {
            choices.emplace_back(choice, std::stod(std::string(first, last)));
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return choices;
}

std::vector<RankedResult> LlmReranker::rerank(const std::vector<RankedResult>& nodes,
                                              const std::string& query,
                                              const RerankParams& params,
                                              const LlmParams& llm_params) const {
    if (nodes.empty()) return {};
    if (!completion_) throw InvalidRequestError("Reranking requires a completion endpoint");

    const size_t batch_size = std::max<size_t>(1, params.choice_batch_size);
    std::vector<RankedResult> picked;
    for (size_t start = 0; start < nodes.size(); start += batch_size) {
        size_t end = std::min(nodes.size(), start + batch_size);
        std::vector<RankedResult> batch(nodes.begin() + static_cast<std::ptrdiff_t>(start),
                                        nodes.begin() + static_cast<std::ptrdiff_t>(end));

        std::string answer = completion_(build_choice_select_prompt(batch, query), llm_params);
        std::string trimmed = trim(answer);
        if (trimmed.empty() || trimmed == "Empty Response") {
            spdlog::error("❌ LLMRerank request returned an unparsable or invalid response");
            throw InvalidRequestError("Rerank operation failed: Invalid response from LLM. This feature is experimental.");
        }

        for (const auto& [choice, relevance] : parse_choice_select_answer(answer, batch.size())) {
            RankedResult node = batch[choice - 1];
            node.score = relevance;
            node.kind = ScoreKind::Fused;
            picked.push_back(std::move(node));
        }
    }

    std::stable_sort(picked.begin(), picked.end(),
                     [](const RankedResult& a, const RankedResult& b) { return a.score > b.score; });
    if (picked.size() > params.top_n) picked.resize(params.top_n);
    spdlog::info("🔀 Reranked {} nodes down to {}", nodes.size(), picked.size());
    return picked;
}

} // namespace rag_engine
