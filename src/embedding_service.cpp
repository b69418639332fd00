#include "embedding_service.hpp"
#include "errors.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace rag_engine {

using json = nlohmann::json;

namespace {

json post_json(const EndpointConfig& endpoint, const json& body, const char* what) {
    cpr::Header header{{"Content-Type", "application/json"}};
    if (!endpoint.api_key.empty()) header["Authorization"] = "Bearer " + endpoint.api_key;

    auto r = cpr::Post(cpr::Url{endpoint.url},
                       cpr::Body{body.dump(-1, ' ', false, json::error_handler_t::replace)},
                       header,
                       cpr::Timeout{endpoint.timeout_ms});

    if (r.error.code != cpr::ErrorCode::OK || r.status_code == 0) {
        throw BackendUnavailableError(std::string(what) + " endpoint " + endpoint.url +
                                      " unreachable: " + r.error.message);
    }
    if (r.status_code >= 500) {
        spdlog::error("❌ {} API error [{}]: {}", what, r.status_code, r.text);
        throw BackendUnavailableError(std::string(what) + " endpoint returned " + std::to_string(r.status_code));
    }
    if (r.status_code != 200) {
        spdlog::error("❌ {} API rejected request [{}]: {}", what, r.status_code, r.text);
        throw RagError(std::string(what) + " request failed [" + std::to_string(r.status_code) + "]: " + r.text);
    }
    try {
        return json::parse(r.text);
    } catch (const json::exception& e) {
        throw RagError(std::string(what) + " endpoint returned invalid JSON: " + e.what());
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::vector<float>> EmbeddingModel::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed(t));
    return out;
}

RemoteEmbeddingService::RemoteEmbeddingService(EndpointConfig endpoint, int dimension)
    : endpoint_(std::move(endpoint)), dimension_(dimension) {
    if (endpoint_.url.empty()) {
        throw InvalidRequestError("Remote embedding requires a URL (REMOTE_EMBEDDING_URL)");
    }
}

json RemoteEmbeddingService::post(const json& body) const {
    return post_json(endpoint_, body, "Embedding");
}

std::vector<float> RemoteEmbeddingService::embed(const std::string& text) {
    return embed_batch({text}).front();
}

std::vector<std::vector<float>> RemoteEmbeddingService::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out(texts.size());
    std::vector<size_t> missing;
    for (size_t i = 0; i < texts.size(); ++i) {
        if (auto cached = cache_.get(endpoint_.model, texts[i])) {
            out[i] = std::move(*cached);
        } else {
            missing.push_back(i);
        }
    }
    if (missing.empty()) return out;

    json input = json::array();
    for (size_t i : missing) input.push_back(texts[i]);
    json body = {{"input", input}};
    if (!endpoint_.model.empty()) body["model"] = endpoint_.model;

    auto start = std::chrono::high_resolution_clock::now();
    auto response = post(body);
    auto end = std::chrono::high_resolution_clock::now();
    spdlog::debug("Embedded {} texts in {:.1f}ms", missing.size(),
                  std::chrono::duration<double, std::milli>(end - start).count());

    if (!response.contains("data") || !response["data"].is_array() ||
        response["data"].size() != missing.size()) {
        throw RagError("Embedding response does not match request size");
    }

    for (const auto& item : response["data"]) {
        size_t pos = item.value("index", size_t{0});
        if (pos >= missing.size()) throw RagError("Embedding response index out of range");
        auto vec = item.at("embedding").get<std::vector<float>>();
        if (static_cast<int>(vec.size()) != dimension_) {
            throw RagError("Embedding dimension " + std::to_string(vec.size()) +
                           " does not match configured " + std::to_string(dimension_));
        }
        size_t slot = missing[pos];
        cache_.set(endpoint_.model, texts[slot], vec);
        out[slot] = std::move(vec);
    }
    return out;
}

LlmParams LlmParams::from_json(const json& j) {
    LlmParams p;
    if (j.is_null()) return p;
    if (!j.is_object()) throw InvalidRequestError("llm_params must be a JSON object");

    for (const auto& [key, value] : j.items()) {
        if (key == "temperature") {
            if (!value.is_number()) throw InvalidRequestError("temperature must be a number");
            double t = value.get<double>();
            if (t < 0.0 || t > 1.0) {
                throw InvalidRequestError("Temperature must be between 0.0 and 1.0.");
            }
            p.temperature = t;
        } else if (key == "max_tokens") {
            if (!value.is_number_integer() || value.get<long long>() <= 0) {
                throw InvalidRequestError("max_tokens must be a positive integer");
            }
            p.max_tokens = value.get<int>();
        } else {
            p.extra[key] = value;
        }
    }
    return p;
}

json LlmParams::to_json() const {
    json j = extra.is_object() ? extra : json::object();
    if (temperature) j["temperature"] = *temperature;
    if (max_tokens) j["max_tokens"] = *max_tokens;
    return j;
}

RemoteCompletionClient::RemoteCompletionClient(EndpointConfig endpoint)
    : endpoint_(std::move(endpoint)), chat_(ends_with(endpoint_.url, "/chat/completions")) {
    if (endpoint_.url.empty()) {
        throw InvalidRequestError("Completion client requires a URL (LLM_INFERENCE_URL)");
    }
}

std::string RemoteCompletionClient::complete(const std::string& prompt, const LlmParams& params) const {
    json body = params.to_json();
    if (!endpoint_.model.empty()) body["model"] = endpoint_.model;
    if (chat_) {
        body["messages"] = json::array({{{"role", "user"}, {"content", prompt}}});
    } else {
        body["prompt"] = prompt;
    }

    auto response = post_json(endpoint_, body, "Completion");
    try {
        const auto& choice = response.at("choices").at(0);
        if (chat_) return choice.at("message").at("content").get<std::string>();
        return choice.at("text").get<std::string>();
    } catch (const json::exception& e) {
        throw RagError(std::string("Unexpected completion response: ") + e.what());
    }
}

CompletionFunction RemoteCompletionClient::as_function() const {
    auto self = *this;
    return [self](const std::string& prompt, const LlmParams& params) {
        return self.complete(prompt, params);
    };
}

} // namespace rag_engine
