#include "chunking/chunking_transformer.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace rag_engine {

ChunkingTransformer::ChunkingTransformer(const ChunkingConfig& config, double chars_per_token)
    : config_(config),
      sentence_splitter_(config.chunk_size, config.chunk_overlap, chars_per_token) {}

CodeSplitter& ChunkingTransformer::code_splitter(const std::string& language) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = code_splitters_.find(language);
    if (it == code_splitters_.end()) {
        auto splitter = std::make_unique<CodeSplitter>(language, static_cast<size_t>(config_.code_max_chars));
        spdlog::info("🌳 Code splitter ready for '{}'", language);
        it = code_splitters_.emplace(language, std::move(splitter)).first;
    }
    return *it->second;
}

std::vector<std::string> ChunkingTransformer::split(const Document& doc) {
    auto type = doc.metadata.find("split_type");
    if (type != doc.metadata.end() && type->second == "code") {
        auto lang = doc.metadata.find("language");
        if (lang == doc.metadata.end() || lang->second.empty()) {
            throw InvalidRequestError("Language not specified in node metadata.");
        }
        return code_splitter(lang->second).split_text(doc.text);
    }
    return sentence_splitter_.split_text(doc.text);
}

size_t ChunkingTransformer::cached_code_splitters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return code_splitters_.size();
}

} // namespace rag_engine
