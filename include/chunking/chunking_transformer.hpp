#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "chunking/code_splitter.hpp"
#include "chunking/sentence_splitter.hpp"
#include "engine_config.hpp"
#include "models.hpp"

namespace rag_engine {

// Picks a splitter from document metadata:
//   split_type == "code"  -> CodeSplitter for metadata["language"] (required)
//   anything else         -> SentenceSplitter
// Code splitters are created on first use and cached per language.
class ChunkingTransformer {
public:
    explicit ChunkingTransformer(const ChunkingConfig& config, double chars_per_token = 3.0);

    std::vector<std::string> split(const Document& doc);

    size_t cached_code_splitters() const;

private:
    CodeSplitter& code_splitter(const std::string& language);

    ChunkingConfig config_;
    SentenceSplitter sentence_splitter_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<CodeSplitter>> code_splitters_;
};

} // namespace rag_engine
