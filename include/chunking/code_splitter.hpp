#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <tree_sitter/api.h>
#include "chunking/text_splitter.hpp"

extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_typescript();
}

namespace rag_engine {

// Syntax-aware splitter: walks the tree-sitter parse tree and packs sibling
// nodes into chunks of at most `max_chars` bytes, descending into any node that
// is too large on its own.
class CodeSplitter : public TextSplitter {
public:
    // Throws InvalidRequestError for a language without a linked grammar.
    CodeSplitter(const std::string& language, size_t max_chars = 1500);
    ~CodeSplitter() override;

    CodeSplitter(const CodeSplitter&) = delete;
    CodeSplitter& operator=(const CodeSplitter&) = delete;

    // Throws InvalidRequestError when the text does not parse in this language.
    std::vector<std::string> split_text(const std::string& text) override;

    const std::string& language() const { return language_; }

    // Grammar for a language name or common alias, nullptr if unsupported.
    static const TSLanguage* grammar_for(const std::string& language);

private:
    std::vector<std::string> chunk_node(TSNode node, const std::string& text, uint32_t last_end) const;

    std::string language_;
    size_t max_chars_;
    TSParser* parser_;
    std::mutex mutex_;   // TSParser is single-threaded
};

} // namespace rag_engine
