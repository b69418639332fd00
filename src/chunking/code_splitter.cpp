#include "chunking/code_splitter.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace rag_engine {

const TSLanguage* CodeSplitter::grammar_for(const std::string& language) {
    std::string lang = language;
    std::transform(lang.begin(), lang.end(), lang.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lang == "cpp" || lang == "c++" || lang == "c" || lang == "cc") return tree_sitter_cpp();
    if (lang == "python" || lang == "py") return tree_sitter_python();
    if (lang == "typescript" || lang == "ts" || lang == "javascript" || lang == "js") return tree_sitter_typescript();
    return nullptr;
}

CodeSplitter::CodeSplitter(const std::string& language, size_t max_chars)
    : language_(language), max_chars_(max_chars), parser_(nullptr) {
    const TSLanguage* grammar = grammar_for(language);
    if (!grammar) {
        throw InvalidRequestError("Unsupported code language: '" + language + "'");
    }
    parser_ = ts_parser_new();
    if (!ts_parser_set_language(parser_, grammar)) {
        ts_parser_delete(parser_);
        throw InvalidRequestError("Grammar for '" + language + "' is incompatible with the tree-sitter runtime");
    }
}

CodeSplitter::~CodeSplitter() {
    if (parser_) ts_parser_delete(parser_);
}

std::vector<std::string> CodeSplitter::chunk_node(TSNode node, const std::string& text, uint32_t last_end) const {
    std::vector<std::string> chunks;
    std::string current;

    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_child(node, i);
        uint32_t start = ts_node_start_byte(child);
        uint32_t end = ts_node_end_byte(child);
        size_t span = end - start;

        if (span > max_chars_) {
            if (!current.empty()) chunks.push_back(current);
            current.clear();
            auto nested = chunk_node(child, text, last_end);
            chunks.insert(chunks.end(), nested.begin(), nested.end());
        } else if (current.size() + span > max_chars_) {
            chunks.push_back(current);
            current = text.substr(last_end, end - last_end);
        } else {
            current += text.substr(last_end, end - last_end);
        }
        last_end = end;
    }
    if (!current.empty()) chunks.push_back(current);
    return chunks;
}

std::vector<std::string> CodeSplitter::split_text(const std::string& text) {
    if (text.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, text.c_str(), static_cast<uint32_t>(text.length()));
    if (!tree) {
        throw InvalidRequestError("tree-sitter could not parse " + language_ + " input");
    }
    TSNode root = ts_tree_root_node(tree);

    if (ts_node_child_count(root) > 0 &&
        std::string(ts_node_type(ts_node_child(root, 0))) == "ERROR") {
        ts_tree_delete(tree);
        throw InvalidRequestError("Could not parse code with language " + language_ + ".");
    }

    auto raw = chunk_node(root, text, 0);
    ts_tree_delete(tree);

    std::vector<std::string> chunks;
    for (auto& c : raw) {
        auto t = trim(c);
        if (!t.empty()) chunks.push_back(std::move(t));
    }
    spdlog::debug("🌳 Split {} bytes of {} into {} chunks", text.size(), language_, chunks.size());
    return chunks;
}

} // namespace rag_engine
