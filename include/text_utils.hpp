#pragma once
#include <string>
#include <vector>

namespace rag_engine {

// Cuts at most `length` bytes without leaving a dangling UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(const std::string& data);

// Content hash used as the document identity.
std::string generate_doc_id(const std::string& text);

// Deterministic UUID-shaped id for chunk `chunk_index` of `doc_id`.
// Qdrant only accepts integers or UUIDs as point ids, so every node id uses this form.
std::string make_node_id(const std::string& doc_id, int chunk_index);

// Lowercased alphanumeric terms, stopwords removed.
std::vector<std::string> tokenize(const std::string& text);

int estimate_tokens(const std::string& text, double chars_per_token);

std::string trim(const std::string& s);

} // namespace rag_engine
