#include "text_utils.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <unordered_set>

namespace rag_engine {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    // Walk back over continuation bytes; drop the lead byte if its sequence was cut.
    size_t i = sub.size();
    size_t continuation = 0;
    while (i > 0) {
        unsigned char c = static_cast<unsigned char>(sub[i - 1]);
        if ((c & 0xC0) != 0x80) break;
        ++continuation;
        --i;
    }
    if (i == 0) return "";
    unsigned char lead = static_cast<unsigned char>(sub[i - 1]);
    size_t expected = 0;
    if (lead >= 0xF0) expected = 3;
    else if (lead >= 0xE0) expected = 2;
    else if (lead >= 0xC0) expected = 1;
    if (expected != continuation) sub.resize(i - 1);
    return sub;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

std::string generate_doc_id(const std::string& text) {
    return sha256_hex(text);
}

std::string make_node_id(const std::string& doc_id, int chunk_index) {
    std::string h = sha256_hex(doc_id + ":" + std::to_string(chunk_index));
    // 8-4-4-4-12
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
           h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::vector<std::string> tokenize(const std::string& text) {
    static const std::unordered_set<std::string> stopwords = {
        "a", "an", "and", "are", "as", "at", "be", "but", "by", "for", "if", "in",
        "into", "is", "it", "no", "not", "of", "on", "or", "such", "that", "the",
        "their", "then", "there", "these", "they", "this", "to", "was", "will", "with"
    };

    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            if (!stopwords.count(current)) tokens.push_back(current);
            current.clear();
        }
    };
    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

int estimate_tokens(const std::string& text, double chars_per_token) {
    if (text.empty() || chars_per_token <= 0.0) return 0;
    return static_cast<int>(static_cast<double>(text.size()) / chars_per_token);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace rag_engine
