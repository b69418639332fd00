#include "chunking/sentence_splitter.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <deque>

namespace rag_engine {

namespace {

// Cuts after every occurrence of `sep`, keeping the separator on the left piece.
std::vector<std::string> split_keep(const std::string& text, const std::string& sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        size_t end = pos + sep.size();
        parts.push_back(text.substr(start, end - start));
        start = end;
    }
    return parts;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && i + 1 < text.size() &&
            (text[i + 1] == ' ' || text[i + 1] == '\n' || text[i + 1] == '\t')) {
            parts.push_back(text.substr(start, i + 2 - start));
            start = i + 2;
            ++i;
        }
    }
    if (start < text.size()) parts.push_back(text.substr(start));
    return parts;
}

} // namespace

SentenceSplitter::SentenceSplitter(int chunk_size, int chunk_overlap, double chars_per_token)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap), chars_per_token_(chars_per_token) {
    if (chunk_size_ <= 0) throw InvalidRequestError("chunk_size must be positive");
    if (chars_per_token_ <= 0.0) throw InvalidRequestError("chars_per_token must be positive");
    if (chunk_overlap_ < 0 || chunk_overlap_ >= chunk_size_) {
        throw InvalidRequestError("chunk_overlap must be in [0, chunk_size)");
    }
}

// Rounded up so the pieces of a chunk never add up to less than the chunk's own estimate.
int SentenceSplitter::tokens(const std::string& s) const {
    if (s.empty()) return 0;
    return static_cast<int>(std::ceil(static_cast<double>(s.size()) / chars_per_token_));
}

void SentenceSplitter::split_recursive(const std::string& text, int level, std::vector<Piece>& out) const {
    int t = tokens(text);
    if (t <= chunk_size_) {
        out.push_back({text, t});
        return;
    }

    std::vector<std::string> parts;
    switch (level) {
        case 0: parts = split_keep(text, "\n\n"); break;
        case 1: parts = split_keep(text, "\n"); break;
        case 2: parts = split_sentences(text); break;
        case 3: parts = split_keep(text, " "); break;
        default: {
            // Hard cut on UTF-8 boundaries.
            size_t max_bytes = std::max<size_t>(1, static_cast<size_t>(chunk_size_ * chars_per_token_));
            std::string rest = text;
            while (!rest.empty()) {
                std::string head = utf8_safe_substr(rest, max_bytes);
                if (head.empty()) head = rest.substr(0, 1);
                out.push_back({head, tokens(head)});
                rest.erase(0, head.size());
            }
            return;
        }
    }

    if (parts.size() <= 1) {
        split_recursive(text, level + 1, out);
        return;
    }
    for (const auto& p : parts) split_recursive(p, level + 1, out);
}

std::vector<std::string> SentenceSplitter::merge(const std::vector<Piece>& pieces) const {
    std::vector<std::string> chunks;
    std::deque<Piece> current;
    int current_tokens = 0;
    bool fresh = true;   // nothing but overlap in `current`

    auto close_chunk = [&]() {
        std::string joined;
        for (const auto& p : current) joined += p.text;
        chunks.push_back(std::move(joined));

        std::deque<Piece> overlap;
        int overlap_tokens = 0;
        for (auto it = current.rbegin(); it != current.rend(); ++it) {
            if (overlap_tokens + it->tokens > chunk_overlap_) break;
            overlap_tokens += it->tokens;
            overlap.push_front(*it);
        }
        current = std::move(overlap);
        current_tokens = overlap_tokens;
        fresh = true;
    };

    size_t i = 0;
    while (i < pieces.size()) {
        const auto& p = pieces[i];
        if (current_tokens + p.tokens > chunk_size_ && !fresh) {
            close_chunk();
            // Overlap alone might not leave room for the next piece.
            while (!current.empty() && current_tokens + p.tokens > chunk_size_) {
                current_tokens -= current.front().tokens;
                current.pop_front();
            }
            continue;
        }
        current.push_back(p);
        current_tokens += p.tokens;
        fresh = false;
        ++i;
    }
    if (!fresh) {
        std::string joined;
        for (const auto& p : current) joined += p.text;
        chunks.push_back(std::move(joined));
    }
    return chunks;
}

std::vector<std::string> SentenceSplitter::split_text(const std::string& text) {
    if (trim(text).empty()) return {};

    std::vector<Piece> pieces;
    split_recursive(text, 0, pieces);

    std::vector<std::string> chunks;
    for (auto& c : merge(pieces)) {
        auto t = trim(c);
        if (!t.empty()) chunks.push_back(std::move(t));
    }
    return chunks;
}

} // namespace rag_engine
