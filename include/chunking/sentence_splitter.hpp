#pragma once
#include <string>
#include <vector>
#include "chunking/text_splitter.hpp"

namespace rag_engine {

// Prose splitter that prefers to break between paragraphs, then between
// sentences, then between words. Pieces are packed into chunks of at most
// `chunk_size` estimated tokens; each chunk starts with up to
// `chunk_overlap` tokens taken from the tail of the previous one.
class SentenceSplitter : public TextSplitter {
public:
    SentenceSplitter(int chunk_size = 1024, int chunk_overlap = 200, double chars_per_token = 3.0);

    std::vector<std::string> split_text(const std::string& text) override;

private:
    struct Piece {
        std::string text;
        int tokens = 0;
    };

    int tokens(const std::string& s) const;
    void split_recursive(const std::string& text, int level, std::vector<Piece>& out) const;
    std::vector<std::string> merge(const std::vector<Piece>& pieces) const;

    int chunk_size_;
    int chunk_overlap_;
    double chars_per_token_;
};

} // namespace rag_engine
