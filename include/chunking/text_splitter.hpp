#pragma once
#include <string>
#include <vector>

namespace rag_engine {

class TextSplitter {
public:
    virtual ~TextSplitter() = default;
    // Non-empty, whitespace-trimmed chunks in document order.
    virtual std::vector<std::string> split_text(const std::string& text) = 0;
};

} // namespace rag_engine
