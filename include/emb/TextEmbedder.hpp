#pragma once
#include <string>
#include <vector>

namespace emb {

// text -> L2-normalized vector; empty result = could not embed
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;
    virtual std::vector<float> embed(const std::string& text, size_t max_len = 256) const = 0;
};

}  // namespace emb
