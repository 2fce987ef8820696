#pragma once
#include "emb/TextEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

// Sentence-transformer (MiniLM family) ONNX export: mean pooling over the last hidden state.
class MiniLmEmbedder final : public TextEmbedder {
public:
    // throws std::runtime_error if the vocab or model cannot be loaded
    MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path);

    std::vector<float> embed(const std::string& text, size_t max_len = 256) const override;

private:
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "media-recs"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
    size_t m_input_count = 3;
};

}  // namespace emb
