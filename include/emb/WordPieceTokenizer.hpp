#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// BERT uncased WordPiece over a vocab.txt (one token per line, line number = id).
class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);

    // [CLS] ... [SEP], never longer than max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t unk_id() const { return id_or(0, "[UNK]"); }
    int64_t cls_id() const { return id_or(0, "[CLS]"); }
    int64_t sep_id() const { return id_or(0, "[SEP]"); }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    // words longer than this become [UNK] without a piece search
    static constexpr size_t kMaxWordBytes = 100;

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<int64_t>& out, size_t room) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};

}  // namespace emb
