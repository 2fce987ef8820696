#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace emb {

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    return m_tok_to_id.count("[CLS]") && m_tok_to_id.count("[SEP]");
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

static bool is_ascii_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

// ASCII-lowercased words, each ASCII punctuation mark its own token.
// Multi-byte UTF-8 sequences stay inside their word.
std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char ch : text) {
        const unsigned char c = (unsigned char)ch;
        if (std::isspace(c) && c < 0x80) {
            flush();
        } else if (is_ascii_punct(c)) {
            flush();
            out.emplace_back(1, ch);
        } else if (c < 0x80) {
            cur.push_back((char)std::tolower(c));
        } else {
            cur.push_back(ch);
        }
    }
    flush();
    return out;
}

// Greedy longest-match-first; a word with any unmatched span becomes a single [UNK].
void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<int64_t>& out, size_t room) const {
    if (room == 0) return;
    if (word.size() > kMaxWordBytes) {
        out.push_back(unk_id());
        return;
    }

    std::vector<int64_t> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        int64_t found = -1;
        while (end > start) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub = "##" + sub;
            auto it = m_tok_to_id.find(sub);
            if (it != m_tok_to_id.end()) {
                found = it->second;
                break;
            }
            --end;
        }
        if (found < 0) {
            out.push_back(unk_id());
            return;
        }
        pieces.push_back(found);
        start = end;
    }

    for (size_t i = 0; i < pieces.size() && i < room; ++i) out.push_back(pieces[i]);
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids;
    if (max_len < 2) max_len = 2;
    ids.reserve(max_len);
    ids.push_back(cls_id());

    for (const auto& w : basic_tokenize(text)) {
        if (ids.size() + 1 >= max_len) break;  // keep room for [SEP]
        wordpiece(w, ids, max_len - 1 - ids.size());
    }

    ids.push_back(sep_id());
    return ids;
}

}  // namespace emb
