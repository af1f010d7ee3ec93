#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "emb/TextTokenizer.hpp"

// BERT-style tokenizer for the multilingual text tower. UTF-8 aware: CJK
// ideographs become single tokens, and lowercasing strips Latin-1 accents.
class WordPieceTokenizer final : public TextTokenizer {
public:
    bool load_vocab(const std::string& vocab_path, bool lowercase = true);

    // [CLS] ... [SEP], truncated and then padded to max_len
    TokenizedText encode(const std::string& text, size_t max_len) const override;

    int64_t pad_id() const { return lookup("[PAD]", 0); }
    int64_t unk_id() const { return lookup("[UNK]", -1); }
    int64_t cls_id() const { return lookup("[CLS]", -1); }
    int64_t sep_id() const { return lookup("[SEP]", -1); }

    size_t vocab_size() const { return m_vocab.size(); }

private:
    std::vector<std::string> m_vocab;
    std::unordered_map<std::string, int64_t> m_ids;
    bool m_lowercase = true;

    static constexpr size_t kMaxWordChars = 100;

    // words and single-symbol tokens, each a list of UTF-8 encoded code points
    std::vector<std::vector<std::string>> split_words(const std::string& text) const;
    std::vector<std::string> wordpiece(const std::vector<std::string>& chars) const;

    int64_t lookup(const std::string& tok, int64_t def) const;
};
