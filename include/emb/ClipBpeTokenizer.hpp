#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "emb/TextTokenizer.hpp"

// CLIP byte-level BPE (vocab.json + merges.txt).
class ClipBpeTokenizer final : public TextTokenizer {
public:
    // throws std::runtime_error on unreadable or malformed files
    void load(const std::string& vocab_json, const std::string& merges_txt);

    // <|startoftext|> ... <|endoftext|>, truncated and then padded to max_len
    TokenizedText encode(const std::string& text, size_t max_len) const override;

    // BPE symbols for one pre-tokenized word, last one carrying "</w>"
    std::vector<std::string> bpe(const std::string& word) const;

    int64_t bos_id() const { return m_bos; }
    int64_t eos_id() const { return m_eos; }
    int64_t pad_id() const { return m_pad; }

private:
    std::unordered_map<std::string, int64_t> m_vocab;
    std::map<std::pair<std::string, std::string>, int> m_ranks;
    std::vector<std::string> m_byte_to_sym;  // 256 entries, UTF-8

    int64_t m_bos = -1;
    int64_t m_eos = -1;
    int64_t m_pad = 0;

    static std::string clean_text(const std::string& text);
    static std::vector<std::string> pre_tokenize(const std::string& cleaned);
};
