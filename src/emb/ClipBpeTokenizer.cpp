#include "emb/ClipBpeTokenizer.hpp"

#include <cctype>
#include <climits>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

static std::string utf8_encode(int cp) {
    std::string s;
    if (cp < 0x80) {
        s.push_back((char)cp);
    } else if (cp < 0x800) {
        s.push_back((char)(0xC0 | (cp >> 6)));
        s.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        s.push_back((char)(0xE0 | (cp >> 12)));
        s.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back((char)(0x80 | (cp & 0x3F)));
    }
    return s;
}

// GPT-2 / CLIP reversible byte -> printable code point table
static std::vector<std::string> build_byte_table() {
    std::vector<int> cps(256, -1);
    for (int b = '!'; b <= '~'; ++b) cps[b] = b;
    for (int b = 0xA1; b <= 0xAC; ++b) cps[b] = b;
    for (int b = 0xAE; b <= 0xFF; ++b) cps[b] = b;

    int n = 0;
    for (int b = 0; b < 256; ++b) {
        if (cps[b] < 0) cps[b] = 256 + n++;
    }

    std::vector<std::string> out(256);
    for (int b = 0; b < 256; ++b) out[b] = utf8_encode(cps[b]);
    return out;
}

void ClipBpeTokenizer::load(const std::string& vocab_json, const std::string& merges_txt) {
    std::ifstream vf(vocab_json);
    if (!vf) throw std::runtime_error("cannot open BPE vocab: " + vocab_json);

    nlohmann::json j;
    try {
        vf >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse BPE vocab: " + vocab_json + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("BPE vocab must be an object: " + vocab_json);

    m_vocab.clear();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number_integer()) {
            throw std::runtime_error("BPE vocab id for '" + it.key() + "' must be an integer");
        }
        m_vocab[it.key()] = it.value().get<int64_t>();
    }

    auto id_or = [&](const char* tok, int64_t def) {
        auto it = m_vocab.find(tok);
        return it == m_vocab.end() ? def : it->second;
    };
    m_bos = id_or("<|startoftext|>", -1);
    m_eos = id_or("<|endoftext|>", -1);
    m_pad = id_or("<|pad|>", 0);

    std::ifstream mf(merges_txt);
    if (!mf) throw std::runtime_error("cannot open BPE merges: " + merges_txt);

    m_ranks.clear();
    std::string line;
    int rank = 0;
    while (std::getline(mf, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;  // "#version: 0.2"
        std::istringstream iss(line);
        std::string a, b;
        if (iss >> a >> b) m_ranks[{a, b}] = rank++;
    }

    m_byte_to_sym = build_byte_table();
}

std::string ClipBpeTokenizer::clean_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool prev_space = true;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!prev_space) out.push_back(' ');
            prev_space = true;
        } else {
            out.push_back((char)std::tolower(c));
            prev_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> ClipBpeTokenizer::pre_tokenize(const std::string& cleaned) {
    // ASCII rendition of CLIP's split pattern
    static const std::regex re(
        R"(<\|startoftext\|>|<\|endoftext\|>|'s|'t|'re|'ve|'m|'ll|'d|[a-z]+|[0-9]|[^\sa-z0-9]+)");

    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(cleaned.begin(), cleaned.end(), re); it != std::sregex_iterator(); ++it) {
        std::string tok = it->str();
        if (!tok.empty()) out.push_back(std::move(tok));
    }
    return out;
}

static std::set<std::pair<std::string, std::string>> get_pairs(const std::vector<std::string>& word) {
    std::set<std::pair<std::string, std::string>> pairs;
    for (size_t i = 0; i + 1 < word.size(); ++i) pairs.emplace(word[i], word[i + 1]);
    return pairs;
}

std::vector<std::string> ClipBpeTokenizer::bpe(const std::string& token) const {
    if (token.empty() || m_byte_to_sym.empty()) return {};

    std::vector<std::string> word;
    word.reserve(token.size());
    for (unsigned char c : token) word.push_back(m_byte_to_sym[c]);
    word.back() += "</w>";

    if (word.size() == 1) return word;

    auto pairs = get_pairs(word);
    while (true) {
        int min_rank = INT_MAX;
        std::pair<std::string, std::string> bigram;
        for (const auto& p : pairs) {
            auto it = m_ranks.find(p);
            if (it != m_ranks.end() && it->second < min_rank) {
                min_rank = it->second;
                bigram = p;
            }
        }
        if (min_rank == INT_MAX) break;

        std::vector<std::string> merged;
        merged.reserve(word.size());
        for (size_t i = 0; i < word.size();) {
            if (i + 1 < word.size() && word[i] == bigram.first && word[i + 1] == bigram.second) {
                merged.push_back(word[i] + word[i + 1]);
                i += 2;
            } else {
                merged.push_back(word[i]);
                i += 1;
            }
        }
        word.swap(merged);
        if (word.size() == 1) break;
        pairs = get_pairs(word);
    }
    return word;
}

TokenizedText ClipBpeTokenizer::encode(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids;
    if (m_bos >= 0) ids.push_back(m_bos);

    const size_t reserve_eos = (m_eos >= 0) ? 1 : 0;
    for (const auto& w : pre_tokenize(clean_text(text))) {
        for (const auto& piece : bpe(w)) {
            if (ids.size() + reserve_eos >= max_len) break;
            auto it = m_vocab.find(piece);
            if (it != m_vocab.end()) ids.push_back(it->second);
        }
        if (ids.size() + reserve_eos >= max_len) break;
    }
    if (m_eos >= 0) ids.push_back(m_eos);

    TokenizedText out;
    out.ids.assign(max_len, m_pad);
    out.mask.assign(max_len, 0);
    for (size_t i = 0; i < ids.size() && i < max_len; ++i) {
        out.ids[i] = ids[i];
        out.mask[i] = 1;
    }
    return out;
}
