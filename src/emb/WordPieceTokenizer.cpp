#include "emb/WordPieceTokenizer.hpp"
#include <fstream>

namespace {

// one code point starting at s[i]; invalid bytes decode as themselves
uint32_t next_code_point(const std::string& s, size_t& i) {
    const unsigned char c = (unsigned char)s[i];
    size_t len = 1;
    uint32_t cp = c;
    if (c >= 0xF0 && c < 0xF8) { len = 4; cp = c & 0x07; }
    else if (c >= 0xE0) { len = 3; cp = c & 0x0F; }
    else if (c >= 0xC0) { len = 2; cp = c & 0x1F; }

    if (len == 1 || i + len > s.size()) {
        ++i;
        return c;
    }
    for (size_t k = 1; k < len; ++k) cp = (cp << 6) | ((unsigned char)s[i + k] & 0x3F);
    i += len;
    return cp;
}

std::string encode_utf8(uint32_t cp) {
    std::string s;
    if (cp < 0x80) {
        s.push_back((char)cp);
    } else if (cp < 0x800) {
        s.push_back((char)(0xC0 | (cp >> 6)));
        s.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        s.push_back((char)(0xE0 | (cp >> 12)));
        s.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        s.push_back((char)(0xF0 | (cp >> 18)));
        s.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        s.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back((char)(0x80 | (cp & 0x3F)));
    }
    return s;
}

bool is_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == 0xA0 || cp == 0x3000 ||
           (cp >= 0x2000 && cp <= 0x200A);
}

bool is_control(uint32_t cp) {
    return cp == 0 || cp == 0xFFFD || (cp < 0x20 && !is_space(cp)) || (cp >= 0x7F && cp < 0xA0);
}

bool is_punct(uint32_t cp) {
    if ((cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) || (cp >= 91 && cp <= 96) || (cp >= 123 && cp <= 126)) {
        return true;
    }
    return (cp >= 0xA1 && cp <= 0xBF && cp != 0xAA && cp != 0xB5 && cp != 0xBA) ||
           (cp >= 0x2010 && cp <= 0x205E) ||
           (cp >= 0x3001 && cp <= 0x303F) ||
           (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20);
}

bool is_cjk(uint32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
           (cp >= 0x20000 && cp <= 0x2A6DF) || (cp >= 0x2A700 && cp <= 0x2B73F) ||
           (cp >= 0x2B740 && cp <= 0x2B81F) || (cp >= 0x2B820 && cp <= 0x2CEAF) ||
           (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0x2F800 && cp <= 0x2FA1F);
}

// U+00C0..U+00FF folded to lowercase ASCII; '.' keeps the original letter
const char kLatin1Fold[] =
    "aaaaaa.ceeeeiiii.nooooo.ouuuuy.."
    "aaaaaa.ceeeeiiii.nooooo.ouuuuy.y";

uint32_t fold(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + ('a' - 'A');
    if (cp >= 0xC0 && cp <= 0xFF) {
        const char base = kLatin1Fold[cp - 0xC0];
        if (base != '.') return (uint32_t)base;
        if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    }
    return cp;
}

}  // namespace

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path, bool lowercase) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_vocab.clear();
    m_ids.clear();
    m_lowercase = lowercase;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        m_ids.emplace(line, (int64_t)m_vocab.size());
        m_vocab.push_back(std::move(line));
    }

    // unusable without the framing tokens
    return !m_vocab.empty() && cls_id() >= 0 && sep_id() >= 0;
}

int64_t WordPieceTokenizer::lookup(const std::string& tok, int64_t def) const {
    auto it = m_ids.find(tok);
    return it == m_ids.end() ? def : it->second;
}

std::vector<std::vector<std::string>> WordPieceTokenizer::split_words(const std::string& text) const {
    std::vector<std::vector<std::string>> out;
    std::vector<std::string> cur;
    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    };

    for (size_t i = 0; i < text.size();) {
        uint32_t cp = next_code_point(text, i);
        if (is_control(cp)) continue;
        if (m_lowercase) cp = fold(cp);

        if (is_space(cp)) {
            flush();
        } else if (is_punct(cp) || is_cjk(cp)) {
            flush();
            out.push_back({encode_utf8(cp)});
        } else {
            cur.push_back(encode_utf8(cp));
        }
    }
    flush();
    return out;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::vector<std::string>& chars) const {
    if (chars.empty() || chars.size() > kMaxWordChars) return {"[UNK]"};

    std::vector<std::string> pieces;
    size_t start = 0;

    // longest vocabulary match first, on code point boundaries
    while (start < chars.size()) {
        size_t end = chars.size();
        std::string match;

        for (; end > start; --end) {
            std::string sub = start > 0 ? "##" : "";
            for (size_t k = start; k < end; ++k) sub += chars[k];
            if (m_ids.count(sub)) {
                match = std::move(sub);
                break;
            }
        }

        if (match.empty()) return {"[UNK]"};
        pieces.push_back(std::move(match));
        start = end;
    }
    return pieces;
}

TokenizedText WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    const int64_t unk = unk_id();

    std::vector<int64_t> ids{cls_id()};
    for (const auto& word : split_words(text)) {
        bool full = false;
        for (const auto& p : wordpiece(word)) {
            // keep room for [SEP]
            if (ids.size() + 1 >= max_len) {
                full = true;
                break;
            }
            ids.push_back(lookup(p, unk));
        }
        if (full) break;
    }
    ids.push_back(sep_id());

    TokenizedText out;
    out.ids.assign(max_len, pad_id());
    out.mask.assign(max_len, 0);
    for (size_t i = 0; i < ids.size() && i < max_len; ++i) {
        out.ids[i] = ids[i];
        out.mask[i] = 1;
    }
    return out;
}
