#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Fixed-length model input: ids padded to max_len, mask 1 for real tokens.
struct TokenizedText {
    std::vector<int64_t> ids;
    std::vector<int64_t> mask;

    size_t length() const {
        size_t n = 0;
        for (int64_t m : mask) n += (m != 0);
        return n;
    }
};

class TextTokenizer {
public:
    virtual ~TextTokenizer() = default;
    virtual TokenizedText encode(const std::string& text, size_t max_len) const = 0;
};
