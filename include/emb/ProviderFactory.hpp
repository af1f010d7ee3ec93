#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "emb/EmbeddingProvider.hpp"

namespace emb {

enum class TokenizerKind {
    Bpe,        // CLIP byte-level BPE: vocab.json + merges.txt
    WordPiece   // BERT-style vocab.txt (multilingual text towers)
};

struct ProviderConfig {
    std::string text_model;    // onnx
    std::string image_model;   // onnx, optional: no image embeddings without it
    TokenizerKind tokenizer = TokenizerKind::Bpe;
    std::string vocab;
    std::string merges;        // Bpe only
    size_t max_len = 77;
    bool lowercase = true;     // WordPiece only
    int threads = 1;
};

// Builds and initializes the provider for `kind` once; nullptr on failure
// (reason printed to stderr).
std::unique_ptr<EmbeddingProvider> make_provider(ProviderKind kind, const ProviderConfig& cfg);

} // namespace emb
