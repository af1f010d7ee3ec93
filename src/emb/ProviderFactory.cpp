#include "emb/ProviderFactory.hpp"

#include <iostream>

#include "emb/OnnxClipEmbedder.hpp"

namespace emb {

std::unique_ptr<EmbeddingProvider> make_provider(ProviderKind kind, const ProviderConfig& cfg) {
    if (cfg.text_model.empty() || cfg.vocab.empty()) {
        std::cerr << "make_provider(" << provider_kind_str(kind) << "): text_model and vocab are required\n";
        return nullptr;
    }
    if (cfg.tokenizer == TokenizerKind::Bpe && cfg.merges.empty()) {
        std::cerr << "make_provider(" << provider_kind_str(kind) << "): bpe tokenizer needs merges\n";
        return nullptr;
    }

    auto p = std::make_unique<OnnxClipEmbedder>(kind);
    if (!p->init(cfg)) return nullptr;
    return p;
}

} // namespace emb
