#pragma once

#include <map>
#include <optional>
#include <string>

#include "emb/EmbeddingProvider.hpp"

// Table-driven provider for tests: unknown inputs are absent.
class FakeProvider final : public emb::EmbeddingProvider {
public:
    explicit FakeProvider(emb::ProviderKind k = emb::ProviderKind::Baseline) : m_kind(k) {}

    std::map<std::string, emb::Vector> texts;
    std::map<std::string, emb::Vector> images;

    mutable int text_calls = 0;
    mutable int image_calls = 0;

    emb::ProviderKind kind() const override { return m_kind; }

    std::optional<emb::Vector> embed_text(const std::string& text) const override {
        ++text_calls;
        auto it = texts.find(text);
        if (it == texts.end()) return std::nullopt;
        return it->second;
    }

    std::optional<emb::Vector> embed_image(const std::string& image_ref) const override {
        ++image_calls;
        auto it = images.find(image_ref);
        if (it == images.end()) return std::nullopt;
        return it->second;
    }

private:
    emb::ProviderKind m_kind;
};
