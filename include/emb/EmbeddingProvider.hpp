#pragma once
#include <optional>
#include <string>
#include <vector>

namespace emb {

using Vector = std::vector<float>;

// clip / fclip / mclip
enum class ProviderKind {
    Baseline,
    Fast,
    Multilingual
};

const char* provider_kind_str(ProviderKind k);
bool parse_provider_kind(const std::string& name, ProviderKind& out);

// in place; a zero vector is left unchanged
void l2_normalize(Vector& v);

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual ProviderKind kind() const = 0;

    // std::nullopt when the model or input is unavailable; never throws for that
    virtual std::optional<Vector> embed_text(const std::string& text) const = 0;
    virtual std::optional<Vector> embed_image(const std::string& image_ref) const = 0;
};

class NullEmbeddingProvider final : public EmbeddingProvider {
public:
    explicit NullEmbeddingProvider(ProviderKind k = ProviderKind::Baseline) : m_kind(k) {}

    ProviderKind kind() const override { return m_kind; }
    std::optional<Vector> embed_text(const std::string&) const override { return std::nullopt; }
    std::optional<Vector> embed_image(const std::string&) const override { return std::nullopt; }

private:
    ProviderKind m_kind;
};

} // namespace emb
