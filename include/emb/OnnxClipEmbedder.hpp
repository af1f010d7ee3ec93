#pragma once
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "emb/EmbeddingProvider.hpp"
#include "emb/ProviderFactory.hpp"
#include "emb/TextTokenizer.hpp"

namespace emb {

// CLIP-style dual encoder: text and image towers exported to ONNX.
// Each tower's first output should be the projected embedding ([1, dim],
// text_embeds / image_embeds). A [1, seq, dim] output is mean-pooled over the
// mask, which suits sentence-encoder text towers only.
// Outputs are L2-normalized.
class OnnxClipEmbedder final : public EmbeddingProvider {
public:
    explicit OnnxClipEmbedder(ProviderKind kind) : m_kind(kind) {}

    bool init(const ProviderConfig& cfg);

    ProviderKind kind() const override { return m_kind; }
    std::optional<Vector> embed_text(const std::string& text) const override;
    std::optional<Vector> embed_image(const std::string& image_ref) const override;

private:
    ProviderKind m_kind;
    size_t m_max_len = 77;
    std::unique_ptr<TextTokenizer> m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "catalog-tagger"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_text;
    std::unique_ptr<Ort::Session> m_image;

    std::vector<std::string> m_text_inputs;
    std::string m_text_output;
    std::string m_image_input;
    std::string m_image_output;
    int m_image_h = 224;
    int m_image_w = 224;

    std::unique_ptr<Ort::Session> open_session(const std::string& model_path);
};

} // namespace emb
