#include "emb/OnnxClipEmbedder.hpp"

#include <exception>
#include <filesystem>
#include <iostream>

#include "emb/ClipBpeTokenizer.hpp"
#include "emb/ClipImage.hpp"
#include "emb/WordPieceTokenizer.hpp"

namespace emb {

// [1, dim] as is, [1, seq, dim] mean-pooled over the mask
static Vector pool_output(Ort::Value& out, const std::vector<int64_t>* mask) {
    auto info = out.GetTensorTypeAndShapeInfo();
    auto shp = info.GetShape();
    const float* data = out.GetTensorData<float>();

    Vector v;
    if (shp.size() == 2 && shp[1] > 0) {
        v.assign(data, data + shp[1]);
    } else if (shp.size() == 3 && shp[1] > 0 && shp[2] > 0) {
        const size_t seq = (size_t)shp[1];
        const size_t hidden = (size_t)shp[2];
        v.assign(hidden, 0.0f);

        double denom = 0.0;
        for (size_t t = 0; t < seq; ++t) {
            if (mask && t < mask->size() && (*mask)[t] == 0) continue;
            denom += 1.0;
            const float* row = data + t * hidden;
            for (size_t j = 0; j < hidden; ++j) v[j] += row[j];
        }
        if (denom > 0.0) {
            float inv = (float)(1.0 / denom);
            for (float& x : v) x *= inv;
        }
    }

    l2_normalize(v);
    return v;
}

std::unique_ptr<Ort::Session> OnnxClipEmbedder::open_session(const std::string& model_path) {
#ifdef _WIN32
    std::wstring wmodel(model_path.begin(), model_path.end());
    return std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
    return std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif
}

bool OnnxClipEmbedder::init(const ProviderConfig& cfg) {
    const char* name = provider_kind_str(m_kind);
    m_max_len = cfg.max_len;

    try {
        if (cfg.tokenizer == TokenizerKind::Bpe) {
            auto tok = std::make_unique<ClipBpeTokenizer>();
            tok->load(cfg.vocab, cfg.merges);
            m_tok = std::move(tok);
        } else {
            auto tok = std::make_unique<WordPieceTokenizer>();
            if (!tok->load_vocab(cfg.vocab, cfg.lowercase)) {
                std::cerr << "OnnxClipEmbedder(" << name << "): failed to load vocab: " << cfg.vocab << "\n";
                return false;
            }
            m_tok = std::move(tok);
        }
    } catch (const std::exception& e) {
        std::cerr << "OnnxClipEmbedder(" << name << "): " << e.what() << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(cfg.threads > 0 ? cfg.threads : 1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        Ort::AllocatorWithDefaultOptions allocator;

        m_text = open_session(cfg.text_model);
        m_text_inputs.clear();
        for (size_t i = 0; i < m_text->GetInputCount(); ++i) {
            m_text_inputs.push_back(m_text->GetInputNameAllocated(i, allocator).get());
        }
        m_text_output = m_text->GetOutputNameAllocated(0, allocator).get();

        // CLIP text embeddings are the projected EOS state; a mean over
        // last_hidden_state lands in a different space than the image tower
        auto text_out = m_text->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (text_out.size() == 3 && cfg.tokenizer == TokenizerKind::Bpe) {
            std::cerr << "OnnxClipEmbedder(" << name << "): warning: text output '" << m_text_output
                      << "' is per-token; mean pooling it is not the CLIP text embedding."
                      << " Export the text tower with its projection (text_embeds).\n";
        }

        if (!cfg.image_model.empty()) {
            m_image = open_session(cfg.image_model);
            m_image_input = m_image->GetInputNameAllocated(0, allocator).get();
            m_image_output = m_image->GetOutputNameAllocated(0, allocator).get();

            auto shape = m_image->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape(); // [1,3,H,W]
            if (shape.size() != 4) {
                std::cerr << "OnnxClipEmbedder(" << name << "): image input is not NCHW\n";
                return false;
            }
            // dynamic spatial dims keep the 224x224 default
            if (shape[2] > 0 && shape[3] > 0) {
                m_image_h = (int)shape[2];
                m_image_w = (int)shape[3];
            }
        }
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "OnnxClipEmbedder(" << name << ") ORT exception: " << e.what() << "\n";
        std::cerr << "text_model=" << cfg.text_model << " image_model=" << cfg.image_model << "\n";
        return false;
    }
}

std::optional<Vector> OnnxClipEmbedder::embed_text(const std::string& text) const {
    if (!m_text || !m_tok) return std::nullopt;

    TokenizedText tt = m_tok->encode(text, m_max_len);
    std::vector<int64_t> type_ids(tt.ids.size(), 0);
    std::vector<int64_t> shape{1, (int64_t)tt.ids.size()};

    try {
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

        std::vector<const char*> in_names;
        std::vector<Ort::Value> in_vals;
        for (size_t i = 0; i < m_text_inputs.size(); ++i) {
            const std::string& n = m_text_inputs[i];
            std::vector<int64_t>* src = &tt.ids;
            if (n.find("mask") != std::string::npos) src = &tt.mask;
            else if (n.find("type") != std::string::npos) src = &type_ids;
            else if (i > 0) continue;  // unknown extra input

            in_names.push_back(n.c_str());
            in_vals.push_back(Ort::Value::CreateTensor<int64_t>(
                mem, src->data(), src->size(), shape.data(), shape.size()));
        }

        const char* out_names[1] = { m_text_output.c_str() };
        auto outs = m_text->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(),
                                out_names, 1);

        Vector v = pool_output(outs[0], &tt.mask);
        if (v.empty()) return std::nullopt;
        return v;
    } catch (const Ort::Exception& e) {
        std::cerr << "OnnxClipEmbedder(" << provider_kind_str(m_kind) << "): text inference failed: "
                  << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<Vector> OnnxClipEmbedder::embed_image(const std::string& image_ref) const {
    if (!m_image) return std::nullopt;
    if (!is_local_image_ref(image_ref)) return std::nullopt;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(image_ref, ec)) return std::nullopt;

    std::vector<float> chw;
    if (!load_clip_image(image_ref, m_image_h, m_image_w, chw)) return std::nullopt;

    std::vector<int64_t> shape{1, 3, m_image_h, m_image_w};

    try {
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
        Ort::Value input = Ort::Value::CreateTensor<float>(mem, chw.data(), chw.size(), shape.data(), shape.size());

        const char* in_names[1] = { m_image_input.c_str() };
        const char* out_names[1] = { m_image_output.c_str() };
        auto outs = m_image->Run(Ort::RunOptions{nullptr}, in_names, &input, 1, out_names, 1);

        Vector v = pool_output(outs[0], nullptr);
        if (v.empty()) return std::nullopt;
        return v;
    } catch (const Ort::Exception& e) {
        std::cerr << "OnnxClipEmbedder(" << provider_kind_str(m_kind) << "): image inference failed: "
                  << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace emb
