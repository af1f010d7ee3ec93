#include "emb/EmbeddingProvider.hpp"

#include <cmath>

namespace emb {

const char* provider_kind_str(ProviderKind k) {
    switch (k) {
        case ProviderKind::Baseline: return "clip";
        case ProviderKind::Fast: return "fclip";
        case ProviderKind::Multilingual: return "mclip";
        default: return "unknown";
    }
}

bool parse_provider_kind(const std::string& name, ProviderKind& out) {
    if (name == "clip")  { out = ProviderKind::Baseline; return true; }
    if (name == "fclip") { out = ProviderKind::Fast; return true; }
    if (name == "mclip") { out = ProviderKind::Multilingual; return true; }
    return false;
}

void l2_normalize(Vector& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

} // namespace emb
