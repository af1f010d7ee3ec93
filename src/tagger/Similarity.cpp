#include "tagger/Similarity.hpp"

#include <cmath>
#include <string>

namespace tagger {

DimensionMismatch::DimensionMismatch(size_t lhs, size_t rhs)
    : std::runtime_error("dimension mismatch: " + std::to_string(lhs) + " vs " + std::to_string(rhs)),
      m_lhs(lhs),
      m_rhs(rhs) {}

float similarity(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) throw DimensionMismatch(a.size(), b.size());

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;

    double s = dot / (std::sqrt(na) * std::sqrt(nb));
    // rounding can push |s| a hair past 1
    if (s > 1.0) s = 1.0;
    if (s < -1.0) s = -1.0;
    return (float)s;
}

Vector blend(const std::vector<Vector>& parts) {
    if (parts.empty()) return {};

    const size_t dim = parts.front().size();
    std::vector<double> acc(dim, 0.0);

    for (const auto& p : parts) {
        if (p.size() != dim) throw DimensionMismatch(dim, p.size());
        for (size_t i = 0; i < dim; ++i) acc[i] += p[i];
    }

    Vector out(dim);
    const double inv = 1.0 / (double)parts.size();
    for (size_t i = 0; i < dim; ++i) out[i] = (float)(acc[i] * inv);
    return out;
}

}  // namespace tagger
