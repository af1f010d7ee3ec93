#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "tagger/Models.hpp"

namespace tagger {

class DimensionMismatch : public std::runtime_error {
public:
    DimensionMismatch(size_t lhs, size_t rhs);

    size_t lhs() const { return m_lhs; }
    size_t rhs() const { return m_rhs; }

private:
    size_t m_lhs;
    size_t m_rhs;
};

// Cosine similarity of the two vectors after independent L2 normalization.
// Throws DimensionMismatch if sizes differ. A zero vector scores 0.
float similarity(const Vector& a, const Vector& b);

// Element-wise mean (the "blend" of an image and a text embedding).
Vector blend(const std::vector<Vector>& parts);

}  // namespace tagger
