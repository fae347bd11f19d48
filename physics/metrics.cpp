#include "metrics.hpp"
#include <algorithm>
#include <cmath>

namespace traitgalaxy {

namespace {

// 1 - (L1 distance over the common prefix) / (L * kTraitMax), floored at 0
float normalized_alignment(const TraitVector& a, const TraitVector& b) {
    const size_t len = std::min(a.size(), b.size());
    if (len == 0) {
        return 0.0f;
    }

    float sum = 0.0f;
    for (size_t i = 0; i < len; ++i) {
        sum += std::abs(a[i] - b[i]);
    }

    const float max_diff = static_cast<float>(len) * kTraitMax;
    return std::max(0.0f, 1.0f - sum / max_diff);
}

}  // namespace

float compatibility(const TraitVector& preferences, const TraitVector& traits) {
    return normalized_alignment(preferences, traits);
}

float similarity(const TraitVector& a, const TraitVector& b) {
    return normalized_alignment(a, b);
}

}  // namespace traitgalaxy
