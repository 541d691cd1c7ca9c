#include "embedding_model.hpp"

#include <cmath>

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0;
    }

    double dot = 0, norm_a = 0, norm_b = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0 || norm_b <= 0) {
        return 0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}
