#pragma once

#include <optional>
#include <string>
#include <vector>

using Embedding = std::vector<float>;

class Embedding_Model {
  public:
    virtual ~Embedding_Model() = default;

    // one vector per text, same order; nullopt if the model cant run
    virtual std::optional<std::vector<Embedding>> embed_batch(const std::vector<std::string>& texts) const = 0;
};

// 0 when either vector is null or the sizes differ
double cosine_similarity(const Embedding& a, const Embedding& b);
