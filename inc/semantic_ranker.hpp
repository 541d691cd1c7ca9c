#pragma once

#include <memory>
#include <string>
#include <vector>

#include "embedding_model.hpp"
#include "outline_types.hpp"

/* Orders headings by cosine similarity to a persona and task query. A ranker
 * built without a model is valid but unavailable and ranks nothing.
 */
class Semantic_Ranker {
  public:
    explicit Semantic_Ranker(std::unique_ptr<Embedding_Model> model);

    bool available() const { return model_ != nullptr; }

    static std::string build_query(const std::string& persona, const std::string& task);

    // scored copies of sections, highest score first; empty when unavailable or on model failure
    std::vector<Ranked_Section> rank_sections(const std::string& persona, const std::string& task,
                                              std::vector<Ranked_Section> sections) const;

  private:
    std::unique_ptr<Embedding_Model> model_;
};
