#include "semantic_ranker.hpp"
#include "logging.hpp"

#include <algorithm>
#include <utility>

Semantic_Ranker::Semantic_Ranker(std::unique_ptr<Embedding_Model> model) :
    model_(std::move(model)) {

}

std::string Semantic_Ranker::build_query(const std::string& persona, const std::string& task) {
    return "User profile: " + persona + ". Task to be completed: " + task;
}

std::vector<Ranked_Section> Semantic_Ranker::rank_sections(const std::string& persona, const std::string& task,
                                                           std::vector<Ranked_Section> sections) const {
    if (!model_ || sections.empty()) {
        return {};
    }

    // the query goes first, headings follow in input order
    std::vector<std::string> texts;
    texts.reserve(sections.size() + 1);
    texts.push_back(build_query(persona, task));
    for (const Ranked_Section& section : sections) {
        texts.push_back(section.item.text);
    }

    LOG_CHANNEL_INFO("ranker") << "embedding " << sections.size() << " headings";
    std::optional<std::vector<Embedding>> embeddings = model_->embed_batch(texts);
    if (!embeddings || embeddings->size() != texts.size()) {
        LOG_CHANNEL_ERROR("ranker") << "embedding model returned no usable vectors";
        return {};
    }

    const Embedding& query = embeddings->front();
    for (size_t i = 0; i < sections.size(); ++i) {
        sections[i].relevance_score = cosine_similarity(query, (*embeddings)[i + 1]);
    }

    std::stable_sort(sections.begin(), sections.end(),
                     [](const Ranked_Section& a, const Ranked_Section& b) {
                         return a.relevance_score > b.relevance_score;
                     });
    return sections;
}
