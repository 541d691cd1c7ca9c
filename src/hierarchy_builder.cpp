#include "hierarchy_builder.hpp"
#include "heading_rules.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <set>

void Hierarchy_Path::enter(Heading_Level level, const std::string& text, unsigned int text_limit) {
    const unsigned int depth = level_depth(level);
    for (unsigned int i = depth; i < CAPACITY; ++i) {
        slots_[i].reset();
    }
    slots_[depth] = utf8_prefix(text, text_limit);
}

unsigned int Hierarchy_Path::depth() const {
    for (unsigned int i = CAPACITY; i > 0; --i) {
        if (slots_[i - 1]) {
            return i;
        }
    }
    return 0;
}

std::vector<std::string> Hierarchy_Path::labels() const {
    std::vector<std::string> labels;
    for (const auto& slot : slots_) {
        if (slot) {
            labels.push_back(*slot);
        }
    }
    return labels;
}

Hierarchy_Builder::Hierarchy_Builder(const Outline_Config& config) :
    config_(config) {

}

bool Hierarchy_Builder::is_contextual_duplicate(const std::string& text) const {
    const std::string key = trim_copy(to_lower_copy(text));
    const std::vector<std::string> words = split_words(to_lower_copy(text));
    const std::set<std::string> words1(words.begin(), words.end());

    const size_t window = std::min<size_t>(config_.recent_heading_window, outline_.size());
    for (auto it = outline_.end() - static_cast<long>(window); it != outline_.end(); ++it) {
        if (key == trim_copy(to_lower_copy(it->text))) {
            return true;
        }

        const std::vector<std::string> other = split_words(to_lower_copy(it->text));
        const std::set<std::string> words2(other.begin(), other.end());
        if (words1.empty() || words2.empty()) {
            continue;
        }

        size_t overlap = 0;
        for (const std::string& word : words1) {
            overlap += words2.count(word);
        }
        const size_t min_len = std::min(words1.size(), words2.size());
        if (static_cast<double>(overlap) / static_cast<double>(min_len) > config_.duplicate_overlap_ratio) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> Hierarchy_Builder::rejection_reason(const Heading_Candidate& candidate) const {
    Heading_Text text(candidate.text);

    if (seen_texts_.count(text.lower_trimmed) > 0) {
        return std::string("duplicate");
    }

    if (candidate.confidence < config_.path_accept_threshold) {
        return std::string("low_confidence");
    }

    Rule_Outcome outcome = check_sentence_fragment(text);
    if (outcome) {
        return std::string("fragment:") + outcome.rule;
    }

    outcome = check_breaks_hierarchy_path(text);
    if (outcome) {
        return std::string("breaks_path:") + outcome.rule;
    }

    outcome = check_meaningful_heading(text);
    if (!outcome) {
        return std::string("not_meaningful:") + (outcome.rule ? outcome.rule : "no_rule");
    }

    if (is_contextual_duplicate(candidate.text)) {
        return std::string("contextual_duplicate");
    }

    return std::nullopt;
}

void Hierarchy_Builder::record(const Heading_Candidate& candidate, bool accepted, std::string reason) {
    LOG_CHANNEL_DEBUG("hierarchy") << (accepted ? "accept " : "reject ") << candidate.level
                                   << " page " << candidate.page << " \"" << candidate.text << "\" ("
                                   << candidate.confidence << "): " << reason;

    Hierarchy_Decision decision;
    decision.candidate = candidate;
    decision.accepted = accepted;
    decision.reason = std::move(reason);
    decision.path = path_.labels();
    trace_.push_back(std::move(decision));
}

bool Hierarchy_Builder::consider(const Heading_Candidate& candidate) {
    std::optional<std::string> reason = rejection_reason(candidate);
    if (reason) {
        record(candidate, false, std::move(*reason));
        return false;
    }

    path_.enter(candidate.level, candidate.text, config_.path_text_limit);
    seen_texts_.insert(trim_copy(to_lower_copy(candidate.text)));

    Outline_Item item;
    item.level = candidate.level;
    item.text = candidate.text;
    item.page = candidate.page;
    item.position = candidate.position;
    outline_.push_back(std::move(item));

    record(candidate, true, "accepted");
    return true;
}

std::vector<Outline_Item> build_document_hierarchy(std::vector<Heading_Candidate> candidates,
                                                   const Outline_Config& config,
                                                   std::vector<Hierarchy_Decision>* trace) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Heading_Candidate& a, const Heading_Candidate& b) {
                         if (a.page != b.page) {
                             return a.page < b.page;
                         }
                         return a.position < b.position;
                     });

    Hierarchy_Builder builder(config);
    for (const Heading_Candidate& candidate : candidates) {
        builder.consider(candidate);
    }

    if (trace) {
        *trace = builder.trace();
    }

    std::vector<Outline_Item> outline = builder.outline();
    if (outline.size() > config.max_outline_items) {
        outline.resize(config.max_outline_items);
    }
    return outline;
}
