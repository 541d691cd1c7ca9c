#include "language_detector.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <unordered_set>
#include <vector>

namespace {

bool is_kana(unsigned int codepoint) {
    return (codepoint >= 0x3040 && codepoint <= 0x30ff) || (codepoint >= 0x31f0 && codepoint <= 0x31ff);
}

bool is_han(unsigned int codepoint) {
    return (codepoint >= 0x4e00 && codepoint <= 0x9fff) || (codepoint >= 0x3400 && codepoint <= 0x4dbf);
}

struct Stopword_Set {
    const char* language;
    std::unordered_set<std::string> words;
};

const std::vector<Stopword_Set>& stopword_sets() {
    static const std::vector<Stopword_Set> sets = {
        {"en", {"the", "and", "of", "to", "in", "is", "for", "that", "with", "on", "are", "this", "by", "from"}},
        {"fr", {"le", "la", "les", "et", "des", "du", "un", "une", "est", "pour", "dans", "que", "sur", "avec"}},
        {"de", {"der", "die", "das", "und", "ist", "nicht", "mit", "ein", "eine", "den", "zu", "von", "auf", "für"}}
    };
    return sets;
}

// lower cased words with surrounding ASCII punctuation removed
std::vector<std::string> sample_words(const std::string& sample) {
    std::vector<std::string> words;
    for (const std::string& raw : split_words(to_lower_copy(sample))) {
        size_t first = 0;
        size_t last = raw.size();
        while (first < last && std::ispunct(static_cast<unsigned char>(raw[first]))) {
            first++;
        }
        while (last > first && std::ispunct(static_cast<unsigned char>(raw[last - 1]))) {
            last--;
        }
        if (first < last) {
            words.push_back(raw.substr(first, last - first));
        }
    }
    return words;
}

}

std::optional<std::string> Stopword_Language_Detector::detect(const std::string& sample) const {
    if (trim_copy(sample).empty()) {
        return std::nullopt;
    }

    size_t kana = 0;
    size_t han = 0;
    for (unsigned int codepoint : UTF8ToUnicode(sample)) {
        if (is_kana(codepoint)) {
            kana++;
        } else if (is_han(codepoint)) {
            han++;
        }
    }
    if (kana > 0) {
        return std::string("ja");
    }
    if (han > 0) {
        return std::string("zh-cn");
    }

    const std::vector<std::string> words = sample_words(sample);

    const char* best = nullptr;
    size_t best_hits = 0;
    bool tie = false;
    for (const Stopword_Set& set : stopword_sets()) {
        size_t hits = 0;
        for (const std::string& word : words) {
            if (set.words.count(word)) {
                hits++;
            }
        }
        if (hits > best_hits) {
            best = set.language;
            best_hits = hits;
            tie = false;
        } else if (hits == best_hits && hits > 0) {
            tie = true;
        }
    }

    if (!best || tie || best_hits < LANGUAGE_MIN_STOPWORD_HITS) {
        return std::nullopt;
    }
    return std::string(best);
}
