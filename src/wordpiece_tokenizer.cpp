#include "wordpiece_tokenizer.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <fstream>

namespace {

bool is_ascii_punct(char c) {
    const unsigned char uc = static_cast<unsigned char>(c);
    return (uc >= 33 && uc <= 47) || (uc >= 58 && uc <= 64) ||
           (uc >= 91 && uc <= 96) || (uc >= 123 && uc <= 126);
}

}

bool Wordpiece_Tokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) {
        return false;
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        tokens.push_back(line);
    }

    set_vocab(tokens);
    return !empty();
}

void Wordpiece_Tokenizer::set_vocab(const std::vector<std::string>& tokens) {
    id_to_token_ = tokens;
    token_to_id_.clear();
    for (size_t id = 0; id < id_to_token_.size(); ++id) {
        token_to_id_.emplace(id_to_token_[id], static_cast<int64_t>(id));
    }
}

int64_t Wordpiece_Tokenizer::id_or(int64_t fallback, const std::string& token) const {
    auto it = token_to_id_.find(token);
    return it == token_to_id_.end() ? fallback : it->second;
}

std::vector<std::string> Wordpiece_Tokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : to_lower_copy(text)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else if (is_ascii_punct(c)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            tokens.emplace_back(1, c);
        } else {
            current.push_back(c);
        }
    }

    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::vector<std::string> Wordpiece_Tokenizer::wordpiece(const std::string& word) const {
    if (word.empty()) {
        return {"[UNK]"};
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        std::string best;

        // greedy longest match
        while (end > start) {
            std::string piece = word.substr(start, end - start);
            if (start > 0) {
                piece = "##" + piece;
            }
            if (token_to_id_.count(piece)) {
                best = std::move(piece);
                break;
            }
            --end;
        }

        if (best.empty()) {
            return {"[UNK]"};
        }
        pieces.push_back(std::move(best));
        start = end;
    }
    return pieces;
}

std::vector<int64_t> Wordpiece_Tokenizer::encode(const std::string& text, size_t max_length) const {
    const int64_t unk = unk_id();

    std::vector<int64_t> ids;
    ids.reserve(max_length);
    ids.push_back(cls_id());

    for (const std::string& word : basic_tokenize(text)) {
        for (const std::string& piece : wordpiece(word)) {
            // keep room for [SEP]
            if (ids.size() + 1 >= max_length) {
                break;
            }
            ids.push_back(id_or(unk, piece));
        }
        if (ids.size() + 1 >= max_length) {
            break;
        }
    }

    ids.push_back(sep_id());
    return ids;
}
