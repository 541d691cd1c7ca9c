#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

/* Lower casing BERT tokenizer: whitespace and ASCII punctuation split the
 * text, then each word is cut into the longest vocabulary pieces ("##"
 * marks a continuation piece). Unknown words become [UNK].
 */
class Wordpiece_Tokenizer {
  public:
    // one token per line, the line number is the token id
    bool load_vocab(const std::string& vocab_path);

    void set_vocab(const std::vector<std::string>& tokens);

    bool empty() const { return id_to_token_.empty(); }

    // [CLS] ... [SEP], at most max_length ids
    std::vector<int64_t> encode(const std::string& text, size_t max_length) const;

    std::vector<std::string> basic_tokenize(const std::string& text) const;

    std::vector<std::string> wordpiece(const std::string& word) const;

    int64_t pad_id() const { return id_or(0, "[PAD]"); }
    int64_t unk_id() const { return id_or(-1, "[UNK]"); }
    int64_t cls_id() const { return id_or(-1, "[CLS]"); }
    int64_t sep_id() const { return id_or(-1, "[SEP]"); }

  private:
    int64_t id_or(int64_t fallback, const std::string& token) const;

    std::vector<std::string> id_to_token_;
    std::unordered_map<std::string, int64_t> token_to_id_;
};
