#include <gtest/gtest.h>

#include "wordpiece_tokenizer.hpp"

namespace {

Wordpiece_Tokenizer small_tokenizer() {
    Wordpiece_Tokenizer tokenizer;
    tokenizer.set_vocab({"[PAD]", "[UNK]", "[CLS]", "[SEP]", "hello", "world", "un", "##believ", "##able", ","});
    return tokenizer;
}

}

TEST(WordpieceTokenizer, SpecialTokenIds) {
    Wordpiece_Tokenizer tokenizer = small_tokenizer();
    EXPECT_FALSE(tokenizer.empty());
    EXPECT_EQ(tokenizer.pad_id(), 0);
    EXPECT_EQ(tokenizer.unk_id(), 1);
    EXPECT_EQ(tokenizer.cls_id(), 2);
    EXPECT_EQ(tokenizer.sep_id(), 3);

    Wordpiece_Tokenizer empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.pad_id(), 0);
    EXPECT_EQ(empty.unk_id(), -1);
}

TEST(WordpieceTokenizer, SplitsOnSpaceAndPunctuation) {
    Wordpiece_Tokenizer tokenizer = small_tokenizer();
    EXPECT_EQ(tokenizer.basic_tokenize("  Hello, World!"), (std::vector<std::string>{"hello", ",", "world", "!"}));
    EXPECT_TRUE(tokenizer.basic_tokenize("   ").empty());
}

TEST(WordpieceTokenizer, GreedyLongestMatch) {
    Wordpiece_Tokenizer tokenizer = small_tokenizer();
    EXPECT_EQ(tokenizer.wordpiece("unbelievable"), (std::vector<std::string>{"un", "##believ", "##able"}));
    EXPECT_EQ(tokenizer.wordpiece("xyz"), std::vector<std::string>{"[UNK]"});
    EXPECT_EQ(tokenizer.wordpiece("unxyz"), std::vector<std::string>{"[UNK]"});
}

TEST(WordpieceTokenizer, EncodeWrapsWithClsAndSep) {
    Wordpiece_Tokenizer tokenizer = small_tokenizer();
    EXPECT_EQ(tokenizer.encode("Hello, World!", 16), (std::vector<int64_t>{2, 4, 9, 5, 1, 3}));
    EXPECT_EQ(tokenizer.encode("", 16), (std::vector<int64_t>{2, 3}));
}

TEST(WordpieceTokenizer, EncodeTruncates) {
    Wordpiece_Tokenizer tokenizer = small_tokenizer();
    std::vector<int64_t> ids = tokenizer.encode("hello, world unbelievable", 4);
    EXPECT_EQ(ids, (std::vector<int64_t>{2, 4, 9, 3}));
}

TEST(WordpieceTokenizer, MissingVocabFile) {
    Wordpiece_Tokenizer tokenizer;
    EXPECT_FALSE(tokenizer.load_vocab("/nonexistent/vocab.txt"));
    EXPECT_TRUE(tokenizer.empty());
}
