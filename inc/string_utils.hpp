#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

std::string UnicodeToUTF8(unsigned int codepoint);

std::string trim_copy(const std::string& s);

// full Unicode simple case mapping, malformed bytes are dropped from non-ASCII input
std::string to_lower_copy(const std::string& s);

// collapse every run of whitespace into a single space and trim both ends
std::string collapse_whitespace(const std::string& s);

// split on runs of whitespace, no empty tokens
std::vector<std::string> split_words(const std::string& s);

// split on an exact separator, keeps empty pieces
std::vector<std::string> split_on(const std::string& s, const std::string& separator);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

bool starts_with_any(std::string_view s, std::initializer_list<const char*> prefixes);
bool ends_with_any(std::string_view s, std::initializer_list<const char*> suffixes);
bool contains_any(std::string_view s, std::initializer_list<const char*> needles);

// at least one cased letter and no lower case letter, cased per Unicode properties
bool is_upper_text(std::string_view s);

// every word starts with an upper case letter followed by lower case letters only
bool is_title_text(std::string_view s);

// first code point is a lower case letter
bool starts_lowercase(std::string_view s);

bool is_digits(std::string_view s);

// number of code points of a UTF-8 string
size_t utf8_length(std::string_view s);

// at most max_chars code points
std::string utf8_prefix(const std::string& s, size_t max_chars);

// code points of a UTF-8 string, malformed bytes are skipped
std::vector<unsigned int> UTF8ToUnicode(std::string_view s);
