#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <unicode/uchar.h>

std::string UnicodeToUTF8(unsigned int codepoint) {
    std::string out;

    if (codepoint <= 0x7f) {
        out.append(1, static_cast<char>(codepoint));
    } else if (codepoint <= 0x7ff) {
        out.append(1, static_cast<char>(0xc0 | ((codepoint >> 6) & 0x1f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else if (codepoint <= 0xffff) {
        out.append(1, static_cast<char>(0xe0 | ((codepoint >> 12) & 0x0f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else {
        out.append(1, static_cast<char>(0xf0 | ((codepoint >> 18) & 0x07)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 12) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    }

    return out;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim_copy(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string to_lower_copy(const std::string& s) {
    bool ascii = std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    if (ascii) {
        std::string out(s);
        for (char& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    std::string out;
    out.reserve(s.size());
    for (unsigned int codepoint : UTF8ToUnicode(s)) {
        out += UnicodeToUTF8(static_cast<unsigned int>(u_tolower(static_cast<UChar32>(codepoint))));
    }
    return out;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
        } else {
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream stream(s);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> split_on(const std::string& s, const std::string& separator) {
    std::vector<std::string> pieces;
    if (separator.empty()) {
        pieces.push_back(s);
        return pieces;
    }

    size_t start = 0;
    size_t pos;
    while ((pos = s.find(separator, start)) != std::string::npos) {
        pieces.push_back(s.substr(start, pos - start));
        start = pos + separator.size();
    }
    pieces.push_back(s.substr(start));
    return pieces;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with_any(std::string_view s, std::initializer_list<const char*> prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(), [s](const char* p) { return starts_with(s, p); });
}

bool ends_with_any(std::string_view s, std::initializer_list<const char*> suffixes) {
    return std::any_of(suffixes.begin(), suffixes.end(), [s](const char* p) { return ends_with(s, p); });
}

bool contains_any(std::string_view s, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(), [s](const char* n) { return s.find(n) != std::string_view::npos; });
}

static bool is_upper_codepoint(unsigned int codepoint) {
    UChar32 c = static_cast<UChar32>(codepoint);
    return u_isupper(c) || u_istitle(c);
}

static bool is_lower_codepoint(unsigned int codepoint) {
    return u_islower(static_cast<UChar32>(codepoint));
}

bool is_upper_text(std::string_view s) {
    bool cased = false;
    for (unsigned int codepoint : UTF8ToUnicode(s)) {
        if (is_lower_codepoint(codepoint)) {
            return false;
        }
        if (is_upper_codepoint(codepoint)) {
            cased = true;
        }
    }
    return cased;
}

bool is_title_text(std::string_view s) {
    bool cased = false;
    bool previous_cased = false;
    for (unsigned int codepoint : UTF8ToUnicode(s)) {
        if (is_upper_codepoint(codepoint)) {
            if (previous_cased) {
                return false;
            }
            previous_cased = true;
            cased = true;
        } else if (is_lower_codepoint(codepoint)) {
            if (!previous_cased) {
                return false;
            }
            previous_cased = true;
            cased = true;
        } else {
            previous_cased = false;
        }
    }
    return cased;
}

bool starts_lowercase(std::string_view s) {
    std::vector<unsigned int> codepoints = UTF8ToUnicode(s);
    return !codepoints.empty() && is_lower_codepoint(codepoints.front());
}

bool is_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xc0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string utf8_prefix(const std::string& s, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xc0) != 0x80) {
            if (count == max_chars) {
                return s.substr(0, i);
            }
            count++;
        }
    }
    return s;
}

std::vector<unsigned int> UTF8ToUnicode(std::string_view s) {
    std::vector<unsigned int> codepoints;
    codepoints.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const unsigned char lead = static_cast<unsigned char>(s[i]);
        unsigned int codepoint = 0;
        size_t extra = 0;
        if (lead < 0x80) {
            codepoint = lead;
        } else if ((lead & 0xe0) == 0xc0) {
            codepoint = lead & 0x1f;
            extra = 1;
        } else if ((lead & 0xf0) == 0xe0) {
            codepoint = lead & 0x0f;
            extra = 2;
        } else if ((lead & 0xf8) == 0xf0) {
            codepoint = lead & 0x07;
            extra = 3;
        } else {
            // stray continuation byte
            i++;
            continue;
        }

        if (i + extra >= s.size()) {
            // truncated sequence
            break;
        }
        for (size_t k = 1; k <= extra; ++k) {
            codepoint = (codepoint << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3f);
        }
        codepoints.push_back(codepoint);
        i += extra + 1;
    }

    return codepoints;
}
