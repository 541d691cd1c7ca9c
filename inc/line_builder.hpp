#pragma once

#include <string>
#include <vector>

#include "outline_types.hpp"

/* Groups the characters of one page into visual lines. Characters sharing a
 * rounded y belong to the same line and are ordered left to right. Lines come
 * back top of page first; lines whose text is blank are dropped.
 */
std::vector<Text_Line> build_text_lines(const std::vector<Char_Record>& chars, unsigned int page);

std::string lines_to_text(const std::vector<Text_Line>& lines);
