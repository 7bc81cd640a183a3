/** \file    TextNormaliser.cc
 *  \brief   Implementation of class TextNormaliser.
 *  \author  The paper_checker authors
 */

/*
 *  Copyright 2026 The paper_checker authors
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TextNormaliser.h"
#include "TextUtil.h"


std::string TextNormaliser::clean(const std::string &text) const {
    std::vector<uint32_t> utf32_chars;
    TextUtil::UTF8ToUTF32(text, &utf32_chars); // Invalid bytes turn into REPLACEMENT_CHARACTERs which we drop below.

    std::vector<uint32_t> kept_chars;
    kept_chars.reserve(utf32_chars.size());
    for (const uint32_t utf32_char : utf32_chars) {
        if (TextUtil::IsDecimalDigit(utf32_char))
            continue;
        if (TextUtil::IsWhitespace(utf32_char) or TextUtil::IsAlphanumeric(utf32_char)
            or TextUtil::IsCJKUnifiedIdeograph(utf32_char))
            kept_chars.emplace_back(utf32_char);
    }

    std::string cleaned_text(TextUtil::UTF32ToUTF8(kept_chars));
    return TextUtil::CollapseAndTrimWhitespace(&cleaned_text);
}


std::vector<std::string> TextNormaliser::filter(const std::vector<std::string> &tokens) const {
    std::vector<std::string> filtered_tokens;
    for (const auto &token : tokens) {
        if (TextUtil::CollapseAndTrimWhitespace(token).empty())
            continue;
        if (TextUtil::CodePointCount(token) < min_token_length_)
            continue;
        if (stop_words_.find(token) != stop_words_.cend())
            continue;

        filtered_tokens.emplace_back(token);
    }

    return filtered_tokens;
}
