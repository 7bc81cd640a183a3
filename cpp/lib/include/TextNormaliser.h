/** \file    TextNormaliser.h
 *  \brief   Character and token level clean-up applied before and after segmentation.
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
#pragma once


#include <string>
#include <vector>
#include "PaperCheckerDefaults.h"


class TextNormaliser {
    StopWordSet stop_words_;
    unsigned min_token_length_;
public:
    explicit TextNormaliser(const StopWordSet &stop_words = PaperCheckerDefaults::GetStopWords(),
                            const unsigned min_token_length = PaperCheckerDefaults::MIN_TOKEN_LENGTH)
        : stop_words_(stop_words), min_token_length_(min_token_length) { }

    inline const StopWordSet &getStopWords() const { return stop_words_; }
    inline unsigned getMinTokenLength() const { return min_token_length_; }

    /** \brief Removes digits and all characters that are neither whitespace nor alphanumeric nor CJK ideographs,
     *         then collapses runs of whitespace into single spaces and trims the result.
     *  \note  Invalid UTF-8 sequences are dropped.
     */
    std::string clean(const std::string &text) const;

    /** \return "tokens" without blank tokens, tokens with fewer than "min_token_length" code points and stop words.
     *          The relative order of the remaining tokens is unchanged.
     */
    std::vector<std::string> filter(const std::vector<std::string> &tokens) const;
};
