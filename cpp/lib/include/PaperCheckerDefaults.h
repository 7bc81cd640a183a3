/** \file    PaperCheckerDefaults.h
 *  \brief   Built-in stop words, academic lexicon and segmentation dictionary.
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
#include <unordered_map>
#include <unordered_set>
#include <vector>


// Word -> frequency.  The frequencies only matter relative to each other.
typedef std::unordered_map<std::string, unsigned> SegmentationDictionary;
typedef std::unordered_set<std::string> StopWordSet;


namespace PaperCheckerDefaults {


constexpr unsigned MAX_FEATURES(5000);
constexpr unsigned MIN_TOKEN_LENGTH(2);


/** \return The function words that never take part in a comparison. */
StopWordSet GetStopWords();


/** \return Domain terms that the segmenter always emits as single tokens, in registration order. */
std::vector<std::string> GetAcademicLexicon();


/** \return A compact table of common Chinese words and their corpus frequencies. */
SegmentationDictionary GetSegmentationDictionary();


/** \brief Reads a segmentation dictionary with one "word [frequency [tag]]" entry per line, i.e. the format of
 *         jieba's dict.txt.
 *  \note  Empty lines and lines starting with '#' are ignored.  A missing frequency counts as 1.  Tags are ignored.
 *  \throws std::runtime_error if the file can't be read or a frequency is not an unsigned number.
 */
SegmentationDictionary LoadSegmentationDictionary(const std::string &path);


/** \brief Reads a file with one word per line, skipping empty lines and lines starting with '#'.
 *  \throws std::runtime_error if the file can't be read.
 */
std::vector<std::string> LoadWordList(const std::string &path);


} // namespace PaperCheckerDefaults
