/** \file    Segmenter.h
 *  \brief   Dictionary based word breaking for text that does not separate its words with spaces.
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


#include <iterator>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <unicode/brkiter.h>
#include "PaperCheckerDefaults.h"


/** \class  Segmenter
 *  \brief  Breaks cleaned text into tokens.
 *
 *  Text is first split at spaces.  Within each chunk the longest academic lexicon term starting at the current
 *  position always wins and is emitted as a single token.  Runs of CJK ideographs between lexicon terms are broken
 *  up along the maximum probability path through the graph of all dictionary words that occur in the run.  Where
 *  that path consists of two or more single ideographs in a row, i.e. words that the dictionary does not know, ICU's
 *  dictionary based word break iterator gets a second go at them.  Every other run of characters becomes a single
 *  token.
 */
class Segmenter {
    std::unordered_set<std::string> lexicon_;
    size_t max_lexicon_term_length_; // in code points
    SegmentationDictionary dictionary_;
    size_t max_word_length_;         // in code points
    double log_total_frequency_;
    std::shared_ptr<const icu::BreakIterator> word_break_iterator_; // Never used directly, only cloned.
public:
    // Frequency assigned to lexicon terms that the segmentation dictionary does not know.
    static constexpr unsigned DEFAULT_LEXICON_TERM_FREQUENCY = 3;

    /** \brief A restartable, lazily evaluated sequence of tokens.
     *  \note  The range holds its own copy of the text and a reference to the Segmenter which must outlive it.
     */
    class Tokens {
        friend class Segmenter;
        const Segmenter &segmenter_;
        std::string text_;
    public:
        class const_iterator {
            friend class Tokens;
            const Tokens *tokens_;
            size_t next_chunk_start_;
            std::vector<std::string> chunk_tokens_;
            size_t current_token_;
        public:
            typedef std::input_iterator_tag iterator_category;
            typedef std::string value_type;
            typedef std::ptrdiff_t difference_type;
            typedef const std::string *pointer;
            typedef const std::string &reference;
        public:
            inline const std::string &operator*() const { return chunk_tokens_[current_token_]; }
            inline const std::string *operator->() const { return &chunk_tokens_[current_token_]; }
            const_iterator &operator++();
            bool operator==(const const_iterator &rhs) const;
            inline bool operator!=(const const_iterator &rhs) const { return not operator==(rhs); }
        private:
            // Creates the end iterator if "tokens" is a nullptr.
            explicit const_iterator(const Tokens * const tokens);
            inline bool atEnd() const { return tokens_ == nullptr; }
            void loadNextNonEmptyChunk();
        };
    public:
        const_iterator begin() const { return const_iterator(this); }
        const_iterator end() const { return const_iterator(nullptr); }
    private:
        Tokens(const Segmenter &segmenter, const std::string &text): segmenter_(segmenter), text_(text) { }
    };
public:
    /** \param lexicon     Terms that must never be split.  Terms with fewer than two code points are ignored.
     *  \param dictionary  Word frequencies for the general word breaker.  Lexicon terms missing from it are added
     *                     with DEFAULT_LEXICON_TERM_FREQUENCY.
     *  \throws std::runtime_error if ICU's word break iterator is unavailable.
     */
    Segmenter(const std::vector<std::string> &lexicon = PaperCheckerDefaults::GetAcademicLexicon(),
              const SegmentationDictionary &dictionary = PaperCheckerDefaults::GetSegmentationDictionary());

    Tokens tokenise(const std::string &text) const { return Tokens(*this, text); }

    /** \return All the tokens of "text", in order. */
    std::vector<std::string> segment(const std::string &text) const;

    inline bool isLexiconTerm(const std::string &term) const { return lexicon_.find(term) != lexicon_.cend(); }
private:
    void segmentChunk(const std::vector<uint32_t> &chunk, std::vector<std::string> * const tokens) const;
    void segmentSpan(const std::vector<uint32_t>::const_iterator &span_begin,
                     const std::vector<uint32_t>::const_iterator &span_end, std::vector<std::string> * const tokens) const;
    void segmentIdeographs(const std::vector<uint32_t>::const_iterator &run_begin,
                           const std::vector<uint32_t>::const_iterator &run_end, std::vector<std::string> * const tokens) const;
    void segmentUnknownWords(const std::vector<uint32_t>::const_iterator &run_begin,
                             const std::vector<uint32_t>::const_iterator &run_end, std::vector<std::string> * const tokens) const;
};
