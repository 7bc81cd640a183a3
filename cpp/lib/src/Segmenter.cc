/** \file    Segmenter.cc
 *  \brief   Implementation of class Segmenter.
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
#include "Segmenter.h"
#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include "TextUtil.h"
#include "util.h"


Segmenter::Tokens::const_iterator::const_iterator(const Tokens * const tokens)
    : tokens_(tokens), next_chunk_start_(0), current_token_(0)
{
    if (tokens_ != nullptr)
        loadNextNonEmptyChunk();
}


Segmenter::Tokens::const_iterator &Segmenter::Tokens::const_iterator::operator++() {
    if (unlikely(atEnd()))
        return *this;

    ++current_token_;
    if (current_token_ >= chunk_tokens_.size())
        loadNextNonEmptyChunk();

    return *this;
}


bool Segmenter::Tokens::const_iterator::operator==(const const_iterator &rhs) const {
    if (atEnd() or rhs.atEnd())
        return atEnd() == rhs.atEnd();

    return tokens_ == rhs.tokens_ and next_chunk_start_ == rhs.next_chunk_start_ and current_token_ == rhs.current_token_;
}


// Segments chunks until one of them yields at least one token.  Turns into the end iterator if we run out of text.
void Segmenter::Tokens::const_iterator::loadNextNonEmptyChunk() {
    const std::string &text(tokens_->text_);
    chunk_tokens_.clear();
    current_token_ = 0;

    while (chunk_tokens_.empty()) {
        if (next_chunk_start_ >= text.length()) {
            tokens_ = nullptr;
            return;
        }

        size_t chunk_end(text.find(' ', next_chunk_start_));
        if (chunk_end == std::string::npos)
            chunk_end = text.length();

        std::vector<uint32_t> chunk;
        TextUtil::UTF8ToUTF32(text.substr(next_chunk_start_, chunk_end - next_chunk_start_), &chunk);
        tokens_->segmenter_.segmentChunk(chunk, &chunk_tokens_);
        next_chunk_start_ = chunk_end + 1;
    }
}


Segmenter::Segmenter(const std::vector<std::string> &lexicon, const SegmentationDictionary &dictionary)
    : max_lexicon_term_length_(0), dictionary_(dictionary), max_word_length_(1)
{
    for (const auto &term : lexicon) {
        const size_t term_length(TextUtil::CodePointCount(term));
        if (term_length < 2)
            continue;

        lexicon_.emplace(term);
        max_lexicon_term_length_ = std::max(max_lexicon_term_length_, term_length);
        dictionary_.emplace(term, DEFAULT_LEXICON_TERM_FREQUENCY);
    }

    double total_frequency(0.0);
    for (const auto &word_and_frequency : dictionary_) {
        total_frequency += word_and_frequency.second;
        max_word_length_ = std::max(max_word_length_, TextUtil::CodePointCount(word_and_frequency.first));
    }
    log_total_frequency_ = std::log(std::max(total_frequency, 1.0));

    UErrorCode error_code(U_ZERO_ERROR);
    icu::BreakIterator * const word_break_iterator(icu::BreakIterator::createWordInstance(icu::Locale::getChinese(),
                                                                                           error_code));
    word_break_iterator_.reset(word_break_iterator);
    if (unlikely(U_FAILURE(error_code) or word_break_iterator == nullptr))
        throw std::runtime_error("in Segmenter::Segmenter: can't create a word break iterator ("
                                 + std::string(u_errorName(error_code)) + ")!");
}


std::vector<std::string> Segmenter::segment(const std::string &text) const {
    const auto tokens(tokenise(text));
    return std::vector<std::string>(tokens.begin(), tokens.end());
}


void Segmenter::segmentChunk(const std::vector<uint32_t> &chunk, std::vector<std::string> * const tokens) const {
    auto pending_span_start(chunk.cbegin());
    auto current(chunk.cbegin());
    while (current != chunk.cend()) {
        const size_t remaining_length(static_cast<size_t>(chunk.cend() - current));
        size_t match_length(std::min(max_lexicon_term_length_, remaining_length));
        for (/* Intentionally empty! */; match_length >= 2; --match_length) {
            if (isLexiconTerm(TextUtil::UTF32ToUTF8(current, current + match_length)))
                break;
        }

        if (match_length < 2)
            ++current;
        else {
            segmentSpan(pending_span_start, current, tokens);
            tokens->emplace_back(TextUtil::UTF32ToUTF8(current, current + match_length));
            current += match_length;
            pending_span_start = current;
        }
    }

    segmentSpan(pending_span_start, chunk.cend(), tokens);
}


void Segmenter::segmentSpan(const std::vector<uint32_t>::const_iterator &span_begin,
                            const std::vector<uint32_t>::const_iterator &span_end, std::vector<std::string> * const tokens) const
{
    auto run_begin(span_begin);
    while (run_begin != span_end) {
        const bool ideographic_run(TextUtil::IsCJKUnifiedIdeograph(*run_begin));
        auto run_end(run_begin + 1);
        while (run_end != span_end and TextUtil::IsCJKUnifiedIdeograph(*run_end) == ideographic_run)
            ++run_end;

        if (ideographic_run)
            segmentIdeographs(run_begin, run_end, tokens);
        else
            tokens->emplace_back(TextUtil::UTF32ToUTF8(run_begin, run_end));
        run_begin = run_end;
    }
}


namespace {


struct Route {
    double log_probability_;
    size_t last_index_; // Of the word starting at the position that this Route belongs to.
public:
    Route(const double log_probability, const size_t last_index): log_probability_(log_probability), last_index_(last_index) { }
    inline bool operator>(const Route &rhs) const {
        return log_probability_ > rhs.log_probability_
               or (log_probability_ == rhs.log_probability_ and last_index_ > rhs.last_index_);
    }
};


} // unnamed namespace


// Dynamic programming from right to left: route[i] is the most probable segmentation of the suffix starting at i.
void Segmenter::segmentIdeographs(const std::vector<uint32_t>::const_iterator &run_begin,
                                  const std::vector<uint32_t>::const_iterator &run_end,
                                  std::vector<std::string> * const tokens) const
{
    const size_t run_length(static_cast<size_t>(run_end - run_begin));
    std::vector<Route> routes(run_length + 1, Route(0.0, 0));
    for (size_t i(run_length); i-- > 0; /* Intentionally empty! */) {
        Route best_route(0.0, 0);
        bool found_a_route(false);
        const size_t last_candidate(std::min(run_length, i + max_word_length_));
        for (size_t j(i); j < last_candidate; ++j) {
            const auto word_and_frequency(dictionary_.find(TextUtil::UTF32ToUTF8(run_begin + i, run_begin + j + 1)));
            if (j > i and word_and_frequency == dictionary_.cend())
                continue;

            unsigned frequency(word_and_frequency == dictionary_.cend() ? 1 : word_and_frequency->second);
            if (frequency == 0)
                frequency = 1;
            const Route candidate(std::log(static_cast<double>(frequency)) - log_total_frequency_
                                  + routes[j + 1].log_probability_, j);
            if (not found_a_route or candidate > best_route) {
                best_route = candidate;
                found_a_route = true;
            }
        }
        routes[i] = best_route;
    }

    // Consecutive single ideographs are collected and handed to segmentUnknownWords() as a whole.
    size_t unknown_words_start(0);
    for (size_t i(0); i < run_length; i = routes[i].last_index_ + 1) {
        if (routes[i].last_index_ == i)
            continue;

        segmentUnknownWords(run_begin + unknown_words_start, run_begin + i, tokens);
        tokens->emplace_back(TextUtil::UTF32ToUTF8(run_begin + i, run_begin + routes[i].last_index_ + 1));
        unknown_words_start = routes[i].last_index_ + 1;
    }
    segmentUnknownWords(run_begin + unknown_words_start, run_end, tokens);
}


void Segmenter::segmentUnknownWords(const std::vector<uint32_t>::const_iterator &run_begin,
                                    const std::vector<uint32_t>::const_iterator &run_end,
                                    std::vector<std::string> * const tokens) const
{
    if (run_begin == run_end)
        return;
    if (run_end - run_begin == 1) {
        tokens->emplace_back(TextUtil::UTF32ToUTF8(run_begin, run_end));
        return;
    }

    const icu::UnicodeString run(icu::UnicodeString::fromUTF32(reinterpret_cast<const UChar32 *>(&*run_begin),
                                                                static_cast<int32_t>(run_end - run_begin)));
    // Break iterators are stateful, so every call gets its own.
    const std::unique_ptr<icu::BreakIterator> break_iterator(word_break_iterator_->clone());
    if (unlikely(break_iterator == nullptr))
        throw std::runtime_error("in Segmenter::segmentUnknownWords: can't clone the word break iterator!");

    break_iterator->setText(run);
    int32_t start(break_iterator->first());
    for (int32_t end(break_iterator->next()); end != icu::BreakIterator::DONE; end = break_iterator->next()) {
        std::string token;
        run.tempSubStringBetween(start, end).toUTF8String(token);
        tokens->emplace_back(token);
        start = end;
    }
}
