/** \file    TfIdfVectoriser.cc
 *  \brief   Implementation of class TfIdfVectoriser.
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
#include "TfIdfVectoriser.h"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <cmath>
#include "util.h"


TfIdfVectoriser::TfIdfVectoriser(const unsigned max_features): max_features_(max_features) {
    if (unlikely(max_features_ == 0))
        throw std::invalid_argument("in TfIdfVectoriser::TfIdfVectoriser: max_features must be positive!");
}


namespace {


const unsigned DOCUMENT_COUNT(2);


std::unordered_map<std::string, unsigned> CountTerms(const std::vector<std::string> &tokens) {
    std::unordered_map<std::string, unsigned> term_counts;
    for (const auto &token : tokens)
        ++term_counts[token];

    return term_counts;
}


inline unsigned GetCount(const std::unordered_map<std::string, unsigned> &term_counts, const std::string &term) {
    const auto term_and_count(term_counts.find(term));
    return term_and_count == term_counts.cend() ? 0 : term_and_count->second;
}


// \return The lexicographically sorted vocabulary, restricted to the "max_features" most frequent terms.
std::vector<std::string> SelectVocabulary(const std::unordered_map<std::string, unsigned> &term_counts1,
                                          const std::unordered_map<std::string, unsigned> &term_counts2,
                                          const unsigned max_features)
{
    std::map<std::string, unsigned> total_counts;
    for (const auto &term_and_count : term_counts1)
        total_counts[term_and_count.first] += term_and_count.second;
    for (const auto &term_and_count : term_counts2)
        total_counts[term_and_count.first] += term_and_count.second;

    std::vector<std::pair<std::string, unsigned>> terms_and_counts(total_counts.cbegin(), total_counts.cend());
    if (terms_and_counts.size() > max_features) {
        // Stable, so equal counts stay in lexicographic order.
        std::stable_sort(terms_and_counts.begin(), terms_and_counts.end(),
                         [](const std::pair<std::string, unsigned> &lhs, const std::pair<std::string, unsigned> &rhs)
                         { return lhs.second > rhs.second; });
        terms_and_counts.resize(max_features);
        std::sort(terms_and_counts.begin(), terms_and_counts.end());
    }

    std::vector<std::string> vocabulary;
    vocabulary.reserve(terms_and_counts.size());
    for (const auto &term_and_count : terms_and_counts)
        vocabulary.emplace_back(term_and_count.first);

    return vocabulary;
}


} // unnamed namespace


void TfIdfVectoriser::vectorise(const std::vector<std::string> &tokens1, const std::vector<std::string> &tokens2,
                                VectorOfReals * const vector1, VectorOfReals * const vector2,
                                std::vector<std::string> * const vocabulary) const
{
    if (unlikely(tokens1.empty() or tokens2.empty()))
        throw std::invalid_argument("in TfIdfVectoriser::vectorise: can't vectorise an empty token sequence!");

    const auto term_counts1(CountTerms(tokens1)), term_counts2(CountTerms(tokens2));
    const auto selected_terms(SelectVocabulary(term_counts1, term_counts2, max_features_));

    *vector1 = VectorOfReals(selected_terms.size());
    *vector2 = VectorOfReals(selected_terms.size());
    for (size_t index(0); index < selected_terms.size(); ++index) {
        const std::string &term(selected_terms[index]);
        const unsigned count1(GetCount(term_counts1, term)), count2(GetCount(term_counts2, term));
        const unsigned document_frequency((count1 > 0 ? 1 : 0) + (count2 > 0 ? 1 : 0));
        const real idf(std::log((1.0 + DOCUMENT_COUNT) / (1.0 + document_frequency)) + 1.0);
        (*vector1)[index] = count1 * idf;
        (*vector2)[index] = count2 * idf;
    }

    if (vocabulary != nullptr)
        *vocabulary = selected_terms;
}
