/** \file    TfIdfVectoriser.h
 *  \brief   Turns a pair of token sequences into TF-IDF weighted feature vectors.
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
#include "VectorOfReals.h"


/** \class  TfIdfVectoriser
 *  \brief  Builds a vocabulary from exactly two documents and weights each term by its raw count times the smoothed
 *          inverse document frequency ln((1 + n) / (1 + df)) + 1 with n = 2.
 *
 *  If the two documents together contain more than "max_features" distinct terms, only the terms with the highest
 *  combined counts are kept.  Ties are resolved in favour of the lexicographically smaller term.  The axes of the
 *  resulting vectors follow the lexicographic order of the kept terms.
 */
class TfIdfVectoriser {
    unsigned max_features_;
public:
    /** \throws std::invalid_argument if "max_features" is zero. */
    explicit TfIdfVectoriser(const unsigned max_features = PaperCheckerDefaults::MAX_FEATURES);

    inline unsigned getMaxFeatures() const { return max_features_; }

    /** \brief Computes the feature vectors of "tokens1" and "tokens2".
     *  \param vocabulary  If not nullptr, the terms corresponding to the vector components will be stored here.
     *  \throws std::invalid_argument if either token sequence is empty.
     */
    void vectorise(const std::vector<std::string> &tokens1, const std::vector<std::string> &tokens2,
                   VectorOfReals * const vector1, VectorOfReals * const vector2,
                   std::vector<std::string> * const vocabulary = nullptr) const;
};
