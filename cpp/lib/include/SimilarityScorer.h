/** \file    SimilarityScorer.h
 *  \brief   Cosine similarity between feature vectors.
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
#include "TfIdfVectoriser.h"
#include "VectorOfReals.h"


namespace SimilarityScorer {


// Number of decimal places that scores are rounded to.
constexpr unsigned SCORE_PRECISION(4);


/** \return The cosine of the angle between "vector1" and "vector2", clamped to [0,1] and rounded to
 *          SCORE_PRECISION decimal places.  0.0 if either vector has a zero norm.
 *  \throws std::invalid_argument if the two vectors differ in size.
 */
double Score(const VectorOfReals &vector1, const VectorOfReals &vector2);


/** \brief Vectorises the two token sequences with "vectoriser" and scores the resulting vectors.
 *  \return 0.0 if either sequence is empty.
 *  \note   Any exception raised during vectorisation or scoring is logged as a warning and reported as a score of 0.0.
 */
double ScoreTokens(const std::vector<std::string> &tokens1, const std::vector<std::string> &tokens2,
                   const TfIdfVectoriser &vectoriser);


} // namespace SimilarityScorer
