/** \file    SimilarityScorer.cc
 *  \brief   Implementation of the SimilarityScorer functions.
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
#include "SimilarityScorer.h"
#include <stdexcept>
#include "MathUtil.h"
#include "StringUtil.h"
#include "WallClockTimer.h"
#include "util.h"


namespace SimilarityScorer {


double Score(const VectorOfReals &vector1, const VectorOfReals &vector2) {
    if (unlikely(vector1.size() != vector2.size()))
        throw std::invalid_argument("in SimilarityScorer::Score: vector sizes differ (" + std::to_string(vector1.size())
                                    + " vs. " + std::to_string(vector2.size()) + ")!");

    const real norm1(vector1.norm()), norm2(vector2.norm());
    if (norm1 == 0.0 or norm2 == 0.0)
        return 0.0;

    const real cosine((vector1 * vector2) / (norm1 * norm2));
    return MathUtil::RoundToDecimalPlaces(MathUtil::Clamp(cosine, 0.0, 1.0), SCORE_PRECISION);
}


double ScoreTokens(const std::vector<std::string> &tokens1, const std::vector<std::string> &tokens2,
                   const TfIdfVectoriser &vectoriser)
{
    if (tokens1.empty() or tokens2.empty())
        return 0.0;

    WallClockTimer timer(WallClockTimer::NON_CUMULATIVE, "scoring");
    try {
        double score;
        {
            WallClockTimerStartStopper timer_start_stopper(&timer);
            VectorOfReals vector1, vector2;
            std::vector<std::string> vocabulary;
            vectoriser.vectorise(tokens1, tokens2, &vector1, &vector2, &vocabulary);
            score = Score(vector1, vector2);
            LOG_DEBUG("vocabulary size: " + std::to_string(vocabulary.size()));
        }
        LOG_DEBUG("scored " + std::to_string(tokens1.size()) + " against " + std::to_string(tokens2.size()) + " tokens in "
                  + StringUtil::ToFixedPointString(timer.getTime(), 6) + "s");
        return score;
    } catch (const std::exception &x) {
        LOG_WARNING("similarity computation failed, reporting 0.0: " + std::string(x.what()));
        return 0.0;
    }
}


} // namespace SimilarityScorer
