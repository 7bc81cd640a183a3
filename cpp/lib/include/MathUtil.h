/** \file   MathUtil.h
 *  \brief  Numerical helper functions and classes.
 *  \author Wagner Truppel
 *  \author Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
 *  Copyright 2020 Universitätsbibliothek Tübingen.  All rights reserved.
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

#ifndef MATH_UTIL_H
#define MATH_UTIL_H


#include <algorithm>
#include <vector>
#include <cmath>
#include "Real.h"
#include "util.h"


/** \brief  Helper function used when adding numbers in a numerically safe way. Refer to class
 *          MathUtil::NumericallySafeSum for details.
 */
template<typename FloatingPointType> inline bool SortedByIncreasingMagnitude(const FloatingPointType value1,
                                                                             const FloatingPointType value2)
    { return std::fabs(value1) < std::fabs(value2); }


/** \namespace  MathUtil
 *  \brief      Numerical helpers used by the vector space code.
 */
namespace MathUtil {


/** \brief An utility class to be used when one wants to add several numbers in a way that minimizes both
 *         round-off error and the chance of getting an overflow error.
 *  \note  The result only depends on the multiset of summands, not on the order in which they were added.
 */
template<typename FloatingPointType> class NumericallySafeSum: private std::vector<FloatingPointType> {
public:
    explicit NumericallySafeSum(const typename std::vector<FloatingPointType>::size_type initial_size = 0) {
        if (initial_size != 0)
            this->reserve(initial_size);
    }

    const NumericallySafeSum<FloatingPointType> &operator+=(const FloatingPointType &value) {
        if (value != 0.0)
            this->push_back(value);

        return *this;
    }

    FloatingPointType sum();
};


template<typename FloatingPointType> FloatingPointType NumericallySafeSum<FloatingPointType>::sum() {
    if (unlikely(this->empty()))
        return 0.0;

    // We need to sort the summands to add them in increasing order of their absolute values, so as
    // to guarantee robustness against round-off errors.
    std::sort(this->begin(), this->end(), SortedByIncreasingMagnitude<FloatingPointType>);

    // The largest summand, in absolute value, is at the end of the sorted vector.
    const FloatingPointType abs_max(std::fabs(this->back()));

    FloatingPointType sum_over_max(0.0);
    for (const auto summand : *this)
        sum_over_max += summand / abs_max;

    return abs_max * sum_over_max;
}


/** \brief  Rounds "x" to "no_of_decimal_places" places after the decimal point, halfway cases away from zero. */
inline real RoundToDecimalPlaces(const real x, const unsigned no_of_decimal_places) {
    const real scale(std::pow(static_cast<real>(10.0), static_cast<real>(no_of_decimal_places)));
    return std::round(x * scale) / scale;
}


/** \return "x" limited to the closed interval ["lower", "upper"]. */
inline real Clamp(const real x, const real lower, const real upper) {
    return std::min(std::max(x, lower), upper);
}


} // namespace MathUtil


#endif // ifndef MATH_UTIL_H
