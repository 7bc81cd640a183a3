/** \file   VectorOfReals.cc
 *  \brief  Implementation of class VectorOfReals.
 *  \author Wagner Truppel
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
#include "VectorOfReals.h"
#include <stdexcept>
#include "MathUtil.h"


real VectorOfReals::operator*(const VectorOfReals &v) const {
    if (unlikely(size() != v.size()))
        throw std::invalid_argument("in VectorOfReals::operator*: vector sizes differ (" + std::to_string(size()) + " != "
                                    + std::to_string(v.size()) + ")!");

    MathUtil::NumericallySafeSum<real> dot_product(size());
    for (size_t i(0); i < size(); ++i)
        dot_product += vector_[i] * v.vector_[i];

    return dot_product.sum();
}


real VectorOfReals::norm() const {
    return SQRT(*this * *this);
}

