/** \file   VectorOfReals.h
 *  \brief  A class for dense vectors of reals.
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


#ifndef VECTOR_OF_REALS_H
#define VECTOR_OF_REALS_H


#include <string>
#include <vector>
#include "Real.h"


/** \class VectorOfReals */
class VectorOfReals {
    std::vector<real> vector_;
public:
    /** \brief   Constructs a vector with the given size where all elements are
     *           initialized to zero.
     *  \param   initial_size  The vector's desired size.
     */
    explicit VectorOfReals(const size_t initial_size = 0): vector_(initial_size) { }

    size_t size() const { return vector_.size(); }
    bool empty() const { return vector_.empty(); }

    /** \brief  Returns the inner product (dot product) between this vector and the input vector v.
     *          The calculation is robust against overflows and minimizes round-off errors. Throws
     *          an exception if the two vectors do not have the same logical size.
     */
    real operator*(const VectorOfReals &v) const;

    /** \brief  Returns the Euclidean length of this vector. */
    real norm() const;

    const real &operator[](const size_t index) const { return vector_[index]; }
    real &operator[](const size_t index) { return vector_[index]; }
};


#endif // ifndef VECTOR_OF_REALS_H
