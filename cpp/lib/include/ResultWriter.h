/** \file    ResultWriter.h
 *  \brief   Writes similarity scores to result files.
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


namespace ResultWriter {


// What ends up in a result file if no score could be computed.
extern const std::string FALLBACK_VALUE;


/** \brief Writes "value" with exactly two decimals and no trailing newline to "path", replacing any previous contents.
 *         Missing parent directories are created.
 *  \throws std::runtime_error if the directory can't be created or the file can't be written.
 */
void Write(const std::string &path, const double value);


/** \brief Tries to write FALLBACK_VALUE to "path".  Failures are logged as warnings but otherwise ignored. */
void WriteFallback(const std::string &path);


} // namespace ResultWriter
