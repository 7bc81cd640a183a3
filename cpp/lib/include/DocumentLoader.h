/** \file    DocumentLoader.h
 *  \brief   Reads documents in one of several Chinese or Unicode encodings and returns their text as UTF-8.
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


namespace DocumentLoader {


enum LoadStatus { SUCCESS, EMPTY_FILE, NOT_FOUND, DECODE_ERROR, EMPTY_CONTENT };


struct LoadResult {
    LoadStatus status_;
    std::string text_;     // UTF-8, only meaningful if status_ == SUCCESS.
    std::string encoding_; // The encoding that decoded the file, if any.
public:
    explicit LoadResult(const LoadStatus status, const std::string &text = "", const std::string &encoding = "")
        : status_(status), text_(text), encoding_(encoding) { }
    inline bool ok() const { return status_ == SUCCESS; }
};


// The encodings we try, in order.
extern const std::vector<std::string> CANDIDATE_ENCODINGS;


std::string LoadStatusToString(const LoadStatus status);


/** \brief Reads "path" and decodes it with the first of CANDIDATE_ENCODINGS that accepts its contents.
 *  \return NOT_FOUND if "path" is not a readable regular file, EMPTY_FILE for zero-length files, DECODE_ERROR if none of
 *          the candidate encodings matches the contents and EMPTY_CONTENT if the decoded text only contains
 *          whitespace.
 *  \note   A UTF-8 byte order mark is removed.  UTF-16 without a byte order mark is assumed to be big-endian.
 */
LoadResult Load(const std::string &path);


} // namespace DocumentLoader
