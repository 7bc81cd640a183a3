/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2015-2020 Universitätsbibliothek Tübingen
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
#include "StringUtil.h"
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include "util.h"


namespace StringUtil {


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    std::string::size_type trimmed_length(s->length());
    while (trimmed_length > 0 and trim_set.find((*s)[trimmed_length - 1]) != std::string::npos)
        --trimmed_length;

    if (trimmed_length < s->length())
        s->resize(trimmed_length);

    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    const std::string::size_type no_of_leading_trim_chars(s->find_first_not_of(trim_set));
    if (no_of_leading_trim_chars == std::string::npos)
        s->clear();
    else if (no_of_leading_trim_chars > 0)
        s->erase(0, no_of_leading_trim_chars);

    return *s;
}


std::string ToFixedPointString(const double n, const unsigned no_of_decimals) {
    char buf[64];
    const int length(std::snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(no_of_decimals), n));
    if (unlikely(length < 0 or static_cast<size_t>(length) >= sizeof(buf)))
        throw std::runtime_error("in StringUtil::ToFixedPointString: can't format " + std::to_string(n) + "!");

    return std::string(buf, static_cast<size_t>(length));
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(*ch))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, base));
    *n = static_cast<unsigned>(ul);

    return (*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX);
}


} // namespace StringUtil
