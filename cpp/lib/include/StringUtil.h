/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
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
#pragma once


#include <string>
#include <cstring>
#include <strings.h>


namespace StringUtil {


/** ASCII whitespace only, so that trimming never cuts into a UTF-8 multibyte sequence. */
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief   Remove all occurences of a set of characters from the end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from the beginning of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
inline std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief  Convert a double to a string with exactly "no_of_decimals" digits after the decimal point.
 *  \note   Uses printf(3)-style "%.Nf" rounding.
 */
std::string ToFixedPointString(const double n, const unsigned no_of_decimals);


/** \brief   Convert a string into an unsigned number.
 *  \param   s     The string to convert.
 *  \param   n     Number that will hold the result.
 *  \param   base  The base of the string representation.
 *  \return  true if the conversion was successful, false otherwise.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);




/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A container to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of fields stored in "container".
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type next_delimiter(source.find(delimiter, start));
        const std::string field(source.substr(start, next_delimiter == std::string::npos ? std::string::npos
                                                                                         : next_delimiter - start));
        if (not suppress_empty_components or not field.empty()) {
            container->insert(container->end(), field);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


} // namespace StringUtil
