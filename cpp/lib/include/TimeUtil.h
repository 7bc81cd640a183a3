/** \file    TimeUtil.h
 *  \brief   Declarations of time-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2015-2020 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <ctime>


namespace TimeUtil {


const std::string DEFAULT_FORMAT("%Y-%m-%d %T");
const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!


enum TimeZone { LOCAL, UTC };


/** \brief  Formats "the_time" according to "format", a strftime(3) format string.
 *  \throws std::runtime_error if the conversion fails.
 */
std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT,
                          const TimeZone time_zone = LOCAL);


/** \brief   Get the current date time as a string
 *  \return  A string representing the current date and time.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


} // namespace TimeUtil
