/** \file    WallClockTimer.cc
 *  \brief   Implementation of class WallClockTimer.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
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
#include "WallClockTimer.h"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "util.h"


WallClockTimer::WallClockTimer(const WallClockTimerType timer_type, const std::string &name)
    : is_running_(false), time_(0.0), name_(name), timer_type_(timer_type)
{
    time_start_.tv_sec = time_start_.tv_nsec = 0;
    if (timer_type & AUTO_START_FLAG)
        start();
}


void WallClockTimer::start() {
    if (unlikely(is_running_))
        throw std::runtime_error("in WallClockTimer::start: " + getDescription() + " is running!");

    if (unlikely(::clock_gettime(CLOCK_MONOTONIC, &time_start_) == -1))
        throw std::runtime_error("in WallClockTimer::start: clock_gettime(2) failed (" + std::string(::strerror(errno)) + ")!");

    is_running_ = true;
}


void WallClockTimer::stop() {
    if (unlikely(not is_running_))
        throw std::runtime_error("in WallClockTimer::stop: " + getDescription() + " is not running!");

    struct timespec time_end;
    if (unlikely(::clock_gettime(CLOCK_MONOTONIC, &time_end) == -1))
        throw std::runtime_error("in WallClockTimer::stop: clock_gettime(2) failed (" + std::string(::strerror(errno)) + ")!");

    if (timer_type_ & CUMULATIVE_FLAG)
        time_ += TimespecToDouble(time_end) - TimespecToDouble(time_start_);
    else // Assume noncumulative timing.
        time_ = TimespecToDouble(time_end) - TimespecToDouble(time_start_);

    is_running_ = false;
}


double WallClockTimer::getTime() const {
    if (unlikely(is_running_))
        throw std::runtime_error("in WallClockTimer::getTime: " + getDescription() + " is still running!");

    return time_;
}
