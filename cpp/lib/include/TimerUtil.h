/** \file    TimerUtil.h
 *  \brief   Timer-related helper functions and classes.
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

#ifndef TIMER_UTIL_H
#define TIMER_UTIL_H


#include <ctime>


inline double TimespecToDouble(const struct timespec &ts) {
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1.0e-9;
}


/** \brief  Wrapper class that implements interval timers in an exception-safe manner.
 *  \note   The constructor of this class calls the timer's start() member function
 *          and the destructor calls the timer's stop() member function.  So timing
 *          will be limited to the scope of an object of this class.
 */
template<class SomeTimer> class TimerStartStopper {
    SomeTimer &some_timer_;
public:
    explicit TimerStartStopper(SomeTimer * const some_timer): some_timer_(*some_timer) { some_timer_.start(); }
    ~TimerStartStopper() { some_timer_.stop(); }
private:
    TimerStartStopper(const TimerStartStopper &rhs) = delete;
    const TimerStartStopper &operator=(const TimerStartStopper &rhs) = delete;
};


#endif // ifndef TIMER_UTIL_H
