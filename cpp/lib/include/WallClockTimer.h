/** \file    WallClockTimer.h
 *  \brief   Declaration of class WallClockTimer.
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

#ifndef WALL_CLOCK_TIMER_H
#define WALL_CLOCK_TIMER_H


#include <string>
#include <ctime>
#include "TimerUtil.h"


/** \class  WallClockTimer
 *  \brief  Measures elapsed real time with clock_gettime(2) and CLOCK_MONOTONIC.
 */
class WallClockTimer {
    bool is_running_;
    struct timespec time_start_;
    double time_;
    std::string name_;

    static const unsigned char CUMULATIVE_FLAG = 1u << 0;
    static const unsigned char AUTO_START_FLAG = 1u << 1;
public:
    enum WallClockTimerType {
        /** Time spent between multiple start/stop pairs gets accumulated. */
        CUMULATIVE                     = CUMULATIVE_FLAG,
        /** Each call to start() resets the timer to zero. */
        NON_CUMULATIVE                 = 0,
        /** Like "CUMULATIVE" and constructor automatically calls start(). */
        CUMULATIVE_WITH_AUTO_START     = CUMULATIVE_FLAG | AUTO_START_FLAG,
        /** Like "NON_CUMULATIVE" and constructor automatically calls start(). */
        NON_CUMULATIVE_WITH_AUTO_START = AUTO_START_FLAG,
    };
private:
    WallClockTimerType timer_type_;
public:
    /** \brief  Constructs and initialises an object of type WallClockTimer.
     *  \param  timer_type  Specifies the desired behaviour of the timer.
     *  \param  name        Allows assignment of an optional name to a timer.  The name, if provided, will also be
     *                      used in error reporting,
     */
    explicit WallClockTimer(const WallClockTimerType timer_type = NON_CUMULATIVE, const std::string &name = "");

    void start();
    void stop();

    /** \brief   Returns either the cumulative wall clock time between all pairs of calls to to start() and stop()
     *           or else just the last pair.
     *  \return  The elapsed wall clock time in seconds with a nanosecond resolution.
     *  \note    The Timer must be stopped to return a meaningful time.
     */
    double getTime() const;

private:
    WallClockTimer(const WallClockTimer &rhs) = delete;
    const WallClockTimer &operator=(const WallClockTimer &rhs) = delete;

    std::string getDescription() const { return name_.empty() ? "timer" : "timer \"" + name_ + "\""; }
};


// For convenience:
typedef TimerStartStopper<WallClockTimer> WallClockTimerStartStopper;


#endif // ifndef WALL_CLOCK_TIMER_H
