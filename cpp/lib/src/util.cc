/** \file    util.cc
 *  \brief   Implementation of the Logger class and assorted process-wide helpers.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
    Copyright (C) 2015-2020 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "util.h"
#include <iostream>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include "StringUtil.h"
#include "TimeUtil.h"


char *progname; // Must be set in main() with "progname = argv[0];";


const std::string Logger::FUNCTION_NAME_SEPARATOR(" --> ");


Logger::Logger()
    : log_fd_(STDERR_FILENO), log_process_pids_(false), log_no_decorations_(false), log_strip_call_site_(false),
      min_log_level_(LL_INFO)
{
    const char * const min_log_level(::getenv("MIN_LOG_LEVEL"));
    if (min_log_level != nullptr and not StringToLogLevel(min_log_level, &min_log_level_))
        error("in Logger::Logger: not a valid minimum log level in MIN_LOG_LEVEL: \"" + std::string(min_log_level)
              + "\"! (Use ERROR, WARNING, INFO or DEBUG)");

    const char * const logger_format(::getenv("LOGGER_FORMAT"));
    if (logger_format != nullptr) {
        if (std::strstr(logger_format, "process_pids") != nullptr)
            log_process_pids_ = true;
        if (std::strstr(logger_format, "no_decorations") != nullptr)
            log_no_decorations_ = true;
        if (std::strstr(logger_format, "strip_call_site") != nullptr)
            log_strip_call_site_ = true;
    }
}


void Logger::error(const std::string &msg) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    std::string error_message_string;
    if (errno != 0)
        error_message_string = " (last errno error code: " + std::string(std::strerror(errno)) + ")";

    writeString("SEVERE", msg + error_message_string);
    std::exit(EXIT_FAILURE);
}


void Logger::warning(const std::string &msg) {
    if (min_log_level_ < LL_WARNING)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("WARN", msg);
}


void Logger::info(const std::string &msg) {
    if (min_log_level_ < LL_INFO)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("INFO", msg);
}


void Logger::debug(const std::string &msg) {
    if (min_log_level_ < LL_DEBUG) {
        const char * const util_log_debug(::getenv("UTIL_LOG_DEBUG"));
        if (util_log_debug == nullptr or std::strcmp(util_log_debug, "true") != 0)
            return;
    }

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString("DEBUG", msg);
}


inline Logger *LoggerInstantiator() {
    return new Logger();
}


Logger *logger(LoggerInstantiator());


bool Logger::StringToLogLevel(const std::string &level_candidate, LogLevel * const log_level) {
    if (level_candidate == "ERROR")
        *log_level = Logger::LL_ERROR;
    else if (level_candidate == "WARNING")
        *log_level = Logger::LL_WARNING;
    else if (level_candidate == "INFO")
        *log_level = Logger::LL_INFO;
    else if (level_candidate == "DEBUG")
        *log_level = Logger::LL_DEBUG;
    else
        return false;

    return true;
}


void Logger::formatMessage(const std::string &level, std::string * const msg) {
    if (log_strip_call_site_) {
        const auto END_OF_CALL_SITE_PREFIX(msg->find(FUNCTION_NAME_SEPARATOR));
        if (END_OF_CALL_SITE_PREFIX != std::string::npos)
            *msg = msg->substr(END_OF_CALL_SITE_PREFIX + FUNCTION_NAME_SEPARATOR.length());
    }

    if (not log_no_decorations_) {
        *msg = TimeUtil::GetCurrentDateAndTime(TimeUtil::ISO_8601_FORMAT) + " " + level + " "
               + std::string(::program_invocation_name) + ": " + *msg;
        if (log_process_pids_)
            *msg += " (PID: " + std::to_string(::getpid()) + ")";
    }

    *msg += '\n';
}


void Logger::writeString(const std::string &level, std::string msg) {
    formatMessage(level, &msg);

    if (unlikely(::write(log_fd_, reinterpret_cast<const void *>(msg.data()), msg.size()) == -1)) {
        const std::string error_message("in Logger::writeString(util.cc): write to file descriptor " + std::to_string(log_fd_)
                                        + " failed! (errno = " + std::to_string(errno) + ")\n");
#pragma GCC diagnostic ignored "-Wunused-result"
        ::write(STDERR_FILENO, error_message.data(), error_message.size());
#pragma GCC diagnostic warning "-Wunused-result"
        _exit(EXIT_FAILURE);
    }
}


[[noreturn]] void Usage(const std::string &usage_message) {
    std::vector<std::string> lines;
    StringUtil::Split(usage_message, '\n', &lines, /* suppress_empty_components = */ false);
    auto line(lines.begin());
    if (unlikely(line == lines.end()))
        LOG_ERROR("missing usage message!");

    std::cerr << "Usage: " << ::program_invocation_name << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] "
              << StringUtil::TrimWhite(*line) << '\n';
    const std::string padding(__builtin_strlen("Usage: ") + __builtin_strlen(::program_invocation_name) + 1, ' ');
    for (++line; line != lines.end(); ++line)
        std::cerr << padding << StringUtil::TrimWhite(*line) << '\n';

    std::exit(EXIT_FAILURE);
}
