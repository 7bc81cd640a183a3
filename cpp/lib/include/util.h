/** \file   util.h
 *  \brief  Logging and other process-wide odds and ends used by the paper_checker library and tools.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2015-2020 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <mutex>
#include <string>


#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)


/** A thread-safe logger class.
 * \note Set the environment variable MIN_LOG_LEVEL to one of ERROR, WARNING, INFO or DEBUG to control the verbosity.
 *       Set LOGGER_FORMAT to a string containing any of "process_pids", "no_decorations" or "strip_call_site"
 *       to alter the layout of the emitted lines.
 */
class Logger {
public:
    enum LogLevel { LL_ERROR = 1, LL_WARNING = 2, LL_INFO = 3, LL_DEBUG = 4 };
    friend Logger *LoggerInstantiator();
protected:
    static const std::string FUNCTION_NAME_SEPARATOR;

    std::mutex mutex_;
    int log_fd_;
    bool log_process_pids_, log_no_decorations_, log_strip_call_site_;
    LogLevel min_log_level_;
public:
    Logger();
    virtual ~Logger() = default;

    void setMinimumLogLevel(const LogLevel min_log_level) { min_log_level_ = min_log_level; }

    //* Emits "msg" and then calls exit(3).
    [[noreturn]] virtual void error(const std::string &msg) __attribute__((noreturn));
    [[noreturn]] void error(const std::string &function_name, const std::string &msg) __attribute__((noreturn)) {
        error("in " + function_name + FUNCTION_NAME_SEPARATOR + msg);
        __builtin_unreachable();
    }

    virtual void warning(const std::string &msg);
    inline void warning(const std::string &function_name, const std::string &msg) {
        warning("in " + function_name + FUNCTION_NAME_SEPARATOR + msg);
    }

    virtual void info(const std::string &msg);
    inline void info(const std::string &function_name, const std::string &msg) {
        info("in " + function_name + FUNCTION_NAME_SEPARATOR + msg);
    }

    /** \note Also writes log messages if the environment variable "UTIL_LOG_DEBUG" exists and is set to "true"! */
    virtual void debug(const std::string &msg);
    inline void debug(const std::string &function_name, const std::string &msg) {
        debug("in " + function_name + FUNCTION_NAME_SEPARATOR + msg);
    }

    /** \return True and sets "*log_level" if "level_candidate" is one of "ERROR", "WARNING", "INFO" or "DEBUG",
     *          else false.
     */
    static bool StringToLogLevel(const std::string &level_candidate, LogLevel * const log_level);
protected:
    void formatMessage(const std::string &level, std::string * const msg);
    virtual void writeString(const std::string &level, std::string msg);
};
extern Logger *logger;


#define LOG_ERROR(message) logger->error(__PRETTY_FUNCTION__, message), __builtin_unreachable()
#define LOG_WARNING(message) logger->warning(__PRETTY_FUNCTION__, message)
#define LOG_INFO(message) logger->info(__PRETTY_FUNCTION__, message)
#define LOG_DEBUG(message) logger->debug(__PRETTY_FUNCTION__, message)


/** Must be set to point to argv[0] in main(). */
extern char *progname;


// \note A single newline will be appended to the message that is emitted on stderr.  Furthermore,
//       "[--min-log-level=...] " will be prepended.
[[noreturn]] void Usage(const std::string &usage_message);
