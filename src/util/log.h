/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <atomic>
#include <optional>
#include <utility>

namespace msgtrack {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // every crumb written or replayed
        LOG_DEBUG,    // each mutation, snapshot writes
        LOG_INFO,     // load/save summaries, recovery
        LOG_WARNING,  // discarded crumbs, dropped duplicates
        LOG_ERROR,    // failed saves, loads and crumb writes
        LOG_SEVERE
    };

    /**
     * Per-thread message buffer. A message is accumulated with operator<<
     * and emitted as one line by flush(), so lines from different threads
     * never interleave.
     */
    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        stringstream ss;
        LogLevel logLevel;
        string _threadName;
    public:

        friend class LogManager;
        /**
         * set the log file (nullptr restores stderr)
         */
        static void setLogFile(FILE* f);

        // Writes the pending message with its timestamp/thread/level prefix
        void flush();

        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }
        LogLevel level() const { return logLevel; }

        Logger& operator<<(const char *x) { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char x)        { ss << x; return *this; }
        Logger& operator<<(int x)         { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(const void *x)   { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)               { ss << (x ? "true" : "false"); return *this; }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

        bool hasPending() const { return !ss.str().empty(); }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() : logLevel(LOG_INFO), _threadName("msgtrack") {}
        void _reset() {
            ss.str("");
            ss.clear();
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    const char* logLevelToString(LogLevel l);

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        ~LoggerWrapper() {
            // Only do work if we have a logger (filtered messages have nullptr)
            if (should_flush_ && logger_ && logger_->hasPending()) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            // Short-circuit for filtered messages
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )  // LogLevel enum: lower value = more verbose
            return LoggerWrapper(nullptr, false);   // Return no-op wrapper
        Logger& logger = Logger::get().setLogLevel( l );
        return LoggerWrapper(&logger, true);  // Auto-flush on destruction
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // "trace", "DEBUG", "warn", ... -> level; nullopt for anything else
    inline std::optional<LogLevel> parseLogLevel(const std::string& name) {
        static const std::pair<const char*, LogLevel> names[] = {
            {"TRACE", LOG_TRACE}, {"DEBUG", LOG_DEBUG}, {"INFO", LOG_INFO},
            {"WARNING", LOG_WARNING}, {"WARN", LOG_WARNING},
            {"ERROR", LOG_ERROR}, {"SEVERE", LOG_SEVERE}, {"FATAL", LOG_SEVERE},
        };
        std::string upper(name);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (const auto& [n, level] : names) {
            if (upper == n) {
                return level;
            }
        }
        return std::nullopt;
    }

    inline bool setLogLevelFromString(const std::string& name) {
        auto level = parseLogLevel(name);
        if (!level) {
            return false;
        }
        logLevel.store(*level, std::memory_order_relaxed);
        return true;
    }

    // Applies $<var> (LOG_LEVEL by default) if set; unknown names are reported and ignored
    inline void initLoggingFromEnv(const char* var = "LOG_LEVEL") {
        const char* value = std::getenv(var);
        if (value && !setLogLevelFromString(value)) {
            std::cerr << "Warning: Invalid " << var << " '" << value
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}
