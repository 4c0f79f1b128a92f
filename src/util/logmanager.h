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

#include "log.h"
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace msgtrack {

    /**
     * Routes Logger output into <logdir>/msgtrack.log.
     *
     * The file is opened in append mode; rotate() renames the current file
     * to a timestamped sibling and reopens a fresh one. Destroying the
     * manager hands logging back to stderr.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir, bool append = true) : _enabled(false), _append(append), _file(0) {
            boost::filesystem::path dir(logdir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());
            }
            start((dir / "msgtrack.log").string());
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if ( _file )
                fclose( _file );
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return "unknown-time";
            return buf;
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
#ifdef POSIX_FADV_DONTNEED
                posix_fadvise(fileno(_file), 0, 0, POSIX_FADV_DONTNEED);
#endif
                // Rename the (open) existing log file to a timestamped name
                string rotated = _path + "." + terseCurrentTime( false );
                boost::system::error_code ec;
                boost::filesystem::rename( _path, rotated, ec );
                if ( ec ) {
                    cerr << "can't rotate " << _path << ": " << ec.message() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

    private:
        void start( const string& lp ) {
            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }

            bool exists = boost::filesystem::exists(lp);
            _path = lp;
            _enabled = true;
            rotate_open(exists);
        }

        void rotate_open(bool existed) {
            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }
            if (_append && existed) {
                const string msg = "\n***** MSGTRACK RESTARTED *****\n\n";
                if (fwrite(msg.data(), 1, msg.size(), tmp) != msg.size()) {
                    cerr << "can't write restart marker to " << _path << ": " << errnoWithDescription() << endl;
                }
            }
            Logger::setLogFile(tmp);
            _file = tmp;
        }

        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
