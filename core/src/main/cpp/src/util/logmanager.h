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
#include <boost/filesystem.hpp>

namespace paneflow {

    /**
     * Redirects Logger output to a file for the lifetime of the manager.
     * The default target (stderr) is restored on destruction.
     */
    class LogManager {
    public:

        explicit LogManager(const std::string& logpath, bool append = true)
            : _path(logpath), _append(append), _file(nullptr) {}

        ~LogManager() {
            stop();
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        /**
         * Resolve the log path from PANEFLOW_LOG_FILE, falling back to
         * the given default when unset.
         */
        static std::string pathFromEnv(const std::string& fallback = "") {
            const char* env = std::getenv("PANEFLOW_LOG_FILE");
            return env ? std::string(env) : fallback;
        }

        /**
         * Open the log file and route all loggers to it.
         * @return false when the path is a directory or cannot be opened
         */
        bool start() {
            if (_file)
                return true;

            boost::filesystem::path lp(_path);
            if (boost::filesystem::is_directory(lp)) {
                std::cerr << "logpath [" << _path << "] should be a file name not a directory" << std::endl;
                return false;
            }

            boost::system::error_code ec;
            if (lp.has_parent_path()) {
                boost::filesystem::create_directories(lp.parent_path(), ec);
                if (ec) {
                    std::cerr << "can't create log directory for [" << _path << "]: " << ec.message() << std::endl;
                    return false;
                }
            }

            bool exists = boost::filesystem::exists(lp);
            _file = fopen(_path.c_str(), _append ? "a" : "w");
            if (!_file) {
                std::cerr << "can't open [" << _path << "] for log file: " << errnoWithDescription() << std::endl;
                return false;
            }

            if (_append && exists) {
                const std::string msg = "\n\n***** SCHEDULER RESTARTED *****\n\n";
                if (fwrite(msg.data(), 1, msg.size(), _file) != msg.size()) {
                    std::cerr << "failed to write restart marker to [" << _path << "]" << std::endl;
                }
            }

            Logger::setLogFile(_file);
            return true;
        }

        void stop() {
            if (!_file)
                return;
            Logger::setLogFile(nullptr);
            fclose(_file);
            _file = nullptr;
        }

        bool enabled() const { return _file != nullptr; }
        const std::string& path() const { return _path; }

    private:
        std::string _path;
        bool _append;
        FILE* _file;
    };

}
