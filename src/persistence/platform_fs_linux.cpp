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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace msgtrack {
    namespace persist {

        namespace {
            // rc from a syscall that sets errno on failure
            inline FSResult from_rc(int rc) {
                return {rc == 0, rc == 0 ? 0 : errno};
            }

            // Opens `path` with `flags`, runs `op` on the descriptor, closes it.
            // The first failure wins.
            template<typename Op>
            FSResult with_fd(const std::string& path, int flags, Op op) {
                int fd = ::open(path.c_str(), flags | O_CLOEXEC);
                if (fd < 0) {
                    return {false, errno};
                }
                FSResult res = from_rc(op(fd));
                if (::close(fd) != 0 && res.ok) {
                    res = {false, errno};
                }
                return res;
            }
        }

        FSResult PlatformFS::sync_file(const std::string& path) {
            return with_fd(path, O_RDONLY, [](int fd) { return ::fdatasync(fd); });
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            return with_fd(dir_path, O_RDONLY | O_DIRECTORY, [](int fd) { return ::fsync(fd); });
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            FSResult res = rename(src, dst);
            if (!res.ok) {
                return res;
            }
            // The rename is durable once the containing directory is synced
            std::string parent = std::filesystem::path(dst).parent_path().string();
            return fsync_directory(parent.empty() ? "." : parent);
        }

        FSResult PlatformFS::rename(const std::string& src, const std::string& dst) {
            return from_rc(::rename(src.c_str(), dst.c_str()));
        }

        FSResult PlatformFS::remove(const std::string& path) {
            FSResult res = from_rc(::unlink(path.c_str()));
            if (!res.ok && res.err == ENOENT) {
                return {true, 0};
            }
            return res;
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                return {false, ec.value()};
            }
            if (!std::filesystem::is_directory(path, ec)) {
                return {false, ec ? ec.value() : ENOTDIR};
            }
            return {true, 0};
        }

    } // namespace persist
} // namespace msgtrack
