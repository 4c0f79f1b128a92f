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
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include "config.h"  // For defaults

namespace msgtrack {
namespace persist {

/**
 * Runtime configuration for the record store
 * Paths can be customized per store instead of compile-time constants
 */
struct StoreConfig {
    // Snapshot file written by save() and read by load()
    std::string snapshot_path;

    // Directory holding one crumb file per unsaved mutation
    std::string crumb_dir;

    // fdatasync crumbs and snapshots, and fsync their directory after rename
    bool sync_writes = true;

    /**
     * Config rooted at a single data directory:
     *   <dir>/msgtrack.json and <dir>/crumbs/
     */
    static StoreConfig in_directory(const std::string& dir) {
        std::filesystem::path root(dir);
        StoreConfig cfg;
        cfg.snapshot_path = (root / files::kSnapshotFile).string();
        cfg.crumb_dir = (root / files::kCrumbDir).string();
        return cfg;
    }

    /**
     * Default data directory: $XDG_DATA_HOME/msgtrack, then
     * $HOME/.local/share/msgtrack, then ./msgtrack
     */
    static std::string default_data_dir() {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return (std::filesystem::path(xdg) / files::kAppDir).string();
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return (std::filesystem::path(home) / ".local" / "share" / files::kAppDir).string();
        }
        return (std::filesystem::path(".") / files::kAppDir).string();
    }

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        std::string dir = default_data_dir();
        if (const char* env = std::getenv("MSGTRACK_DATA_DIR"); env && *env) {
            dir = env;
        }

        StoreConfig cfg = in_directory(dir);

        // Check environment variables for overrides
        if (const char* env = std::getenv("MSGTRACK_SNAPSHOT_PATH"); env && *env) {
            cfg.snapshot_path = env;
        }

        if (const char* env = std::getenv("MSGTRACK_CRUMB_DIR"); env && *env) {
            cfg.crumb_dir = env;
        }

        if (const char* env = std::getenv("MSGTRACK_SYNC_WRITES")) {
            std::string v(env);
            cfg.sync_writes = !(v == "0" || v == "false" || v == "off" || v == "no");
        }

        return cfg;
    }

    /**
     * Validate configuration
     *
     * The crumb directory must not be the snapshot itself, the directory
     * holding it, or any ancestor of that directory. Paths are compared in
     * absolute form with symlinks resolved, so "msgtrack.json" and "$PWD"
     * or a linked alias of the data directory are caught as well.
     */
    bool validate() const {
        if (snapshot_path.empty() || crumb_dir.empty()) {
            return false;
        }
        std::filesystem::path snap = resolve(snapshot_path);
        std::filesystem::path crumbs = resolve(crumb_dir);
        if (snap == crumbs) {
            return false;
        }
        return !is_within(snap.parent_path(), crumbs);
    }

private:
    // Absolute, symlink-resolved, without a trailing separator
    static std::filesystem::path resolve(const std::string& p) {
        std::error_code ec;
        std::filesystem::path out = std::filesystem::absolute(p, ec);
        if (ec) {
            out = std::filesystem::path(p);
        }
        std::filesystem::path canon = std::filesystem::weakly_canonical(out, ec);
        out = ec ? out.lexically_normal() : canon.lexically_normal();
        if (!out.has_filename() && out != out.root_path()) {
            out = out.parent_path();
        }
        return out;
    }

    // True if `dir` equals `ancestor` or lies beneath it
    static bool is_within(const std::filesystem::path& dir, const std::filesystem::path& ancestor) {
        auto d = dir.begin();
        for (auto a = ancestor.begin(); a != ancestor.end(); ++a, ++d) {
            if (d == dir.end() || *d != *a) {
                return false;
            }
        }
        return true;
    }
};

} // namespace persist
} // namespace msgtrack
