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
#include <stdexcept>
#include <string>

namespace msgtrack {

    // Base for every hard failure raised by the record store.
    class StoreError : public std::runtime_error {
    public:
        explicit StoreError(const std::string& what) : std::runtime_error(what) {}
    };

    // Snapshot or crumb file could not be created, written, read or renamed.
    class IOError : public StoreError {
    public:
        IOError(const std::string& what, const std::string& path)
            : StoreError(what + ": " + path), path_(path) {}

        const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

    // Snapshot or crumb body exists but does not parse as records.
    class CorruptDataError : public StoreError {
    public:
        CorruptDataError(const std::string& what, const std::string& path)
            : StoreError(what + ": " + path), path_(path) {}

        const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

    // Rotation requested on an empty collection.
    class EmptyCollectionError : public StoreError {
    public:
        EmptyCollectionError() : StoreError("record collection is empty") {}
    };

}
