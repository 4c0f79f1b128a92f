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

#include "crumb_name.h"
#include "config.h"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace msgtrack {
namespace persist {

const char* crumb_kind_token(CrumbKind kind) noexcept {
    switch (kind) {
        case CrumbKind::New:    return crumb::kKindNew;
        case CrumbKind::Update: return crumb::kKindUpdate;
        case CrumbKind::Delete: return crumb::kKindDelete;
    }
    return "unknown";
}

static std::optional<CrumbKind> kind_from_token(const std::string& token) {
    if (token == crumb::kKindNew) return CrumbKind::New;
    if (token == crumb::kKindUpdate) return CrumbKind::Update;
    if (token == crumb::kKindDelete) return CrumbKind::Delete;
    return std::nullopt;
}

// Reads exactly `width` decimal digits starting at `pos`
static bool parse_digits(const std::string& s, size_t pos, size_t width, uint64_t* out) {
    if (pos + width > s.size()) {
        return false;
    }
    uint64_t v = 0;
    for (size_t i = pos; i < pos + width; i++) {
        char c = s[i];
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    *out = v;
    return true;
}

std::string CrumbName::filename() const {
    char stamp_buf[32];
    std::snprintf(stamp_buf, sizeof(stamp_buf), "%0*llu.%0*u",
                  static_cast<int>(crumb::kSecondsWidth),
                  static_cast<unsigned long long>(stamp.seconds),
                  static_cast<int>(crumb::kNanosWidth),
                  static_cast<unsigned>(stamp.nanos));

    std::string name(crumb::kPrefix);
    name += stamp_buf;
    name += '-';
    name += crumb_kind_token(kind);
    name += crumb::kExtension;
    return name;
}

bool CrumbName::owned(const std::string& filename) {
    const std::string temp_start = std::string(crumb::kTempPrefix) + crumb::kPrefix;
    return filename.compare(0, std::strlen(crumb::kPrefix), crumb::kPrefix) == 0 ||
           filename.compare(0, temp_start.size(), temp_start) == 0;
}

std::optional<CrumbName> CrumbName::parse(const std::string& filename) {
    const size_t prefix_len = std::strlen(crumb::kPrefix);
    const size_t ext_len = std::strlen(crumb::kExtension);

    if (filename.compare(0, prefix_len, crumb::kPrefix) != 0) {
        return std::nullopt;
    }
    if (filename.size() < prefix_len + ext_len ||
        filename.compare(filename.size() - ext_len, ext_len, crumb::kExtension) != 0) {
        return std::nullopt;
    }

    size_t pos = prefix_len;
    uint64_t seconds = 0;
    uint64_t nanos = 0;

    if (!parse_digits(filename, pos, crumb::kSecondsWidth, &seconds)) {
        return std::nullopt;
    }
    pos += crumb::kSecondsWidth;

    if (pos >= filename.size() || filename[pos] != '.') {
        return std::nullopt;
    }
    pos++;

    if (!parse_digits(filename, pos, crumb::kNanosWidth, &nanos) || nanos >= crumb::kNanosPerSecond) {
        return std::nullopt;
    }
    pos += crumb::kNanosWidth;

    if (pos >= filename.size() || filename[pos] != '-') {
        return std::nullopt;
    }
    pos++;

    size_t kind_end = filename.size() - ext_len;
    if (kind_end <= pos) {
        return std::nullopt;
    }
    auto kind = kind_from_token(filename.substr(pos, kind_end - pos));
    if (!kind) {
        return std::nullopt;
    }

    CrumbName out;
    out.stamp.seconds = seconds;
    out.stamp.nanos = static_cast<uint32_t>(nanos);
    out.kind = *kind;
    return out;
}

CrumbStamp CrumbClock::next() {
    static std::mutex mu;
    static CrumbStamp last;

    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    if (ns < 0) {
        ns = 0;
    }

    CrumbStamp candidate;
    candidate.seconds = static_cast<uint64_t>(ns) / crumb::kNanosPerSecond;
    candidate.nanos = static_cast<uint32_t>(static_cast<uint64_t>(ns) % crumb::kNanosPerSecond);

    std::lock_guard<std::mutex> lock(mu);
    if (!(last < candidate)) {
        // Same tick or clock stepped back: advance past the last stamp
        candidate = last;
        if (++candidate.nanos == crumb::kNanosPerSecond) {
            candidate.nanos = 0;
            candidate.seconds++;
        }
    }
    last = candidate;
    return candidate;
}

} // namespace persist
} // namespace msgtrack
