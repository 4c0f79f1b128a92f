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
#include <string>
#include "rapidjson/document.h"
#include "../record.h"

namespace msgtrack {
namespace persist {

/**
 * JSON encoding of a Record, shared by snapshot and crumb files.
 *
 * {
 *   "message_id": "<a1@example.org>",
 *   "group": "INBOX",
 *   "display_line": "...", "date": "...", "subject": "...", "sender": "...",
 *   "recipients": [ {"role": "To", "addresses": ["x@y", ...]}, ... ],
 *   "references": "...",
 *   "in_reply_to": "<...>" | null
 * }
 *
 * Strings are written with explicit lengths so embedded NULs survive.
 */
namespace record_codec {

    // Writes one record object through any rapidjson writer
    template<typename Writer>
    void write(Writer& writer, const Record& r) {
        auto str = [&writer](const char* key, const std::string& value) {
            writer.Key(key);
            writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
        };

        writer.StartObject();
        str("message_id", r.message_id);
        str("group", r.group);
        str("display_line", r.display_line);
        str("date", r.date);
        str("subject", r.subject);
        str("sender", r.sender);

        writer.Key("recipients");
        writer.StartArray();
        for (const auto& rcpt : r.recipients) {
            writer.StartObject();
            str("role", rcpt.role);
            writer.Key("addresses");
            writer.StartArray();
            for (const auto& addr : rcpt.addresses) {
                writer.String(addr.data(), static_cast<rapidjson::SizeType>(addr.size()));
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();

        str("references", r.references);

        writer.Key("in_reply_to");
        if (r.in_reply_to) {
            writer.String(r.in_reply_to->data(), static_cast<rapidjson::SizeType>(r.in_reply_to->size()));
        } else {
            writer.Null();
        }
        writer.EndObject();
    }

    // Parses one record object. Returns false and fills `why` when a field
    // is missing, has the wrong type, or message_id is empty.
    bool read(const rapidjson::Value& value, Record* out, std::string* why);

    // Single record as a compact JSON document (crumb body)
    std::string encode(const Record& r);

    // Inverse of encode(); false and `why` on any parse or shape error
    bool decode(const std::string& json, Record* out, std::string* why);

} // namespace record_codec

} // namespace persist
} // namespace msgtrack
