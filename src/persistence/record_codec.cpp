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

#include "record_codec.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

namespace msgtrack {
namespace persist {
namespace record_codec {

static bool read_string(const rapidjson::Value& obj, const char* key, std::string* out, std::string* why) {
    if (!obj.HasMember(key) || !obj[key].IsString()) {
        *why = std::string("missing or non-string field '") + key + "'";
        return false;
    }
    const auto& v = obj[key];
    out->assign(v.GetString(), v.GetStringLength());
    return true;
}

bool read(const rapidjson::Value& value, Record* out, std::string* why) {
    if (!value.IsObject()) {
        *why = "record is not a JSON object";
        return false;
    }

    Record r;
    if (!read_string(value, "message_id", &r.message_id, why) ||
        !read_string(value, "group", &r.group, why) ||
        !read_string(value, "display_line", &r.display_line, why) ||
        !read_string(value, "date", &r.date, why) ||
        !read_string(value, "subject", &r.subject, why) ||
        !read_string(value, "sender", &r.sender, why) ||
        !read_string(value, "references", &r.references, why)) {
        return false;
    }

    if (r.message_id.empty()) {
        *why = "empty message_id";
        return false;
    }

    if (!value.HasMember("recipients") || !value["recipients"].IsArray()) {
        *why = "missing or non-array field 'recipients'";
        return false;
    }
    const auto& rcpts = value["recipients"];
    r.recipients.reserve(rcpts.Size());
    for (rapidjson::SizeType i = 0; i < rcpts.Size(); i++) {
        const auto& entry = rcpts[i];
        if (!entry.IsObject()) {
            *why = "recipient entry is not an object";
            return false;
        }
        Recipient rcpt;
        if (!read_string(entry, "role", &rcpt.role, why)) {
            return false;
        }
        if (!entry.HasMember("addresses") || !entry["addresses"].IsArray()) {
            *why = "missing or non-array field 'addresses'";
            return false;
        }
        const auto& addrs = entry["addresses"];
        for (rapidjson::SizeType j = 0; j < addrs.Size(); j++) {
            if (!addrs[j].IsString()) {
                *why = "non-string address";
                return false;
            }
            rcpt.addresses.emplace_back(addrs[j].GetString(), addrs[j].GetStringLength());
        }
        r.recipients.push_back(std::move(rcpt));
    }

    // in_reply_to: string, null, or absent
    if (value.HasMember("in_reply_to")) {
        const auto& irt = value["in_reply_to"];
        if (irt.IsString()) {
            r.in_reply_to = std::string(irt.GetString(), irt.GetStringLength());
        } else if (!irt.IsNull()) {
            *why = "field 'in_reply_to' is neither string nor null";
            return false;
        }
    }

    *out = std::move(r);
    return true;
}

std::string encode(const Record& r) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write(writer, r);
    return std::string(buffer.GetString(), buffer.GetSize());
}

bool decode(const std::string& json, Record* out, std::string* why) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        *why = std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
               ": " + rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }

    return read(doc, out, why);
}

} // namespace record_codec
} // namespace persist
} // namespace msgtrack
