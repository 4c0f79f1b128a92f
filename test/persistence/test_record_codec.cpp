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

#include <gtest/gtest.h>
#include <string>
#include "persistence/record_codec.h"
#include "rapidjson/document.h"
#include "persistence/test_helpers.h"

using namespace msgtrack;
using namespace msgtrack::persist;

TEST(RecordCodecTest, FullRecordSurvives) {
    Record in = test::make_full_record("<full@example.org>");

    Record out;
    std::string why;
    ASSERT_TRUE(record_codec::decode(record_codec::encode(in), &out, &why)) << why;
    EXPECT_EQ(out, in);
}

TEST(RecordCodecTest, AbsentAndEmptyInReplyToStayDistinct) {
    Record absent = test::make_record("<a@x>");
    Record empty = test::make_record("<b@x>");
    empty.in_reply_to = "";

    Record out;
    std::string why;
    ASSERT_TRUE(record_codec::decode(record_codec::encode(absent), &out, &why)) << why;
    EXPECT_FALSE(out.in_reply_to.has_value());

    ASSERT_TRUE(record_codec::decode(record_codec::encode(empty), &out, &why)) << why;
    ASSERT_TRUE(out.in_reply_to.has_value());
    EXPECT_EQ(*out.in_reply_to, "");
}

TEST(RecordCodecTest, EmbeddedNulAndUnicode) {
    Record in = test::make_record("<nul@x>");
    in.subject = std::string("a\0b", 3);
    in.sender = "J\xC3\xBCrgen <j@example.de>";

    Record out;
    std::string why;
    ASSERT_TRUE(record_codec::decode(record_codec::encode(in), &out, &why)) << why;
    EXPECT_EQ(out.subject.size(), 3u);
    EXPECT_EQ(out, in);
}

TEST(RecordCodecTest, EncodesNullInReplyTo) {
    std::string json = record_codec::encode(test::make_record("<a@x>"));
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.HasMember("in_reply_to"));
    EXPECT_TRUE(doc["in_reply_to"].IsNull());
    EXPECT_STREQ(doc["message_id"].GetString(), "<a@x>");
}

TEST(RecordCodecTest, MissingInReplyToReadsAsAbsent) {
    const std::string json =
        R"({"message_id":"<a@x>","group":"INBOX","display_line":"","date":"","subject":"",)"
        R"("sender":"","recipients":[],"references":""})";
    Record out;
    std::string why;
    ASSERT_TRUE(record_codec::decode(json, &out, &why)) << why;
    EXPECT_EQ(out.message_id, "<a@x>");
    EXPECT_FALSE(out.in_reply_to.has_value());
}

TEST(RecordCodecTest, RejectsBadInput) {
    Record out;
    std::string why;

    EXPECT_FALSE(record_codec::decode("", &out, &why));
    EXPECT_FALSE(why.empty());

    why.clear();
    EXPECT_FALSE(record_codec::decode("{\"message_id\": ", &out, &why));
    EXPECT_NE(why.find("parse error"), std::string::npos);

    EXPECT_FALSE(record_codec::decode("[1,2,3]", &out, &why));
    EXPECT_EQ(why, "record is not a JSON object");

    // Missing group
    EXPECT_FALSE(record_codec::decode(R"({"message_id":"<a@x>"})", &out, &why));
    EXPECT_NE(why.find("'group'"), std::string::npos);

    // Empty key
    const std::string empty_id =
        R"({"message_id":"","group":"INBOX","display_line":"","date":"","subject":"",)"
        R"("sender":"","recipients":[],"references":"","in_reply_to":null})";
    EXPECT_FALSE(record_codec::decode(empty_id, &out, &why));
    EXPECT_EQ(why, "empty message_id");

    // Wrong in_reply_to type
    const std::string bad_irt =
        R"({"message_id":"<a@x>","group":"INBOX","display_line":"","date":"","subject":"",)"
        R"("sender":"","recipients":[],"references":"","in_reply_to":5})";
    EXPECT_FALSE(record_codec::decode(bad_irt, &out, &why));

    // Non-string address
    const std::string bad_addr =
        R"({"message_id":"<a@x>","group":"INBOX","display_line":"","date":"","subject":"",)"
        R"("sender":"","recipients":[{"role":"To","addresses":[1]}],"references":""})";
    EXPECT_FALSE(record_codec::decode(bad_addr, &out, &why));
    EXPECT_EQ(why, "non-string address");
}

TEST(RecordCodecTest, FailedDecodeLeavesOutputUntouched) {
    Record out = test::make_record("<keep@x>");
    std::string why;
    EXPECT_FALSE(record_codec::decode(R"({"message_id":"<a@x>"})", &out, &why));
    EXPECT_EQ(out.message_id, "<keep@x>");
}
