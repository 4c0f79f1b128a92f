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
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "errors.h"
#include "persistence/crumb_replay.h"
#include "persistence/record_codec.h"
#include "persistence/test_helpers.h"

using namespace msgtrack;
using namespace msgtrack::persist;
namespace fs = std::filesystem;

class CrumbReplayTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string crumb_dir_;
    std::vector<std::pair<CrumbKind, std::string>> applied_;

    void SetUp() override {
        test_dir_ = test::create_temp_dir("msgtrack_replay_test");
        crumb_dir_ = test_dir_ + "/crumbs";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    CrumbReplay::ApplyFn recorder() {
        return [this](CrumbKind kind, const Record& r) {
            applied_.emplace_back(kind, r.message_id + "/" + r.group);
        };
    }

    // Write a crumb by hand with a chosen stamp
    void plant(uint64_t seconds, uint32_t nanos, CrumbKind kind, const Record& r) {
        fs::create_directories(crumb_dir_);
        CrumbName name;
        name.stamp = CrumbStamp{seconds, nanos};
        name.kind = kind;
        test::write_file(crumb_dir_ + "/" + name.filename(), record_codec::encode(r));
    }
};

TEST_F(CrumbReplayTest, EmptyDirectory) {
    JournalWriter journal(crumb_dir_);
    CrumbReplay replay(journal);

    auto result = replay.run(recorder());
    EXPECT_EQ(result.applied, 0u);
    EXPECT_EQ(result.discarded, 0u);
    EXPECT_TRUE(applied_.empty());
}

TEST_F(CrumbReplayTest, AppliesInChronologicalOrder) {
    // Planted out of order on purpose
    plant(1700000002, 0, CrumbKind::Delete, test::make_record("<a@x>", "Archive"));
    plant(1700000000, 5, CrumbKind::New, test::make_record("<a@x>"));
    plant(1700000001, 999999999, CrumbKind::Update, test::make_record("<a@x>", "Archive"));
    plant(1700000000, 10, CrumbKind::New, test::make_record("<b@x>"));

    JournalWriter journal(crumb_dir_);
    auto result = CrumbReplay(journal).run(recorder());

    EXPECT_EQ(result.applied, 4u);
    ASSERT_EQ(applied_.size(), 4u);
    EXPECT_EQ(applied_[0], std::make_pair(CrumbKind::New, std::string("<a@x>/INBOX")));
    EXPECT_EQ(applied_[1], std::make_pair(CrumbKind::New, std::string("<b@x>/INBOX")));
    EXPECT_EQ(applied_[2], std::make_pair(CrumbKind::Update, std::string("<a@x>/Archive")));
    EXPECT_EQ(applied_[3], std::make_pair(CrumbKind::Delete, std::string("<a@x>/Archive")));
}

TEST_F(CrumbReplayTest, LeavesAppliedCrumbsOnDisk) {
    JournalWriter journal(crumb_dir_);
    journal.append(CrumbKind::New, test::make_record("<a@x>"));
    journal.append(CrumbKind::New, test::make_record("<b@x>"));

    auto result = CrumbReplay(journal).run(recorder());
    EXPECT_EQ(result.applied, 2u);
    EXPECT_EQ(test::list_dir(crumb_dir_).size(), 2u);

    // Replaying again hands the same crumbs over
    applied_.clear();
    result = CrumbReplay(journal).run(recorder());
    EXPECT_EQ(result.applied, 2u);
    EXPECT_EQ(applied_.size(), 2u);
}

TEST_F(CrumbReplayTest, MalformedFilesAreDiscardedAndNotCounted) {
    plant(1700000000, 0, CrumbKind::New, test::make_record("<a@x>"));
    test::write_file(crumb_dir_ + "/.cr-1700000001.000000000-new.json.tmp", "{\"message_id\":");
    test::write_file(crumb_dir_ + "/cr-1700000002.000000000-rename.json", "{}");

    JournalWriter journal(crumb_dir_);
    auto result = CrumbReplay(journal).run(recorder());

    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(result.discarded, 2u);
    ASSERT_EQ(applied_.size(), 1u);
    EXPECT_EQ(applied_[0].second, "<a@x>/INBOX");

    auto left = test::list_dir(crumb_dir_);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0], "cr-1700000000.000000000-new.json");
}

TEST_F(CrumbReplayTest, ForeignFilesAreLeftInPlace) {
    plant(1700000000, 0, CrumbKind::New, test::make_record("<a@x>"));
    // A snapshot or user file sharing the directory
    test::write_file(crumb_dir_ + "/msgtrack.json", "{\"version\":1,\"records\":[]}");
    test::write_file(crumb_dir_ + "/notes.txt", "hello");

    JournalWriter journal(crumb_dir_);
    auto result = CrumbReplay(journal).run(recorder());

    EXPECT_EQ(result.applied, 1u);
    EXPECT_EQ(result.discarded, 0u);
    EXPECT_EQ(result.foreign, 2u);
    EXPECT_EQ(test::read_file(crumb_dir_ + "/msgtrack.json"), "{\"version\":1,\"records\":[]}");
    EXPECT_EQ(test::read_file(crumb_dir_ + "/notes.txt"), "hello");

    // Compaction leaves them alone too
    EXPECT_EQ(journal.remove_all(), 1u);
    auto left = test::list_dir(crumb_dir_);
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0], "msgtrack.json");
    EXPECT_EQ(left[1], "notes.txt");
}

TEST_F(CrumbReplayTest, CorruptBodyAbortsBeforeApplying) {
    plant(1700000000, 0, CrumbKind::New, test::make_record("<a@x>"));
    plant(1700000001, 0, CrumbKind::New, test::make_record("<b@x>"));
    std::string bad = crumb_dir_ + "/cr-1700000002.000000000-update.json";
    test::write_file(bad, "{\"message_id\": \"<a@x>\", \"gro");

    JournalWriter journal(crumb_dir_);
    CrumbReplay replay(journal);
    try {
        replay.run(recorder());
        FAIL() << "expected CorruptDataError";
    } catch (const CorruptDataError& e) {
        EXPECT_EQ(fs::path(e.path()).filename().string(), fs::path(bad).filename().string());
    }

    // Nothing applied, nothing deleted
    EXPECT_TRUE(applied_.empty());
    EXPECT_EQ(test::list_dir(crumb_dir_).size(), 3u);
}

TEST_F(CrumbReplayTest, ApplyExceptionPropagates) {
    plant(1700000000, 0, CrumbKind::New, test::make_record("<a@x>"));
    JournalWriter journal(crumb_dir_);

    CrumbReplay replay(journal);
    EXPECT_THROW(replay.run([](CrumbKind, const Record&) {
        throw std::runtime_error("apply failed");
    }), std::runtime_error);
}
