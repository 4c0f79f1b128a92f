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
#include <string>
#include "errors.h"
#include "persistence/journal_writer.h"
#include "persistence/record_codec.h"
#include "persistence/test_helpers.h"

using namespace msgtrack;
using namespace msgtrack::persist;
namespace fs = std::filesystem;

class JournalWriterTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string crumb_dir_;

    void SetUp() override {
        test_dir_ = test::create_temp_dir("msgtrack_journal_test");
        crumb_dir_ = test_dir_ + "/crumbs";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }
};

TEST_F(JournalWriterTest, AppendCreatesDirectoryAndCrumb) {
    JournalWriter journal(crumb_dir_);
    EXPECT_FALSE(fs::exists(crumb_dir_));

    Record r = test::make_full_record("<a1@example.org>");
    std::string name = journal.append(CrumbKind::New, r);

    auto parsed = CrumbName::parse(name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->kind, CrumbKind::New);

    // Exactly one file, no temp left behind
    auto files = test::list_dir(crumb_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], name);

    // Body carries the full record
    Record decoded;
    std::string why;
    ASSERT_TRUE(record_codec::decode(journal.read_file(name), &decoded, &why)) << why;
    EXPECT_EQ(decoded, r);
}

TEST_F(JournalWriterTest, AppendWithoutSync) {
    JournalWriter journal(crumb_dir_, false);
    EXPECT_FALSE(journal.sync_writes());

    std::string name = journal.append(CrumbKind::Delete, test::make_record("<a@x>"));
    EXPECT_EQ(CrumbName::parse(name)->kind, CrumbKind::Delete);
    EXPECT_EQ(test::list_dir(crumb_dir_).size(), 1u);
}

TEST_F(JournalWriterTest, NamesSortInAppendOrder) {
    JournalWriter journal(crumb_dir_);
    std::vector<std::string> written;
    for (int i = 0; i < 50; i++) {
        written.push_back(journal.append(static_cast<CrumbKind>(i % 3),
                                         test::make_record("<m" + std::to_string(i) + "@x>")));
    }

    auto on_disk = test::list_dir(crumb_dir_);
    ASSERT_EQ(on_disk.size(), written.size());
    // Lexicographic order of the stamp part matches write order
    for (size_t i = 1; i < written.size(); i++) {
        EXPECT_TRUE(CrumbName::parse(written[i - 1])->stamp < CrumbName::parse(written[i])->stamp);
    }
}

TEST_F(JournalWriterTest, AppendFailsWhenDirectoryIsBlocked) {
    // Crumb directory path occupied by a regular file
    test::write_file(crumb_dir_, "not a directory");
    JournalWriter journal(crumb_dir_);

    EXPECT_THROW(journal.append(CrumbKind::New, test::make_record("<a@x>")), IOError);

    try {
        journal.append(CrumbKind::New, test::make_record("<a@x>"));
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.path(), crumb_dir_);
    }
}

TEST_F(JournalWriterTest, ListFilesOnMissingDirectory) {
    JournalWriter journal(crumb_dir_);
    EXPECT_TRUE(journal.list_files().empty());
    EXPECT_EQ(journal.remove_all(), 0u);
}

TEST_F(JournalWriterTest, ListFilesSkipsSubdirectories) {
    JournalWriter journal(crumb_dir_);
    journal.append(CrumbKind::New, test::make_record("<a@x>"));
    fs::create_directories(crumb_dir_ + "/nested");
    test::write_file(crumb_dir_ + "/README", "hello");

    auto files = journal.list_files();
    EXPECT_EQ(files.size(), 2u);
}

TEST_F(JournalWriterTest, ReadMissingFileThrows) {
    JournalWriter journal(crumb_dir_);
    fs::create_directories(crumb_dir_);
    EXPECT_THROW(journal.read_file("cr-0000000001.000000000-new.json"), IOError);
}

TEST_F(JournalWriterTest, RemoveAllDeletesOnlyCrumbs) {
    JournalWriter journal(crumb_dir_);
    journal.append(CrumbKind::New, test::make_record("<a@x>"));
    journal.append(CrumbKind::Update, test::make_record("<a@x>", "Archive"));
    journal.append(CrumbKind::Delete, test::make_record("<a@x>"));

    // Leftover of a torn write, and an unrelated file
    test::write_file(crumb_dir_ + "/.cr-0000000001.000000000-new.json.tmp", "{");
    test::write_file(crumb_dir_ + "/README", "keep me");

    EXPECT_EQ(journal.remove_all(), 4u);

    auto files = test::list_dir(crumb_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], "README");
}

TEST_F(JournalWriterTest, RemoveFileToleratesMissing) {
    JournalWriter journal(crumb_dir_);
    std::string name = journal.append(CrumbKind::New, test::make_record("<a@x>"));
    EXPECT_TRUE(journal.remove_file(name));
    EXPECT_TRUE(journal.remove_file(name));
    EXPECT_TRUE(test::list_dir(crumb_dir_).empty());
}
