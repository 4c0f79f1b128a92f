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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/record_store.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"

using namespace msgtrack;
using namespace std;

namespace {

    enum ExitCode {
        kOk = 0,
        kUsage = 1,
        kStoreError = 2,
        kNothingToShow = 3
    };

    struct Args {
        string dir;
        bool no_save = false;
        bool yes = false;
        string cmd;
        vector<string> operands;
    };

    void printHelp() {
        cerr << "usage: msgtrack [--dir DIR] [--no-save] [--yes] <command> [args]\n"
             << "\n"
             << "commands:\n"
             << "  list                                   print records, most recent first\n"
             << "  add <message-id> <group> [subject] [sender]\n"
             << "  move <message-id> <group>\n"
             << "  forget <message-id>\n"
             << "  forget-all                             requires --yes\n"
             << "  show <message-id>\n"
             << "  next | prev                            rotate and print the moved record\n"
             << "  save                                   write a snapshot now\n"
             << "\n"
             << "environment: MSGTRACK_DATA_DIR, MSGTRACK_SNAPSHOT_PATH, MSGTRACK_CRUMB_DIR,\n"
             << "             MSGTRACK_SYNC_WRITES, MSGTRACK_LOG_DIR, LOG_LEVEL\n";
    }

    optional<Args> parseCLI(int argc, char** argv) {
        Args a;
        int i = 1;
        for (; i < argc; ++i) {
            string t = argv[i];
            if (t == "--dir") {
                if (++i >= argc) {
                    cerr << "Missing value for --dir\n";
                    return nullopt;
                }
                a.dir = argv[i];
                continue;
            }
            if (t == "--no-save") { a.no_save = true; continue; }
            if (t == "--yes") { a.yes = true; continue; }
            if (t == "-h" || t == "--help") return nullopt;
            if (t.size() > 1 && t[0] == '-') {
                cerr << "Unknown option: " << t << "\n";
                return nullopt;
            }
            break;
        }
        if (i >= argc) return nullopt;
        a.cmd = argv[i++];
        for (; i < argc; ++i) {
            a.operands.emplace_back(argv[i]);
        }
        return a;
    }

    bool arity(const Args& a, size_t min, size_t max) {
        if (a.operands.size() < min || a.operands.size() > max) {
            cerr << a.cmd << ": wrong number of arguments\n";
            return false;
        }
        return true;
    }

    void printRecord(const Record& r) {
        cout << r.message_id << "\t" << r.group;
        if (!r.display_line.empty()) cout << "\t" << r.display_line;
        cout << "\n";
    }

    void printDetail(const Record& r) {
        cout << "message-id:  " << r.message_id << "\n"
             << "group:       " << r.group << "\n";
        if (!r.date.empty())    cout << "date:        " << r.date << "\n";
        if (!r.subject.empty()) cout << "subject:     " << r.subject << "\n";
        if (!r.sender.empty())  cout << "from:        " << r.sender << "\n";
        for (const auto& rcpt : r.recipients) {
            cout << rcpt.role << ":";
            for (const auto& addr : rcpt.addresses) cout << " " << addr;
            cout << "\n";
        }
        if (r.in_reply_to)      cout << "in-reply-to: " << *r.in_reply_to << "\n";
        if (!r.references.empty()) cout << "references:  " << r.references << "\n";
    }

    int runCommand(RecordStore& store, const Args& a, bool& save_on_exit) {
        const string& cmd = a.cmd;

        if (cmd == "list") {
            if (!arity(a, 0, 0)) return kUsage;
            for (const auto& r : store.records()) printRecord(r);
            return kOk;
        }
        if (cmd == "add") {
            if (!arity(a, 2, 4)) return kUsage;
            Record r;
            r.message_id = a.operands[0];
            r.group = a.operands[1];
            if (a.operands.size() > 2) r.subject = a.operands[2];
            if (a.operands.size() > 3) r.sender = a.operands[3];
            r.display_line = r.sender.empty() ? r.subject : r.sender + ": " + r.subject;
            store.insert(r);
            return kOk;
        }
        if (cmd == "move") {
            if (!arity(a, 2, 2)) return kUsage;
            if (!store.find(a.operands[0])) return kNothingToShow;
            store.update_location(a.operands[0], a.operands[1]);
            return kOk;
        }
        if (cmd == "forget") {
            if (!arity(a, 1, 1)) return kUsage;
            return store.remove(a.operands[0]) ? kOk : kNothingToShow;
        }
        if (cmd == "forget-all") {
            if (!arity(a, 0, 0)) return kUsage;
            if (!a.yes) {
                cerr << "forget-all drops every tracked record; rerun with --yes\n";
                return kUsage;
            }
            store.remove_all();
            return kOk;
        }
        if (cmd == "show") {
            if (!arity(a, 1, 1)) return kUsage;
            auto r = store.find(a.operands[0]);
            if (!r) return kNothingToShow;
            printDetail(*r);
            return kOk;
        }
        if (cmd == "next" || cmd == "prev") {
            if (!arity(a, 0, 0)) return kUsage;
            if (store.empty()) return kNothingToShow;
            printRecord(cmd == "next" ? store.rotate_forward() : store.rotate_backward());
            return kOk;
        }
        if (cmd == "save") {
            if (!arity(a, 0, 0)) return kUsage;
            store.save();
            save_on_exit = false;
            return kOk;
        }

        cerr << "Unknown command: " << cmd << "\n";
        return kUsage;
    }

}

int main(int argc, char** argv) {
    initLoggingFromEnv();
    Logger::get().setThreadName("main");

    auto args = parseCLI(argc, argv);
    if (!args) {
        printHelp();
        return kUsage;
    }

    unique_ptr<LogManager> log_manager;
    if (const char* log_dir = getenv("MSGTRACK_LOG_DIR"); log_dir && *log_dir) {
        try {
            log_manager = make_unique<LogManager>(log_dir);
        } catch (const std::runtime_error& e) {
            cerr << "msgtrack: " << e.what() << "\n";
            return kStoreError;
        }
    }

    persist::StoreConfig config = args->dir.empty() ? persist::StoreConfig::defaults()
                                                    : persist::StoreConfig::in_directory(args->dir);
    if (!args->dir.empty()) {
        config.sync_writes = persist::StoreConfig::defaults().sync_writes;
    }

    try {
        RecordStore store(config);
        store.load();

        bool save_on_exit = !args->no_save;
        int rc = runCommand(store, *args, save_on_exit);
        if (rc == kOk && save_on_exit) {
            store.save();
        }
        return rc;
    } catch (const EmptyCollectionError& e) {
        cerr << "msgtrack: " << e.what() << "\n";
        return kNothingToShow;
    } catch (const StoreError& e) {
        cerr << "msgtrack: " << e.what() << "\n";
        return kStoreError;
    } catch (const std::invalid_argument& e) {
        cerr << "msgtrack: " << e.what() << "\n";
        return kUsage;
    }
}
