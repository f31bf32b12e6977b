#include "test_common.h"

#include "seqrun/audit_log.h"

#include <filesystem>
#include <fstream>

using seqrun::AuditLog;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("audit_log");

    fs::path p = dir / "sub" / "job_queue.log";
    AuditLog log(p);
    expect_true(log.tail(5).empty(), "missing log tails to nothing");

    std::string err = log.append("Added job 1: echo a");
    expect_true(err.empty(), "append 1 should succeed: " + err);
    err = log.append("Added job 2: two\nlines");
    expect_true(err.empty(), "append 2 should succeed: " + err);
    for (int i = 3; i <= 30; i++) {
        err = log.append("event " + std::to_string(i));
        expect_true(err.empty(), "append should succeed: " + err);
    }

    auto all = log.tail(1000);
    expect_eq_ll((long long)all.size(), 30, "one line per event");
    expect_true(all[0].front() == '[', "line starts with timestamp");
    expect_true(all[0].find("] Added job 1: echo a") != std::string::npos, "message after timestamp");
    expect_true(all[1].find("two lines") != std::string::npos, "newlines in a message are flattened");

    auto last = log.tail(3);
    expect_eq_ll((long long)last.size(), 3, "tail window");
    expect_true(last[2].find("event 30") != std::string::npos, "tail is oldest first, newest last");
    expect_true(last[0].find("event 28") != std::string::npos, "tail starts at n-th from end");
    expect_true(log.tail(0).empty(), "tail(0) is empty");

    // a second writer on the same file appends, never truncates
    {
        AuditLog other(p);
        err = other.append("from another writer");
        expect_true(err.empty(), "second writer append: " + err);
    }
    all = log.tail(1000);
    expect_eq_ll((long long)all.size(), 31, "second writer appended");
    expect_true(all.back().find("from another writer") != std::string::npos, "second writer line last");

    std::string line = seqrun::format_event_line("x");
    expect_eq_ll((long long)line.size(), 24, "\"[YYYY-MM-DD HH:MM:SS] x\\n\"");

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
