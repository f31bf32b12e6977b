#include "test_common.h"

#include "seqrun/types.h"

using namespace seqrun;

int main() {
    // status names round-trip, unknown names are rejected
    for (auto st : {JobStatus::PENDING, JobStatus::RUNNING, JobStatus::COMPLETED,
                    JobStatus::FAILED, JobStatus::STOPPED}) {
        auto back = status_from_str(status_to_str(st));
        expect_true(back && *back == st, std::string("status round trip: ") + status_to_str(st));
    }
    expect_true(!status_from_str("PENDING"), "status names are lowercase");
    expect_true(!status_from_str("done"), "unknown status rejected");

    // forward-only lifecycle
    expect_true(can_transition(JobStatus::PENDING, JobStatus::RUNNING), "pending -> running");
    expect_true(!can_transition(JobStatus::PENDING, JobStatus::COMPLETED), "pending cannot finish directly");
    expect_true(can_transition(JobStatus::RUNNING, JobStatus::COMPLETED), "running -> completed");
    expect_true(can_transition(JobStatus::RUNNING, JobStatus::FAILED), "running -> failed");
    expect_true(can_transition(JobStatus::RUNNING, JobStatus::STOPPED), "running -> stopped");
    expect_true(!can_transition(JobStatus::RUNNING, JobStatus::PENDING), "running cannot go back");
    expect_true(!can_transition(JobStatus::COMPLETED, JobStatus::STOPPED), "terminal is final");
    expect_true(!can_transition(JobStatus::STOPPED, JobStatus::FAILED), "terminal is final (stopped)");
    expect_true(!is_terminal(JobStatus::PENDING) && !is_terminal(JobStatus::RUNNING), "active states");

    // default names
    expect_eq_str(derive_job_name("echo hi"), "echo hi", "short command kept");
    expect_eq_str(derive_job_name("  make \t -j8\n all "), "make -j8 all", "whitespace collapsed");
    std::string long_cmd = "python3 train.py --epochs 100 --batch-size 64 --lr 0.001";
    std::string name = derive_job_name(long_cmd);
    expect_eq_ll((long long)name.size(), 40, "long name cut to 40");
    expect_true(name.compare(name.size() - 3, 3, "...") == 0, "cut name ends with ellipsis");

    // cuts never split a multibyte character
    std::string accented = "echo x";
    for (int i = 0; i < 20; i++) accented += "\xC3\xA9";  // U+00E9
    name = derive_job_name(accented);
    std::string stem = name.substr(0, name.size() - 3);
    expect_eq_ll((long long)stem.size(), 36, "cut backs up to the previous character boundary");
    expect_true(((unsigned char)stem.back() & 0xC0) == 0x80, "stem ends on a continuation byte");
    expect_true(name.compare(name.size() - 3, 3, "...") == 0, "multibyte name still ends with ellipsis");
    std::string euro = "\xE2\x82\xAC\xE2\x82\xAC";  // two 3-byte characters
    expect_eq_ll((long long)utf8_prefix_len(euro, 5), 3, "three-byte sequence kept whole");
    expect_eq_ll((long long)utf8_prefix_len(euro, 2), 0, "nothing fits");
    expect_eq_ll((long long)utf8_prefix_len(euro, 6), 6, "short string untouched");
    expect_eq_ll((long long)utf8_prefix_len("abc", 2), 2, "ascii cut");

    // QueueState lookup
    QueueState qs;
    Job a; a.id = "1";
    Job b; b.id = "2";
    qs.jobs = {a, b};
    expect_true(qs.find("2") == &qs.jobs[1], "find by id");
    expect_true(qs.find("3") == nullptr, "unknown id");

    expect_eq_ll((long long)format_local_time(now_ms()).size(), 19, "local time format width");

    std::cerr << "test_types: ALL PASSED" << std::endl;
    return 0;
}
