#include <gtest/gtest.h>
#include "TestDir.h"
#include "proc/ProcessTable.h"
#include <stdexcept>
#include <string>

TEST(ProcessTable, ParseStatReadsFields) {
    auto record = parse_stat("1234 (koreader) T 1000 1234 999 0 -1 4194560 1 2 3");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->pid, 1234);
    EXPECT_EQ(record->command, "koreader");
    EXPECT_EQ(record->state, RunState::TRACED);
    EXPECT_EQ(record->parent_pid, 1000);
    EXPECT_EQ(record->session_id, 999);
}

TEST(ProcessTable, CommandMayContainParentheses) {
    auto record = parse_stat("77 (my (odd) app) S 1 77 77 0");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->command, "my (odd) app");
    EXPECT_EQ(record->state, RunState::SLEEPING);
}

TEST(ProcessTable, RejectsTruncatedStat) {
    EXPECT_FALSE(parse_stat("").has_value());
    EXPECT_FALSE(parse_stat("12 (sh").has_value());
    EXPECT_FALSE(parse_stat("12 (sh) R").has_value());
}

TEST(ProcessTable, RunStateGroups) {
    EXPECT_TRUE(is_alive(parse_run_state('R')));
    EXPECT_TRUE(is_alive(parse_run_state('S')));
    EXPECT_TRUE(is_alive(parse_run_state('D')));
    EXPECT_TRUE(is_stopped(parse_run_state('T')));
    EXPECT_TRUE(is_stopped(parse_run_state('t')));
    EXPECT_TRUE(is_dead(parse_run_state('Z')));
    EXPECT_TRUE(is_dead(parse_run_state('X')));
    EXPECT_EQ(parse_run_state('I'), RunState::OTHER);
    EXPECT_STREQ(run_state_name(RunState::WAITING_IO), "waiting-io");
}

TEST(ProcessTable, ProcFsSourceScansPidDirectories) {
    TestDir proc;
    proc.write("42/stat", "42 (xochitl) S 1 42 42 0");
    proc.write("42/cmdline", std::string("/usr/bin/xochitl\0--system\0", 26));
    proc.write("7/stat", "7 (sh) R 1 7 7 0");
    proc.write("self/stat", "99 (self) R 1 99 99 0");
    proc.write("9/cmdline", "orphan");

    ProcFsSource source(proc.path());
    auto records = source.snapshot();

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].pid, 7);
    EXPECT_EQ(records[0].command_line, "");
    EXPECT_EQ(records[1].pid, 42);
    EXPECT_EQ(records[1].command_line, "/usr/bin/xochitl --system");
}

TEST(ProcessTable, MissingRootIsFatal) {
    ProcFsSource source("/nonexistent/proc/root");
    EXPECT_THROW(source.snapshot(), std::runtime_error);
}
