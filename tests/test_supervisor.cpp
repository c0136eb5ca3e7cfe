#include <gtest/gtest.h>
#include "FakeProcesses.h"
#include "TestDir.h"
#include "proc/Supervisor.h"
#include <filesystem>
#include <signal.h>

namespace {

// 10 -> {11 -> {13}, 12}
class SupervisorTest : public ::testing::Test {
protected:
    FakeProcessSource source;
    RecordingSignalSink signals;
    Supervisor supervisor{source, signals};

    void SetUp() override {
        source.add(1, 0, "init");
        source.add(10, 1, "koreader");
        source.add(11, 10, "sh");
        source.add(12, 10, "luajit");
        source.add(13, 11, "sleep");
    }
};

}

TEST_F(SupervisorTest, ChildrenOfScansFreshly) {
    auto children = supervisor.children_of(10);
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].pid, 11);
    EXPECT_EQ(children[1].pid, 12);

    source.add(14, 10, "late");
    EXPECT_EQ(supervisor.children_of(10).size(), 3u);
}

TEST_F(SupervisorTest, SuspendSignalsParentBeforeChildren) {
    supervisor.suspend(10);

    ASSERT_EQ(signals.sent.size(), 4u);
    EXPECT_EQ(signals.sent[0], std::make_pair(pid_t(10), SIGSTOP));
    EXPECT_LT(signals.index_of(11, SIGSTOP), signals.index_of(13, SIGSTOP));
    EXPECT_LT(signals.index_of(10, SIGSTOP), signals.index_of(12, SIGSTOP));
}

TEST_F(SupervisorTest, ResumeSignalsChildrenBeforeParent) {
    supervisor.resume(10);

    ASSERT_EQ(signals.sent.size(), 4u);
    EXPECT_EQ(signals.sent.back(), std::make_pair(pid_t(10), SIGCONT));
    EXPECT_LT(signals.index_of(13, SIGCONT), signals.index_of(11, SIGCONT));
    EXPECT_LT(signals.index_of(12, SIGCONT), signals.index_of(10, SIGCONT));
}

TEST_F(SupervisorTest, TerminateKillsDescendantsBeforeRoot) {
    signals.source = &source;
    supervisor.terminate(10);

    ASSERT_EQ(signals.sent.size(), 4u);
    EXPECT_EQ(signals.sent.back(), std::make_pair(pid_t(10), SIGKILL));
    EXPECT_LT(signals.index_of(13, SIGKILL), signals.index_of(11, SIGKILL));
    EXPECT_FALSE(supervisor.find(13).has_value());
    EXPECT_TRUE(supervisor.find(1).has_value());
}

TEST_F(SupervisorTest, LookupByCommand) {
    source.get(10)->command_line = "/opt/bin/koreader -d";

    EXPECT_EQ(supervisor.find_by_command("luajit")->pid, 12);
    EXPECT_EQ(supervisor.find_by_command_line("/opt/bin/koreader -d")->pid, 10);
    EXPECT_FALSE(supervisor.find_by_command("missing").has_value());
    EXPECT_FALSE(supervisor.find(999).has_value());
}

TEST(PidMarkers, WriteReadRemove) {
    TestDir dir;
    PidMarkers markers(dir.path());

    ASSERT_TRUE(markers.write("KOReader", 1234));
    EXPECT_EQ(markers.read("KOReader"), 1234);
    EXPECT_TRUE(std::filesystem::exists(dir.path("KOReader.pid")));

    EXPECT_TRUE(markers.remove("KOReader"));
    EXPECT_FALSE(markers.read("KOReader").has_value());
}

TEST(PidMarkers, ListSkipsForeignAndUnreadableFiles) {
    TestDir dir;
    dir.write("b.pid", "20");
    dir.write("a.pid", "10\n");
    dir.write("junk.pid", "not a pid");
    dir.write("notes.txt", "5");

    PidMarkers markers(dir.path());
    auto list = markers.list();

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], std::make_pair(std::string("a"), pid_t(10)));
    EXPECT_EQ(list[1], std::make_pair(std::string("b"), pid_t(20)));
}

TEST(ResetRuntime, KillsLeftoversAndRecreatesTree) {
    TestDir dir;
    Config config;
    config.temp_dir = dir.path("parchment");
    config.system_launcher = "/usr/bin/xochitl --system";

    FakeProcessSource source;
    source.add(50, 1, "xochitl");
    source.get(50)->command_line = "/usr/bin/xochitl --system";
    source.add(60, 1, "koreader");
    source.add(61, 60, "luajit");

    RecordingSignalSink signals;
    signals.source = &source;
    Supervisor supervisor(source, signals);

    dir.write("parchment/processes/xochitl.pid", "50");
    dir.write("parchment/processes/KOReader.pid", "60");
    dir.write("parchment/processes/Gone.pid", "70");
    dir.write("parchment/screenshots/panel", "stale");

    ASSERT_TRUE(reset_runtime(config, supervisor));

    EXPECT_TRUE(supervisor.find(50).has_value());
    EXPECT_FALSE(supervisor.find(60).has_value());
    EXPECT_FALSE(supervisor.find(61).has_value());
    EXPECT_LT(signals.index_of(60, SIGCONT), signals.index_of(60, SIGKILL));
    EXPECT_EQ(signals.index_of(50, SIGKILL), signals.sent.size());

    EXPECT_TRUE(std::filesystem::is_directory(config.screenshots_dir()));
    EXPECT_TRUE(std::filesystem::is_directory(config.icons_dir()));
    EXPECT_TRUE(std::filesystem::is_directory(config.pids_dir()));
    EXPECT_FALSE(std::filesystem::exists(config.screenshot_path("panel")));
    EXPECT_TRUE(PidMarkers(config.pids_dir()).list().empty());
}
