#include <gtest/gtest.h>
#include "FakeProcesses.h"
#include "FakeSurface.h"
#include "TestDir.h"
#include "gesture/Recognizers.h"
#include "tray/MainLoop.h"
#include "widgets/Layout.h"
#include <filesystem>
#include <stdexcept>

namespace {

// Hands its recorded calls to the test when the render thread drops it
class RecordedSurface : public FakeSurface {
public:
    std::vector<Call>& sink;

    explicit RecordedSurface(std::vector<Call>& sink) : sink(sink) {}
    ~RecordedSurface() override { sink = calls; }
};

class MainLoopTest : public ::testing::Test {
protected:
    TestDir dir;
    Config config;
    FakeProcessSource source;
    RecordingSignalSink signals;
    Supervisor supervisor{source, signals};
    std::unique_ptr<DraftPrograms> drafts;
    DraftProgram reader;

    std::pair<Sender<MainEvent>, Receiver<MainEvent>> main_channel = Channel<MainEvent>::create();
    std::pair<Sender<RenderEvent>, Receiver<RenderEvent>> render_channel = Channel<RenderEvent>::create();

    void SetUp() override {
        config.temp_dir = dir.path("runtime");
        signals.source = &source;
        std::filesystem::create_directories(config.pids_dir());
        std::filesystem::create_directories(config.screenshots_dir());

        reader.name = "KOReader";
        reader.desc = "Ebook reader";
        reader.call = "/opt/koreader/koreader.sh";

        drafts = std::make_unique<DraftPrograms>(
            std::vector<DraftProgram>{reader}, supervisor, config.pids_dir(),
            [](const std::string&) { return std::optional<pid_t>(700); });
    }

    MainLoop make_loop(std::unique_ptr<RenderThread> render_thread = nullptr,
                       std::vector<DraftProgram> stopped = {}) {
        return MainLoop(std::move(main_channel.second), InputHandles(), std::move(render_thread),
                        render_channel.first, *drafts, std::move(stopped), config);
    }

    const MainSender& events() { return main_channel.first; }

    std::vector<Execute> sent_plans() {
        std::vector<Execute> plans;
        while (auto event = render_channel.second.try_recv()) {
            if (auto* execute = std::get_if<Execute>(&*event)) plans.push_back(*execute);
        }
        return plans;
    }
};

}

TEST_F(MainLoopTest, TouchesReachTheTopmostRecognizer) {
    std::vector<std::string> fired;

    GestureRecognizer recognizer;
    recognizer.add(recognize_press([&](const Point&) { fired.push_back("bottom"); }));
    recognizer.add(recognize_press([&](const Point&) { fired.push_back("top"); }));

    MainLoop loop = make_loop();
    post(events(), SetGestureRecognizer{recognizer});
    post(events(), InputReceived{ButtonEvent{KEY_POWER, true}});
    post(events(), InputReceived{TouchEvent{TouchPhase::PRESS, 3, Point(10, 10)}});
    post(events(), Exit{});
    loop.run();

    EXPECT_TRUE(loop.has_gesture_recognizer());
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], "top");
}

TEST_F(MainLoopTest, TouchesWithoutRecognizerAreDropped) {
    MainLoop loop = make_loop();
    post(events(), InputReceived{TouchEvent{TouchPhase::PRESS, 1, Point(0, 0)}});
    post(events(), SetGestureRecognizer{std::nullopt});
    post(events(), Exit{});
    loop.run();

    EXPECT_FALSE(loop.has_gesture_recognizer());
}

TEST_F(MainLoopTest, SetDrawAndRedrawRenderThePlan) {
    MainLoop loop = make_loop();
    post(events(), Redraw{});
    post(events(), SetDraw{clear()});
    post(events(), Redraw{});
    post(events(), SetDraw{std::nullopt});
    post(events(), Redraw{});
    post(events(), Exit{});
    loop.run();

    auto plans = sent_plans();
    ASSERT_EQ(plans.size(), 2u);
    EXPECT_TRUE(plans[0].publish_recognizer);
    EXPECT_TRUE(plans[1].publish_recognizer);
}

TEST_F(MainLoopTest, LoadIconFillsTheCache) {
    MainLoop loop = make_loop();
    post(events(), LoadIcon{"KOReader", std::make_shared<Image>()});
    post(events(), Exit{});
    loop.run();

    EXPECT_EQ(drafts->get_icons().count("KOReader"), 1u);
}

TEST_F(MainLoopTest, ContinuingTheStoppedDraftRestoresThePanel) {
    source.add(40, 1, "koreader.sh", RunState::TRACED);
    PidMarkers(config.pids_dir()).write("KOReader", 40);
    dir.write("runtime/screenshots/panel", std::string("\x07\x08", 2));

    MainLoop loop = make_loop(nullptr, {reader});
    post(events(), ::Run{reader});
    post(events(), Exit{});
    loop.run();

    EXPECT_EQ(signals.sent.back(), std::make_pair(pid_t(40), SIGCONT));

    auto plans = sent_plans();
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_FALSE(plans[0].publish_recognizer);

    FakeSurface surface;
    render(plans[0].draw, surface, surface.bounds());
    auto restores = surface.calls_of("restore");
    ASSERT_EQ(restores.size(), 1u);
    EXPECT_EQ(restores[0].rect, TrayMetrics::from_config(config).panel_rect());
    EXPECT_EQ(surface.restored[0], (std::vector<uint8_t>{7, 8}));
    EXPECT_EQ(surface.calls_of("partial_refresh").size(), 1u);
}

TEST_F(MainLoopTest, SwitchingDraftsRestoresFullScreenshot) {
    source.add(40, 1, "koreader.sh", RunState::TRACED);
    PidMarkers(config.pids_dir()).write("KOReader", 40);
    dir.write("runtime/screenshots/koreader.sh", std::string("\x01", 1));

    DraftProgram other = reader;
    other.name = "Terminal";
    other.call = "/opt/bin/yaft";

    MainLoop loop = make_loop(nullptr, {other});
    post(events(), ::Run{reader});
    post(events(), Exit{});
    loop.run();

    FakeSurface surface;
    render(sent_plans().at(0).draw, surface, surface.bounds());
    ASSERT_EQ(surface.calls_of("restore").size(), 1u);
    EXPECT_EQ(surface.calls_of("restore")[0].rect, surface.bounds());
    EXPECT_EQ(surface.calls_of("full_refresh").size(), 1u);
}

TEST_F(MainLoopTest, MissingScreenshotClearsTheDisplay) {
    source.add(40, 1, "koreader.sh", RunState::TRACED);
    PidMarkers(config.pids_dir()).write("KOReader", 40);

    MainLoop loop = make_loop(nullptr, {reader});
    post(events(), ::Run{reader});
    post(events(), Exit{});
    loop.run();

    FakeSurface surface;
    render(sent_plans().at(0).draw, surface, surface.bounds());
    EXPECT_EQ(surface.calls_of("clear").size(), 1u);
    EXPECT_EQ(surface.calls_of("full_refresh").size(), 1u);
}

TEST_F(MainLoopTest, FreshLaunchDrawsNothing) {
    MainLoop loop = make_loop();
    post(events(), ::Run{reader});
    post(events(), Exit{});
    loop.run();

    EXPECT_TRUE(sent_plans().empty());
    EXPECT_EQ(PidMarkers(config.pids_dir()).read("KOReader"), 700);
}

TEST_F(MainLoopTest, StopRendererDrainsPendingPlans) {
    std::vector<FakeSurface::Call> drawn;
    auto thread = std::make_unique<RenderThread>(
        [&drawn]() { return std::make_unique<RecordedSurface>(drawn); },
        std::move(render_channel.second), events());
    ASSERT_TRUE(thread->start());

    MainLoop loop = make_loop(std::move(thread));
    post(events(), SetDraw{rect_fill(COLOR_BLACK)});
    post(events(), StopInput{});
    post(events(), StopRenderer{});
    post(events(), Exit{});
    loop.run();

    ASSERT_EQ(drawn.size(), 1u);
    EXPECT_EQ(drawn[0].op, "fill_rect");
}

TEST_F(MainLoopTest, DrawRequestsAfterStopRendererAreDropped) {
    std::vector<FakeSurface::Call> drawn;
    auto thread = std::make_unique<RenderThread>(
        [&drawn]() { return std::make_unique<RecordedSurface>(drawn); },
        std::move(render_channel.second), events());
    ASSERT_TRUE(thread->start());

    MainLoop loop = make_loop(std::move(thread));
    post(events(), SetDraw{rect_fill(COLOR_BLACK)});
    post(events(), StopInput{});
    post(events(), StopRenderer{});
    post(events(), Redraw{});
    post(events(), SetDraw{rect_fill(COLOR_WHITE)});
    post(events(), Exit{});
    EXPECT_NO_THROW(loop.run());

    ASSERT_EQ(drawn.size(), 1u);
    EXPECT_EQ(drawn[0].op, "fill_rect");
}

TEST_F(MainLoopTest, StopRendererWithoutThreadThrows) {
    MainLoop loop = make_loop();
    post(events(), StopRenderer{});
    EXPECT_THROW(loop.run(), std::runtime_error);
}

TEST_F(MainLoopTest, DisconnectedChannelThrows) {
    MainLoop loop = make_loop();
    main_channel.first = MainSender();
    EXPECT_THROW(loop.run(), std::runtime_error);
}
