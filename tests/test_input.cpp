#include <gtest/gtest.h>
#include "core/Channel.h"
#include "input/InputDecoder.h"
#include "input/InputDevice.h"
#include "input/InputThread.h"
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace {

struct input_event ev(uint16_t type, uint16_t code, int32_t value) {
    struct input_event e;
    std::memset(&e, 0, sizeof(e));
    e.type = type;
    e.code = code;
    e.value = value;
    return e;
}

std::vector<TouchEvent> feed(InputDecoder& decoder, const std::vector<struct input_event>& events) {
    std::vector<TouchEvent> out;
    for (const auto& e : events) {
        for (const auto& decoded : decoder.decode(e)) {
            if (auto* touch = std::get_if<TouchEvent>(&decoded)) out.push_back(*touch);
        }
    }
    return out;
}

MultitouchDecoder make_touch_decoder() {
    return MultitouchDecoder(AxisRange{0, 1403}, AxisRange{0, 1871}, 1404, 1872);
}

}

TEST(AxisRange, ScalesToDisplay) {
    AxisRange range{0, 767};
    EXPECT_EQ(range.scale(0, 1404), 0);
    EXPECT_EQ(range.scale(384, 1404), 702);
    EXPECT_EQ(range.scale(767, 1404), 1402);
    EXPECT_EQ(range.scale(5000, 1404), 1403);
    EXPECT_EQ(range.scale(-10, 1404), 0);
}

TEST(AxisRange, DegenerateRangePassesThrough) {
    AxisRange range{0, 0};
    EXPECT_EQ(range.scale(123, 1404), 123);
}

TEST(MultitouchDecoder, PressMoveRelease) {
    auto decoder = make_touch_decoder();

    auto press = feed(decoder, {
        ev(EV_ABS, ABS_MT_SLOT, 0),
        ev(EV_ABS, ABS_MT_TRACKING_ID, 5),
        ev(EV_ABS, ABS_MT_POSITION_X, 100),
        ev(EV_ABS, ABS_MT_POSITION_Y, 200),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    ASSERT_EQ(press.size(), 1u);
    EXPECT_EQ(press[0].phase, TouchPhase::PRESS);
    EXPECT_EQ(press[0].finger, 5);
    EXPECT_EQ(press[0].position, Point(100, 200));

    auto move = feed(decoder, {
        ev(EV_ABS, ABS_MT_POSITION_X, 110),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    ASSERT_EQ(move.size(), 1u);
    EXPECT_EQ(move[0].phase, TouchPhase::MOVE);
    EXPECT_EQ(move[0].position, Point(110, 200));

    auto release = feed(decoder, {
        ev(EV_ABS, ABS_MT_TRACKING_ID, -1),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    ASSERT_EQ(release.size(), 1u);
    EXPECT_EQ(release[0].phase, TouchPhase::RELEASE);
    EXPECT_EQ(release[0].finger, 5);
    EXPECT_EQ(release[0].position, Point(110, 200));
}

TEST(MultitouchDecoder, FrameWithoutChangesIsSilent) {
    auto decoder = make_touch_decoder();
    EXPECT_TRUE(feed(decoder, {ev(EV_SYN, SYN_REPORT, 0)}).empty());
}

TEST(MultitouchDecoder, TwoSlotsInOneFrame) {
    auto decoder = make_touch_decoder();

    auto events = feed(decoder, {
        ev(EV_ABS, ABS_MT_SLOT, 0),
        ev(EV_ABS, ABS_MT_TRACKING_ID, 1),
        ev(EV_ABS, ABS_MT_POSITION_X, 10),
        ev(EV_ABS, ABS_MT_POSITION_Y, 20),
        ev(EV_ABS, ABS_MT_SLOT, 1),
        ev(EV_ABS, ABS_MT_TRACKING_ID, 2),
        ev(EV_ABS, ABS_MT_POSITION_X, 30),
        ev(EV_ABS, ABS_MT_POSITION_Y, 40),
        ev(EV_SYN, SYN_REPORT, 0),
    });

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].finger, 1);
    EXPECT_EQ(events[0].position, Point(10, 20));
    EXPECT_EQ(events[1].finger, 2);
    EXPECT_EQ(events[1].position, Point(30, 40));
}

TEST(MultitouchDecoder, ReusedSlotReleasesThePreviousContact) {
    auto decoder = make_touch_decoder();

    feed(decoder, {
        ev(EV_ABS, ABS_MT_SLOT, 0),
        ev(EV_ABS, ABS_MT_TRACKING_ID, 7),
        ev(EV_ABS, ABS_MT_POSITION_X, 100),
        ev(EV_ABS, ABS_MT_POSITION_Y, 200),
        ev(EV_SYN, SYN_REPORT, 0),
    });

    auto events = feed(decoder, {
        ev(EV_ABS, ABS_MT_TRACKING_ID, 8),
        ev(EV_ABS, ABS_MT_POSITION_X, 500),
        ev(EV_ABS, ABS_MT_POSITION_Y, 600),
        ev(EV_SYN, SYN_REPORT, 0),
    });

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].phase, TouchPhase::RELEASE);
    EXPECT_EQ(events[0].finger, 7);
    EXPECT_EQ(events[0].position, Point(100, 200));
    EXPECT_EQ(events[1].phase, TouchPhase::PRESS);
    EXPECT_EQ(events[1].finger, 8);
    EXPECT_EQ(events[1].position, Point(500, 600));

    auto release = feed(decoder, {
        ev(EV_ABS, ABS_MT_TRACKING_ID, -1),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    ASSERT_EQ(release.size(), 1u);
    EXPECT_EQ(release[0].finger, 8);
}

TEST(MultitouchDecoder, ContactLiftedWithinItsFirstFrameIsDropped) {
    auto decoder = make_touch_decoder();
    auto events = feed(decoder, {
        ev(EV_ABS, ABS_MT_TRACKING_ID, 3),
        ev(EV_ABS, ABS_MT_TRACKING_ID, -1),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    EXPECT_TRUE(events.empty());
}

TEST(MultitouchDecoder, ReleaseOfUnseenContactIsDropped) {
    auto decoder = make_touch_decoder();
    auto events = feed(decoder, {
        ev(EV_ABS, ABS_MT_TRACKING_ID, -1),
        ev(EV_SYN, SYN_REPORT, 0),
    });
    EXPECT_TRUE(events.empty());
}

TEST(ButtonDecoder, DropsAutorepeat) {
    ButtonDecoder decoder;

    auto down = decoder.decode(ev(EV_KEY, KEY_POWER, 1));
    ASSERT_EQ(down.size(), 1u);
    EXPECT_EQ(std::get<ButtonEvent>(down[0]).code, KEY_POWER);
    EXPECT_TRUE(std::get<ButtonEvent>(down[0]).pressed);

    EXPECT_TRUE(decoder.decode(ev(EV_KEY, KEY_POWER, 2)).empty());
    EXPECT_FALSE(std::get<ButtonEvent>(decoder.decode(ev(EV_KEY, KEY_POWER, 0))[0]).pressed);
    EXPECT_TRUE(decoder.decode(ev(EV_SYN, SYN_REPORT, 0)).empty());
}

TEST(PenDecoder, EmitsOnReportAfterChange) {
    PenDecoder decoder(AxisRange{0, 20966}, AxisRange{0, 15725}, 1404, 1872);

    decoder.decode(ev(EV_ABS, ABS_X, 0));
    decoder.decode(ev(EV_KEY, BTN_TOUCH, 1));
    decoder.decode(ev(EV_ABS, ABS_PRESSURE, 900));
    auto events = decoder.decode(ev(EV_SYN, SYN_REPORT, 0));

    ASSERT_EQ(events.size(), 1u);
    const auto& pen = std::get<PenEvent>(events[0]);
    EXPECT_TRUE(pen.touching);
    EXPECT_EQ(pen.pressure, 900);
    EXPECT_EQ(pen.position, Point(0, 0));

    EXPECT_TRUE(decoder.decode(ev(EV_SYN, SYN_REPORT, 0)).empty());
}

TEST(FloodEvents, RepeatConcatenates) {
    auto events = repeat_events(touch_flood_events(), 3);
    ASSERT_EQ(events.size(), 12u);
    EXPECT_EQ(events[4].code, ABS_DISTANCE);
    EXPECT_EQ(events[4].value, 1);
    EXPECT_TRUE(repeat_events(button_flood_events(), 0).empty());
}

TEST(InputThread, ForwardsDecodedEventsUntilStopped) {
    int fds[2];
    ASSERT_EQ(pipe2(fds, O_NONBLOCK), 0);

    auto channel = Channel<InputEvent>::create();
    Sender<InputEvent> tx = channel.first;

    InputThread thread(DeviceClass::BUTTONS,
                       std::make_unique<InputDevice>(fds[0], "pipe"),
                       std::make_unique<ButtonDecoder>(),
                       {},
                       [tx](const InputEvent& event) { return tx.send(event); },
                       10);
    ASSERT_TRUE(thread.start());
    EXPECT_TRUE(thread.is_running());

    std::vector<struct input_event> raw = {ev(EV_KEY, KEY_HOME, 1), ev(EV_SYN, SYN_REPORT, 0)};
    ASSERT_EQ(write(fds[1], raw.data(), raw.size() * sizeof(raw[0])),
              (ssize_t)(raw.size() * sizeof(raw[0])));

    auto received = channel.second.recv();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(std::get<ButtonEvent>(*received).code, KEY_HOME);

    EXPECT_TRUE(thread.send(InputCommand::STOP));
    thread.join();
    EXPECT_FALSE(thread.is_running());
    EXPECT_FALSE(thread.send(InputCommand::GRAB));

    close(fds[1]);
}

TEST(InputThread, HangupEndsTheThread) {
    int fds[2];
    ASSERT_EQ(pipe2(fds, O_NONBLOCK), 0);

    auto channel = Channel<InputEvent>::create();
    Sender<InputEvent> tx = channel.first;

    InputThread thread(DeviceClass::BUTTONS,
                       std::make_unique<InputDevice>(fds[0], "pipe"),
                       std::make_unique<ButtonDecoder>(),
                       {},
                       [tx](const InputEvent& event) { return tx.send(event); },
                       10);
    ASSERT_TRUE(thread.start());

    std::vector<struct input_event> raw = {ev(EV_KEY, KEY_POWER, 1), ev(EV_SYN, SYN_REPORT, 0)};
    ASSERT_EQ(write(fds[1], raw.data(), raw.size() * sizeof(raw[0])),
              (ssize_t)(raw.size() * sizeof(raw[0])));
    close(fds[1]);

    auto received = channel.second.recv();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(std::get<ButtonEvent>(*received).code, KEY_POWER);

    thread.join();
    EXPECT_FALSE(thread.is_running());
}

TEST(InputThread, StartWithoutDeviceFails) {
    InputThread thread(DeviceClass::PEN, std::make_unique<InputDevice>(),
                       std::make_unique<PenDecoder>(AxisRange{0, 1}, AxisRange{0, 1}, 1, 1),
                       {}, [](const InputEvent&) { return true; }, 10);
    EXPECT_FALSE(thread.start());
    EXPECT_THROW(thread.join(), std::runtime_error);
}
