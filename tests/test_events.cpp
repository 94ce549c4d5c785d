#include <gtest/gtest.h>

#include "joystick.h"
#include "recorder.h"

using namespace fake;

class EventsTest : public LoopTest
{
  protected:
    void SetUp() override
    {
        LoopTest::SetUp();
        ASSERT_NE(create(), nullptr);
    }
};

TEST_F(EventsTest, KeyDownAndUpTrackPressedSet)
{
    push(keyDown(SDL_SCANCODE_A, SDLK_a));
    push(keyDown(SDL_SCANCODE_LSHIFT, SDLK_LSHIFT));
    kilnPumpEvents(loop);

    int count = 0;
    const KeyInfo *keys = kilnGetKeys(loop, &count);
    ASSERT_EQ(count, 2);
    EXPECT_EQ(keys[0], KILN_A);
    EXPECT_EQ(keys[1], KILN_LSHIFT);
    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_A));

    push(keyUp(SDL_SCANCODE_A, SDLK_a));
    kilnPumpEvents(loop);

    keys = kilnGetKeys(loop, &count);
    ASSERT_EQ(count, 1);
    EXPECT_EQ(keys[0], KILN_LSHIFT);
    EXPECT_FALSE(kilnIsKeyDown(loop, KILN_A));
}

TEST_F(EventsTest, RepeatedKeyDownIsNotDuplicated)
{
    push(keyDown(SDL_SCANCODE_A, SDLK_a));
    push(keyDown(SDL_SCANCODE_A, SDLK_a));
    push(keyUp(SDL_SCANCODE_A, SDLK_a));
    kilnPumpEvents(loop);

    int count = -1;
    kilnGetKeys(loop, &count);
    EXPECT_EQ(count, 0);

    ASSERT_EQ(recorder.keys.size(), 2u);
    EXPECT_EQ(recorder.keys[0], std::make_pair(KILN_A, true));
    EXPECT_EQ(recorder.keys[1], std::make_pair(KILN_A, false));
}

TEST_F(EventsTest, RepeatedControlKeyKeepsEchoing)
{
    push(keyDown(SDL_SCANCODE_BACKSPACE, SDLK_BACKSPACE));
    push(keyDown(SDL_SCANCODE_BACKSPACE, SDLK_BACKSPACE));
    kilnPumpEvents(loop);

    EXPECT_EQ(recorder.keys.size(), 1u);
    EXPECT_EQ(recorder.chars.size(), 2u);
}

TEST_F(EventsTest, KeyIdentityFollowsLayoutKeycode)
{
    // azerty: the key in the qwerty 'Q' position types 'a'
    push(keyDown(SDL_SCANCODE_Q, SDLK_a));
    kilnPumpEvents(loop);

    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_A));
    EXPECT_FALSE(kilnIsKeyDown(loop, KILN_Q));
    ASSERT_EQ(recorder.keys.size(), 1u);
    EXPECT_EQ(recorder.keys[0].first, KILN_A);

    push(keyUp(SDL_SCANCODE_Q, SDLK_a));
    kilnPumpEvents(loop);

    int count = -1;
    kilnGetKeys(loop, &count);
    EXPECT_EQ(count, 0);
}

TEST_F(EventsTest, NonCharacterKeycodesUseTheirScancode)
{
    push(keyDown(SDL_SCANCODE_KP_1, SDLK_KP_1));
    push(keyDown(SDL_SCANCODE_F5, SDLK_F5));
    push(keyDown(SDL_SCANCODE_RCTRL, SDLK_RCTRL));
    kilnPumpEvents(loop);

    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_NUMPAD_1));
    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_F5));
    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_RCTRL));
}

TEST_F(EventsTest, UnmappedCharacterFallsBackToScancode)
{
    // azerty: the '2' key types e-acute unshifted
    push(keyDown(SDL_SCANCODE_2, 0xE9));
    kilnPumpEvents(loop);

    EXPECT_TRUE(kilnIsKeyDown(loop, KILN_2));
}

TEST_F(EventsTest, KeyUpOfUnpressedKeyStillNotifies)
{
    push(keyUp(SDL_SCANCODE_B, SDLK_b));
    kilnPumpEvents(loop);

    int count = -1;
    kilnGetKeys(loop, &count);
    EXPECT_EQ(count, 0);
    ASSERT_EQ(recorder.keys.size(), 1u);
    EXPECT_EQ(recorder.keys[0].first, KILN_B);
    EXPECT_FALSE(recorder.keys[0].second);
}

TEST_F(EventsTest, UnmappedScancodeIsIgnored)
{
    push(keyDown(SDL_SCANCODE_UNKNOWN, 0));
    kilnPumpEvents(loop);

    int count = -1;
    kilnGetKeys(loop, &count);
    EXPECT_EQ(count, 0);
    EXPECT_TRUE(recorder.keys.empty());
}

TEST_F(EventsTest, ControlKeysEchoAsCharacters)
{
    push(keyDown(SDL_SCANCODE_RETURN, SDLK_RETURN));
    push(keyDown(SDL_SCANCODE_BACKSPACE, SDLK_BACKSPACE));
    push(keyDown(SDL_SCANCODE_A, SDLK_a));
    kilnPumpEvents(loop);

    ASSERT_EQ(recorder.chars.size(), 2u);
    EXPECT_EQ(recorder.chars[0].first, L'\r');
    EXPECT_EQ(recorder.chars[0].second, KILN_ENTER);
    EXPECT_EQ(recorder.chars[1].first, static_cast<wchar_t>(8));
    EXPECT_EQ(recorder.chars[1].second, KILN_BACKSPACE);
}

TEST_F(EventsTest, MouseMotionAndRelease)
{
    push(mouseButton(SDL_BUTTON_LEFT, true));
    push(mouseButton(SDL_BUTTON_RIGHT, true));
    push(mouseMotion(320, 200));
    kilnPumpEvents(loop);

    MouseState ms;
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.x, 320);
    EXPECT_EQ(ms.y, 200);

    push(mouseButton(SDL_BUTTON_RIGHT, false));
    kilnPumpEvents(loop);
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.right, KILN_RELEASED);
    EXPECT_EQ(ms.left, KILN_PRESSED);
}

TEST_F(EventsTest, UnknownMouseButtonChangesNothing)
{
    MouseState before;
    kilnGetMouse(loop, &before);

    push(mouseButton(9, true));
    kilnPumpEvents(loop);

    MouseState after;
    kilnGetMouse(loop, &after);
    EXPECT_EQ(after.x, before.x);
    EXPECT_EQ(after.y, before.y);
    EXPECT_EQ(after.left, before.left);
    EXPECT_EQ(after.right, before.right);
    EXPECT_EQ(after.middle, before.middle);
    EXPECT_EQ(after.x1, before.x1);
    EXPECT_EQ(after.x2, before.x2);
    EXPECT_EQ(after.scroll_x, before.scroll_x);
    EXPECT_EQ(after.scroll_y, before.scroll_y);
}

namespace
{

struct ButtonCase
{
    uint8_t button;
    ButtonState MouseState::*field;
};

const ButtonCase kButtons[] = {
    {SDL_BUTTON_LEFT, &MouseState::left},     {SDL_BUTTON_RIGHT, &MouseState::right},
    {SDL_BUTTON_MIDDLE, &MouseState::middle}, {SDL_BUTTON_X1, &MouseState::x1},
    {SDL_BUTTON_X2, &MouseState::x2},
};

} // namespace

class MouseButtonTest : public LoopTest, public ::testing::WithParamInterface<int>
{
  protected:
    void SetUp() override
    {
        LoopTest::SetUp();
        ASSERT_NE(create(), nullptr);
    }
};

TEST_P(MouseButtonTest, SetsOnlyItsOwnField)
{
    const ButtonCase &pressed = kButtons[GetParam()];
    push(mouseButton(pressed.button, true));
    kilnPumpEvents(loop);

    MouseState ms;
    kilnGetMouse(loop, &ms);
    for (const ButtonCase &c : kButtons)
        EXPECT_EQ(ms.*c.field, c.button == pressed.button ? KILN_PRESSED : KILN_RELEASED)
            << "button " << int(c.button);
}

INSTANTIATE_TEST_SUITE_P(EachButton, MouseButtonTest, ::testing::Range(0, 5));

TEST_F(EventsTest, WheelAccumulatesUntilTaken)
{
    push(wheel(0, 1));
    push(wheel(0, 2));
    push(wheel(-1, 0));
    kilnPumpEvents(loop);

    MouseState ms;
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.scroll_y, 360);
    EXPECT_EQ(ms.scroll_x, -120);

    // reading the state doesn't consume it
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.scroll_y, 360);

    int sx = 0, sy = 0;
    kilnTakeScroll(loop, &sx, &sy);
    EXPECT_EQ(sx, -120);
    EXPECT_EQ(sy, 360);

    kilnTakeScroll(loop, &sx, &sy);
    EXPECT_EQ(sx, 0);
    EXPECT_EQ(sy, 0);
}

TEST_F(EventsTest, TextInputDropsCodePointsAboveBMP)
{
    push(text("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
    kilnPumpEvents(loop);

    ASSERT_EQ(recorder.chars.size(), 3u);
    EXPECT_EQ(recorder.chars[0].first, L'a');
    EXPECT_EQ(recorder.chars[0].second, KILN_A);
    EXPECT_EQ(recorder.chars[1].first, static_cast<wchar_t>(0xE9));
    EXPECT_EQ(recorder.chars[1].second, KILN_NONE);
    EXPECT_EQ(recorder.chars[2].first, static_cast<wchar_t>(0x20AC));
}

TEST_F(EventsTest, TextInputSkipsMalformedSequence)
{
    push(text("\xC3(x"));
    kilnPumpEvents(loop);

    // C3 28 fails as a pair, decoding resumes after it
    ASSERT_EQ(recorder.chars.size(), 1u);
    EXPECT_EQ(recorder.chars[0].first, L'x');
}

TEST_F(EventsTest, TextInputStopsAtTruncatedSequence)
{
    push(text("b\xE2\x82"));
    kilnPumpEvents(loop);

    ASSERT_EQ(recorder.chars.size(), 1u);
    EXPECT_EQ(recorder.chars[0].first, L'b');
}

TEST_F(EventsTest, TextInputCanBeDisabled)
{
    EXPECT_TRUE(kilnGetTextInput(loop));
    kilnSetTextInput(loop, false);
    EXPECT_FALSE(kilnGetTextInput(loop));

    push(text("abc"));
    kilnPumpEvents(loop);
    EXPECT_TRUE(recorder.chars.empty());
}

TEST_F(EventsTest, WindowEvents)
{
    push(window(SDL_WINDOWEVENT_RESIZED, 1024, 768));
    push(window(SDL_WINDOWEVENT_SIZE_CHANGED, 1280, 720));
    push(window(SDL_WINDOWEVENT_MOVED, 10, 20));
    push(window(SDL_WINDOWEVENT_FOCUS_GAINED));
    kilnPumpEvents(loop);

    ASSERT_EQ(recorder.sizes.size(), 2u);
    EXPECT_EQ(recorder.sizes[0], std::make_pair(1024, 768));
    EXPECT_EQ(recorder.sizes[1], std::make_pair(1280, 720));
    EXPECT_EQ(recorder.moves, 1);
    EXPECT_TRUE(kilnIsActive(loop));

    push(window(SDL_WINDOWEVENT_FOCUS_LOST));
    kilnPumpEvents(loop);
    EXPECT_FALSE(kilnIsActive(loop));
    EXPECT_EQ(recorder.focus, (std::vector<bool>{true, false}));
    EXPECT_FALSE(kilnIsExiting(loop));

    push(window(SDL_WINDOWEVENT_CLOSE));
    kilnPumpEvents(loop);
    EXPECT_TRUE(kilnIsExiting(loop));
}

TEST_F(EventsTest, QuitRequestsExit)
{
    push(quit());
    kilnPumpEvents(loop);
    EXPECT_TRUE(kilnIsExiting(loop));
}

TEST_F(EventsTest, DroppedFileIsReportedThenFreed)
{
    push(drop("/tmp/level.a3d"));
    kilnPumpEvents(loop);

    ASSERT_EQ(recorder.drops.size(), 1u);
    EXPECT_EQ(recorder.drops[0], "/tmp/level.a3d");
    EXPECT_EQ(native().calls.back(), "free_string");
}

TEST_F(EventsTest, JoysticksAndPadsReachTheRegistry)
{
    push(joyAdded(0));
    push(joyAdded(1));
    push(padButton(100, 500));
    push(padAxis(100, 520));
    kilnPumpEvents(loop);

    EXPECT_EQ(kilnJoyCount(), 2);

    uint32_t packet = 0, stamp = 0;
    ASSERT_TRUE(kilnPadGetPacket(100, &packet, &stamp));
    EXPECT_EQ(packet, 2u);
    EXPECT_EQ(stamp, 520u);
    EXPECT_FALSE(kilnPadGetPacket(101, &packet, &stamp));

    push(padRemoved(100));
    push(joyRemoved(101));
    kilnPumpEvents(loop);

    EXPECT_FALSE(kilnPadGetPacket(100, &packet, &stamp));
    EXPECT_EQ(kilnJoyCount(), 1);
}

TEST_F(EventsTest, PumpStopsWhenQueueIsEmpty)
{
    push(mouseMotion(1, 1));
    pushEndOfPump();
    push(mouseMotion(2, 2));

    kilnPumpEvents(loop);
    MouseState ms;
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.x, 1);

    kilnPumpEvents(loop);
    kilnGetMouse(loop, &ms);
    EXPECT_EQ(ms.x, 2);
}
