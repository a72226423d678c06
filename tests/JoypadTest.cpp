#include <gtest/gtest.h>

#include "input/Joypad.hpp"

namespace {

TEST(JoypadTest, StrobeHighReadsButtonA) {
    Joypad pad;
    pad.SetButton(Joypad::BUTTON_A, true);
    pad.WriteStrobe(0x01);

    EXPECT_EQ(pad.Read(), 0x41);
    EXPECT_EQ(pad.Read(), 0x41);
    EXPECT_EQ(pad.GetShiftCount(), 0);
}

TEST(JoypadTest, ShiftsButtonsInOrder) {
    Joypad pad;
    pad.SetButton(Joypad::BUTTON_A, true);
    pad.SetButton(Joypad::BUTTON_START, true);
    pad.SetButton(Joypad::BUTTON_RIGHT, true);
    pad.WriteStrobe(0x01);
    pad.WriteStrobe(0x00);

    const uint8_t expected[8] = { 0x41, 0x40, 0x40, 0x41, 0x40, 0x40, 0x40, 0x41 };
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(pad.Read(), expected[i]) << "bit " << i;
    }
    EXPECT_EQ(pad.GetShiftCount(), 8);
}

TEST(JoypadTest, ReadsOnesAfterEightBits) {
    Joypad pad;
    pad.WriteStrobe(0x01);
    pad.WriteStrobe(0x00);
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(pad.Read(), 0x40);
    }
    EXPECT_EQ(pad.Read(), 0x41);
    EXPECT_EQ(pad.Read(), 0x41);
}

TEST(JoypadTest, ExtraReadSkipsAButton) {
    Joypad pad;
    pad.SetButton(Joypad::BUTTON_A, true);
    pad.WriteStrobe(0x01);
    pad.WriteStrobe(0x00);

    pad.Read();     // clocked by someone else
    EXPECT_EQ(pad.Read(), 0x40);
}

TEST(JoypadTest, ReleasingButtonClearsBit) {
    Joypad pad;
    pad.SetButton(Joypad::BUTTON_B, true);
    EXPECT_EQ(pad.GetButtons(), 0x02);
    pad.SetButton(Joypad::BUTTON_B, false);
    EXPECT_EQ(pad.GetButtons(), 0x00);

    pad.SetButton(9, true);
    EXPECT_EQ(pad.GetButtons(), 0x00);
}

} // namespace
