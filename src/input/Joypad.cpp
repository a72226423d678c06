#include "Joypad.hpp"
#include "state/StateStream.hpp"

Joypad::Joypad() {
    Reset();
}

void Joypad::Reset() {
    buttons = 0;
    shift_register = 0;
    shift_count = 0;
    strobe = false;
}

uint8_t Joypad::Read() {
    if (strobe) {
        // Latch is transparent, always the A button
        return OPEN_BUS_BITS | (buttons & 0x01);
    }

    uint8_t bit = shift_register & 0x01;
    // Serial input is tied high, so 1s shift in behind the buttons
    shift_register = (shift_register >> 1) | 0x80;
    if (shift_count < 8) shift_count++;
    return OPEN_BUS_BITS | bit;
}

void Joypad::WriteStrobe(uint8_t value) {
    strobe = (value & 0x01) != 0;
    if (strobe) {
        shift_register = buttons;
        shift_count = 0;
    }
}

void Joypad::SetButton(uint8_t button, bool pressed) {
    if (button > BUTTON_RIGHT) return;

    if (pressed) {
        buttons |= (1 << button);
    } else {
        buttons &= ~(1 << button);
    }
    if (strobe) shift_register = buttons;
}

void Joypad::SaveState(StateWriter& out) const {
    out.U8(buttons);
    out.U8(shift_register);
    out.U8(shift_count);
    out.Bool(strobe);
}

void Joypad::LoadState(StateReader& in) {
    buttons = in.U8();
    shift_register = in.U8();
    shift_count = in.U8();
    strobe = in.Bool();
}
