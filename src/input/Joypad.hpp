#pragma once

#include <cstdint>

class StateWriter;
class StateReader;

/**
 * Joypad - Standard controller (4021 shift register)
 *
 * Hardware Behavior:
 * - Strobe high ($4016 bit 0) continuously reloads the 8 button bits
 * - Each read with strobe low shifts one bit out: A, B, Select, Start,
 *   Up, Down, Left, Right; after that the register reads 1s
 * - Upper data lines are not driven, reads return $40 | bit
 * - Every read clocks the register, including the repeated reads caused
 *   by DMC DMA on NTSC consoles
 *
 * Interface:
 * - Read() for $4016/$4017, WriteStrobe() for $4016 writes
 * - Button state input from frontend
 */
class Joypad {
public:
    Joypad();

    void Reset();

    // === Register Interface ===
    uint8_t Read();
    void WriteStrobe(uint8_t value);

    // === Button Input (directly exposed from external input) ===
    void SetButton(uint8_t button, bool pressed);
    uint8_t GetButtons() const { return buttons; }

    // Button indices (shift order)
    static constexpr uint8_t BUTTON_A      = 0;
    static constexpr uint8_t BUTTON_B      = 1;
    static constexpr uint8_t BUTTON_SELECT = 2;
    static constexpr uint8_t BUTTON_START  = 3;
    static constexpr uint8_t BUTTON_UP     = 4;
    static constexpr uint8_t BUTTON_DOWN   = 5;
    static constexpr uint8_t BUTTON_LEFT   = 6;
    static constexpr uint8_t BUTTON_RIGHT  = 7;

    // === Debug Access ===
    // Shifts since the last reload, saturating at 8. Not visible to the CPU;
    // lets tests count the extra clocks from sample fetch re-reads.
    uint8_t GetShiftCount() const { return shift_count; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    static constexpr uint8_t OPEN_BUS_BITS = 0x40;

    uint8_t buttons;        // Bit n = button n pressed
    uint8_t shift_register;
    uint8_t shift_count;    // Debug counter only, does not affect reads
    bool strobe;
};
