#pragma once

#include <cstdint>
#include <array>

class StateWriter;
class StateReader;

/**
 * Memory - Internal RAM
 *
 * Hardware Behavior:
 * - 2KB SRAM on the console board
 * - Only 11 address lines are wired, so $0000-$07FF repeats through $1FFF
 * - Does NOT know about CPU or any other component
 */
class Memory {
public:
    static constexpr uint16_t RAM_SIZE = 0x0800;

    Memory();

    void Reset();

    uint8_t ReadRAM(uint16_t addr) const;
    void WriteRAM(uint16_t addr, uint8_t value);

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    std::array<uint8_t, RAM_SIZE> ram;
};
