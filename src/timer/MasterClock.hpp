#pragma once

#include <cstdint>
#include "config/HardwareConfig.hpp"

class StateWriter;
class StateReader;

/**
 * MasterClock - Master oscillator and the CPU/PPU dividers
 *
 * Hardware Behavior:
 * - NTSC: master / 4 clocks the PPU, master / 12 clocks the CPU (3 dots per CPU cycle)
 * - PAL:  master / 5 clocks the PPU, master / 16 clocks the CPU (3.2 dots per CPU cycle)
 * - The CPU cycle counter parity decides whether OAM DMA needs an alignment cycle
 *
 * Interface:
 * - Advance() is called once per PPU dot and reports whether a CPU cycle
 *   falls on that dot. Counters are monotonic and never wrap in practice.
 */
class MasterClock {
public:
    MasterClock();

    void Reset(VideoRegion region = VideoRegion::NTSC);

    // Advance by one PPU dot. Returns true when a CPU cycle completes on this dot.
    bool Advance();

    uint64_t GetMasterCycles() const { return master_cycles; }
    uint64_t GetPpuDots() const { return ppu_dots; }
    uint64_t GetCpuCycles() const { return cpu_cycles; }
    bool IsOddCpuCycle() const { return (cpu_cycles & 1) != 0; }
    VideoRegion GetRegion() const { return region; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    static constexpr uint8_t NTSC_PPU_DIVIDER = 4;
    static constexpr uint8_t NTSC_CPU_DIVIDER = 12;
    static constexpr uint8_t PAL_PPU_DIVIDER = 5;
    static constexpr uint8_t PAL_CPU_DIVIDER = 16;

    VideoRegion region;
    uint8_t ppu_divider;
    uint8_t cpu_divider;

    uint64_t master_cycles;
    uint64_t ppu_dots;
    uint64_t cpu_cycles;

    // Master cycles accumulated toward the next CPU cycle
    uint8_t cpu_phase;
};
