#include "MasterClock.hpp"
#include "state/StateStream.hpp"

MasterClock::MasterClock() {
    Reset();
}

void MasterClock::Reset(VideoRegion region) {
    this->region = region;
    if (region == VideoRegion::PAL) {
        ppu_divider = PAL_PPU_DIVIDER;
        cpu_divider = PAL_CPU_DIVIDER;
    } else {
        ppu_divider = NTSC_PPU_DIVIDER;
        cpu_divider = NTSC_CPU_DIVIDER;
    }
    master_cycles = 0;
    ppu_dots = 0;
    cpu_cycles = 0;
    cpu_phase = 0;
}

bool MasterClock::Advance() {
    master_cycles += ppu_divider;
    ppu_dots++;

    cpu_phase += ppu_divider;
    if (cpu_phase >= cpu_divider) {
        cpu_phase -= cpu_divider;
        cpu_cycles++;
        return true;
    }
    return false;
}

void MasterClock::SaveState(StateWriter& out) const {
    out.U64(master_cycles);
    out.U64(ppu_dots);
    out.U64(cpu_cycles);
    out.U8(cpu_phase);
}

void MasterClock::LoadState(StateReader& in) {
    // Region is part of the machine configuration, not the snapshot
    master_cycles = in.U64();
    ppu_dots = in.U64();
    cpu_cycles = in.U64();
    cpu_phase = in.U8();
    if (cpu_phase >= cpu_divider) in.Fail();
}
