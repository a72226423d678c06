#include "DmcDma.hpp"
#include "state/StateStream.hpp"

DmcDma::DmcDma() {
    Reset();
}

void DmcDma::Reset() {
    rdy_low = false;
    transfer_complete = false;
    stall_cycles_remaining = 0;
    sample_address = 0;
    sample_byte = 0;
    last_read_address = 0;
}

void DmcDma::Trigger(uint16_t address, uint16_t last_read_address) {
    rdy_low = true;
    transfer_complete = false;
    stall_cycles_remaining = STALL_CYCLES;
    sample_address = address;
    this->last_read_address = last_read_address;
}

bool DmcDma::Step(const ReadCallback& fetch, const ReadCallback& repeat_read,
                  bool repeat_reads_enabled) {
    if (!rdy_low) return false;

    // 1-based position of this cycle inside the stall
    uint8_t stall_cycle = STALL_CYCLES - stall_cycles_remaining + 1;
    stall_cycles_remaining--;

    if (stall_cycles_remaining == 0) {
        sample_byte = fetch(sample_address);
        rdy_low = false;
        transfer_complete = true;
        return true;
    }

    if (repeat_reads_enabled && (stall_cycle == 2 || stall_cycle == 3)) {
        // Value is discarded, only the side effect on the device matters
        (void)repeat_read(last_read_address);
    }
    return false;
}

void DmcDma::SaveState(StateWriter& out) const {
    out.Bool(rdy_low);
    out.Bool(transfer_complete);
    out.U8(stall_cycles_remaining);
    out.U16(sample_address);
    out.U8(sample_byte);
    out.U16(last_read_address);
}

void DmcDma::LoadState(StateReader& in) {
    rdy_low = in.Bool();
    transfer_complete = in.Bool();
    stall_cycles_remaining = in.U8();
    sample_address = in.U16();
    sample_byte = in.U8();
    last_read_address = in.U16();

    // Active means 1..4 stall cycles left, idle means none
    bool stall_valid = rdy_low ? (stall_cycles_remaining >= 1 && stall_cycles_remaining <= STALL_CYCLES)
                               : stall_cycles_remaining == 0;
    if (!stall_valid) in.Fail();
}
