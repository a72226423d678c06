#pragma once

#include <cstdint>
#include <functional>

class StateWriter;
class StateReader;

/**
 * DmcDma - Delta Modulation Channel sample fetch
 *
 * Hardware Behavior:
 * - Pulls RDY low and stalls the CPU for 4 cycles: halt, dummy, alignment, fetch
 * - The byte is read from the sample address on the last cycle
 * - NTSC 2A03 revisions repeat the halted CPU read on the 2nd and 3rd cycles,
 *   which clocks $4016/$4017 shift registers an extra time. The 2A07 does not.
 * - Always wins the bus over OAM DMA
 *
 * Interface:
 * - Trigger(address, last_read_address) from the DMC memory reader
 * - Step() returns true on the cycle the sample byte arrives
 */
class DmcDma {
public:
    using ReadCallback = std::function<uint8_t(uint16_t)>;

    static constexpr uint8_t STALL_CYCLES = 4;

    DmcDma();

    void Reset();

    // A trigger while active re-latches the address and restarts the stall
    void Trigger(uint16_t address, uint16_t last_read_address);

    // Advance one CPU cycle.
    // fetch reads the sample byte, repeat_read replays the halted CPU read.
    bool Step(const ReadCallback& fetch, const ReadCallback& repeat_read,
              bool repeat_reads_enabled);

    // === State (directly exposed for the orchestrator and tests) ===
    bool IsActive() const { return rdy_low; }
    uint8_t GetStallCyclesRemaining() const { return stall_cycles_remaining; }
    uint16_t GetSampleAddress() const { return sample_address; }
    uint8_t GetSampleByte() const { return sample_byte; }
    uint16_t GetLastReadAddress() const { return last_read_address; }
    bool IsTransferComplete() const { return transfer_complete; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    bool rdy_low;                   // CPU stalled
    bool transfer_complete;         // Sample byte from the last fetch is valid
    uint8_t stall_cycles_remaining; // 4 on trigger, 0 when done
    uint16_t sample_address;
    uint8_t sample_byte;
    uint16_t last_read_address;     // CPU read address when RDY went low
};
