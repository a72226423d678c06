#pragma once

#include <cstdint>
#include <functional>

#include "OamDma.hpp"
#include "DmcDma.hpp"
#include "DmaConflictLedger.hpp"

/**
 * DmaUnits - Both DMA engines and their conflict ledger
 *
 * Always passed together so one arbitration step sees and updates all of
 * the DMA state at once.
 */
struct DmaUnits {
    OamDma oam;
    DmcDma dmc;
    DmaConflictLedger ledger;

    void Reset() {
        oam.Reset();
        dmc.Reset();
        ledger.Reset();
    }
};

// Which engine drives the CPU bus on a given cycle
enum class DmaOwner : uint8_t {
    NONE,
    SAMPLE_FETCH,
    BULK_COPY
};

// Bus connections the engines need for one cycle
struct DmaBusPorts {
    std::function<uint8_t(uint16_t)> dma_read;      // Source reads, no CPU side bookkeeping
    std::function<uint8_t(uint16_t)> repeat_read;   // Replay of the halted CPU read
    std::function<void(uint8_t)> oam_write;         // $2004 write from OAM DMA
};

// Outcome of one arbitration step
struct DmaCycleResult {
    DmaOwner owner = DmaOwner::NONE;
    bool halt = false;              // CPU must not run this cycle
    bool oam_bus_access = false;    // OAM DMA performed a get or put
    bool sample_fetched = false;    // DMC byte arrived this cycle
    uint8_t sample_byte = 0;
};

/**
 * DmaArbiter - One CPU cycle of DMA arbitration
 *
 * Hardware Behavior:
 * - DMC DMA owns every cycle it is active; an active OAM DMA is paused in
 *   whichever half (get/put) it was about to perform and does nothing
 * - When the DMC fetch lands, OAM DMA resumes but first spends exactly one
 *   alignment cycle with no bus access
 * - The halt signal is high whenever either engine consumed the cycle,
 *   including OAM cycles spent paused or aligning
 *
 * All state lives in DmaUnits; the arbiter itself is stateless.
 */
class DmaArbiter {
public:
    // $4014 write. Parity comes from the CPU cycle counter at the write.
    static void TriggerBulkCopy(DmaUnits& units, uint8_t page, bool odd_cycle);

    // DMC memory reader request
    static void TriggerSampleFetch(DmaUnits& units, uint16_t address,
                                   uint16_t last_read_address, uint64_t cycle);

    static DmaOwner ResolveOwner(const DmaUnits& units);

    static DmaCycleResult Tick(DmaUnits& units, const DmaBusPorts& ports,
                               uint64_t cycle, bool repeat_reads_enabled);

    // OAM DMA is paused exactly while both engines are in flight
    static bool IsConsistent(const DmaUnits& units);
};
