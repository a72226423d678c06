#include "DmaArbiter.hpp"

#include <cassert>

void DmaArbiter::TriggerBulkCopy(DmaUnits& units, uint8_t page, bool odd_cycle) {
    units.oam.Trigger(page, odd_cycle);
    // A restarted copy does not inherit alignment owed to the old one
    units.ledger.ClearPendingAlignment();
}

void DmaArbiter::TriggerSampleFetch(DmaUnits& units, uint16_t address,
                                    uint16_t last_read_address, uint64_t cycle) {
    units.dmc.Trigger(address, last_read_address);
    units.ledger.RecordDmcActive(cycle);
}

DmaOwner DmaArbiter::ResolveOwner(const DmaUnits& units) {
    if (units.dmc.IsActive()) return DmaOwner::SAMPLE_FETCH;
    if (units.oam.IsActive()) return DmaOwner::BULK_COPY;
    return DmaOwner::NONE;
}

DmaCycleResult DmaArbiter::Tick(DmaUnits& units, const DmaBusPorts& ports,
                                uint64_t cycle, bool repeat_reads_enabled) {
    DmaCycleResult result;
    result.owner = ResolveOwner(units);
    result.halt = result.owner != DmaOwner::NONE;

    switch (result.owner) {
        case DmaOwner::SAMPLE_FETCH:
            if (units.oam.IsActive() && !units.oam.IsPaused()) {
                units.oam.Pause();
                units.ledger.RecordOamPause(cycle);
            }

            if (units.dmc.Step(ports.dma_read, ports.repeat_read, repeat_reads_enabled)) {
                result.sample_fetched = true;
                result.sample_byte = units.dmc.GetSampleByte();
                units.ledger.RecordDmcInactive(cycle);

                if (units.oam.IsPaused()) {
                    units.oam.Resume();
                    units.ledger.RecordOamResume(cycle);
                }
            }
            break;

        case DmaOwner::BULK_COPY:
            // A paused copy can only be here if the DMC state was corrupted
            assert(!units.oam.IsPaused());
            if (units.ledger.ConsumeAlignment()) {
                break;
            }
            result.oam_bus_access = units.oam.Step(ports.dma_read, ports.oam_write);
            break;

        case DmaOwner::NONE:
            break;
    }

    assert(IsConsistent(units));
    return result;
}

bool DmaArbiter::IsConsistent(const DmaUnits& units) {
    bool should_be_paused = units.oam.IsActive() && units.dmc.IsActive();
    return units.oam.IsPaused() == should_be_paused;
}
