#pragma once

#include <cstdint>

class StateWriter;
class StateReader;

/**
 * DmaConflictLedger - Bookkeeping between DMC DMA and OAM DMA
 *
 * Records, in CPU cycles, when the sample fetch started and finished and
 * when it paused and resumed the bulk copy. The pause state itself lives in
 * the OAM DMA phase; the timestamps are kept for tracing and snapshots.
 *
 * The one piece of state that drives behavior is the alignment cycle owed
 * to OAM DMA after a DMC fetch that interrupted it.
 */
class DmaConflictLedger {
public:
    DmaConflictLedger();

    void Reset();

    // === Transitions (recorded by DmaArbiter) ===
    void RecordDmcActive(uint64_t cycle) { last_dmc_active_cycle = cycle; }
    void RecordDmcInactive(uint64_t cycle) { last_dmc_inactive_cycle = cycle; }
    void RecordOamPause(uint64_t cycle);
    void RecordOamResume(uint64_t cycle);

    // Returns true once per owed alignment cycle and clears it
    bool ConsumeAlignment();
    void ClearPendingAlignment() { needs_alignment_after_dmc = false; }

    // === Queries ===
    uint64_t GetLastDmcActiveCycle() const { return last_dmc_active_cycle; }
    uint64_t GetLastDmcInactiveCycle() const { return last_dmc_inactive_cycle; }
    uint64_t GetOamPauseCycle() const { return oam_pause_cycle; }
    uint64_t GetOamResumeCycle() const { return oam_resume_cycle; }
    bool NeedsAlignmentAfterDmc() const { return needs_alignment_after_dmc; }
    uint32_t GetInterruptionCount() const { return interruption_count; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    uint64_t last_dmc_active_cycle;
    uint64_t last_dmc_inactive_cycle;
    uint64_t oam_pause_cycle;
    uint64_t oam_resume_cycle;
    bool needs_alignment_after_dmc;
    uint32_t interruption_count;    // OAM DMA pauses since reset
};
