#include "DmaConflictLedger.hpp"
#include "state/StateStream.hpp"

DmaConflictLedger::DmaConflictLedger() {
    Reset();
}

void DmaConflictLedger::Reset() {
    last_dmc_active_cycle = 0;
    last_dmc_inactive_cycle = 0;
    oam_pause_cycle = 0;
    oam_resume_cycle = 0;
    needs_alignment_after_dmc = false;
    interruption_count = 0;
}

void DmaConflictLedger::RecordOamPause(uint64_t cycle) {
    oam_pause_cycle = cycle;
    interruption_count++;
}

void DmaConflictLedger::RecordOamResume(uint64_t cycle) {
    oam_resume_cycle = cycle;
    needs_alignment_after_dmc = true;
}

bool DmaConflictLedger::ConsumeAlignment() {
    if (!needs_alignment_after_dmc) return false;
    needs_alignment_after_dmc = false;
    return true;
}

void DmaConflictLedger::SaveState(StateWriter& out) const {
    out.U64(last_dmc_active_cycle);
    out.U64(last_dmc_inactive_cycle);
    out.U64(oam_pause_cycle);
    out.U64(oam_resume_cycle);
    out.Bool(needs_alignment_after_dmc);
    out.U32(interruption_count);
}

void DmaConflictLedger::LoadState(StateReader& in) {
    last_dmc_active_cycle = in.U64();
    last_dmc_inactive_cycle = in.U64();
    oam_pause_cycle = in.U64();
    oam_resume_cycle = in.U64();
    needs_alignment_after_dmc = in.Bool();
    interruption_count = in.U32();
}
