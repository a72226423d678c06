#include "VBlankLedger.hpp"
#include "state/StateStream.hpp"

VBlankLedger::VBlankLedger() {
    Reset();
}

void VBlankLedger::Reset() {
    flag = false;
    span_active = false;
    nmi_enabled = false;
    suppress_next_flag = false;
    nmi_line = false;
    nmi_edge_count = 0;
    last_set_cycle = 0;
    last_clear_cycle = 0;
    last_read_cycle = 0;
    last_enable_write_cycle = 0;
}

void VBlankLedger::RecordWindowStart(uint64_t cycle) {
    span_active = true;
    if (suppress_next_flag) {
        suppress_next_flag = false;
    } else {
        flag = true;
        last_set_cycle = cycle;
    }
    RecomputeNmiLine();
}

void VBlankLedger::RecordWindowEnd(uint64_t cycle) {
    span_active = false;
    suppress_next_flag = false;
    if (flag) {
        flag = false;
        last_clear_cycle = cycle;
    }
    RecomputeNmiLine();
}

bool VBlankLedger::RecordStatusRead(uint64_t cycle) {
    bool observed = flag;
    last_read_cycle = cycle;
    if (flag) {
        flag = false;
        last_clear_cycle = cycle;
    }
    RecomputeNmiLine();
    return observed;
}

void VBlankLedger::RecordEnableWrite(uint64_t cycle, bool enabled) {
    nmi_enabled = enabled;
    last_enable_write_cycle = cycle;
    RecomputeNmiLine();
}

void VBlankLedger::RecomputeNmiLine() {
    bool line = flag && nmi_enabled;
    if (line && !nmi_line) {
        nmi_edge_count++;
    }
    nmi_line = line;
}

void VBlankLedger::SaveState(StateWriter& out) const {
    out.Bool(flag);
    out.Bool(span_active);
    out.Bool(nmi_enabled);
    out.Bool(suppress_next_flag);
    out.Bool(nmi_line);
    out.U32(nmi_edge_count);
    out.U64(last_set_cycle);
    out.U64(last_clear_cycle);
    out.U64(last_read_cycle);
    out.U64(last_enable_write_cycle);
}

void VBlankLedger::LoadState(StateReader& in) {
    flag = in.Bool();
    span_active = in.Bool();
    nmi_enabled = in.Bool();
    suppress_next_flag = in.Bool();
    nmi_line = in.Bool();
    nmi_edge_count = in.U32();
    last_set_cycle = in.U64();
    last_clear_cycle = in.U64();
    last_read_cycle = in.U64();
    last_enable_write_cycle = in.U64();
}
