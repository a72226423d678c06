#include "OamDma.hpp"
#include "state/StateStream.hpp"

OamDma::OamDma() {
    Reset();
}

void OamDma::Reset() {
    active = false;
    phase = Phase::IDLE;
    interrupted_phase = Phase::IDLE;
    source_page = 0;
    current_offset = 0;
    current_cycle = 0;
    needs_alignment = false;
    temp_value = 0;
}

void OamDma::Trigger(uint8_t page, bool started_on_odd_cycle) {
    // Hardware re-latches the page and starts over on a second write
    source_page = page;
    current_offset = 0;
    current_cycle = 0;
    needs_alignment = started_on_odd_cycle;
    temp_value = 0;
    active = true;
    phase = Phase::ALIGNING;
    interrupted_phase = Phase::IDLE;
}

bool OamDma::Step(const ReadCallback& read, const WriteCallback& write) {
    if (!active) return false;

    switch (phase) {
        case Phase::ALIGNING:
            current_cycle++;
            if (needs_alignment) {
                // Halt cycle done, one more wait to land on a get cycle
                needs_alignment = false;
            } else {
                phase = Phase::READING;
            }
            return false;

        case Phase::READING:
            temp_value = read(GetSourceAddress());
            current_cycle++;
            phase = Phase::WRITING;
            return true;

        case Phase::WRITING:
            write(temp_value);
            current_cycle++;
            current_offset++;
            if (current_offset == 0) {
                active = false;
                phase = Phase::IDLE;
            } else {
                phase = Phase::READING;
            }
            return true;

        case Phase::PAUSED_DURING_READ:
        case Phase::PAUSED_DURING_WRITE:
        case Phase::IDLE:
            return false;
    }
    return false;
}

void OamDma::Pause() {
    if (!active || IsPaused()) return;

    interrupted_phase = phase;
    phase = (phase == Phase::WRITING) ? Phase::PAUSED_DURING_WRITE
                                      : Phase::PAUSED_DURING_READ;
}

void OamDma::Resume() {
    if (!IsPaused()) return;

    phase = interrupted_phase;
    interrupted_phase = Phase::IDLE;
}

const char* OamDma::PhaseName(Phase phase) {
    switch (phase) {
        case Phase::IDLE:                return "idle";
        case Phase::ALIGNING:            return "aligning";
        case Phase::READING:             return "reading";
        case Phase::WRITING:             return "writing";
        case Phase::PAUSED_DURING_READ:  return "paused_read";
        case Phase::PAUSED_DURING_WRITE: return "paused_write";
    }
    return "?";
}

void OamDma::SaveState(StateWriter& out) const {
    out.Bool(active);
    out.U8(static_cast<uint8_t>(phase));
    out.U8(static_cast<uint8_t>(interrupted_phase));
    out.U8(source_page);
    out.U8(current_offset);
    out.U16(current_cycle);
    out.Bool(needs_alignment);
    out.U8(temp_value);
}

void OamDma::LoadState(StateReader& in) {
    active = in.Bool();
    phase = static_cast<Phase>(in.U8());
    interrupted_phase = static_cast<Phase>(in.U8());
    source_page = in.U8();
    current_offset = in.U8();
    current_cycle = in.U16();
    needs_alignment = in.Bool();
    temp_value = in.U8();
    if (!IsValidState()) in.Fail();
}

bool OamDma::IsValidState() const {
    if (phase > Phase::PAUSED_DURING_WRITE) return false;
    if (active != (phase != Phase::IDLE)) return false;
    if (IsPaused()) {
        if (interrupted_phase == Phase::IDLE || interrupted_phase > Phase::WRITING) return false;
        return (phase == Phase::PAUSED_DURING_WRITE) == (interrupted_phase == Phase::WRITING);
    }
    return interrupted_phase == Phase::IDLE;
}
