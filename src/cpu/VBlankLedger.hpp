#pragma once

#include <cstdint>

class StateWriter;
class StateReader;

/**
 * VBlankLedger - Vertical blank flag, NMI enable and the NMI line
 *
 * Hardware Behavior:
 * - The PPU sets the VBlank flag at scanline 241 dot 1 and clears it at
 *   pre-render dot 1. Reading $2002 also clears the flag, but the blanking
 *   window itself keeps running until pre-render.
 * - NMI = VBlank flag AND PPUCTRL bit 7. Setting bit 7 while the flag is
 *   already set raises NMI immediately.
 * - Reading $2002 one dot before the flag would be set suppresses it for
 *   the whole frame.
 *
 * Does NOT contain CPU logic - the CPU samples GetNmiLine() at instruction
 * boundaries and does its own edge detection.
 *
 * Interface:
 * - Timing events from the PPU (window start/end)
 * - Processor events ($2002 read, $2000 write)
 * - NMI line output, recomputed on every event
 */
class VBlankLedger {
public:
    VBlankLedger();

    void Reset();

    // === Timing Events (from video timing) ===
    void RecordWindowStart(uint64_t cycle);
    void RecordWindowEnd(uint64_t cycle);

    // Next window start opens the window without setting the flag
    void SuppressNextFlag() { suppress_next_flag = true; }

    // === Processor Events ===
    // Returns the flag value the read observes, then clears the flag
    bool RecordStatusRead(uint64_t cycle);
    void RecordEnableWrite(uint64_t cycle, bool enabled);

    // === NMI Output (directly exposed output pin) ===
    bool GetNmiLine() const { return nmi_line; }

    // === Queries ===
    bool IsFlagSet() const { return flag; }
    bool IsSpanActive() const { return span_active; }
    bool IsNmiEnabled() const { return nmi_enabled; }
    uint64_t GetLastSetCycle() const { return last_set_cycle; }
    uint64_t GetLastClearCycle() const { return last_clear_cycle; }
    uint64_t GetLastReadCycle() const { return last_read_cycle; }
    uint64_t GetLastEnableWriteCycle() const { return last_enable_write_cycle; }

    // Number of 0->1 transitions of the NMI line since reset
    uint32_t GetNmiEdgeCount() const { return nmi_edge_count; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    void RecomputeNmiLine();

    // === Flag vs. Window ===
    bool flag;              // $2002 bit 7
    bool span_active;       // Scanline 241 dot 1 until pre-render dot 1
    bool nmi_enabled;       // $2000 bit 7
    bool suppress_next_flag;

    // === Output ===
    bool nmi_line;
    uint32_t nmi_edge_count;

    // === Timestamps (master cycles) ===
    uint64_t last_set_cycle;
    uint64_t last_clear_cycle;
    uint64_t last_read_cycle;
    uint64_t last_enable_write_cycle;
};
