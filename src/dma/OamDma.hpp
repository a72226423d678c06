#pragma once

#include <cstdint>
#include <functional>

class StateWriter;
class StateReader;

/**
 * OamDma - Sprite Memory Bulk Copy ($4014)
 *
 * Hardware Behavior:
 * - Copies 256 bytes from CPU page $XX00-$XXFF into PPU OAM via $2004
 * - First cycle is a halt cycle; a trigger on an odd CPU cycle costs one more
 * - Then alternates read (get) and write (put) cycles, one byte per pair
 * - 513 cycles from an even start, 514 from an odd start
 * - Does NOT know about DMC DMA - the arbiter pauses and resumes it
 *
 * Phases:
 * - ALIGNING: halt/alignment cycles before the first read
 * - READING / WRITING: next cycle is a get / put
 * - PAUSED_DURING_READ / PAUSED_DURING_WRITE: DMC DMA owns the bus, the
 *   engine remembers which access it was about to perform
 *
 * Interface:
 * - Trigger(page, odd) from the $4014 write
 * - Step() with a bus read callback and an OAM write callback
 */
class OamDma {
public:
    enum class Phase : uint8_t {
        IDLE,
        ALIGNING,
        READING,
        WRITING,
        PAUSED_DURING_READ,
        PAUSED_DURING_WRITE
    };

    using ReadCallback = std::function<uint8_t(uint16_t)>;
    using WriteCallback = std::function<void(uint8_t)>;

    static constexpr uint16_t BYTES_TO_TRANSFER = 256;

    OamDma();

    void Reset();

    // Latches a new transfer. A trigger while active restarts from offset 0.
    void Trigger(uint8_t page, bool started_on_odd_cycle);

    // Advance one CPU cycle. Returns true if the engine touched the bus.
    bool Step(const ReadCallback& read, const WriteCallback& write);

    // === Arbitration (driven by DmaArbiter) ===
    void Pause();
    void Resume();

    // === State (directly exposed for the orchestrator and tests) ===
    bool IsActive() const { return active; }
    bool IsPaused() const {
        return phase == Phase::PAUSED_DURING_READ || phase == Phase::PAUSED_DURING_WRITE;
    }
    Phase GetPhase() const { return phase; }
    uint8_t GetSourcePage() const { return source_page; }
    uint8_t GetCurrentOffset() const { return current_offset; }
    uint16_t GetCurrentCycle() const { return current_cycle; }
    bool NeedsAlignment() const { return needs_alignment; }
    uint8_t GetTempValue() const { return temp_value; }

    uint16_t GetSourceAddress() const {
        return (static_cast<uint16_t>(source_page) << 8) | current_offset;
    }

    static const char* PhaseName(Phase phase);

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    bool IsValidState() const;

    // === Transfer State ===
    bool active;
    Phase phase;
    Phase interrupted_phase;    // Phase to restore on Resume()
    uint8_t source_page;        // High byte latched from $4014
    uint8_t current_offset;     // Next byte to copy, wraps to 0 when done
    uint16_t current_cycle;     // Cycles the engine itself has run
    bool needs_alignment;       // Odd-cycle start, one extra wait owed
    uint8_t temp_value;         // Byte held between get and put
};
