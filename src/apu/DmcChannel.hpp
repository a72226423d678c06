#pragma once

#include <cstdint>
#include <array>

#include "config/HardwareConfig.hpp"

class StateWriter;
class StateReader;

/**
 * DmcChannel - Delta Modulation Channel (timer, output unit, memory reader)
 *
 * Hardware Behavior:
 * - Timer counts CPU cycles; the period comes from the NTSC or PAL rate table
 * - Each timer expiry clocks the output unit, which shifts one sample bit
 *   and nudges the 7-bit level by +/-2; every 8 bits it reloads from the
 *   sample buffer, or goes silent if the buffer is empty
 * - The memory reader asks for a DMA fetch whenever the buffer is empty and
 *   bytes remain. Addresses wrap from $FFFF to $8000.
 * - End of sample: restart if looping, else raise the DMC IRQ if enabled
 * - Does NOT touch the bus - the orchestrator turns a request into DMC DMA
 *
 * Interface:
 * - Registers $4010-$4013 and $4015
 * - Fetch request / sample delivery
 * - IRQ output signal
 */
class DmcChannel {
public:
    DmcChannel();

    void Reset(VideoRegion region = VideoRegion::NTSC);

    // Advance one CPU cycle
    void Step();

    // === Register Interface (directly exposed memory-mapped I/O) ===
    void WriteRegister(uint16_t addr, uint8_t value);
    uint8_t ReadStatus() const;     // DMC bits of $4015

    // === Memory Reader Interface ===
    bool IsFetchRequested() const {
        return sample_buffer_empty && bytes_remaining > 0 && !fetch_pending;
    }
    uint16_t GetCurrentAddress() const { return current_address; }
    void AcknowledgeFetchRequest() { fetch_pending = true; }
    void LoadSampleByte(uint8_t value);

    // === Interrupt Signal (directly exposed output pin) ===
    bool IsInterruptRequested() const { return irq_flag; }

    // === State Query ===
    bool IsFetchPending() const { return fetch_pending; }
    uint16_t GetBytesRemaining() const { return bytes_remaining; }
    uint16_t GetTimerPeriod() const { return timer_period; }
    uint8_t GetOutputLevel() const { return output_level; }
    bool IsSilenced() const { return silence; }
    bool IsLooping() const { return loop; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

    // Sample address and length from $4012/$4013
    static uint16_t SampleAddress(uint8_t value) { return 0xC000 + (static_cast<uint16_t>(value) << 6); }
    static uint16_t SampleLength(uint8_t value) { return (static_cast<uint16_t>(value) << 4) + 1; }

private:
    void ClockOutputUnit();
    void RestartSample();

    // === Rate Tables (CPU cycles per output bit) ===
    static constexpr std::array<uint16_t, 16> NTSC_RATES = {
        428, 380, 340, 320, 286, 254, 226, 214,
        190, 160, 142, 128, 106,  84,  72,  54
    };
    static constexpr std::array<uint16_t, 16> PAL_RATES = {
        398, 354, 316, 298, 276, 236, 210, 198,
        176, 148, 132, 118,  98,  78,  66,  50
    };

    const std::array<uint16_t, 16>* rate_table;

    // === Registers ===
    bool irq_enabled;           // $4010 bit 7
    bool loop;                  // $4010 bit 6
    uint8_t rate_index;         // $4010 bits 0-3
    uint8_t sample_address_reg; // $4012
    uint8_t sample_length_reg;  // $4013

    // === Timer ===
    uint16_t timer_period;
    uint16_t timer_counter;

    // === Output Unit ===
    uint8_t output_level;       // 7-bit DAC input ($4011)
    uint8_t shift_register;
    uint8_t bits_remaining;
    bool silence;

    // === Memory Reader ===
    uint8_t sample_buffer;
    bool sample_buffer_empty;
    uint16_t current_address;
    uint16_t bytes_remaining;
    bool fetch_pending;         // DMA requested, byte not delivered yet

    // === Output Signals ===
    bool irq_flag;
};
