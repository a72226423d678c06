#pragma once

#include <cstdint>
#include <array>

#include "config/HardwareConfig.hpp"

class StateWriter;
class StateReader;

/**
 * PPU - Picture Processing Unit (timing, registers and OAM)
 *
 * Hardware Behavior:
 * - One Step() per dot: 341 dots per scanline
 * - NTSC: 262 scanlines, PAL: 312 scanlines; the last line is pre-render
 * - VBlank starts at scanline 241 dot 1 and ends at pre-render dot 1
 * - NTSC odd frames with rendering enabled skip the last pre-render dot
 * - Registers $2000-$2007 mirror every 8 bytes through $3FFF
 * - Writes refresh the I/O latch; unused $2002 bits read back from it
 *
 * Pixel rendering is not modelled. The VBlank flag itself lives in
 * VBlankLedger; the PPU only reports when the window opens and closes.
 *
 * Interface:
 * - Register access ($2000-$3FFF, $2002 composed by the orchestrator)
 * - OAM write port for OAM DMA
 * - One-dot event pulses: VBlank start, VBlank end
 */
class PPU {
public:
    PPU();

    void Reset(VideoRegion region = VideoRegion::NTSC);

    // Advance one dot
    void Step();

    // === Register Interface (memory-mapped I/O) ===
    uint8_t ReadRegister(uint16_t addr);
    void WriteRegister(uint16_t addr, uint8_t value);

    // $2002 read with the flag value supplied by the VBlank ledger
    uint8_t ReadStatus(bool vblank_flag);

    // === OAM Interface ===
    void DMAWriteOAM(uint8_t value);
    uint8_t ReadOAM(uint8_t index) const { return oam[index]; }
    const std::array<uint8_t, 256>& GetOAM() const { return oam; }
    uint8_t GetOAMAddr() const { return oam_addr; }

    // === Timing Events (valid until the next Step) ===
    bool DidVBlankStart() const { return vblank_started; }
    bool DidVBlankEnd() const { return vblank_ended; }

    // Latched until cleared by the consumer
    bool IsFrameComplete() const { return frame_complete; }
    void ClearFrameComplete() { frame_complete = false; }

    // A $2002 read now lands one dot before the flag is set
    bool IsDotBeforeVBlankStart() const {
        return scanline == VBLANK_START_LINE && dot == VBLANK_START_DOT - 1;
    }

    // === State Query ===
    uint16_t GetScanline() const { return scanline; }
    uint16_t GetDot() const { return dot; }
    uint64_t GetFrame() const { return frame; }
    bool IsOddFrame() const { return odd_frame; }
    uint16_t GetPreRenderLine() const { return scanlines_per_frame - 1; }
    uint16_t GetScanlinesPerFrame() const { return scanlines_per_frame; }
    bool IsNmiEnabled() const { return (ctrl & 0x80) != 0; }
    bool IsRenderingEnabled() const { return (mask & 0x18) != 0; }
    uint8_t GetCtrl() const { return ctrl; }
    uint8_t GetMask() const { return mask; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

    static constexpr uint16_t DOTS_PER_SCANLINE = 341;
    static constexpr uint16_t NTSC_SCANLINES = 262;
    static constexpr uint16_t PAL_SCANLINES = 312;
    static constexpr uint16_t VBLANK_START_LINE = 241;
    static constexpr uint16_t VBLANK_START_DOT = 1;
    static constexpr uint16_t VBLANK_END_DOT = 1;

private:
    // === Register Offsets ===
    enum Register : uint8_t {
        PPUCTRL = 0,
        PPUMASK = 1,
        PPUSTATUS = 2,
        OAMADDR = 3,
        OAMDATA = 4
    };

    uint16_t scanlines_per_frame;
    bool odd_frame_skip_enabled;

    // === Position (last dot processed) ===
    uint16_t scanline;
    uint16_t dot;
    uint64_t frame;
    bool odd_frame;

    // === Registers ===
    uint8_t ctrl;       // $2000
    uint8_t mask;       // $2001
    uint8_t oam_addr;   // $2003
    uint8_t io_latch;   // Last value driven on the PPU data bus

    std::array<uint8_t, 256> oam;

    // === Output Signals ===
    bool vblank_started;
    bool vblank_ended;
    bool frame_complete;
};
