#include "PPU.hpp"
#include "state/StateStream.hpp"

PPU::PPU() {
    Reset();
}

void PPU::Reset(VideoRegion region) {
    scanlines_per_frame = (region == VideoRegion::PAL) ? PAL_SCANLINES : NTSC_SCANLINES;
    odd_frame_skip_enabled = (region == VideoRegion::NTSC);

    scanline = 0;
    dot = 0;
    frame = 0;
    odd_frame = false;

    ctrl = 0;
    mask = 0;
    oam_addr = 0;
    io_latch = 0;
    oam.fill(0);

    vblank_started = false;
    vblank_ended = false;
    frame_complete = false;
}

void PPU::Step() {
    vblank_started = false;
    vblank_ended = false;

    dot++;

    // Odd frames drop the last pre-render dot when rendering is on
    bool skip_dot = odd_frame_skip_enabled && odd_frame && IsRenderingEnabled() &&
                    scanline == GetPreRenderLine() && dot == DOTS_PER_SCANLINE - 1;

    if (dot >= DOTS_PER_SCANLINE || skip_dot) {
        dot = 0;
        scanline++;
        if (scanline >= scanlines_per_frame) {
            scanline = 0;
            frame++;
            odd_frame = !odd_frame;
            frame_complete = true;
        }
    }

    if (scanline == VBLANK_START_LINE && dot == VBLANK_START_DOT) {
        vblank_started = true;
    } else if (scanline == GetPreRenderLine() && dot == VBLANK_END_DOT) {
        vblank_ended = true;
    }
}

uint8_t PPU::ReadRegister(uint16_t addr) {
    switch (addr & 0x07) {
        case OAMDATA:
            io_latch = oam[oam_addr];
            return io_latch;
        default:
            // Write-only registers return the latch
            return io_latch;
    }
}

void PPU::WriteRegister(uint16_t addr, uint8_t value) {
    io_latch = value;

    switch (addr & 0x07) {
        case PPUCTRL:
            ctrl = value;
            break;
        case PPUMASK:
            mask = value;
            break;
        case OAMADDR:
            oam_addr = value;
            break;
        case OAMDATA:
            oam[oam_addr++] = value;
            break;
        default:
            // Scroll and VRAM ports are not modelled
            break;
    }
}

uint8_t PPU::ReadStatus(bool vblank_flag) {
    // Sprite 0 hit and overflow are never set without rendering
    uint8_t value = (vblank_flag ? 0x80 : 0x00) | (io_latch & 0x1F);
    io_latch = value;
    return value;
}

void PPU::DMAWriteOAM(uint8_t value) {
    oam[oam_addr++] = value;
}

void PPU::SaveState(StateWriter& out) const {
    out.U16(scanline);
    out.U16(dot);
    out.U64(frame);
    out.Bool(odd_frame);
    out.U8(ctrl);
    out.U8(mask);
    out.U8(oam_addr);
    out.U8(io_latch);
    out.Bytes(oam.data(), oam.size());
    out.Bool(vblank_started);
    out.Bool(vblank_ended);
    out.Bool(frame_complete);
}

void PPU::LoadState(StateReader& in) {
    scanline = in.U16();
    dot = in.U16();
    frame = in.U64();
    odd_frame = in.Bool();
    ctrl = in.U8();
    mask = in.U8();
    oam_addr = in.U8();
    io_latch = in.U8();
    in.Bytes(oam.data(), oam.size());
    vblank_started = in.Bool();
    vblank_ended = in.Bool();
    frame_complete = in.Bool();
    if (scanline >= scanlines_per_frame || dot >= DOTS_PER_SCANLINE) in.Fail();
}
