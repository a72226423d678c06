#include "Bus.hpp"
#include "state/StateStream.hpp"

Bus::Bus() {
    Reset();
}

void Bus::Reset() {
    open_bus = 0;
    last_read_address = 0;
}

uint8_t Bus::Decode(uint16_t addr) {
    // Internal RAM ($0000-$1FFF)
    if (addr < 0x2000) {
        if (ram_read) return ram_read(addr);
        return open_bus;
    }

    // PPU registers ($2000-$3FFF)
    if (addr < 0x4000) {
        if (ppu_read) return ppu_read(addr);
        return open_bus;
    }

    // APU / I/O ($4000-$401F)
    if (addr < 0x4020) {
        if (io_read) return io_read(addr);
        return open_bus;
    }

    // Cartridge ($4020-$FFFF)
    if (cart_read) return cart_read(addr);
    return open_bus;
}

uint8_t Bus::Read(uint16_t addr) {
    last_read_address = addr;
    open_bus = Decode(addr);
    return open_bus;
}

uint8_t Bus::DMARead(uint16_t addr) {
    open_bus = Decode(addr);
    return open_bus;
}

void Bus::Write(uint16_t addr, uint8_t value) {
    open_bus = value;

    if (addr < 0x2000) {
        if (ram_write) ram_write(addr, value);
        return;
    }

    if (addr < 0x4000) {
        if (ppu_write) ppu_write(addr, value);
        return;
    }

    if (addr < 0x4020) {
        if (io_write) io_write(addr, value);
        return;
    }

    if (cart_write) cart_write(addr, value);
}

void Bus::SaveState(StateWriter& out) const {
    out.U8(open_bus);
    out.U16(last_read_address);
}

void Bus::LoadState(StateReader& in) {
    open_bus = in.U8();
    last_read_address = in.U16();
}
