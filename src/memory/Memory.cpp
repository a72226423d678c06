#include "Memory.hpp"
#include "state/StateStream.hpp"

Memory::Memory() {
    Reset();
}

void Memory::Reset() {
    ram.fill(0);
}

uint8_t Memory::ReadRAM(uint16_t addr) const {
    return ram[addr & (RAM_SIZE - 1)];
}

void Memory::WriteRAM(uint16_t addr, uint8_t value) {
    ram[addr & (RAM_SIZE - 1)] = value;
}

void Memory::SaveState(StateWriter& out) const {
    out.Bytes(ram.data(), ram.size());
}

void Memory::LoadState(StateReader& in) {
    in.Bytes(ram.data(), ram.size());
}
