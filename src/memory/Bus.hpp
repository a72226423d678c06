#pragma once

#include <cstdint>
#include <functional>

class StateWriter;
class StateReader;

/**
 * Bus - CPU Address Decoder
 *
 * Hardware Behavior:
 * - Decodes address lines and routes to appropriate device
 * - Does NOT contain component logic - just routes signals
 * - The data bus keeps the last value driven on it (open bus)
 *
 * CPU memory map:
 * - $0000-$1FFF: 2KB internal RAM, mirrored every $0800
 * - $2000-$3FFF: PPU registers, mirrored every 8 bytes
 * - $4000-$401F: APU, OAM DMA and controller ports
 * - $4020-$FFFF: Cartridge
 *
 * Interface:
 * - Read/Write for the CPU (tracks the last CPU read address)
 * - DMARead for the DMA engines (leaves the CPU read address alone)
 * - Callbacks to individual components
 */
class Bus {
public:
    // Read/Write callback types - each "chip" provides these
    using ReadCallback = std::function<uint8_t(uint16_t addr)>;
    using WriteCallback = std::function<void(uint16_t addr, uint8_t value)>;

    Bus();

    void Reset();

    // === Main Bus Operations (directly exposed CPU interface) ===
    uint8_t Read(uint16_t addr);
    void Write(uint16_t addr, uint8_t value);

    // === DMA Support ===
    uint8_t DMARead(uint16_t addr);

    // === Device Connection (wire up components like chips on PCB) ===
    // Internal RAM ($0000-$1FFF)
    void ConnectRAM(ReadCallback read, WriteCallback write) {
        ram_read = read;
        ram_write = write;
    }

    // PPU registers ($2000-$3FFF)
    void ConnectPPU(ReadCallback read, WriteCallback write) {
        ppu_read = read;
        ppu_write = write;
    }

    // APU, $4014 and controllers ($4000-$401F)
    void ConnectIO(ReadCallback read, WriteCallback write) {
        io_read = read;
        io_write = write;
    }

    // Cartridge space ($4020-$FFFF)
    void ConnectCartridge(ReadCallback read, WriteCallback write) {
        cart_read = read;
        cart_write = write;
    }

    // === Bus State ===
    uint8_t GetOpenBus() const { return open_bus; }
    uint16_t GetLastReadAddress() const { return last_read_address; }

    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    uint8_t Decode(uint16_t addr);

    // === Device Callbacks ===
    ReadCallback ram_read;
    WriteCallback ram_write;

    ReadCallback ppu_read;
    WriteCallback ppu_write;

    ReadCallback io_read;
    WriteCallback io_write;

    ReadCallback cart_read;
    WriteCallback cart_write;

    // === Data Bus Latch ===
    uint8_t open_bus;
    uint16_t last_read_address;
};
