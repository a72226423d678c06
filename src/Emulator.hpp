#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

#include "config/HardwareConfig.hpp"
#include "dma/DmaArbiter.hpp"

// Forward declarations - components don't know each other
class MasterClock;
class PPU;
class VBlankLedger;
class DmcChannel;
class Joypad;
class Bus;
class Memory;
class StateWriter;
class StateReader;

// Signals the processor obeys, published whenever one of them changes
struct CoreSignals {
    bool halt = false;  // DMA owns the cycle, CPU must not run
    bool nmi = false;   // VBlank flag AND PPUCTRL bit 7
    bool irq = false;   // DMC IRQ flag

    bool operator==(const CoreSignals& other) const {
        return halt == other.halt && nmi == other.nmi && irq == other.irq;
    }
    bool operator!=(const CoreSignals& other) const { return !(*this == other); }
};

/**
 * Emulator - The "Motherboard" / Tick Orchestrator
 *
 * Hardware Accuracy Model:
 * This class represents the PHYSICAL INTERCONNECTION of components,
 * like the traces between the 2A03, the PPU and the RAM on the console board.
 *
 * In real hardware:
 * - A master oscillator drives everything; the PPU and CPU divide it down
 * - The CPU has no say in DMA: RDY is pulled low and it simply stops
 * - NMI is a wire from the PPU, IRQ a wire from the APU
 *
 * This orchestrator:
 * - Wires components together via the Bus
 * - Advances one PPU dot per Tick(), and one CPU cycle every 3 (NTSC)
 *   or 3.2 (PAL) dots
 * - Feeds VBlank timing into the ledger, arbitrates DMA, publishes
 *   halt/NMI/IRQ
 * - Does NOT execute instructions - an external processor is connected
 *   through ConnectProcessor() and runs on every cycle that is not halted
 */
class Emulator {
public:
    using ProcessorCallback = std::function<void()>;
    using SignalCallback = std::function<void(const CoreSignals&)>;
    using CartridgeReadCallback = std::function<uint8_t(uint16_t addr)>;
    using CartridgeWriteCallback = std::function<void(uint16_t addr, uint8_t value)>;

    explicit Emulator(const HardwareConfig& hardware = HardwareConfig());
    ~Emulator();

    // === Initialization (like powering on the console) ===
    void Reset();
    void Configure(const HardwareConfig& hardware);
    const HardwareConfig& GetHardwareConfig() const { return hardware; }

    // === Clock Distribution ===
    // Advance exactly one PPU dot
    void Tick();

    // Advance until N more CPU cycles have completed
    void StepCpuCycles(uint32_t cycles);

    // Run until the PPU finishes the current frame
    void RunFrame();

    // === Processor Side ===
    void ConnectProcessor(ProcessorCallback callback) { processor = std::move(callback); }
    void SetSignalCallback(SignalCallback callback) { signal_callback = std::move(callback); }
    const CoreSignals& GetSignals() const { return signals; }

    // CPU bus access (used by the processor, and by tests between ticks)
    uint8_t Read(uint16_t addr);
    void Write(uint16_t addr, uint8_t value);

    // === External Devices ===
    void ConnectCartridge(CartridgeReadCallback read, CartridgeWriteCallback write);
    void SetButton(uint8_t port, uint8_t button, bool pressed);

    // === Debug Access (directly exposed for debugging and tests) ===
    const MasterClock& GetClock() const { return *clock; }
    const PPU& GetPPU() const { return *ppu; }
    const VBlankLedger& GetVBlankLedger() const { return *vblank; }
    const DmaUnits& GetDma() const { return *dma; }
    const DmcChannel& GetDmcChannel() const { return *dmc; }
    const Joypad& GetJoypad(uint8_t port) const { return *joypads[port & 1]; }
    const Bus& GetBus() const { return *bus; }

    uint64_t GetCpuCycles() const;
    uint64_t GetHaltedCycles() const { return halted_cycles; }

    // Internal RAM read without touching the bus
    uint8_t DebugRead(uint16_t addr) const;

    // === Save States ===
    void SaveState(StateWriter& out) const;
    void LoadState(StateReader& in);

private:
    HardwareConfig hardware;

    // === Hardware Components (like chips on the motherboard) ===
    std::unique_ptr<MasterClock> clock;
    std::unique_ptr<PPU> ppu;
    std::unique_ptr<VBlankLedger> vblank;
    std::unique_ptr<DmaUnits> dma;
    std::unique_ptr<DmcChannel> dmc;
    std::array<std::unique_ptr<Joypad>, 2> joypads;
    std::unique_ptr<Bus> bus;
    std::unique_ptr<Memory> memory;

    // === Processor Connection ===
    ProcessorCallback processor;
    SignalCallback signal_callback;
    CoreSignals signals;
    uint64_t halted_cycles;

    DmaBusPorts dma_ports;

    // === Internal Wiring (connecting components like PCB traces) ===
    void WireComponents();

    // One CPU cycle: DMA arbitration, processor, DMC timer
    void StepCpuCycle();

    // Recompute halt/NMI/IRQ and notify on change
    void UpdateSignals(bool halt);

    // === Register Routers ===
    uint8_t ReadPPU(uint16_t addr);
    void WritePPU(uint16_t addr, uint8_t value);
    uint8_t ReadIO(uint16_t addr);
    void WriteIO(uint16_t addr, uint8_t value);
};
