#include "Emulator.hpp"

#include "timer/MasterClock.hpp"
#include "ppu/PPU.hpp"
#include "cpu/VBlankLedger.hpp"
#include "apu/DmcChannel.hpp"
#include "input/Joypad.hpp"
#include "memory/Bus.hpp"
#include "memory/Memory.hpp"
#include "state/StateStream.hpp"

Emulator::Emulator(const HardwareConfig& hardware)
    : hardware(hardware)
    , clock(std::make_unique<MasterClock>())
    , ppu(std::make_unique<PPU>())
    , vblank(std::make_unique<VBlankLedger>())
    , dma(std::make_unique<DmaUnits>())
    , dmc(std::make_unique<DmcChannel>())
    , joypads{std::make_unique<Joypad>(), std::make_unique<Joypad>()}
    , bus(std::make_unique<Bus>())
    , memory(std::make_unique<Memory>())
    , halted_cycles(0)
{
    WireComponents();
    Reset();
}

Emulator::~Emulator() = default;

/**
 * Wire Components Together
 *
 * Each component exposes its pins, and we connect them through the Bus.
 * DMA gets its own ports: source reads skip the CPU read-address latch,
 * the DMC repeat read goes through the normal CPU path.
 */
void Emulator::WireComponents() {
    // === Connect Internal RAM ($0000-$1FFF) ===
    bus->ConnectRAM(
        [this](uint16_t addr) { return memory->ReadRAM(addr); },
        [this](uint16_t addr, uint8_t val) { memory->WriteRAM(addr, val); }
    );

    // === Connect PPU Registers ($2000-$3FFF) ===
    bus->ConnectPPU(
        [this](uint16_t addr) { return ReadPPU(addr); },
        [this](uint16_t addr, uint8_t val) { WritePPU(addr, val); }
    );

    // === Connect APU / I/O ($4000-$401F) ===
    bus->ConnectIO(
        [this](uint16_t addr) { return ReadIO(addr); },
        [this](uint16_t addr, uint8_t val) { WriteIO(addr, val); }
    );

    // === Connect DMA Ports ===
    dma_ports.dma_read = [this](uint16_t addr) { return bus->DMARead(addr); };
    dma_ports.repeat_read = [this](uint16_t addr) { return bus->Read(addr); };
    dma_ports.oam_write = [this](uint8_t val) { ppu->DMAWriteOAM(val); };
}

void Emulator::Reset() {
    clock->Reset(hardware.region);
    ppu->Reset(hardware.region);
    vblank->Reset();
    dma->Reset();
    dmc->Reset(hardware.region);
    joypads[0]->Reset();
    joypads[1]->Reset();
    bus->Reset();
    memory->Reset();

    halted_cycles = 0;
    signals = CoreSignals();
}

void Emulator::Configure(const HardwareConfig& hardware) {
    this->hardware = hardware;
    Reset();
}

void Emulator::ConnectCartridge(CartridgeReadCallback read, CartridgeWriteCallback write) {
    bus->ConnectCartridge(std::move(read), std::move(write));
}

/**
 * Tick - one PPU dot
 *
 * Order inside a dot:
 * 1. Master clock advances, possibly completing a CPU cycle
 * 2. PPU moves to the next dot and reports VBlank edges to the ledger
 * 3. On a CPU cycle: DMA arbitration, then the processor if not halted
 * 4. Signals are republished
 */
void Emulator::Tick() {
    bool cpu_tick = clock->Advance();

    ppu->Step();
    uint64_t now = clock->GetMasterCycles();
    if (ppu->DidVBlankStart()) {
        vblank->RecordWindowStart(now);
    }
    if (ppu->DidVBlankEnd()) {
        vblank->RecordWindowEnd(now);
    }

    if (cpu_tick) {
        StepCpuCycle();
    } else {
        UpdateSignals(signals.halt);
    }
}

void Emulator::StepCpuCycle() {
    uint64_t cycle = clock->GetCpuCycles();

    DmaCycleResult result = DmaArbiter::Tick(*dma, dma_ports, cycle,
                                             hardware.HasSampleFetchReadCorruption());
    if (result.sample_fetched) {
        dmc->LoadSampleByte(result.sample_byte);
    }

    UpdateSignals(result.halt);

    if (result.halt) {
        halted_cycles++;
    } else if (processor) {
        processor();
    }

    // DMC memory reader runs after the CPU; a request stalls from the next cycle
    dmc->Step();
    if (dmc->IsFetchRequested()) {
        dmc->AcknowledgeFetchRequest();
        DmaArbiter::TriggerSampleFetch(*dma, dmc->GetCurrentAddress(),
                                       bus->GetLastReadAddress(), cycle);
    }

    UpdateSignals(result.halt);
}

void Emulator::UpdateSignals(bool halt) {
    CoreSignals next;
    next.halt = halt;
    next.nmi = vblank->GetNmiLine();
    next.irq = dmc->IsInterruptRequested();

    if (next != signals) {
        signals = next;
        if (signal_callback) signal_callback(signals);
    }
}

void Emulator::StepCpuCycles(uint32_t cycles) {
    uint64_t target = clock->GetCpuCycles() + cycles;
    while (clock->GetCpuCycles() < target) {
        Tick();
    }
}

void Emulator::RunFrame() {
    while (!ppu->IsFrameComplete()) {
        Tick();
    }
    ppu->ClearFrameComplete();
}

uint8_t Emulator::Read(uint16_t addr) {
    uint8_t value = bus->Read(addr);
    // Status reads can drop NMI immediately
    UpdateSignals(signals.halt);
    return value;
}

void Emulator::Write(uint16_t addr, uint8_t value) {
    bus->Write(addr, value);
    UpdateSignals(signals.halt);
}

/**
 * PPU Register Router ($2000-$3FFF, mirrored every 8 bytes)
 *
 * $2002 and $2000 are split between the PPU (register bits, I/O latch)
 * and the VBlank ledger (flag, NMI enable).
 */
uint8_t Emulator::ReadPPU(uint16_t addr) {
    if ((addr & 0x07) == 0x02) {
        if (ppu->IsDotBeforeVBlankStart()) {
            vblank->SuppressNextFlag();
        }
        bool flag = vblank->RecordStatusRead(clock->GetMasterCycles());
        return ppu->ReadStatus(flag);
    }
    return ppu->ReadRegister(addr);
}

void Emulator::WritePPU(uint16_t addr, uint8_t value) {
    ppu->WriteRegister(addr, value);
    if ((addr & 0x07) == 0x00) {
        vblank->RecordEnableWrite(clock->GetMasterCycles(), ppu->IsNmiEnabled());
    }
}

/**
 * I/O Register Router ($4000-$401F)
 *
 * Only the DMC, OAM DMA and controller ports are modelled; everything else
 * reads as open bus and ignores writes.
 */
uint8_t Emulator::ReadIO(uint16_t addr) {
    switch (addr) {
        case 0x4015:
            // Bit 5 is not driven
            return dmc->ReadStatus() | (bus->GetOpenBus() & 0x20);
        case 0x4016:
            return joypads[0]->Read();
        case 0x4017:
            return joypads[1]->Read();
        default:
            return bus->GetOpenBus();
    }
}

void Emulator::WriteIO(uint16_t addr, uint8_t value) {
    switch (addr) {
        case 0x4010:
        case 0x4011:
        case 0x4012:
        case 0x4013:
        case 0x4015:
            dmc->WriteRegister(addr, value);
            break;
        case 0x4014:
            DmaArbiter::TriggerBulkCopy(*dma, value, clock->IsOddCpuCycle());
            break;
        case 0x4016:
            joypads[0]->WriteStrobe(value);
            joypads[1]->WriteStrobe(value);
            break;
        default:
            break;
    }
}

void Emulator::SetButton(uint8_t port, uint8_t button, bool pressed) {
    joypads[port & 1]->SetButton(button, pressed);
}

uint64_t Emulator::GetCpuCycles() const {
    return clock->GetCpuCycles();
}

uint8_t Emulator::DebugRead(uint16_t addr) const {
    if (addr < 0x2000) return memory->ReadRAM(addr);
    return bus->GetOpenBus();
}

void Emulator::SaveState(StateWriter& out) const {
    clock->SaveState(out);
    ppu->SaveState(out);
    vblank->SaveState(out);
    dma->oam.SaveState(out);
    dma->dmc.SaveState(out);
    dma->ledger.SaveState(out);
    dmc->SaveState(out);
    joypads[0]->SaveState(out);
    joypads[1]->SaveState(out);
    bus->SaveState(out);
    memory->SaveState(out);
    out.Bool(signals.halt);
    out.Bool(signals.nmi);
    out.Bool(signals.irq);
    out.U64(halted_cycles);
}

void Emulator::LoadState(StateReader& in) {
    clock->LoadState(in);
    ppu->LoadState(in);
    vblank->LoadState(in);
    dma->oam.LoadState(in);
    dma->dmc.LoadState(in);
    dma->ledger.LoadState(in);
    dmc->LoadState(in);
    joypads[0]->LoadState(in);
    joypads[1]->LoadState(in);
    bus->LoadState(in);
    memory->LoadState(in);
    signals.halt = in.Bool();
    signals.nmi = in.Bool();
    signals.irq = in.Bool();
    halted_cycles = in.U64();

    // A paused copy with no sample fetch in flight would hold halt forever
    if (!DmaArbiter::IsConsistent(*dma)) in.Fail();
}
