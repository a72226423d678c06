#include <iostream>
#include <iomanip>
#include <string>
#include <stdexcept>

#include "Emulator.hpp"
#include "config/Config.hpp"
#include "config/HardwareConfig.hpp"
#include "cpu/VBlankLedger.hpp"
#include "dma/DmaArbiter.hpp"
#include "ppu/PPU.hpp"

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --config <file>       Load settings from an INI file\n"
              << "  --variant <name>      CPU variant: RP2A03E, RP2A03G, RP2A03H, RP2A07\n"
              << "  --frames <n>          Run N frames then exit (default: 60)\n"
              << "  --trace-cycles <n>    Print the first N CPU cycles\n"
              << "  --page <hh>           Source page for OAM DMA (hex, default: 02)\n"
              << "  --help                Show this help\n";
}

struct Args {
    std::string config_path;
    std::string variant;
    uint32_t frames = 60;
    uint32_t trace_cycles = 0;
    uint8_t page = 0x02;
};

bool ParseArgs(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return false;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--variant" && i + 1 < argc) {
                args.variant = argv[++i];
            } else if (arg == "--frames" && i + 1 < argc) {
                args.frames = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--trace-cycles" && i + 1 < argc) {
                args.trace_cycles = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--page" && i + 1 < argc) {
                args.page = static_cast<uint8_t>(std::stoul(argv[++i], nullptr, 16));
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return false;
        }
    }
    return true;
}

/**
 * ScriptedProcessor - Stand-in for a CPU core
 *
 * Runs only on cycles it is allowed to run. Waits without touching the bus
 * until NMI is high, then spends one cycle each on the $2002 acknowledge,
 * the OAMADDR reset and the $4014 write that starts OAM DMA.
 */
class ScriptedProcessor {
public:
    ScriptedProcessor(Emulator& emu, uint8_t page) : emu(emu), page(page) {}

    void operator()() {
        switch (step) {
            case 0:
                if (emu.GetSignals().nmi) step = 1;
                break;
            case 1:
                emu.Read(0x2002);
                step = 2;
                break;
            case 2:
                emu.Write(0x2003, 0x00);
                step = 3;
                break;
            case 3:
                emu.Write(0x4014, page);
                dma_starts++;
                step = 0;
                break;
        }
    }

    uint32_t GetDmaStarts() const { return dma_starts; }

private:
    Emulator& emu;
    uint8_t page;
    int step = 0;
    uint32_t dma_starts = 0;
};

int main(int argc, char* argv[]) {
    Args args;
    if (!ParseArgs(argc, argv, args)) {
        return 1;
    }

    Config& config = Config::Instance();
    if (!args.config_path.empty() && !config.Load(args.config_path)) {
        std::cerr << "Error: Failed to load config: " << args.config_path << "\n";
        return 1;
    }
    if (!args.variant.empty()) {
        config.Set("cpu_variant", args.variant);
    }

    HardwareConfig hardware = HardwareConfig::FromConfig(config);
    std::cout << "CPU variant: " << HardwareConfig::ToString(hardware.cpu_variant)
              << ", region: " << HardwareConfig::ToString(hardware.region) << "\n";

    Emulator emu(hardware);

    // Cartridge stand-in: sample data is the low address byte
    emu.ConnectCartridge(
        [](uint16_t addr) { return static_cast<uint8_t>(addr & 0xFF); },
        [](uint16_t, uint8_t) {}
    );

    // Source page holds 0..255
    uint16_t base = static_cast<uint16_t>(args.page) << 8;
    for (uint16_t i = 0; i < 256; i++) {
        emu.Write(base + i, static_cast<uint8_t>(i));
    }

    // NMI on, looping DMC sample at the fastest rate
    emu.Write(0x2000, 0x80);
    emu.Write(0x4010, 0x4F);
    emu.Write(0x4012, 0x00);
    emu.Write(0x4013, 0x01);
    emu.Write(0x4015, 0x10);

    ScriptedProcessor processor(emu, args.page);
    emu.ConnectProcessor([&processor]() { processor(); });

    for (uint32_t i = 0; i < args.trace_cycles; i++) {
        emu.StepCpuCycles(1);
        const DmaUnits& dma = emu.GetDma();
        const CoreSignals& signals = emu.GetSignals();
        std::cout << std::setw(8) << emu.GetCpuCycles()
                  << " halt=" << signals.halt
                  << " nmi=" << signals.nmi
                  << " oam=" << OamDma::PhaseName(dma.oam.GetPhase())
                  << " off=" << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(dma.oam.GetCurrentOffset()) << std::dec << std::setfill(' ')
                  << " dmc=" << static_cast<int>(dma.dmc.GetStallCyclesRemaining()) << "\n";
    }

    for (uint32_t frame = 0; frame < args.frames; frame++) {
        emu.RunFrame();
    }

    uint32_t checksum = 0;
    for (uint8_t value : emu.GetPPU().GetOAM()) {
        checksum = checksum * 31 + value;
    }

    std::cout << "Frames: " << emu.GetPPU().GetFrame() << "\n"
              << "CPU cycles: " << emu.GetCpuCycles() << "\n"
              << "Halted cycles: " << emu.GetHaltedCycles() << "\n"
              << "NMI assertions: " << emu.GetVBlankLedger().GetNmiEdgeCount() << "\n"
              << "OAM DMA starts: " << processor.GetDmaStarts() << "\n"
              << "OAM DMA interrupted by DMC: " << emu.GetDma().ledger.GetInterruptionCount() << "\n"
              << "OAM checksum: 0x" << std::hex << std::setw(8) << std::setfill('0')
              << checksum << std::dec << "\n";

    return 0;
}
