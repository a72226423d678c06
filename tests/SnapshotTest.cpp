#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Emulator.hpp"
#include "cpu/VBlankLedger.hpp"
#include "ppu/PPU.hpp"
#include "state/Snapshot.hpp"
#include "state/StateStream.hpp"
#include "timer/MasterClock.hpp"

namespace {

// Cycle-scripted stand-in: same writes at the same CPU cycles on every run
void ConnectScript(Emulator& emu) {
    emu.ConnectCartridge(
        [](uint16_t addr) { return static_cast<uint8_t>(addr * 7); },
        [](uint16_t, uint8_t) {}
    );
    emu.ConnectProcessor([&emu]() {
        uint64_t cycle = emu.GetCpuCycles();
        if (cycle == 10) {
            emu.Write(0x2000, 0x80);
        } else if (cycle == 20) {
            emu.Write(0x4014, 0x02);
        } else if (cycle > 600 && emu.GetSignals().nmi) {
            emu.Read(0x2002);
            emu.Write(0x4014, 0x03);
        }
    });
}

void Prepare(Emulator& emu) {
    for (int i = 0; i < 0x200; i++) {
        emu.Write(static_cast<uint16_t>(0x0200 + i), static_cast<uint8_t>(i * 3));
    }
    emu.Write(0x4010, 0x4F);
    emu.Write(0x4013, 0x02);
    emu.Write(0x4015, 0x10);
}

struct Trace {
    std::vector<uint8_t> signals;
    std::vector<uint8_t> oam;
};

Trace RunTraced(Emulator& emu, uint32_t cycles) {
    Trace trace;
    for (uint32_t i = 0; i < cycles; i++) {
        emu.StepCpuCycles(1);
        const CoreSignals& s = emu.GetSignals();
        trace.signals.push_back(static_cast<uint8_t>(s.halt | (s.nmi << 1) | (s.irq << 2)));
    }
    const auto& oam = emu.GetPPU().GetOAM();
    trace.oam.assign(oam.begin(), oam.end());
    return trace;
}

// Byte offset of the OAM DMA block inside a whole snapshot
size_t OamDmaOffset(const Emulator& emu) {
    std::vector<uint8_t> prefix;
    StateWriter writer(prefix);
    emu.GetClock().SaveState(writer);
    emu.GetPPU().SaveState(writer);
    emu.GetVBlankLedger().SaveState(writer);
    return Snapshot::HEADER_SIZE + prefix.size();
}

// active, phase, interrupted phase, page, offset, u16 cycle, alignment, temp
constexpr size_t OAM_DMA_STATE_SIZE = 9;

size_t DmcDmaOffset(const Emulator& emu) {
    return OamDmaOffset(emu) + OAM_DMA_STATE_SIZE;
}

// Plain OAM DMA in flight, sample playback off
void StartBulkCopy(Emulator& emu) {
    emu.Write(0x4014, 0x02);
    emu.StepCpuCycles(10);
}

TEST(SnapshotTest, HeaderLayout) {
    Emulator emu;
    std::vector<uint8_t> data = Snapshot::Capture(emu);

    ASSERT_GT(data.size(), Snapshot::HEADER_SIZE);
    EXPECT_EQ(std::string(data.begin(), data.begin() + 4), "NDMA");
    EXPECT_EQ(data[4], Snapshot::FORMAT_VERSION);
    EXPECT_EQ(data[8], static_cast<uint8_t>(CpuVariant::RP2A03G));
    EXPECT_EQ(data[9], static_cast<uint8_t>(VideoRegion::NTSC));
    uint32_t payload = data[10] | (data[11] << 8) | (data[12] << 16) | (data[13] << 24);
    EXPECT_EQ(payload, data.size() - Snapshot::HEADER_SIZE);
}

TEST(SnapshotTest, RestoreMidTransferIsDeterministic) {
    Emulator live;
    ConnectScript(live);
    Prepare(live);
    RunTraced(live, 300);
    ASSERT_TRUE(live.GetDma().oam.IsActive());

    std::vector<uint8_t> saved = Snapshot::Capture(live);

    Emulator restored;
    ConnectScript(restored);
    ASSERT_TRUE(Snapshot::Restore(restored, saved));
    EXPECT_EQ(Snapshot::Capture(restored), saved);

    Trace a = RunTraced(live, 60000);
    Trace b = RunTraced(restored, 60000);
    EXPECT_EQ(a.signals, b.signals);
    EXPECT_EQ(a.oam, b.oam);
    EXPECT_EQ(Snapshot::Capture(live), Snapshot::Capture(restored));
    EXPECT_GT(live.GetVBlankLedger().GetNmiEdgeCount(), 0u);
}

TEST(SnapshotTest, RejectsBadMagicWithoutTouchingState) {
    Emulator emu;
    emu.StepCpuCycles(123);
    std::vector<uint8_t> before = Snapshot::Capture(emu);

    Emulator other;
    std::vector<uint8_t> data = Snapshot::Capture(other);
    data[0] = 'X';

    EXPECT_FALSE(Snapshot::Restore(emu, data));
    EXPECT_EQ(Snapshot::Capture(emu), before);
}

TEST(SnapshotTest, RejectsWrongVersion) {
    Emulator emu;
    std::vector<uint8_t> data = Snapshot::Capture(emu);
    data[4] = static_cast<uint8_t>(Snapshot::FORMAT_VERSION + 1);
    EXPECT_FALSE(Snapshot::Restore(emu, data));
}

TEST(SnapshotTest, RejectsTruncatedData) {
    Emulator emu;
    emu.StepCpuCycles(50);
    std::vector<uint8_t> before = Snapshot::Capture(emu);

    std::vector<uint8_t> data = before;
    data.pop_back();
    EXPECT_FALSE(Snapshot::Restore(emu, data));
    EXPECT_FALSE(Snapshot::Restore(emu, std::vector<uint8_t>()));
    EXPECT_EQ(Snapshot::Capture(emu), before);
}

TEST(SnapshotTest, RejectsSnapshotFromOtherRegion) {
    Emulator pal(HardwareConfig::ForVariant(CpuVariant::RP2A07));
    pal.StepCpuCycles(30000);
    ASSERT_GE(pal.GetPPU().GetScanline(), PPU::NTSC_SCANLINES);
    std::vector<uint8_t> data = Snapshot::Capture(pal);

    Emulator ntsc;
    ntsc.StepCpuCycles(40);
    std::vector<uint8_t> before = Snapshot::Capture(ntsc);

    EXPECT_FALSE(Snapshot::Restore(ntsc, data));
    EXPECT_EQ(Snapshot::Capture(ntsc), before);
    EXPECT_LT(ntsc.GetPPU().GetScanline(), PPU::NTSC_SCANLINES);
}

TEST(SnapshotTest, RejectsSnapshotFromOtherCpuVariant) {
    Emulator rev_e(HardwareConfig::ForVariant(CpuVariant::RP2A03E));
    rev_e.StepCpuCycles(100);
    std::vector<uint8_t> data = Snapshot::Capture(rev_e);

    Emulator rev_g;
    EXPECT_FALSE(Snapshot::Restore(rev_g, data));

    Emulator also_e(HardwareConfig::ForVariant(CpuVariant::RP2A03E));
    EXPECT_TRUE(Snapshot::Restore(also_e, data));
    EXPECT_EQ(also_e.GetCpuCycles(), 100u);
}

TEST(SnapshotTest, RejectsUnknownOamPhase) {
    Emulator emu;
    StartBulkCopy(emu);
    ASSERT_TRUE(emu.GetDma().oam.IsActive());
    std::vector<uint8_t> before = Snapshot::Capture(emu);

    std::vector<uint8_t> data = before;
    data[OamDmaOffset(emu) + 1] = 9;

    EXPECT_FALSE(Snapshot::Restore(emu, data));
    EXPECT_EQ(Snapshot::Capture(emu), before);

    // Still runs to completion with the state it had
    emu.StepCpuCycles(600);
    EXPECT_FALSE(emu.GetDma().oam.IsActive());
    EXPECT_FALSE(emu.GetSignals().halt);
}

TEST(SnapshotTest, RejectsPausedCopyWithoutSampleFetch) {
    Emulator emu;
    StartBulkCopy(emu);
    ASSERT_FALSE(emu.GetDma().dmc.IsActive());
    std::vector<uint8_t> before = Snapshot::Capture(emu);

    std::vector<uint8_t> data = before;
    size_t oam = OamDmaOffset(emu);
    data[oam + 1] = static_cast<uint8_t>(OamDma::Phase::PAUSED_DURING_READ);
    data[oam + 2] = static_cast<uint8_t>(OamDma::Phase::READING);

    EXPECT_FALSE(Snapshot::Restore(emu, data));
    EXPECT_EQ(Snapshot::Capture(emu), before);
}

TEST(SnapshotTest, RejectsSampleFetchStallOutOfRange) {
    Emulator emu;
    StartBulkCopy(emu);
    std::vector<uint8_t> before = Snapshot::Capture(emu);
    size_t dmc = DmcDmaOffset(emu);

    // Active with no stall cycles left
    std::vector<uint8_t> empty_stall = before;
    empty_stall[dmc] = 1;
    empty_stall[dmc + 2] = 0;
    EXPECT_FALSE(Snapshot::Restore(emu, empty_stall));

    // More stall cycles than a fetch ever takes
    std::vector<uint8_t> long_stall = before;
    long_stall[dmc + 2] = DmcDma::STALL_CYCLES + 1;
    EXPECT_FALSE(Snapshot::Restore(emu, long_stall));

    EXPECT_EQ(Snapshot::Capture(emu), before);
}

TEST(SnapshotTest, FileRoundTrip) {
    Emulator emu;
    emu.Write(0x0010, 0x99);
    emu.StepCpuCycles(77);

    std::string path = ::testing::TempDir() + "nesdma_snapshot.bin";
    ASSERT_TRUE(Snapshot::SaveToFile(emu, path));

    Emulator loaded;
    ASSERT_TRUE(Snapshot::LoadFromFile(loaded, path));
    EXPECT_EQ(loaded.GetCpuCycles(), 77u);
    EXPECT_EQ(loaded.DebugRead(0x0010), 0x99);
}

TEST(SnapshotTest, MissingFileFails) {
    Emulator emu;
    EXPECT_FALSE(Snapshot::LoadFromFile(emu, ::testing::TempDir() + "does_not_exist.bin"));
}

} // namespace
