#include <gtest/gtest.h>

#include "apu/DmcChannel.hpp"

namespace {

TEST(DmcChannelTest, NoRequestAfterReset) {
    DmcChannel dmc;
    EXPECT_FALSE(dmc.IsFetchRequested());
    EXPECT_EQ(dmc.GetBytesRemaining(), 0);
    EXPECT_EQ(dmc.ReadStatus(), 0x00);
    EXPECT_FALSE(dmc.IsInterruptRequested());
}

TEST(DmcChannelTest, SampleAddressAndLengthEncoding) {
    EXPECT_EQ(DmcChannel::SampleAddress(0x00), 0xC000);
    EXPECT_EQ(DmcChannel::SampleAddress(0x01), 0xC040);
    EXPECT_EQ(DmcChannel::SampleAddress(0xFF), 0xFFC0);
    EXPECT_EQ(DmcChannel::SampleLength(0x00), 1);
    EXPECT_EQ(DmcChannel::SampleLength(0x01), 17);
    EXPECT_EQ(DmcChannel::SampleLength(0xFF), 4081);
}

TEST(DmcChannelTest, EnableStartsSampleAndRequestsFetch) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4012, 0x02);
    dmc.WriteRegister(0x4013, 0x01);
    dmc.WriteRegister(0x4015, 0x10);

    EXPECT_EQ(dmc.GetCurrentAddress(), 0xC080);
    EXPECT_EQ(dmc.GetBytesRemaining(), 17);
    EXPECT_EQ(dmc.ReadStatus() & 0x10, 0x10);
    EXPECT_TRUE(dmc.IsFetchRequested());

    dmc.AcknowledgeFetchRequest();
    EXPECT_FALSE(dmc.IsFetchRequested());
    EXPECT_TRUE(dmc.IsFetchPending());
}

TEST(DmcChannelTest, DeliveryAdvancesReader) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4013, 0x01);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.AcknowledgeFetchRequest();
    dmc.LoadSampleByte(0x55);

    EXPECT_FALSE(dmc.IsFetchPending());
    EXPECT_EQ(dmc.GetCurrentAddress(), 0xC001);
    EXPECT_EQ(dmc.GetBytesRemaining(), 16);
    // Buffer is full until the output unit takes it
    EXPECT_FALSE(dmc.IsFetchRequested());
}

TEST(DmcChannelTest, AddressWrapsToEightThousand) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4012, 0xFF);
    dmc.WriteRegister(0x4013, 0x04);
    dmc.WriteRegister(0x4015, 0x10);

    for (int i = 0; i < 64; i++) {
        dmc.LoadSampleByte(0x00);
    }
    EXPECT_EQ(dmc.GetCurrentAddress(), 0x8000);
    EXPECT_EQ(dmc.GetBytesRemaining(), 1);
}

TEST(DmcChannelTest, OutputUnitDrainsBufferAndRequestsAgain) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4010, 0x0F);
    dmc.WriteRegister(0x4013, 0x01);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.AcknowledgeFetchRequest();
    dmc.LoadSampleByte(0xFF);

    int cycles = 0;
    while (!dmc.IsFetchRequested() && cycles < 10000) {
        dmc.Step();
        cycles++;
    }
    EXPECT_TRUE(dmc.IsFetchRequested());
    EXPECT_FALSE(dmc.IsSilenced());
}

TEST(DmcChannelTest, EndOfSampleRaisesIrq) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4010, 0x80);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.LoadSampleByte(0x00);

    EXPECT_EQ(dmc.GetBytesRemaining(), 0);
    EXPECT_TRUE(dmc.IsInterruptRequested());
    EXPECT_EQ(dmc.ReadStatus(), 0x80);

    // Any $4015 write acknowledges
    dmc.WriteRegister(0x4015, 0x00);
    EXPECT_FALSE(dmc.IsInterruptRequested());
}

TEST(DmcChannelTest, ClearingIrqEnableAcknowledges) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4010, 0x80);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.LoadSampleByte(0x00);
    ASSERT_TRUE(dmc.IsInterruptRequested());

    dmc.WriteRegister(0x4010, 0x00);
    EXPECT_FALSE(dmc.IsInterruptRequested());
}

TEST(DmcChannelTest, LoopingSampleRestarts) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4010, 0xC0);
    dmc.WriteRegister(0x4012, 0x01);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.LoadSampleByte(0x00);

    EXPECT_FALSE(dmc.IsInterruptRequested());
    EXPECT_EQ(dmc.GetBytesRemaining(), 1);
    EXPECT_EQ(dmc.GetCurrentAddress(), 0xC040);
}

TEST(DmcChannelTest, DisableStopsReader) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4013, 0x10);
    dmc.WriteRegister(0x4015, 0x10);
    ASSERT_TRUE(dmc.IsFetchRequested());

    dmc.WriteRegister(0x4015, 0x00);
    EXPECT_EQ(dmc.GetBytesRemaining(), 0);
    EXPECT_FALSE(dmc.IsFetchRequested());
    EXPECT_EQ(dmc.ReadStatus() & 0x10, 0x00);
}

TEST(DmcChannelTest, EnableWhileBytesRemainDoesNotRestart) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4013, 0x01);
    dmc.WriteRegister(0x4015, 0x10);
    dmc.LoadSampleByte(0x00);
    ASSERT_EQ(dmc.GetBytesRemaining(), 16);

    dmc.WriteRegister(0x4015, 0x10);
    EXPECT_EQ(dmc.GetBytesRemaining(), 16);
    EXPECT_EQ(dmc.GetCurrentAddress(), 0xC001);
}

TEST(DmcChannelTest, RateTablesPerRegion) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4010, 0x00);
    EXPECT_EQ(dmc.GetTimerPeriod(), 428);
    dmc.WriteRegister(0x4010, 0x0F);
    EXPECT_EQ(dmc.GetTimerPeriod(), 54);

    dmc.Reset(VideoRegion::PAL);
    dmc.WriteRegister(0x4010, 0x00);
    EXPECT_EQ(dmc.GetTimerPeriod(), 398);
    dmc.WriteRegister(0x4010, 0x0F);
    EXPECT_EQ(dmc.GetTimerPeriod(), 50);
}

TEST(DmcChannelTest, DirectLoadSetsLevel) {
    DmcChannel dmc;
    dmc.WriteRegister(0x4011, 0xFF);
    EXPECT_EQ(dmc.GetOutputLevel(), 0x7F);
}

} // namespace
