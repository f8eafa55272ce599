#include <gtest/gtest.h>

#include "MemoryBus.hpp"
#include "TestHelpers.hpp"

class MemoryBusTest : public ::testing::Test {
protected:
  std::unique_ptr<MemoryBus> bus;

  void SetUp() override { bus = makeBus(); }
};

// ============================================================================
// Power-on state
// ============================================================================

TEST_F(MemoryBusTest, PowerOn_RegistersMatchPostBootValues) {
  EXPECT_EQ(bus->read8(TIMA), 0x00);
  EXPECT_EQ(bus->read8(TMA), 0x00);
  EXPECT_EQ(bus->read8(TAC), 0xF8);
  EXPECT_EQ(bus->read8(LCDC), 0x91);
  EXPECT_EQ(bus->read8(SCY), 0x00);
  EXPECT_EQ(bus->read8(SCX), 0x00);
  EXPECT_EQ(bus->read8(LYC), 0x00);
  EXPECT_EQ(bus->read8(BGP), 0xFC);
  EXPECT_EQ(bus->read8(OBP0), 0xFF);
  EXPECT_EQ(bus->read8(OBP1), 0xFF);
  EXPECT_EQ(bus->read8(WY), 0x00);
  EXPECT_EQ(bus->read8(WX), 0x00);
  EXPECT_EQ(bus->read8(INTERRUPT_FLAG), 0xE1);
  EXPECT_EQ(bus->read8(INTERRUPT_ENABLE), 0x00);
  EXPECT_EQ(bus->read8(JOYPAD), 0xCF);
  EXPECT_EQ(bus->read8(SERIAL_DATA), 0x00);
  EXPECT_EQ(bus->read8(SERIAL_CONTROL), 0x7E);
  EXPECT_EQ(bus->read8(DIVIDER), 0xAB);
}

// ============================================================================
// Unmapped regions
// ============================================================================

TEST_F(MemoryBusTest, Unmapped_WriteThenRead_ReturnsFF) {
  const WORD addresses[] = {0xFEA0, 0xFEFF, 0xFF03, 0xFF10, 0xFF26, 0xFF3F, 0xFF4C, 0xFF7F};
  for (WORD address : addresses) {
    bus->write8(address, 0x12);
    EXPECT_EQ(bus->read8(address), 0xFF) << std::hex << address;
  }
}

TEST_F(MemoryBusTest, NoCartridge_ROMAndExternalRAMReadFF) {
  MemoryBus empty;
  EXPECT_EQ(empty.read8(0x0000), 0xFF);
  EXPECT_EQ(empty.read8(0x7FFF), 0xFF);
  empty.write8(0xA000, 0x42);
  EXPECT_EQ(empty.read8(0xA000), 0xFF);
}

TEST_F(MemoryBusTest, ROMOnly_WritesIntoROMAreIgnored) {
  EXPECT_EQ(bus->read8(0x0150), 0x00);
  bus->write8(0x0150, 0x99);
  EXPECT_EQ(bus->read8(0x0150), 0x00);
}

// ============================================================================
// RAM regions
// ============================================================================

TEST_F(MemoryBusTest, WorkRAM_EchoMirrorsBothWays) {
  bus->write8(0xC123, 0x5A);
  EXPECT_EQ(bus->read8(0xE123), 0x5A);

  bus->write8(0xFDFF, 0xA5);
  EXPECT_EQ(bus->read8(0xDDFF), 0xA5);
}

TEST_F(MemoryBusTest, VideoRAM_HighRAM_AndIE_StoreValues) {
  bus->write8(0x8000, 0x11);
  bus->write8(0x9FFF, 0x22);
  bus->write8(0xFF80, 0x33);
  bus->write8(0xFFFE, 0x44);
  bus->write8(INTERRUPT_ENABLE, 0x1F);

  EXPECT_EQ(bus->read8(0x8000), 0x11);
  EXPECT_EQ(bus->read8(0x9FFF), 0x22);
  EXPECT_EQ(bus->read8(0xFF80), 0x33);
  EXPECT_EQ(bus->read8(0xFFFE), 0x44);
  EXPECT_EQ(bus->interruptEnable(), 0x1F);
}

TEST_F(MemoryBusTest, Word_AccessIsLittleEndian) {
  bus->write16(0xC000, 0xBEEF);
  EXPECT_EQ(bus->read8(0xC000), 0xEF);
  EXPECT_EQ(bus->read8(0xC001), 0xBE);
  EXPECT_EQ(bus->read16(0xC000), 0xBEEF);
}

// ============================================================================
// I/O registers
// ============================================================================

TEST_F(MemoryBusTest, InterruptFlag_UpperBitsReadAsOne) {
  bus->write8(INTERRUPT_FLAG, 0x00);
  EXPECT_EQ(bus->read8(INTERRUPT_FLAG), 0xE0);
  EXPECT_EQ(bus->interruptFlags(), 0x00);

  bus->write8(INTERRUPT_FLAG, 0xFF);
  EXPECT_EQ(bus->read8(INTERRUPT_FLAG), 0xFF);
  EXPECT_EQ(bus->interruptFlags(), 0x1F);
}

TEST_F(MemoryBusTest, RequestAndClearInterrupt_TouchOneBit) {
  bus->write8(INTERRUPT_FLAG, 0x00);
  bus->requestInterrupt(INTERRUPT_TIMER);
  bus->requestInterrupt(INTERRUPT_JOYPAD);
  EXPECT_EQ(bus->interruptFlags(), 0x14);

  bus->clearInterrupt(INTERRUPT_TIMER);
  EXPECT_EQ(bus->interruptFlags(), 0x10);
}

TEST_F(MemoryBusTest, LY_IsReadOnlyFromTheCPU) {
  bus->setRegister(LY, 0x42);
  bus->write8(LY, 0x10);
  EXPECT_EQ(bus->read8(LY), 0x42);
}

TEST_F(MemoryBusTest, STAT_WriteKeepsModeAndCoincidenceBits) {
  bus->setRegister(STAT, 0x07);
  bus->write8(STAT, 0xF8);
  EXPECT_EQ(bus->getRegister(STAT), 0x7F);
  EXPECT_EQ(bus->read8(STAT), 0xFF);

  bus->write8(STAT, 0x00);
  EXPECT_EQ(bus->read8(STAT), 0x87);
}

TEST_F(MemoryBusTest, DMA_CopiesOneHundredSixtyBytesToOAM) {
  for (int i = 0; i < 0xA0; i++) {
    bus->write8(0xC000 + i, static_cast<BYTE>(i + 1));
  }
  bus->write8(DMA, 0xC0);

  for (int i = 0; i < 0xA0; i++) {
    EXPECT_EQ(bus->read8(0xFE00 + i), static_cast<BYTE>(i + 1));
  }
  EXPECT_EQ(bus->read8(DMA), 0xC0);
}

TEST_F(MemoryBusTest, Tick_RaisesTimerInterrupt) {
  bus->write8(INTERRUPT_FLAG, 0x00);
  bus->write8(DIVIDER, 0x00);
  bus->write8(TMA, 0x80);
  bus->write8(TIMA, 0xFF);
  bus->write8(TAC, 0x05);

  // 16 dots to overflow, 4 more until the reload
  bus->tick(20);

  EXPECT_TRUE(isBitSet(bus->interruptFlags(), INTERRUPT_TIMER));
  EXPECT_EQ(bus->read8(TIMA), 0x80);
}

TEST_F(MemoryBusTest, Reset_RestoresRAMAndRegisters) {
  bus->write8(0xC000, 0x12);
  bus->write8(SCX, 0x34);
  bus->write8(INTERRUPT_ENABLE, 0x05);

  bus->reset();

  EXPECT_EQ(bus->read8(0xC000), 0x00);
  EXPECT_EQ(bus->read8(SCX), 0x00);
  EXPECT_EQ(bus->read8(INTERRUPT_ENABLE), 0x00);
}
