#include <gtest/gtest.h>

#include "CPU.hpp"
#include "TestHelpers.hpp"

/**
 * Runs small programs placed in work RAM. The cartridge is all zeros, so
 * anything in ROM is a NOP.
 */
class CPUTest : public ::testing::Test {
protected:
  std::unique_ptr<MemoryBus> bus;
  std::unique_ptr<CPU> cpu;

  void SetUp() override {
    bus = makeBus();
    bus->write8(INTERRUPT_FLAG, 0x00);
    cpu = std::make_unique<CPU>(*bus);
  }

  void load(std::initializer_list<BYTE> program) {
    poke(*bus, 0xC000, program);
    cpu->setPC(0xC000);
  }

  BYTE flags() const { return cpu->getAF() & 0xFF; }
  BYTE regA() const { return cpu->getAF() >> 8; }
};

// ============================================================================
// Reset and plain execution
// ============================================================================

TEST_F(CPUTest, Reset_HasPostBootRegisters) {
  EXPECT_EQ(cpu->getAF(), 0x01B0);
  EXPECT_EQ(cpu->getBC(), 0x0013);
  EXPECT_EQ(cpu->getDE(), 0x00D8);
  EXPECT_EQ(cpu->getHL(), 0x014D);
  EXPECT_EQ(cpu->getSP(), 0xFFFE);
  EXPECT_EQ(cpu->getPC(), 0x0100);
  EXPECT_FALSE(cpu->getIME());
  EXPECT_EQ(cpu->getRunMode(), RUNNING);
}

TEST_F(CPUTest, NOPROM_EachRunCostsOneAndAdvancesPC) {
  for (int i = 0; i < 100; i++) {
    EXPECT_EQ(cpu->run(), 1);
  }
  EXPECT_EQ(cpu->getPC(), 0x0100 + 100);
}

TEST_F(CPUTest, NOPROM_ProgramCounterWrapsAround) {
  // IE reads 0x00 (NOP) at 0xFFFF
  cpu->setPC(0xFFFF);
  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getPC(), 0x0000);
  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getPC(), 0x0001);
}

// ============================================================================
// Arithmetic and flags
// ============================================================================

TEST_F(CPUTest, ADD_SetsZeroHalfCarryAndCarry) {
  load({0x3E, 0x3A, 0x06, 0xC6, 0x80}); // LD A,0x3A; LD B,0xC6; ADD A,B
  cpu->run();
  cpu->run();
  cpu->run();
  EXPECT_EQ(regA(), 0x00);
  EXPECT_EQ(flags(), 0xB0);
}

TEST_F(CPUTest, SUB_SetsZeroAndSubtract) {
  load({0x3E, 0x3E, 0x1E, 0x3E, 0x93}); // LD A,0x3E; LD E,0x3E; SUB E
  cpu->run();
  cpu->run();
  cpu->run();
  EXPECT_EQ(regA(), 0x00);
  EXPECT_EQ(flags(), 0xC0);
}

TEST_F(CPUTest, SBC_BorrowsThroughCarry) {
  cpu->setAF(0x3B10); // carry set
  cpu->setHL(0xC100);
  bus->write8(0xC100, 0x4F);
  load({0x9E}); // SBC A,(HL)
  EXPECT_EQ(cpu->run(), 2);
  EXPECT_EQ(regA(), 0xEB);
  EXPECT_EQ(flags(), 0x70);
}

TEST_F(CPUTest, INC_KeepsCarry) {
  cpu->setAF(0x0010);
  cpu->setBC(0x0F00);
  load({0x04}); // INC B
  cpu->run();
  EXPECT_EQ(cpu->getBC(), 0x1000);
  EXPECT_EQ(flags(), 0x30);
}

TEST_F(CPUTest, DAA_CorrectsAfterAddition) {
  load({0x3E, 0x45, 0xC6, 0x38, 0x27}); // LD A,0x45; ADD A,0x38; DAA
  cpu->run();
  cpu->run();
  cpu->run();
  EXPECT_EQ(regA(), 0x83);
  EXPECT_FALSE(isBitSet(flags(), FLAG_CARRY));
}

TEST_F(CPUTest, DAA_CorrectsAfterSubtraction) {
  load({0x3E, 0x83, 0xD6, 0x38, 0x27}); // LD A,0x83; SUB 0x38; DAA
  cpu->run();
  cpu->run();
  cpu->run();
  EXPECT_EQ(regA(), 0x45);
}

TEST_F(CPUTest, ADD_HL_SetsHalfCarryFromBit11) {
  cpu->setAF(0x0080); // zero set, must survive
  cpu->setHL(0x8A23);
  cpu->setBC(0x0605);
  load({0x09}); // ADD HL,BC
  EXPECT_EQ(cpu->run(), 2);
  EXPECT_EQ(cpu->getHL(), 0x9028);
  EXPECT_EQ(flags(), 0xA0);
}

TEST_F(CPUTest, ADD_SP_UsesSignedOffset) {
  cpu->setSP(0xFFF8);
  load({0xE8, 0x02}); // ADD SP,2
  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(cpu->getSP(), 0xFFFA);
  EXPECT_EQ(flags(), 0x00);

  cpu->setSP(0x0005);
  load({0xF8, 0xFE}); // LD HL,SP-2
  EXPECT_EQ(cpu->run(), 3);
  EXPECT_EQ(cpu->getHL(), 0x0003);
  EXPECT_EQ(flags(), 0x30);
}

TEST_F(CPUTest, CB_RotateAndSwapOnMemory) {
  cpu->setHL(0xC100);
  bus->write8(0xC100, 0x85);
  load({0xCB, 0x06, 0xCB, 0x36}); // RLC (HL); SWAP (HL)
  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(bus->read8(0xC100), 0x0B);
  EXPECT_EQ(flags(), 0x10);

  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(bus->read8(0xC100), 0xB0);
  EXPECT_EQ(flags(), 0x00);
}

TEST_F(CPUTest, CB_ResetBitOnLowRegister) {
  cpu->setHL(0xFFFF);
  load({0xCB, 0x85}); // RES 0,L
  cpu->run();
  EXPECT_EQ(cpu->getHL(), 0xFFFE);
}

TEST_F(CPUTest, CB_BitTestKeepsCarry) {
  cpu->setAF(0x8010);
  load({0xCB, 0x7F}); // BIT 7,A
  cpu->run();
  EXPECT_EQ(flags(), 0x30);
}

// ============================================================================
// Stack and jumps
// ============================================================================

TEST_F(CPUTest, POP_AF_MasksLowNibble) {
  cpu->setSP(0xDFF0);
  bus->write16(0xDFF0, 0x12FF);
  load({0xF1}); // POP AF
  EXPECT_EQ(cpu->run(), 3);
  EXPECT_EQ(cpu->getAF(), 0x12F0);
  EXPECT_EQ(cpu->getSP(), 0xDFF2);
}

TEST_F(CPUTest, PUSH_StoresHighByteFirst) {
  cpu->setSP(0xDFF0);
  cpu->setDE(0xABCD);
  load({0xD5}); // PUSH DE
  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(cpu->getSP(), 0xDFEE);
  EXPECT_EQ(bus->read8(0xDFEF), 0xAB);
  EXPECT_EQ(bus->read8(0xDFEE), 0xCD);
}

TEST_F(CPUTest, CALL_ThenRET_ReturnsAfterCall) {
  cpu->setSP(0xDFF0);
  load({0xCD, 0x00, 0xC1}); // CALL 0xC100
  poke(*bus, 0xC100, {0xC9}); // RET

  EXPECT_EQ(cpu->run(), 6);
  EXPECT_EQ(cpu->getPC(), 0xC100);
  EXPECT_EQ(bus->read16(0xDFEE), 0xC003);

  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(cpu->getPC(), 0xC003);
  EXPECT_EQ(cpu->getSP(), 0xDFF0);
}

TEST_F(CPUTest, JR_NegativeOffsetJumpsBack) {
  load({0x00, 0x18, 0xFD}); // NOP; JR -3
  cpu->run();
  cpu->run();
  EXPECT_EQ(cpu->getPC(), 0xC000);
}

TEST_F(CPUTest, RST_JumpsToEncodedVector) {
  cpu->setSP(0xDFF0);
  load({0xEF}); // RST 0x28
  EXPECT_EQ(cpu->run(), 4);
  EXPECT_EQ(cpu->getPC(), 0x0028);
  EXPECT_EQ(bus->read16(0xDFEE), 0xC001);
}

// ============================================================================
// Interrupts
// ============================================================================

TEST_F(CPUTest, Halted_PendingInterruptIsDispatchedByPriority) {
  cpu->setSP(0xDFF0);
  cpu->setIME(true);
  bus->write8(INTERRUPT_ENABLE, 0x1F);
  load({0x76, 0x00}); // HALT; NOP

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), HALTED);

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), HALTED);

  bus->requestInterrupt(INTERRUPT_JOYPAD);
  bus->requestInterrupt(INTERRUPT_TIMER);
  bus->requestInterrupt(INTERRUPT_STAT);

  EXPECT_EQ(cpu->run(), 5);
  EXPECT_EQ(cpu->getRunMode(), RUNNING);
  EXPECT_EQ(cpu->getPC(), 0x0048);
  EXPECT_FALSE(cpu->getIME());
  EXPECT_EQ(bus->interruptFlags(), 0x14);
  EXPECT_EQ(bus->read16(cpu->getSP()), 0xC001);
}

TEST_F(CPUTest, Halted_InterruptsDisabledResumesWithoutDispatch) {
  bus->write8(INTERRUPT_ENABLE, 0x04);
  load({0x76, 0x00}); // HALT; NOP

  cpu->run();
  bus->requestInterrupt(INTERRUPT_TIMER);

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), RUNNING);
  EXPECT_EQ(cpu->getPC(), 0xC001);
  EXPECT_TRUE(isBitSet(bus->interruptFlags(), INTERRUPT_TIMER));

  cpu->run();
  EXPECT_EQ(cpu->getPC(), 0xC002);
}

TEST_F(CPUTest, Halted_NotEnabledInterruptKeepsHalting) {
  cpu->setIME(true);
  bus->write8(INTERRUPT_ENABLE, 0x01);
  load({0x76});
  cpu->run();

  bus->requestInterrupt(INTERRUPT_SERIAL);
  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), HALTED);
}

TEST_F(CPUTest, Running_VBlankWinsOverJoypad) {
  cpu->setSP(0xDFF0);
  cpu->setIME(true);
  bus->write8(INTERRUPT_ENABLE, 0x1F);
  bus->requestInterrupt(INTERRUPT_JOYPAD);
  bus->requestInterrupt(INTERRUPT_VBLANK);
  load({0x00});

  EXPECT_EQ(cpu->run(), 5);
  EXPECT_EQ(cpu->getPC(), 0x0040);
  EXPECT_EQ(bus->interruptFlags(), 0x10);
}

TEST_F(CPUTest, EI_TakesEffectAfterNextInstruction) {
  cpu->setSP(0xDFF0);
  bus->write8(INTERRUPT_ENABLE, 0x01);
  bus->requestInterrupt(INTERRUPT_VBLANK);
  load({0xFB, 0x00, 0x00}); // EI; NOP; NOP

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_FALSE(cpu->getIME());
  EXPECT_EQ(cpu->getPC(), 0xC001);

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_TRUE(cpu->getIME());
  EXPECT_EQ(cpu->getPC(), 0xC002);

  EXPECT_EQ(cpu->run(), 5);
  EXPECT_EQ(cpu->getPC(), 0x0040);
  EXPECT_EQ(bus->read16(cpu->getSP()), 0xC002);
}

TEST_F(CPUTest, DI_CancelsPendingEI) {
  load({0xFB, 0xF3, 0x00}); // EI; DI; NOP
  cpu->run();
  cpu->run();
  cpu->run();
  EXPECT_FALSE(cpu->getIME());
}

TEST_F(CPUTest, RETI_EnablesInterruptsImmediately) {
  cpu->setSP(0xDFF0);
  bus->write16(0xDFF0, 0xC123);
  load({0xD9}); // RETI
  EXPECT_EQ(cpu->run(), 4);
  EXPECT_TRUE(cpu->getIME());
  EXPECT_EQ(cpu->getPC(), 0xC123);
}

// ============================================================================
// STOP and undefined opcodes
// ============================================================================

TEST_F(CPUTest, STOP_WaitsForJoypad) {
  load({0x10, 0x00, 0x00}); // STOP; NOP
  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), STOPPED);
  EXPECT_EQ(cpu->getPC(), 0xC002);

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), STOPPED);
  EXPECT_EQ(cpu->getPC(), 0xC002);

  bus->requestInterrupt(INTERRUPT_JOYPAD);
  cpu->run();
  EXPECT_EQ(cpu->getRunMode(), RUNNING);
}

TEST_F(CPUTest, STOP_IgnoresEarlierJoypadRequest) {
  bus->requestInterrupt(INTERRUPT_JOYPAD);
  load({0x10, 0x00});

  cpu->run();
  EXPECT_FALSE(isBitSet(bus->interruptFlags(), INTERRUPT_JOYPAD));

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), STOPPED);
}

TEST_F(CPUTest, STOP_EndsOnWake) {
  load({0x10, 0x00});
  cpu->run();
  cpu->wake();
  EXPECT_EQ(cpu->getRunMode(), RUNNING);
}

TEST_F(CPUTest, UndefinedOpcode_LocksTheCPU) {
  load({0x00, 0xDD, 0x00});
  cpu->run();

  EXPECT_EQ(cpu->run(), 1);
  EXPECT_EQ(cpu->getRunMode(), LOCKED);
  EXPECT_EQ(cpu->getLockedOpcode(), 0xDD);
  EXPECT_EQ(cpu->getLockedAddress(), 0xC001);

  EXPECT_EQ(cpu->run(), 0);
  EXPECT_EQ(cpu->run(), 0);
  EXPECT_EQ(cpu->getPC(), 0xC002);
}

TEST_F(CPUTest, UndefinedOpcode_AllElevenLock) {
  const BYTE undefined[] = {0xD3, 0xDB, 0xDD, 0xE3, 0xE4, 0xEB, 0xEC, 0xED, 0xF4, 0xFC, 0xFD};
  for (BYTE opcode : undefined) {
    CPU fresh(*bus);
    poke(*bus, 0xC000, {opcode});
    fresh.setPC(0xC000);
    fresh.run();
    EXPECT_EQ(fresh.getRunMode(), LOCKED) << std::hex << (int) opcode;
  }
}

TEST_F(CPUTest, Locked_IgnoresPendingInterrupts) {
  cpu->setIME(true);
  bus->write8(INTERRUPT_ENABLE, 0x1F);
  load({0xFC});
  cpu->run();

  bus->requestInterrupt(INTERRUPT_VBLANK);
  EXPECT_EQ(cpu->run(), 0);
  EXPECT_EQ(cpu->getPC(), 0xC001);
}
