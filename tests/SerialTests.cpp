#include <cstdlib>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "CPU.hpp"
#include "PPU.hpp"
#include "Scheduler.hpp"
#include "Serial.hpp"
#include "TestHelpers.hpp"

// ============================================================================
// Serial port
// ============================================================================

TEST(SerialTest, InternalClockTransfer_CompletesAfter4096Dots) {
  Serial serial;
  serial.write8(SERIAL_DATA, 'G');
  serial.write8(SERIAL_CONTROL, 0x81);

  EXPECT_FALSE(serial.update(4095));
  EXPECT_EQ(serial.read8(SERIAL_CONTROL), 0xFF);

  EXPECT_TRUE(serial.update(1));
  EXPECT_EQ(serial.getOutput(), "G");
  EXPECT_EQ(serial.read8(SERIAL_DATA), 0xFF);
  EXPECT_EQ(serial.read8(SERIAL_CONTROL), 0x7F);
}

TEST(SerialTest, ExternalClockTransfer_NeverCompletes) {
  Serial serial;
  serial.write8(SERIAL_DATA, 'X');
  serial.write8(SERIAL_CONTROL, 0x80);

  EXPECT_FALSE(serial.update(100000));
  EXPECT_TRUE(serial.getOutput().empty());
}

TEST(SerialTest, ClearOutput_Empties) {
  Serial serial;
  serial.write8(SERIAL_DATA, 'a');
  serial.write8(SERIAL_CONTROL, 0x81);
  serial.update(4096);
  serial.clearOutput();
  EXPECT_TRUE(serial.getOutput().empty());
}

TEST(SerialTest, Bus_CompletionRaisesSerialInterrupt) {
  std::unique_ptr<MemoryBus> bus = makeBus();
  bus->write8(INTERRUPT_FLAG, 0x00);
  bus->write8(SERIAL_DATA, 'Z');
  bus->write8(SERIAL_CONTROL, 0x81);

  bus->tick(4096);

  EXPECT_TRUE(isBitSet(bus->interruptFlags(), INTERRUPT_SERIAL));
  EXPECT_EQ(bus->getSerial().getOutput(), "Z");
}

// ============================================================================
// Programs reporting over serial
// ============================================================================

// Prints the zero terminated string at 0x0150 through the serial port,
// waiting for each transfer, then spins forever
static std::vector<BYTE> makeSerialPrinter(const std::string& text) {
  std::vector<BYTE> image = makeROM();
  placeProgram(image, 0x0100, {
    0x21, 0x50, 0x01,   // 0100 LD HL, 0x0150
    0x2A,               // 0103 LD A, (HL+)
    0xFE, 0x00,         // 0104 CP 0x00
    0x28, 0x0E,         // 0106 JR Z, 0x0116
    0xE0, 0x01,         // 0108 LDH (SB), A
    0x3E, 0x81,         // 010A LD A, 0x81
    0xE0, 0x02,         // 010C LDH (SC), A
    0xF0, 0x02,         // 010E LDH A, (SC)
    0xCB, 0x7F,         // 0110 BIT 7, A
    0x20, 0xFA,         // 0112 JR NZ, 0x010E
    0x18, 0xED,         // 0114 JR 0x0103
    0x18, 0xFE          // 0116 JR 0x0116
  });
  for (size_t i = 0; i < text.size(); i++) {
    image[0x0150 + i] = static_cast<BYTE>(text[i]);
  }
  image[0x0150 + text.size()] = 0x00;
  return image;
}

TEST(SerialProgramTest, SyntheticTestROM_ReportsPassed) {
  std::unique_ptr<MemoryBus> bus = makeBus(makeSerialPrinter("Passed"));
  CPU cpu(*bus);
  PPU ppu(*bus);
  Scheduler scheduler(cpu, ppu, *bus);
  scheduler.setPacing(false);

  for (int frame = 0; frame < 3; frame++) {
    ASSERT_TRUE(scheduler.runFrame());
  }

  EXPECT_EQ(bus->getSerial().getOutput(), "Passed");
  EXPECT_EQ(cpu.getPC(), 0x0116);
}

// Runs a real CPU instruction test ROM when one is named in the environment
TEST(SerialProgramTest, CPUInstructionROM_ReportsPassed) {
  const char* romPath = std::getenv("SCANBOY_CPU_TEST_ROM");
  if (romPath == nullptr) {
    GTEST_SKIP() << "SCANBOY_CPU_TEST_ROM not set";
  }

  std::unique_ptr<Cartridge> cartridge = loadCartridge(std::string(romPath));
  ASSERT_NE(cartridge, nullptr);

  MemoryBus bus(std::move(cartridge));
  CPU cpu(bus);
  PPU ppu(bus);
  Scheduler scheduler(cpu, ppu, bus);
  scheduler.setPacing(false);

  // About two minutes of emulated time
  const std::string& output = bus.getSerial().getOutput();
  for (int frame = 0; frame < 60 * 120; frame++) {
    if (output.find("Passed") != std::string::npos || output.find("Failed") != std::string::npos) {
      break;
    }
    ASSERT_TRUE(scheduler.runFrame()) << output;
  }

  EXPECT_NE(output.find("Passed"), std::string::npos) << output;
}
