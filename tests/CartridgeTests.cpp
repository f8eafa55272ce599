#include <gtest/gtest.h>

#include "Cartridge.hpp"
#include "TestHelpers.hpp"

// Image where the first byte of every ROM bank holds the bank number
static std::vector<BYTE> makeBankedROM(BYTE type, int banks, BYTE ramSize = 0x00) {
  std::vector<BYTE> image = makeROM(type, banks);
  for (int bank = 1; bank < banks; bank++) {
    image[bank * ROM_BANK_SIZE] = static_cast<BYTE>(bank);
  }
  image[HEADER_RAM_SIZE] = ramSize;
  return image;
}

// ============================================================================
// Loading
// ============================================================================

TEST(CartridgeLoadTest, UnsupportedType_IsRejected) {
  EXPECT_EQ(loadCartridge(makeROM(0x13)), nullptr);
  EXPECT_EQ(loadCartridge(makeROM(0x1B)), nullptr);
}

TEST(CartridgeLoadTest, ImageSmallerThanHeader_IsRejected) {
  std::vector<BYTE> image(0x14F, 0x00);
  EXPECT_EQ(loadCartridge(image), nullptr);
}

TEST(CartridgeLoadTest, MissingFile_IsRejected) {
  EXPECT_EQ(loadCartridge(std::string("/nonexistent/scanboy/rom.gb")), nullptr);
}

TEST(CartridgeLoadTest, Directory_IsRejected) {
  EXPECT_EQ(loadCartridge(::testing::TempDir()), nullptr);
}

TEST(CartridgeLoadTest, SupportedTypes_PickTheirController) {
  const BYTE romOnly[] = {0x00, 0x08, 0x09};
  const BYTE mbc1[] = {0x01, 0x02, 0x03};
  const BYTE mbc2[] = {0x05, 0x06};

  for (BYTE type : romOnly) {
    std::unique_ptr<Cartridge> cart = loadCartridge(makeROM(type));
    ASSERT_NE(cart, nullptr);
    EXPECT_NE(dynamic_cast<ROMOnly*>(cart.get()), nullptr);
  }
  for (BYTE type : mbc1) {
    std::unique_ptr<Cartridge> cart = loadCartridge(makeROM(type));
    ASSERT_NE(cart, nullptr);
    EXPECT_NE(dynamic_cast<MBC1*>(cart.get()), nullptr);
  }
  for (BYTE type : mbc2) {
    std::unique_ptr<Cartridge> cart = loadCartridge(makeROM(type));
    ASSERT_NE(cart, nullptr);
    EXPECT_NE(dynamic_cast<MBC2*>(cart.get()), nullptr);
  }
}

TEST(CartridgeLoadTest, Title_StopsAtPadding) {
  std::vector<BYTE> image = makeROM();
  placeProgram(image, HEADER_TITLE, {'T', 'E', 'T', 'R', 'I', 'S'});

  std::unique_ptr<Cartridge> cart = loadCartridge(image);
  ASSERT_NE(cart, nullptr);
  EXPECT_EQ(cart->getTitle(), "TETRIS");
}

TEST(CartridgeLoadTest, ShortImage_IsPaddedToTwoBanks) {
  std::vector<BYTE> image(0x200, 0x00);
  std::unique_ptr<Cartridge> cart = loadCartridge(image);
  ASSERT_NE(cart, nullptr);
  EXPECT_EQ(cart->getROMBankCount(), 2);
  EXPECT_EQ(cart->read8(0x7FFF), 0xFF);
}

// ============================================================================
// ROM only
// ============================================================================

TEST(ROMOnlyTest, RAMVariant_StoresExternalRAM) {
  std::unique_ptr<Cartridge> plain = loadCartridge(makeROM(0x00));
  plain->write8(0xA000, 0x12);
  EXPECT_EQ(plain->read8(0xA000), 0xFF);

  std::unique_ptr<Cartridge> withRAM = loadCartridge(makeROM(0x08));
  withRAM->write8(0xA000, 0x12);
  EXPECT_EQ(withRAM->read8(0xA000), 0x12);
}

// ============================================================================
// MBC1
// ============================================================================

TEST(MBC1Test, BankSwitching_MapsSelectedBank) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x01, 8));
  ASSERT_NE(cart, nullptr);

  EXPECT_EQ(cart->read8(0x4000), 1);

  cart->write8(0x2000, 0x05);
  EXPECT_EQ(cart->read8(0x4000), 5);

  cart->write8(0x3FFF, 0x02);
  EXPECT_EQ(cart->read8(0x4000), 2);

  // Fixed bank is unaffected
  EXPECT_EQ(cart->read8(0x0000), 0x00);
}

TEST(MBC1Test, BankZero_SelectsBankOne) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x01, 4));
  cart->write8(0x2000, 0x03);
  cart->write8(0x2000, 0x00);
  EXPECT_EQ(cart->read8(0x4000), 1);
}

TEST(MBC1Test, BankNumber_WrapsToROMSize) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x01, 4));
  cart->write8(0x2000, 0x06);
  EXPECT_EQ(cart->read8(0x4000), 2);
}

TEST(MBC1Test, UpperBits_ExtendROMBank) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x01, 64));
  cart->write8(0x2000, 0x01);
  cart->write8(0x4000, 0x01);
  EXPECT_EQ(cart->read8(0x4000), 33);
}

TEST(MBC1Test, RAM_OnlyAccessibleWhenEnabled) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x03, 4, 0x03));

  cart->write8(0xA000, 0x55);
  EXPECT_EQ(cart->read8(0xA000), 0xFF);

  cart->write8(0x0000, 0x0A);
  cart->write8(0xA000, 0x55);
  EXPECT_EQ(cart->read8(0xA000), 0x55);

  cart->write8(0x0000, 0x00);
  EXPECT_EQ(cart->read8(0xA000), 0xFF);

  cart->write8(0x0000, 0x0A);
  EXPECT_EQ(cart->read8(0xA000), 0x55);
}

TEST(MBC1Test, RAMBankingMode_SwitchesRAMBank) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x03, 4, 0x03));
  cart->write8(0x0000, 0x0A);
  cart->write8(0xA000, 0x11);

  cart->write8(0x6000, 0x01);
  cart->write8(0x4000, 0x02);
  EXPECT_EQ(cart->read8(0xA000), 0x00);
  cart->write8(0xA000, 0x22);

  cart->write8(0x4000, 0x00);
  EXPECT_EQ(cart->read8(0xA000), 0x11);

  cart->write8(0x4000, 0x02);
  EXPECT_EQ(cart->read8(0xA000), 0x22);
}

// ============================================================================
// MBC2
// ============================================================================

TEST(MBC2Test, AddressBit8_SelectsRegister) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x05, 8));

  // bit 8 set: ROM bank
  cart->write8(0x2100, 0x03);
  EXPECT_EQ(cart->read8(0x4000), 3);

  // bit 8 clear: RAM enable, the bank stays
  cart->write8(0x0000, 0x0A);
  EXPECT_EQ(cart->read8(0x4000), 3);

  cart->write8(0x0100, 0x00);
  EXPECT_EQ(cart->read8(0x4000), 1);
}

TEST(MBC2Test, RAM_HoldsNibbles) {
  std::unique_ptr<Cartridge> cart = loadCartridge(makeBankedROM(0x06, 4));

  cart->write8(0xA000, 0xAB);
  EXPECT_EQ(cart->read8(0xA000), 0xFF);

  cart->write8(0x0000, 0x0A);
  cart->write8(0xA000, 0xAB);
  EXPECT_EQ(cart->read8(0xA000), 0xFB);
  EXPECT_EQ(cart->read8(0xA200), 0xFB);
}
