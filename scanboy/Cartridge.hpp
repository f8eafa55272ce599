#ifndef SCANBOY_CARTRIDGE_HPP
#define SCANBOY_CARTRIDGE_HPP

#include <memory>
#include <string>
#include <vector>

#include "Device.hpp"

// Cartridge header locations
#define HEADER_TITLE 0x134
#define HEADER_TYPE 0x147
#define HEADER_ROM_SIZE 0x148
#define HEADER_RAM_SIZE 0x149
#define HEADER_END 0x150

#define ROM_BANK_SIZE 0x4000
#define RAM_BANK_SIZE 0x2000

// Largest image loadCartridge(path) accepts (8 MiB)
#define MAX_ROM_SIZE 0x800000

/*
Cartridge ROM (0x0000-0x7FFF) and external RAM (0xA000-0xBFFF). Writes into
the ROM range are not stored; they drive the memory bank controller.
*/
class Cartridge : public Device {

    public:
        explicit Cartridge(const std::vector<BYTE>& image);

        std::string getTitle() const;
        BYTE getType() const;
        int getROMBankCount() const;

    protected:
        std::vector<BYTE> rom;
        std::vector<BYTE> ram;
        int romBanks;

        BYTE readROM(int bank, WORD address) const;

};

class ROMOnly : public Cartridge {

    public:
        explicit ROMOnly(const std::vector<BYTE>& image);

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

};

class MBC1 : public Cartridge {

    public:
        explicit MBC1(const std::vector<BYTE>& image);

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

    private:
        BYTE currentROMBank; // lower 5 bits of the ROM bank number, never 0
        BYTE bankHigh; // 2 bit register, upper ROM bits or RAM bank
        bool enableRAM;
        bool ROMBanking;

        void handleBanking(WORD, BYTE);
        void doRAMBankEnable(BYTE);
        void doChangeLoROMBank(BYTE);
        void doChangeHiBank(BYTE);
        void doChangeROMRAMMode(BYTE);

        int currentRAMBank() const;
        int RAMOffset(WORD) const;

};

class MBC2 : public Cartridge {

    public:
        explicit MBC2(const std::vector<BYTE>& image);

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

    private:
        BYTE currentROMBank;
        bool enableRAM;

};

// Returns nullptr (after printing why) if the image cannot be used
std::unique_ptr<Cartridge> loadCartridge(const std::string& filePath);
std::unique_ptr<Cartridge> loadCartridge(const std::vector<BYTE>& image);

#endif
