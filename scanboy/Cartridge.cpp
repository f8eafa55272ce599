/*

Cartridge header (0x0100 - 0x014F)

0134-0143   Title (upper case ASCII, padded with 0x00)
0147        Cartridge Type
                00h ROM ONLY        08h ROM+RAM         09h ROM+RAM+BATTERY
                01h MBC1            02h MBC1+RAM        03h MBC1+RAM+BATTERY
                05h MBC2            06h MBC2+BATTERY
0148        ROM Size (32KB << n)
0149        RAM Size
                00h None    01h 2KB     02h 8KB
                03h 32KB    04h 128KB   05h 64KB

ROM bank 0 is always mapped at 0x0000-0x3FFF, the switchable bank at
0x4000-0x7FFF. External RAM banks are mapped at 0xA000-0xBFFF.

*/

#include <fstream>
#include <iostream>

#include "Cartridge.hpp"

using namespace std;

static int RAMSizeFromHeader(BYTE code) {
    switch (code) {
        case 0x01: return 0x800;
        case 0x02: return 0x2000;
        case 0x03: return 0x8000;
        case 0x04: return 0x20000;
        case 0x05: return 0x10000;
        default: return 0;
    }
}

/*
********************************************************************************
CARTRIDGE BASE
********************************************************************************
*/

Cartridge::Cartridge(const vector<BYTE>& image) : rom(image) {

    // Pad the image to whole banks so bank reads never run off the end
    int banks = (rom.size() + ROM_BANK_SIZE - 1) / ROM_BANK_SIZE;
    if (banks < 2) banks = 2;
    rom.resize(banks * ROM_BANK_SIZE, 0xFF);
    romBanks = banks;

}

string Cartridge::getTitle() const {
    string title;
    for (int i = HEADER_TITLE; i < HEADER_TITLE + 16; i++) {
        if (rom[i] == 0x00) break;
        title += static_cast<char>(rom[i]);
    }
    return title;
}

BYTE Cartridge::getType() const {
    return rom[HEADER_TYPE];
}

int Cartridge::getROMBankCount() const {
    return romBanks;
}

BYTE Cartridge::readROM(int bank, WORD address) const {
    bank %= romBanks;
    return rom[(bank * ROM_BANK_SIZE) + (address & 0x3FFF)];
}

/*
********************************************************************************
ROM ONLY
********************************************************************************
*/

ROMOnly::ROMOnly(const vector<BYTE>& image) : Cartridge(image) {
    // 0x08 and 0x09 carry 8KB of RAM without any banking
    if (getType() == 0x08 || getType() == 0x09) {
        ram.resize(RAM_BANK_SIZE, 0x00);
    }
}

BYTE ROMOnly::read8(WORD address) const {
    if (address < 0x8000) {
        return rom[address];
    }

    if ((address >= 0xA000) && (address <= 0xBFFF) && !ram.empty()) {
        return ram[address - 0xA000];
    }

    return 0xFF;
}

void ROMOnly::write8(WORD address, BYTE data) {
    if ((address >= 0xA000) && (address <= 0xBFFF) && !ram.empty()) {
        ram[address - 0xA000] = data;
    }
}

/*
********************************************************************************
MBC1
********************************************************************************
*/

MBC1::MBC1(const vector<BYTE>& image) : Cartridge(image) {
    ram.resize(RAMSizeFromHeader(rom[HEADER_RAM_SIZE]), 0x00);
    currentROMBank = 1;
    bankHigh = 0;
    enableRAM = false;
    ROMBanking = true;
}

BYTE MBC1::read8(WORD address) const {

    // Bank 0 area. In RAM banking mode the upper bits also apply here
    if (address < 0x4000) {
        int bank = ROMBanking ? 0 : (bankHigh << 5);
        return readROM(bank, address);
    }

    // Switchable ROM bank
    else if (address < 0x8000) {
        int bank = (bankHigh << 5) | currentROMBank;
        return readROM(bank, address);
    }

    // External RAM, only visible while enabled
    else if ((address >= 0xA000) && (address <= 0xBFFF)) {
        if (!enableRAM || ram.empty()) return 0xFF;
        return ram[RAMOffset(address)];
    }

    return 0xFF;

}

void MBC1::write8(WORD address, BYTE data) {

    if (address < 0x8000) {
        handleBanking(address, data);
    }

    else if ((address >= 0xA000) && (address <= 0xBFFF)) {
        if (enableRAM && !ram.empty()) {
            ram[RAMOffset(address)] = data;
        }
    }

}

void MBC1::handleBanking(WORD address, BYTE data) {
    // do RAM enabling
    if (address < 0x2000) {
        doRAMBankEnable(data);
    }

    // do ROM bank change
    else if (address < 0x4000) {
        doChangeLoROMBank(data);
    }

    // do ROM or RAM bank change
    else if (address < 0x6000) {
        doChangeHiBank(data);
    }

    // this changes whether the 2 bit register above selects
    // the upper ROM bits or the RAM bank
    else {
        doChangeROMRAMMode(data);
    }
}

void MBC1::doRAMBankEnable(BYTE data) {
    // Any value other than 0xA in the lower nibble disables RAM
    enableRAM = ((data & 0xF) == 0xA);
}

void MBC1::doChangeLoROMBank(BYTE data) {

    BYTE lower5bits = data & 0x1F;

    // if lower5bits == 0x0, gameboy automatically sets it to 0x1 as ROM 0 can
    // always be accessed from 0x0000-3FFF
    if (lower5bits == 0x0) lower5bits = 0x1;

    currentROMBank = lower5bits;

}

void MBC1::doChangeHiBank(BYTE data) {
    bankHigh = data & 0x3;
}

void MBC1::doChangeROMRAMMode(BYTE data) {

    // ROM banking mode: 0x0
    // RAM banking mode: 0x1
    ROMBanking = ((data & 0x1) == 0x0);

}

int MBC1::currentRAMBank() const {
    // In ROM banking mode only RAM bank 0 can be accessed
    return ROMBanking ? 0 : bankHigh;
}

int MBC1::RAMOffset(WORD address) const {
    int offset = (currentRAMBank() * RAM_BANK_SIZE) + (address - 0xA000);
    return offset % ram.size();
}

/*
********************************************************************************
MBC2
********************************************************************************
*/

MBC2::MBC2(const vector<BYTE>& image) : Cartridge(image) {
    // 512 x 4 bits of RAM built into the controller
    ram.resize(0x200, 0x00);
    currentROMBank = 1;
    enableRAM = false;
}

BYTE MBC2::read8(WORD address) const {

    if (address < 0x4000) {
        return readROM(0, address);
    }

    else if (address < 0x8000) {
        return readROM(currentROMBank, address);
    }

    // Only the lower nibble exists, the 512 bytes repeat across the area
    else if ((address >= 0xA000) && (address <= 0xBFFF)) {
        if (!enableRAM) return 0xFF;
        return 0xF0 | ram[address & 0x1FF];
    }

    return 0xFF;

}

void MBC2::write8(WORD address, BYTE data) {

    // Bit 8 of the address picks the register:
    // clear -> RAM enable, set -> ROM bank number
    if (address < 0x4000) {
        if (!isBitSet(address >> 8, 0)) {
            enableRAM = ((data & 0xF) == 0xA);
        } else {
            currentROMBank = data & 0xF;
            if (currentROMBank == 0x0) currentROMBank = 0x1;
        }
    }

    else if ((address >= 0xA000) && (address <= 0xBFFF)) {
        if (enableRAM) {
            ram[address & 0x1FF] = data & 0x0F;
        }
    }

}

/*
********************************************************************************
LOADING
********************************************************************************
*/

unique_ptr<Cartridge> loadCartridge(const vector<BYTE>& image) {

    if (image.size() < HEADER_END) {
        cerr << "ROM image too small: " << image.size() << " bytes" << endl;
        return nullptr;
    }

    // Choosing which MBC to use
    switch (image[HEADER_TYPE]) {
        case 0x00: case 0x08: case 0x09:
            return make_unique<ROMOnly>(image);
        case 0x01: case 0x02: case 0x03:
            return make_unique<MBC1>(image);
        case 0x05: case 0x06:
            return make_unique<MBC2>(image);
        default:
            cerr << "Unsupported cartridge type 0x" << hex
                 << (int) image[HEADER_TYPE] << dec << endl;
            return nullptr;
    }

}

unique_ptr<Cartridge> loadCartridge(const string& filePath) {

    ifstream file(filePath.c_str(), ios::binary);
    if (!file.good()) {
        cerr << "Cannot open ROM file " << filePath << endl;
        return nullptr;
    }

    // resize & read rom
    file.seekg(0, ios::end);
    streampos size = file.tellg();
    file.seekg(0, ios::beg);

    // Directories and pipes have no size
    if (static_cast<streamoff>(size) < 0 || static_cast<streamoff>(size) > MAX_ROM_SIZE) {
        cerr << "Not a usable ROM file " << filePath << endl;
        return nullptr;
    }

    vector<BYTE> image(static_cast<size_t>(size));
    file.read(reinterpret_cast<char *>(image.data()), size);
    if (!file) {
        cerr << "Failed to read ROM file " << filePath << endl;
        return nullptr;
    }

    return loadCartridge(image);

}
