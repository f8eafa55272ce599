/*

General Memory Map:

0000-3FFF   16KB ROM Bank 00     (in cartridge, fixed at bank 00)
4000-7FFF   16KB ROM Bank 01..NN (in cartridge, switchable bank number)
8000-9FFF   8KB Video RAM (VRAM)
A000-BFFF   8KB External RAM     (in cartridge, switchable bank, if any)
C000-CFFF   4KB Work RAM Bank 0 (WRAM)
D000-DFFF   4KB Work RAM Bank 1 (WRAM)
E000-FDFF   Same as C000-DDFF (ECHO)
FE00-FE9F   Sprite Attribute Table (OAM)
FEA0-FEFF   Not Usable
FF00-FF7F   I/O Ports
FF80-FFFE   High RAM (HRAM)
FFFF        Interrupt Enable Register

Anything without an owner reads 0xFF (open bus) and ignores writes. Audio is
not emulated, so its registers (FF10-FF3F) are unmapped as well.

*/

#include <utility>

#include "MemoryBus.hpp"

using namespace std;

MemoryBus::MemoryBus(unique_ptr<Cartridge> cart)
    : cartridge(move(cart)),
      videoRAM(0x8000, 0x2000),
      workRAM(0xC000, 0x2000, true),
      OAM(0xFE00, 0xA0),
      highRAM(0xFF80, 0x7F) {

    for (int page = 0; page < 0x100; page++) {
        pageTable[page] = nullptr;
    }

    mapPages(0x00, 0x7F, cartridge.get());
    mapPages(0x80, 0x9F, &videoRAM);
    mapPages(0xA0, 0xBF, cartridge.get());
    mapPages(0xC0, 0xFD, &workRAM);
    mapPages(0xFE, 0xFE, &OAM);

    reset();

}

void MemoryBus::mapPages(int first, int last, Device* device) {
    for (int page = first; page <= last; page++) {
        pageTable[page] = device;
    }
}

void MemoryBus::reset() {

    videoRAM.clear();
    workRAM.clear();
    OAM.clear();
    highRAM.clear();

    joypad.reset();
    serial.reset();
    timer.reset();

    // Values left behind by the boot ROM
    LCDRegisters[LCDC - LCDC] = 0x91;
    LCDRegisters[STAT - LCDC] = 0x80;
    LCDRegisters[SCY - LCDC] = 0x00;
    LCDRegisters[SCX - LCDC] = 0x00;
    LCDRegisters[LY - LCDC] = 0x00;
    LCDRegisters[LYC - LCDC] = 0x00;
    LCDRegisters[DMA - LCDC] = 0xFF;
    LCDRegisters[BGP - LCDC] = 0xFC;
    LCDRegisters[OBP0 - LCDC] = 0xFF;
    LCDRegisters[OBP1 - LCDC] = 0xFF;
    LCDRegisters[WY - LCDC] = 0x00;
    LCDRegisters[WX - LCDC] = 0x00;

    interruptFlag = 0x01;
    interruptEnabled = 0x00;

}

/*
********************************************************************************
READ / WRITE
********************************************************************************
*/

BYTE MemoryBus::read8(WORD address) const {

    if (address >= 0xFF00) {
        return readIO(address);
    }

    const Device* device = pageTable[address >> 8];
    if (device == nullptr) {
        return 0xFF;
    }
    return device->read8(address);

}

void MemoryBus::write8(WORD address, BYTE data) {

    if (address >= 0xFF00) {
        writeIO(address, data);
        return;
    }

    Device* device = pageTable[address >> 8];
    if (device != nullptr) {
        device->write8(address, data);
    }

}

// Little endian, low byte at the lower address
WORD MemoryBus::read16(WORD address) const {
    WORD lowByte = read8(address);
    WORD highByte = read8(address + 1);
    return (highByte << 8) | lowByte;
}

void MemoryBus::write16(WORD address, WORD data) {
    write8(address, data & 0xFF);
    write8(address + 1, data >> 8);
}

BYTE MemoryBus::readIO(WORD address) const {

    if (address == JOYPAD) {
        return joypad.read8(address);
    }

    else if ((address == SERIAL_DATA) || (address == SERIAL_CONTROL)) {
        return serial.read8(address);
    }

    else if ((address >= DIVIDER) && (address <= TAC)) {
        return timer.read8(address);
    }

    // Only the lower 5 bits exist
    else if (address == INTERRUPT_FLAG) {
        return 0xE0 | interruptFlag;
    }

    else if (address == STAT) {
        return 0x80 | LCDRegisters[STAT - LCDC];
    }

    else if ((address >= LCDC) && (address <= WX)) {
        return LCDRegisters[address - LCDC];
    }

    else if ((address >= 0xFF80) && (address <= 0xFFFE)) {
        return highRAM.read8(address);
    }

    else if (address == INTERRUPT_ENABLE) {
        return interruptEnabled;
    }

    return 0xFF;

}

void MemoryBus::writeIO(WORD address, BYTE data) {

    if (address == JOYPAD) {
        joypad.write8(address, data);
    }

    else if ((address == SERIAL_DATA) || (address == SERIAL_CONTROL)) {
        serial.write8(address, data);
    }

    else if ((address >= DIVIDER) && (address <= TAC)) {
        timer.write8(address, data);
    }

    else if (address == INTERRUPT_FLAG) {
        interruptFlag = data & 0x1F;
    }

    // Mode and coincidence bits belong to the PPU
    else if (address == STAT) {
        BYTE status = LCDRegisters[STAT - LCDC];
        LCDRegisters[STAT - LCDC] = (status & 0x07) | (data & 0x78);
    }

    // LY is read only
    else if (address == LY) {}

    // launches a DMA to fill the Sprite Attribute table
    else if (address == DMA) {
        LCDRegisters[DMA - LCDC] = data;
        doDMATransfer(data);
    }

    else if ((address >= LCDC) && (address <= WX)) {
        LCDRegisters[address - LCDC] = data;
    }

    else if ((address >= 0xFF80) && (address <= 0xFFFE)) {
        highRAM.write8(address, data);
    }

    else if (address == INTERRUPT_ENABLE) {
        interruptEnabled = data;
    }

}

/*
Data written to the DMA register is the upper byte of the source address.
Exactly 160 bytes are copied to 0xFE00-FE9F. The copy is done at once; the
real transfer takes 160 M-cycles and blocks everything but HRAM meanwhile.
*/
void MemoryBus::doDMATransfer(BYTE data) {
    WORD address = data << 8;
    for (int i = 0x00; i < 0xA0; i++) {
        OAM.write8(0xFE00 + i, read8(address + i));
    }
}

/*
********************************************************************************
INTERRUPTS
********************************************************************************
*/

void MemoryBus::requestInterrupt(int interruptID) {
    interruptFlag = bitSet(interruptFlag, interruptID);
}

void MemoryBus::clearInterrupt(int interruptID) {
    interruptFlag = bitReset(interruptFlag, interruptID);
}

BYTE MemoryBus::interruptFlags() const {
    return interruptFlag;
}

BYTE MemoryBus::interruptEnable() const {
    return interruptEnabled;
}

/*
********************************************************************************
PPU REGISTER ACCESS
********************************************************************************
*/

BYTE MemoryBus::getRegister(WORD address) const {
    if ((address >= LCDC) && (address <= WX)) {
        return LCDRegisters[address - LCDC];
    }
    return read8(address);
}

void MemoryBus::setRegister(WORD address, BYTE data) {
    if ((address >= LCDC) && (address <= WX)) {
        LCDRegisters[address - LCDC] = data;
        return;
    }
    write8(address, data);
}

/*
********************************************************************************
DEVICES
********************************************************************************
*/

void MemoryBus::tick(int cycles) {

    if (timer.update(cycles)) {
        requestInterrupt(INTERRUPT_TIMER);
    }

    if (serial.update(cycles)) {
        requestInterrupt(INTERRUPT_SERIAL);
    }

}

Joypad& MemoryBus::getJoypad() {
    return joypad;
}

Serial& MemoryBus::getSerial() {
    return serial;
}

Timer& MemoryBus::getTimer() {
    return timer;
}
