#ifndef SCANBOY_MEMORYBUS_HPP
#define SCANBOY_MEMORYBUS_HPP

#include <memory>

#include "Cartridge.hpp"
#include "Device.hpp"
#include "Joypad.hpp"
#include "Serial.hpp"
#include "Timer.hpp"

/*
The 16 bit address space shared by the CPU and the PPU.

There is exactly one bus per session. CPU and PPU keep a reference to it and
only touch it inside their own run() calls, which the scheduler never
overlaps, so nothing here is locked.
*/
class MemoryBus {

    public:
        explicit MemoryBus(std::unique_ptr<Cartridge> cartridge = nullptr);
        MemoryBus(const MemoryBus&) = delete;
        MemoryBus& operator=(const MemoryBus&) = delete;

        void reset();

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);
        WORD read16(WORD address) const;
        void write16(WORD address, WORD data);

        // Interrupt
        void requestInterrupt(int);
        void clearInterrupt(int);
        BYTE interruptFlags() const;
        BYTE interruptEnable() const;

        // LCD registers without the CPU facing write rules (LY, STAT)
        BYTE getRegister(WORD) const;
        void setRegister(WORD, BYTE);

        // Advances timer and serial by a number of dots
        void tick(int cycles);

        Joypad& getJoypad();
        Serial& getSerial();
        Timer& getTimer();

    private:
        std::unique_ptr<Cartridge> cartridge;

        Memory videoRAM;
        Memory workRAM; // mirrored, covers the echo area too
        Memory OAM;
        Memory highRAM;

        Joypad joypad;
        Serial serial;
        Timer timer;

        BYTE LCDRegisters[0x0C]; // 0xFF40 - 0xFF4B
        BYTE interruptFlag;
        BYTE interruptEnabled;

        // Owning device of each 256 byte page, nullptr if unmapped.
        // Page 0xFF is routed by readIO/writeIO instead
        Device* pageTable[0x100];

        void mapPages(int, int, Device*);
        BYTE readIO(WORD) const;
        void writeIO(WORD, BYTE);
        void doDMATransfer(BYTE);

};

#endif
