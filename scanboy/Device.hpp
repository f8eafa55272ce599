#ifndef SCANBOY_DEVICE_HPP
#define SCANBOY_DEVICE_HPP

#include <vector>

#include "Common.hpp"

/*
Anything that sits behind the memory bus. The bus hands every access in a
device's range over unchanged, so a device sees absolute addresses and may
route them further itself (a cartridge picks a ROM or RAM bank).
*/
class Device {

    public:
        virtual ~Device() {}

        virtual BYTE read8(WORD address) const = 0;
        virtual void write8(WORD address, BYTE data) = 0;

};

/*
Plain RAM window starting at a base address. With mirroring enabled,
addresses past the end wrap around (echo RAM), otherwise they are unmapped
and read as 0xFF.
*/
class Memory : public Device {

    public:
        Memory(WORD base, int size, bool mirrored = false);

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

        void clear();

    private:
        WORD base;
        bool mirrored;
        std::vector<BYTE> data;

};

#endif
