#ifndef SCANBOY_TEST_HELPERS_HPP
#define SCANBOY_TEST_HELPERS_HPP

#include <initializer_list>
#include <memory>
#include <vector>

#include "Cartridge.hpp"
#include "MemoryBus.hpp"

// Zero filled ROM image (NOPs everywhere) with the given cartridge type
inline std::vector<BYTE> makeROM(BYTE type = 0x00, int banks = 2) {
    std::vector<BYTE> image(banks * ROM_BANK_SIZE, 0x00);
    image[HEADER_TYPE] = type;
    return image;
}

// Copies a program into the image at the given address
inline void placeProgram(std::vector<BYTE>& image, WORD address, std::initializer_list<BYTE> bytes) {
    for (BYTE b : bytes) {
        image[address++] = b;
    }
}

inline std::unique_ptr<MemoryBus> makeBus(const std::vector<BYTE>& image) {
    return std::make_unique<MemoryBus>(loadCartridge(image));
}

inline std::unique_ptr<MemoryBus> makeBus() {
    return makeBus(makeROM());
}

// Writes bytes through the bus, for programs placed in work RAM
inline void poke(MemoryBus& bus, WORD address, std::initializer_list<BYTE> bytes) {
    for (BYTE b : bytes) {
        bus.write8(address++, b);
    }
}

#endif
