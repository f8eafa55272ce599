#include <algorithm>

#include "Device.hpp"

using namespace std;

Memory::Memory(WORD base, int size, bool mirrored)
    : base(base), mirrored(mirrored), data(size, 0x00) {
}

BYTE Memory::read8(WORD address) const {
    int offset = address - base;
    if (mirrored) {
        offset %= data.size();
    } else if (offset < 0 || offset >= (int) data.size()) {
        return 0xFF;
    }
    return data[offset];
}

void Memory::write8(WORD address, BYTE value) {
    int offset = address - base;
    if (mirrored) {
        offset %= data.size();
    } else if (offset < 0 || offset >= (int) data.size()) {
        return;
    }
    data[offset] = value;
}

void Memory::clear() {
    fill(data.begin(), data.end(), 0x00);
}
