#include <iostream>

#include "Serial.hpp"

using namespace std;

// 8 bits at 8192Hz
static const int TRANSFER_CYCLES = 4096;

Serial::Serial() : echo(false) {
    reset();
}

void Serial::reset() {
    data = 0x00;
    control = 0x00;
    transferCycles = 0;
}

BYTE Serial::read8(WORD address) const {
    if (address == SERIAL_DATA) return data;
    if (address == SERIAL_CONTROL) return 0x7E | control;
    return 0xFF;
}

void Serial::write8(WORD address, BYTE value) {
    if (address == SERIAL_DATA) {
        data = value;
    }

    else if (address == SERIAL_CONTROL) {
        control = value & 0x81;

        // Only an internal clock transfer ever finishes, nothing drives
        // the external clock
        if (isBitSet(control, 7) && isBitSet(control, 0)) {
            transferCycles = TRANSFER_CYCLES;
        } else {
            transferCycles = 0;
        }
    }
}

bool Serial::update(int cycles) {

    if (transferCycles == 0) return false;

    transferCycles -= cycles;
    if (transferCycles > 0) return false;

    transferCycles = 0;
    output += static_cast<char>(data);
    if (echo) {
        cout << static_cast<char>(data) << flush;
    }

    // Nobody on the other end, so ones are shifted in
    data = 0xFF;
    control = bitReset(control, 7);

    return true;

}

const string& Serial::getOutput() const {
    return output;
}

void Serial::clearOutput() {
    output.clear();
}

void Serial::setEcho(bool enabled) {
    echo = enabled;
}
