/*

JOYPAD REGISTER
                    7
                    6
      |-------------5
      |        |----4
Start | Down   |    3
Select| Up     |    2
B     | Left   |    1
A     | Right  |    0

Bits 4 and 5 select the directional or the action buttons (0 = selected),
bits 0-3 are the buttons themselves. A button reads 0 when pressed.

Directly modifying the register on key presses is awkward, so the buttons
are kept in one byte:

Start   Select  B   A   Down    Up  Left    Right   Keys
7       6       5   4   3       2   1       0       Bits

and the register is derived from it whenever the game reads 0xFF00.

*/

#include "Joypad.hpp"

Joypad::Joypad() {
    reset();
}

void Joypad::reset() {
    select = 0x00;
    joypadState = 0xFF;
}

BYTE Joypad::read8(WORD address) const {

    if (address != JOYPAD) return 0xFF;

    BYTE lines = 0x0F;

    // If program requests for directional buttons
    if (!isBitSet(select, 4)) {
        lines &= joypadState & 0x0F;
    }

    // If program requests for normal buttons
    if (!isBitSet(select, 5)) {
        lines &= joypadState >> 4;
    }

    return 0xC0 | select | lines;

}

void Joypad::write8(WORD address, BYTE data) {
    if (address == JOYPAD) {
        select = data & 0x30;
    }
}

void Joypad::setButtonState(BYTE state) {
    joypadState = state;
}

BYTE Joypad::getButtonState() const {
    return joypadState;
}

BYTE Joypad::selectedButtons() const {
    BYTE buttons = 0x00;

    if (!isBitSet(select, 4)) {
        buttons |= 0x0F;
    }
    if (!isBitSet(select, 5)) {
        buttons |= 0xF0;
    }

    return buttons;
}
