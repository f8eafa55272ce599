#ifndef SCANBOY_JOYPAD_HPP
#define SCANBOY_JOYPAD_HPP

#include "Device.hpp"

// Bit of each button in a button state byte
enum BUTTON {
    BUTTON_RIGHT,
    BUTTON_LEFT,
    BUTTON_UP,
    BUTTON_DOWN,
    BUTTON_A,
    BUTTON_B,
    BUTTON_SELECT,
    BUTTON_START
};

/*
The joypad register (0xFF00). The button state byte is kept separately
and the register is derived from it and the group the game selects.
*/
class Joypad : public Device {

    public:
        Joypad();

        void reset();

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

        void setButtonState(BYTE);
        BYTE getButtonState() const;

        // Button bits of the groups the game currently selects
        BYTE selectedButtons() const;

    private:
        BYTE select; // bits 4 and 5 of the register, 0 = group selected
        BYTE joypadState; // 1 = unpressed

};

#endif
