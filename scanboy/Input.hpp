#ifndef SCANBOY_INPUT_HPP
#define SCANBOY_INPUT_HPP

#include <vector>

#include "MemoryBus.hpp"

/*
A source of button presses (keyboard, test script, ...).
buttonState() returns one bit per BUTTON, 0 = pressed.
*/
class InputDevice {

    public:
        virtual ~InputDevice() {}

        virtual BYTE buttonState() const = 0;

};

/*
Merges every attached device into the joypad. A button is pressed if any
device presses it. Call poll() between scheduler ticks.
*/
class InputHandler {

    public:
        explicit InputHandler(MemoryBus& bus);

        // Devices are not owned and must outlive the handler
        void addDevice(InputDevice*);

        // Returns true if a button of a selected group went from released
        // to pressed, which also raises the joypad interrupt
        bool poll();

    private:
        MemoryBus& bus;
        std::vector<InputDevice*> devices;
        BYTE lastState;

};

#endif
