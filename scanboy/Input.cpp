#include "Input.hpp"

using namespace std;

InputHandler::InputHandler(MemoryBus& bus) : bus(bus), lastState(0xFF) {}

void InputHandler::addDevice(InputDevice* device) {
    if (device != nullptr) {
        devices.push_back(device);
    }
}

bool InputHandler::poll() {
    BYTE state = 0xFF;
    for (InputDevice* device : devices) {
        state &= device->buttonState();
    }

    // Bits that were 1 (released) and are now 0 (pressed)
    BYTE newlyPressed = lastState & ~state;
    lastState = state;

    Joypad& joypad = bus.getJoypad();
    joypad.setButtonState(state);

    // Only a line of a selected group can pull P1 low
    newlyPressed &= joypad.selectedButtons();

    if (newlyPressed != 0) {
        bus.requestInterrupt(INTERRUPT_JOYPAD);
        return true;
    }
    return false;
}
