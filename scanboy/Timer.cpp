/*

FF04 Divider Register
FF05 Timer Counter TIMA
FF06 Timer Modulo TMA
FF07 Timer Control TAC

The divider is a 16 bit counter incremented every dot (4194304Hz). Only its
upper byte is visible at FF04, so DIV itself ticks at 16384Hz. Writing any
value to FF04 resets the whole counter to 0.

TAC bit 2 enables TIMA, bits 1 and 0 pick which divider bit clocks it:
00 -> bit 9 (4096Hz)
01 -> bit 3 (262144Hz)
10 -> bit 5 (65536Hz)
11 -> bit 7 (16384Hz)

TIMA increments on the falling edge of that bit. When it overflows it reads
0x00 for one M-cycle, then is loaded with TMA and the timer interrupt is
requested.

*/

#include "Timer.hpp"

Timer::Timer() {
    reset();
}

void Timer::reset() {
    // Divider value when the boot ROM hands over at 0x100
    divider = 0xABCC;
    counter = 0x00;
    modulo = 0x00;
    control = 0x00;
    reloadDelay = 0;
}

BYTE Timer::read8(WORD address) const {
    switch (address) {
        case DIVIDER: return divider >> 8;
        case TIMA: return counter;
        case TMA: return modulo;
        case TAC: return 0xF8 | control;
        default: return 0xFF;
    }
}

void Timer::write8(WORD address, BYTE data) {
    switch (address) {
        case DIVIDER:
            // Resetting the divider is a falling edge if the watched bit was set
            if (clockEnabled() && (divider & controlMask())) {
                incrementCounter();
            }
            divider = 0;
            break;
        case TIMA:
            counter = data;
            // A write during the overflow cycle cancels the reload
            reloadDelay = 0;
            break;
        case TMA:
            modulo = data;
            break;
        case TAC:
            control = data & 0x7;
            break;
        default:
            break;
    }
}

bool Timer::update(int cycles) {
    bool requestInterrupt = false;
    for (int i = 0; i < cycles; i++) {
        if (tick()) {
            requestInterrupt = true;
        }
    }
    return requestInterrupt;
}

WORD Timer::getDivider() const {
    return divider;
}

bool Timer::tick() {

    bool requestInterrupt = false;

    // Finish a pending overflow before looking at the divider
    if (reloadDelay > 0) {
        reloadDelay--;
        if (reloadDelay == 0) {
            counter = modulo;
            requestInterrupt = true;
        }
    }

    WORD before = divider;
    divider++;

    // bits that went from 1 to 0 on this tick
    WORD fallingEdges = before & ~divider;
    if (clockEnabled() && (fallingEdges & controlMask())) {
        incrementCounter();
    }

    return requestInterrupt;

}

void Timer::incrementCounter() {
    if (counter == 0xFF) {
        counter = 0x00;
        reloadDelay = 4;
    } else {
        counter++;
    }
}

WORD Timer::controlMask() const {
    switch (control & 0x3) {
        case 0b00: return 1 << 9;
        case 0b01: return 1 << 3;
        case 0b10: return 1 << 5;
        default: return 1 << 7;
    }
}

bool Timer::clockEnabled() const {
    // Bit 2 of TAC specifies whether timer is enabled(1) or disabled(0)
    return isBitSet(control, 2);
}
