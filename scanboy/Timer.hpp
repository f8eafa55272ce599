#ifndef SCANBOY_TIMER_HPP
#define SCANBOY_TIMER_HPP

#include "Device.hpp"

/*
DIV, TIMA, TMA and TAC (0xFF04 - 0xFF07).

update() is given elapsed dots and reports whether the timer interrupt
should be raised, so the timer never touches IF itself.
*/
class Timer : public Device {

    public:
        Timer();

        void reset();

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

        bool update(int cycles);

        WORD getDivider() const;

    private:
        WORD divider; // DIV is the upper byte
        BYTE counter;
        BYTE modulo;
        BYTE control;
        int reloadDelay; // dots left before TIMA is reloaded after overflow

        bool tick();
        void incrementCounter();
        WORD controlMask() const;
        bool clockEnabled() const;

};

#endif
