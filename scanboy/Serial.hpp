#ifndef SCANBOY_SERIAL_HPP
#define SCANBOY_SERIAL_HPP

#include <string>

#include "Device.hpp"

/*
Serial port (SB 0xFF01, SC 0xFF02) without a link partner. Bytes shifted out
with the internal clock are captured, which is how test ROMs report results.
*/
class Serial : public Device {

    public:
        Serial();

        void reset();

        BYTE read8(WORD address) const;
        void write8(WORD address, BYTE data);

        bool update(int cycles);

        const std::string& getOutput() const;
        void clearOutput();
        void setEcho(bool);

    private:
        BYTE data;
        BYTE control;
        int transferCycles; // dots until the current transfer completes, 0 if idle
        bool echo;
        std::string output;

};

#endif
