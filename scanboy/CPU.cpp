#include <iomanip>
#include <iostream>

#include "CPU.hpp"

using namespace std;

/*
All cycle counts in this file are machine cycles (4 dots each).
*/

CPU::CPU(MemoryBus& bus) : bus(bus), trace(false) {
    resetCPU();
}

// State left behind by the boot ROM
void CPU::resetCPU() {
    programCounter.regstr = 0x100;
    regAF.regstr = 0x01B0;
    regBC.regstr = 0x0013;
    regDE.regstr = 0x00D8;
    regHL.regstr = 0x014D;
    stackPointer.regstr = 0xFFFE;

    InterruptMasterEnabled = false;
    enableInterruptsDelay = 0;

    runMode = RUNNING;
    lockedOpcode = 0x00;
    lockedAddress = 0x0000;
}

int CPU::run() {

    BYTE pending = bus.interruptEnable() & bus.interruptFlags() & 0x1F;

    switch (runMode) {
        case LOCKED:
            return 0;

        case STOPPED:
            // Only a button press (or wake()) ends STOP
            if (isBitSet(bus.interruptFlags(), INTERRUPT_JOYPAD)) {
                runMode = RUNNING;
            }
            return 1;

        case HALTED:
            if (pending == 0) {
                return 1;
            }
            if (InterruptMasterEnabled) {
                return dispatchInterrupt(pending);
            }
            // Interrupts disabled: wake up without servicing anything
            runMode = RUNNING;
            return 1;

        case RUNNING:
            break;
    }

    if (InterruptMasterEnabled && pending != 0) {
        return dispatchInterrupt(pending);
    }

    return executeNextOpcode();
}

void CPU::wake() {
    if (runMode == STOPPED || runMode == HALTED) {
        runMode = RUNNING;
    }
}

int CPU::executeNextOpcode() {
    WORD address = programCounter.regstr;
    BYTE opcode = bus.read8(address);
    programCounter.regstr++;

    if (trace) {
        cout << hex << uppercase << setfill('0')
             << "PC: " << setw(4) << (int) address
             << " OP: " << setw(2) << (int) opcode
             << " AF: " << setw(4) << (int) regAF.regstr
             << " BC: " << setw(4) << (int) regBC.regstr
             << " DE: " << setw(4) << (int) regDE.regstr
             << " HL: " << setw(4) << (int) regHL.regstr
             << " SP: " << setw(4) << (int) stackPointer.regstr
             << dec << endl;
    }

    int cycles = executeOpcode(opcode);

    // EI takes effect after the instruction that follows it
    if (enableInterruptsDelay > 0) {
        enableInterruptsDelay--;
        if (enableInterruptsDelay == 0) {
            InterruptMasterEnabled = true;
        }
    }

    return cycles;
}

/*
    Services the highest priority pending interrupt. Lower bit means higher
    priority, so VBlank wins over STAT, Timer, Serial and Joypad in that
    order.

    5 cycles
*/
int CPU::dispatchInterrupt(BYTE pending) {
    for (int id = INTERRUPT_VBLANK; id <= INTERRUPT_JOYPAD; id++) {
        if (isBitSet(pending, id)) {
            bus.clearInterrupt(id);
            InterruptMasterEnabled = false;
            enableInterruptsDelay = 0;
            runMode = RUNNING;

            pushWord(programCounter.regstr);

            switch (id) {
                case INTERRUPT_VBLANK: programCounter.regstr = 0x40; break;
                case INTERRUPT_STAT: programCounter.regstr = 0x48; break;
                case INTERRUPT_TIMER: programCounter.regstr = 0x50; break;
                case INTERRUPT_SERIAL: programCounter.regstr = 0x58; break;
                case INTERRUPT_JOYPAD: programCounter.regstr = 0x60; break;
            }

            return INTERRUPT_DISPATCH_CYCLES;
        }
    }
    return 0;
}

int CPU::lockUp(BYTE opcode) {
    runMode = LOCKED;
    lockedOpcode = opcode;
    lockedAddress = programCounter.regstr - 1;

    cerr << hex << uppercase << setfill('0')
         << "Undefined opcode 0x" << setw(2) << (int) opcode
         << " at 0x" << setw(4) << (int) lockedAddress
         << ", CPU locked" << dec << endl;

    return 1;
}

RUN_MODE CPU::getRunMode() const {
    return runMode;
}

BYTE CPU::getLockedOpcode() const {
    return lockedOpcode;
}

WORD CPU::getLockedAddress() const {
    return lockedAddress;
}

WORD CPU::getAF() const { return regAF.regstr; }
WORD CPU::getBC() const { return regBC.regstr; }
WORD CPU::getDE() const { return regDE.regstr; }
WORD CPU::getHL() const { return regHL.regstr; }
WORD CPU::getSP() const { return stackPointer.regstr; }
WORD CPU::getPC() const { return programCounter.regstr; }
bool CPU::getIME() const { return InterruptMasterEnabled; }

// Lower nibble of F does not exist
void CPU::setAF(WORD value) { regAF.regstr = value & 0xFFF0; }
void CPU::setBC(WORD value) { regBC.regstr = value; }
void CPU::setDE(WORD value) { regDE.regstr = value; }
void CPU::setHL(WORD value) { regHL.regstr = value; }
void CPU::setSP(WORD value) { stackPointer.regstr = value; }
void CPU::setPC(WORD value) { programCounter.regstr = value; }

void CPU::setIME(bool enabled) {
    InterruptMasterEnabled = enabled;
    enableInterruptsDelay = 0;
}

void CPU::setTrace(bool enabled) {
    trace = enabled;
}

/*
********************************************************************************
Helpers
********************************************************************************
*/

BYTE CPU::readImmediate() {
    BYTE data = bus.read8(programCounter.regstr);
    programCounter.regstr++;
    return data;
}

WORD CPU::readImmediateWord() {
    BYTE low = readImmediate();
    BYTE high = readImmediate();
    return (high << 8) | low;
}

void CPU::pushWord(WORD data) {
    stackPointer.regstr--;
    bus.write8(stackPointer.regstr, data >> 8);
    stackPointer.regstr--;
    bus.write8(stackPointer.regstr, data & 0xFF);
}

WORD CPU::popWord() {
    BYTE low = bus.read8(stackPointer.regstr);
    stackPointer.regstr++;
    BYTE high = bus.read8(stackPointer.regstr);
    stackPointer.regstr++;
    return (high << 8) | low;
}

void CPU::setFlag(int flag, bool value) {
    if (value) {
        regAF.low = bitSet(regAF.low, flag);
    } else {
        regAF.low = bitReset(regAF.low, flag);
    }
}

bool CPU::getFlag(int flag) const {
    return isBitSet(regAF.low, flag);
}

// Bits 3-4 of the conditional opcodes select NZ, Z, NC or C
bool CPU::checkCondition(BYTE opcode) const {
    switch ((opcode >> 3) & 0x03) {
        case 0: return !getFlag(FLAG_ZERO);
        case 1: return getFlag(FLAG_ZERO);
        case 2: return !getFlag(FLAG_CARRY);
        default: return getFlag(FLAG_CARRY);
    }
}

/*
********************************************************************************
Opcode dispatch
********************************************************************************
*/

int CPU::executeOpcode(BYTE opcode) {

    int cycles;

    switch (opcode) {

        /*
        ************************************************************************
        8 bit Load Commands
        ************************************************************************
        */

        // Load B, R/(HL)
        case 0x40: cycles = LD_r_R(regBC.high, regBC.high); break;
        case 0x41: cycles = LD_r_R(regBC.high, regBC.low); break;
        case 0x42: cycles = LD_r_R(regBC.high, regDE.high); break;
        case 0x43: cycles = LD_r_R(regBC.high, regDE.low); break;
        case 0x44: cycles = LD_r_R(regBC.high, regHL.high); break;
        case 0x45: cycles = LD_r_R(regBC.high, regHL.low); break;
        case 0x46: cycles = LD_r_HL(regBC.high); break;
        case 0x47: cycles = LD_r_R(regBC.high, regAF.high); break;

        // Load C, R/(HL)
        case 0x48: cycles = LD_r_R(regBC.low, regBC.high); break;
        case 0x49: cycles = LD_r_R(regBC.low, regBC.low); break;
        case 0x4A: cycles = LD_r_R(regBC.low, regDE.high); break;
        case 0x4B: cycles = LD_r_R(regBC.low, regDE.low); break;
        case 0x4C: cycles = LD_r_R(regBC.low, regHL.high); break;
        case 0x4D: cycles = LD_r_R(regBC.low, regHL.low); break;
        case 0x4E: cycles = LD_r_HL(regBC.low); break;
        case 0x4F: cycles = LD_r_R(regBC.low, regAF.high); break;

        // Load D, R/(HL)
        case 0x50: cycles = LD_r_R(regDE.high, regBC.high); break;
        case 0x51: cycles = LD_r_R(regDE.high, regBC.low); break;
        case 0x52: cycles = LD_r_R(regDE.high, regDE.high); break;
        case 0x53: cycles = LD_r_R(regDE.high, regDE.low); break;
        case 0x54: cycles = LD_r_R(regDE.high, regHL.high); break;
        case 0x55: cycles = LD_r_R(regDE.high, regHL.low); break;
        case 0x56: cycles = LD_r_HL(regDE.high); break;
        case 0x57: cycles = LD_r_R(regDE.high, regAF.high); break;

        // Load E, R/(HL)
        case 0x58: cycles = LD_r_R(regDE.low, regBC.high); break;
        case 0x59: cycles = LD_r_R(regDE.low, regBC.low); break;
        case 0x5A: cycles = LD_r_R(regDE.low, regDE.high); break;
        case 0x5B: cycles = LD_r_R(regDE.low, regDE.low); break;
        case 0x5C: cycles = LD_r_R(regDE.low, regHL.high); break;
        case 0x5D: cycles = LD_r_R(regDE.low, regHL.low); break;
        case 0x5E: cycles = LD_r_HL(regDE.low); break;
        case 0x5F: cycles = LD_r_R(regDE.low, regAF.high); break;

        // Load H, R/(HL)
        case 0x60: cycles = LD_r_R(regHL.high, regBC.high); break;
        case 0x61: cycles = LD_r_R(regHL.high, regBC.low); break;
        case 0x62: cycles = LD_r_R(regHL.high, regDE.high); break;
        case 0x63: cycles = LD_r_R(regHL.high, regDE.low); break;
        case 0x64: cycles = LD_r_R(regHL.high, regHL.high); break;
        case 0x65: cycles = LD_r_R(regHL.high, regHL.low); break;
        case 0x66: cycles = LD_r_HL(regHL.high); break;
        case 0x67: cycles = LD_r_R(regHL.high, regAF.high); break;

        // Load L, R/(HL)
        case 0x68: cycles = LD_r_R(regHL.low, regBC.high); break;
        case 0x69: cycles = LD_r_R(regHL.low, regBC.low); break;
        case 0x6A: cycles = LD_r_R(regHL.low, regDE.high); break;
        case 0x6B: cycles = LD_r_R(regHL.low, regDE.low); break;
        case 0x6C: cycles = LD_r_R(regHL.low, regHL.high); break;
        case 0x6D: cycles = LD_r_R(regHL.low, regHL.low); break;
        case 0x6E: cycles = LD_r_HL(regHL.low); break;
        case 0x6F: cycles = LD_r_R(regHL.low, regAF.high); break;

        // Load (HL), R
        case 0x70: cycles = LD_HL_r(regBC.high); break;
        case 0x71: cycles = LD_HL_r(regBC.low); break;
        case 0x72: cycles = LD_HL_r(regDE.high); break;
        case 0x73: cycles = LD_HL_r(regDE.low); break;
        case 0x74: cycles = LD_HL_r(regHL.high); break;
        case 0x75: cycles = LD_HL_r(regHL.low); break;
        case 0x77: cycles = LD_HL_r(regAF.high); break;

        // Load A, R/(HL)
        case 0x78: cycles = LD_r_R(regAF.high, regBC.high); break;
        case 0x79: cycles = LD_r_R(regAF.high, regBC.low); break;
        case 0x7A: cycles = LD_r_R(regAF.high, regDE.high); break;
        case 0x7B: cycles = LD_r_R(regAF.high, regDE.low); break;
        case 0x7C: cycles = LD_r_R(regAF.high, regHL.high); break;
        case 0x7D: cycles = LD_r_R(regAF.high, regHL.low); break;
        case 0x7E: cycles = LD_r_HL(regAF.high); break;
        case 0x7F: cycles = LD_r_R(regAF.high, regAF.high); break;

        // Load R, n
        case 0x06: cycles = LD_r_n(regBC.high); break;
        case 0x0E: cycles = LD_r_n(regBC.low); break;
        case 0x16: cycles = LD_r_n(regDE.high); break;
        case 0x1E: cycles = LD_r_n(regDE.low); break;
        case 0x26: cycles = LD_r_n(regHL.high); break;
        case 0x2E: cycles = LD_r_n(regHL.low); break;
        case 0x36: cycles = LD_HL_n(); break;
        case 0x3E: cycles = LD_r_n(regAF.high); break;

        // Load A, (BC)/(DE)/(nn)
        case 0x0A: cycles = LD_A_BC(); break;
        case 0x1A: cycles = LD_A_DE(); break;
        case 0xFA: cycles = LD_A_nn(); break;

        // Load (BC)/(DE)/(nn), A
        case 0x02: cycles = LD_BC_A(); break;
        case 0x12: cycles = LD_DE_A(); break;
        case 0xEA: cycles = LD_nn_A(); break;

        // High page loads
        case 0xF0: cycles = LD_A_FF00n(); break;
        case 0xE0: cycles = LD_FF00n_A(); break;
        case 0xF2: cycles = LD_A_FF00C(); break;
        case 0xE2: cycles = LD_FF00C_A(); break;

        // Load with increment/decrement of HL
        case 0x22: cycles = LDI_HL_A(); break;
        case 0x2A: cycles = LDI_A_HL(); break;
        case 0x32: cycles = LDD_HL_A(); break;
        case 0x3A: cycles = LDD_A_HL(); break;

        /*
        ************************************************************************
        16 bit Load Commands
        ************************************************************************
        */

        // Load rr, nn
        case 0x01: cycles = LD_rr_nn(regBC); break;
        case 0x11: cycles = LD_rr_nn(regDE); break;
        case 0x21: cycles = LD_rr_nn(regHL); break;
        case 0x31: cycles = LD_rr_nn(stackPointer); break;

        case 0xF9: cycles = LD_SP_HL(); break;
        case 0x08: cycles = LD_nn_SP(); break;

        // Push rr
        case 0xC5: cycles = PUSH_rr(regBC); break;
        case 0xD5: cycles = PUSH_rr(regDE); break;
        case 0xE5: cycles = PUSH_rr(regHL); break;
        case 0xF5: cycles = PUSH_rr(regAF); break;

        // Pop rr
        case 0xC1: cycles = POP_rr(regBC); break;
        case 0xD1: cycles = POP_rr(regDE); break;
        case 0xE1: cycles = POP_rr(regHL); break;
        case 0xF1: cycles = POP_rr(regAF); break;

        /*
        ************************************************************************
        8 bit Arithmetic/Logical Commands
        ************************************************************************
        */

        // ADD A, R/(HL)/n
        case 0x80: cycles = ADD_A_r(regBC.high); break;
        case 0x81: cycles = ADD_A_r(regBC.low); break;
        case 0x82: cycles = ADD_A_r(regDE.high); break;
        case 0x83: cycles = ADD_A_r(regDE.low); break;
        case 0x84: cycles = ADD_A_r(regHL.high); break;
        case 0x85: cycles = ADD_A_r(regHL.low); break;
        case 0x86: cycles = ADD_A_HL(); break;
        case 0x87: cycles = ADD_A_r(regAF.high); break;
        case 0xC6: cycles = ADD_A_n(); break;

        // ADC A, R/(HL)/n
        case 0x88: cycles = ADC_A_r(regBC.high); break;
        case 0x89: cycles = ADC_A_r(regBC.low); break;
        case 0x8A: cycles = ADC_A_r(regDE.high); break;
        case 0x8B: cycles = ADC_A_r(regDE.low); break;
        case 0x8C: cycles = ADC_A_r(regHL.high); break;
        case 0x8D: cycles = ADC_A_r(regHL.low); break;
        case 0x8E: cycles = ADC_A_HL(); break;
        case 0x8F: cycles = ADC_A_r(regAF.high); break;
        case 0xCE: cycles = ADC_A_n(); break;

        // SUB R/(HL)/n
        case 0x90: cycles = SUB_r(regBC.high); break;
        case 0x91: cycles = SUB_r(regBC.low); break;
        case 0x92: cycles = SUB_r(regDE.high); break;
        case 0x93: cycles = SUB_r(regDE.low); break;
        case 0x94: cycles = SUB_r(regHL.high); break;
        case 0x95: cycles = SUB_r(regHL.low); break;
        case 0x96: cycles = SUB_HL(); break;
        case 0x97: cycles = SUB_r(regAF.high); break;
        case 0xD6: cycles = SUB_n(); break;

        // SBC A, R/(HL)/n
        case 0x98: cycles = SBC_A_r(regBC.high); break;
        case 0x99: cycles = SBC_A_r(regBC.low); break;
        case 0x9A: cycles = SBC_A_r(regDE.high); break;
        case 0x9B: cycles = SBC_A_r(regDE.low); break;
        case 0x9C: cycles = SBC_A_r(regHL.high); break;
        case 0x9D: cycles = SBC_A_r(regHL.low); break;
        case 0x9E: cycles = SBC_A_HL(); break;
        case 0x9F: cycles = SBC_A_r(regAF.high); break;
        case 0xDE: cycles = SBC_A_n(); break;

        // AND R/(HL)/n
        case 0xA0: cycles = AND_r(regBC.high); break;
        case 0xA1: cycles = AND_r(regBC.low); break;
        case 0xA2: cycles = AND_r(regDE.high); break;
        case 0xA3: cycles = AND_r(regDE.low); break;
        case 0xA4: cycles = AND_r(regHL.high); break;
        case 0xA5: cycles = AND_r(regHL.low); break;
        case 0xA6: cycles = AND_HL(); break;
        case 0xA7: cycles = AND_r(regAF.high); break;
        case 0xE6: cycles = AND_n(); break;

        // XOR R/(HL)/n
        case 0xA8: cycles = XOR_r(regBC.high); break;
        case 0xA9: cycles = XOR_r(regBC.low); break;
        case 0xAA: cycles = XOR_r(regDE.high); break;
        case 0xAB: cycles = XOR_r(regDE.low); break;
        case 0xAC: cycles = XOR_r(regHL.high); break;
        case 0xAD: cycles = XOR_r(regHL.low); break;
        case 0xAE: cycles = XOR_HL(); break;
        case 0xAF: cycles = XOR_r(regAF.high); break;
        case 0xEE: cycles = XOR_n(); break;

        // OR R/(HL)/n
        case 0xB0: cycles = OR_r(regBC.high); break;
        case 0xB1: cycles = OR_r(regBC.low); break;
        case 0xB2: cycles = OR_r(regDE.high); break;
        case 0xB3: cycles = OR_r(regDE.low); break;
        case 0xB4: cycles = OR_r(regHL.high); break;
        case 0xB5: cycles = OR_r(regHL.low); break;
        case 0xB6: cycles = OR_HL(); break;
        case 0xB7: cycles = OR_r(regAF.high); break;
        case 0xF6: cycles = OR_n(); break;

        // CP R/(HL)/n
        case 0xB8: cycles = CP_r(regBC.high); break;
        case 0xB9: cycles = CP_r(regBC.low); break;
        case 0xBA: cycles = CP_r(regDE.high); break;
        case 0xBB: cycles = CP_r(regDE.low); break;
        case 0xBC: cycles = CP_r(regHL.high); break;
        case 0xBD: cycles = CP_r(regHL.low); break;
        case 0xBE: cycles = CP_HL(); break;
        case 0xBF: cycles = CP_r(regAF.high); break;
        case 0xFE: cycles = CP_n(); break;

        // Increment R/(HL)
        case 0x04: cycles = INC_r(regBC.high); break;
        case 0x0C: cycles = INC_r(regBC.low); break;
        case 0x14: cycles = INC_r(regDE.high); break;
        case 0x1C: cycles = INC_r(regDE.low); break;
        case 0x24: cycles = INC_r(regHL.high); break;
        case 0x2C: cycles = INC_r(regHL.low); break;
        case 0x34: cycles = INC_HL(); break;
        case 0x3C: cycles = INC_r(regAF.high); break;

        // Decrement R/(HL)
        case 0x05: cycles = DEC_r(regBC.high); break;
        case 0x0D: cycles = DEC_r(regBC.low); break;
        case 0x15: cycles = DEC_r(regDE.high); break;
        case 0x1D: cycles = DEC_r(regDE.low); break;
        case 0x25: cycles = DEC_r(regHL.high); break;
        case 0x2D: cycles = DEC_r(regHL.low); break;
        case 0x35: cycles = DEC_HL(); break;
        case 0x3D: cycles = DEC_r(regAF.high); break;

        case 0x27: cycles = DAA(); break;
        case 0x2F: cycles = CPL(); break;

        /*
        ************************************************************************
        16 bit Arithmetic/Logical Commands
        ************************************************************************
        */

        // Add HL, rr
        case 0x09: cycles = ADD_HL_rr(regBC.regstr); break;
        case 0x19: cycles = ADD_HL_rr(regDE.regstr); break;
        case 0x29: cycles = ADD_HL_rr(regHL.regstr); break;
        case 0x39: cycles = ADD_HL_rr(stackPointer.regstr); break;

        // Increment rr
        case 0x03: cycles = INC_rr(regBC.regstr); break;
        case 0x13: cycles = INC_rr(regDE.regstr); break;
        case 0x23: cycles = INC_rr(regHL.regstr); break;
        case 0x33: cycles = INC_rr(stackPointer.regstr); break;

        // Decrement rr
        case 0x0B: cycles = DEC_rr(regBC.regstr); break;
        case 0x1B: cycles = DEC_rr(regDE.regstr); break;
        case 0x2B: cycles = DEC_rr(regHL.regstr); break;
        case 0x3B: cycles = DEC_rr(stackPointer.regstr); break;

        case 0xE8: cycles = ADD_SP_dd(); break;
        case 0xF8: cycles = LD_HL_SPdd(); break;

        /*
        ************************************************************************
        Rotate and Shift Commands
        ************************************************************************
        */

        case 0x07: cycles = RLCA(); break;
        case 0x17: cycles = RLA(); break;
        case 0x0F: cycles = RRCA(); break;
        case 0x1F: cycles = RRA(); break;

        case 0xCB: cycles = executeCBOpcode(); break;

        /*
        ************************************************************************
        CPU Control Commands
        ************************************************************************
        */

        case 0x3F: cycles = CCF(); break;
        case 0x37: cycles = SCF(); break;
        case 0x00: cycles = NOP(); break;
        case 0x76: cycles = HALT(); break;
        case 0x10: cycles = STOP(); break;
        case 0xF3: cycles = DI(); break;
        case 0xFB: cycles = EI(); break;

        /*
        ************************************************************************
        Jump Commands
        ************************************************************************
        */

        case 0xC3: cycles = JP_nn(); break;
        case 0xE9: cycles = JP_HL(); break;

        // Conditional jumps
        case 0xC2: cycles = JP_f_nn(opcode); break;
        case 0xCA: cycles = JP_f_nn(opcode); break;
        case 0xD2: cycles = JP_f_nn(opcode); break;
        case 0xDA: cycles = JP_f_nn(opcode); break;

        case 0x18: cycles = JR_PCdd(); break;
        case 0x20: cycles = JR_f_PCdd(opcode); break;
        case 0x28: cycles = JR_f_PCdd(opcode); break;
        case 0x30: cycles = JR_f_PCdd(opcode); break;
        case 0x38: cycles = JR_f_PCdd(opcode); break;

        case 0xCD: cycles = CALL_nn(); break;
        case 0xC4: cycles = CALL_f_nn(opcode); break;
        case 0xCC: cycles = CALL_f_nn(opcode); break;
        case 0xD4: cycles = CALL_f_nn(opcode); break;
        case 0xDC: cycles = CALL_f_nn(opcode); break;

        case 0xC9: cycles = RET(); break;
        case 0xC0: cycles = RET_f(opcode); break;
        case 0xC8: cycles = RET_f(opcode); break;
        case 0xD0: cycles = RET_f(opcode); break;
        case 0xD8: cycles = RET_f(opcode); break;
        case 0xD9: cycles = RETI(); break;

        // Restart
        case 0xC7: cycles = RST_n(opcode); break;
        case 0xCF: cycles = RST_n(opcode); break;
        case 0xD7: cycles = RST_n(opcode); break;
        case 0xDF: cycles = RST_n(opcode); break;
        case 0xE7: cycles = RST_n(opcode); break;
        case 0xEF: cycles = RST_n(opcode); break;
        case 0xF7: cycles = RST_n(opcode); break;
        case 0xFF: cycles = RST_n(opcode); break;

        // 0xD3, 0xDB, 0xDD, 0xE3, 0xE4, 0xEB, 0xEC, 0xED, 0xF4, 0xFC, 0xFD
        default: cycles = lockUp(opcode); break;

    }

    return cycles;
}

int CPU::executeCBOpcode() {

    BYTE opcode = readImmediate();
    int cycles = 0;

    switch (opcode) {

        /*
        ************************************************************************
        Rotate and Shift Commands
        ************************************************************************
        */

        // RLC R/(HL)
        case 0x00: cycles = RLC_r(regBC.high); break;
        case 0x01: cycles = RLC_r(regBC.low); break;
        case 0x02: cycles = RLC_r(regDE.high); break;
        case 0x03: cycles = RLC_r(regDE.low); break;
        case 0x04: cycles = RLC_r(regHL.high); break;
        case 0x05: cycles = RLC_r(regHL.low); break;
        case 0x06: cycles = RLC_HL(); break;
        case 0x07: cycles = RLC_r(regAF.high); break;

        // RRC R/(HL)
        case 0x08: cycles = RRC_r(regBC.high); break;
        case 0x09: cycles = RRC_r(regBC.low); break;
        case 0x0A: cycles = RRC_r(regDE.high); break;
        case 0x0B: cycles = RRC_r(regDE.low); break;
        case 0x0C: cycles = RRC_r(regHL.high); break;
        case 0x0D: cycles = RRC_r(regHL.low); break;
        case 0x0E: cycles = RRC_HL(); break;
        case 0x0F: cycles = RRC_r(regAF.high); break;

        // RL R/(HL)
        case 0x10: cycles = RL_r(regBC.high); break;
        case 0x11: cycles = RL_r(regBC.low); break;
        case 0x12: cycles = RL_r(regDE.high); break;
        case 0x13: cycles = RL_r(regDE.low); break;
        case 0x14: cycles = RL_r(regHL.high); break;
        case 0x15: cycles = RL_r(regHL.low); break;
        case 0x16: cycles = RL_HL(); break;
        case 0x17: cycles = RL_r(regAF.high); break;

        // RR R/(HL)
        case 0x18: cycles = RR_r(regBC.high); break;
        case 0x19: cycles = RR_r(regBC.low); break;
        case 0x1A: cycles = RR_r(regDE.high); break;
        case 0x1B: cycles = RR_r(regDE.low); break;
        case 0x1C: cycles = RR_r(regHL.high); break;
        case 0x1D: cycles = RR_r(regHL.low); break;
        case 0x1E: cycles = RR_HL(); break;
        case 0x1F: cycles = RR_r(regAF.high); break;

        // SLA R/(HL)
        case 0x20: cycles = SLA_r(regBC.high); break;
        case 0x21: cycles = SLA_r(regBC.low); break;
        case 0x22: cycles = SLA_r(regDE.high); break;
        case 0x23: cycles = SLA_r(regDE.low); break;
        case 0x24: cycles = SLA_r(regHL.high); break;
        case 0x25: cycles = SLA_r(regHL.low); break;
        case 0x26: cycles = SLA_HL(); break;
        case 0x27: cycles = SLA_r(regAF.high); break;

        // SRA R/(HL)
        case 0x28: cycles = SRA_r(regBC.high); break;
        case 0x29: cycles = SRA_r(regBC.low); break;
        case 0x2A: cycles = SRA_r(regDE.high); break;
        case 0x2B: cycles = SRA_r(regDE.low); break;
        case 0x2C: cycles = SRA_r(regHL.high); break;
        case 0x2D: cycles = SRA_r(regHL.low); break;
        case 0x2E: cycles = SRA_HL(); break;
        case 0x2F: cycles = SRA_r(regAF.high); break;

        // SWAP R/(HL)
        case 0x30: cycles = SWAP_r(regBC.high); break;
        case 0x31: cycles = SWAP_r(regBC.low); break;
        case 0x32: cycles = SWAP_r(regDE.high); break;
        case 0x33: cycles = SWAP_r(regDE.low); break;
        case 0x34: cycles = SWAP_r(regHL.high); break;
        case 0x35: cycles = SWAP_r(regHL.low); break;
        case 0x36: cycles = SWAP_HL(); break;
        case 0x37: cycles = SWAP_r(regAF.high); break;

        // SRL R/(HL)
        case 0x38: cycles = SRL_r(regBC.high); break;
        case 0x39: cycles = SRL_r(regBC.low); break;
        case 0x3A: cycles = SRL_r(regDE.high); break;
        case 0x3B: cycles = SRL_r(regDE.low); break;
        case 0x3C: cycles = SRL_r(regHL.high); break;
        case 0x3D: cycles = SRL_r(regHL.low); break;
        case 0x3E: cycles = SRL_HL(); break;
        case 0x3F: cycles = SRL_r(regAF.high); break;


        /*
        ************************************************************************
        Single Bit Operation Commands
        ************************************************************************
        */

        // Test bit n of R/(HL)
        case 0x40: cycles = BIT_n_r(regBC.high, 0); break;
        case 0x41: cycles = BIT_n_r(regBC.low, 0); break;
        case 0x42: cycles = BIT_n_r(regDE.high, 0); break;
        case 0x43: cycles = BIT_n_r(regDE.low, 0); break;
        case 0x44: cycles = BIT_n_r(regHL.high, 0); break;
        case 0x45: cycles = BIT_n_r(regHL.low, 0); break;
        case 0x46: cycles = BIT_n_HL(0); break;
        case 0x47: cycles = BIT_n_r(regAF.high, 0); break;
        case 0x48: cycles = BIT_n_r(regBC.high, 1); break;
        case 0x49: cycles = BIT_n_r(regBC.low, 1); break;
        case 0x4A: cycles = BIT_n_r(regDE.high, 1); break;
        case 0x4B: cycles = BIT_n_r(regDE.low, 1); break;
        case 0x4C: cycles = BIT_n_r(regHL.high, 1); break;
        case 0x4D: cycles = BIT_n_r(regHL.low, 1); break;
        case 0x4E: cycles = BIT_n_HL(1); break;
        case 0x4F: cycles = BIT_n_r(regAF.high, 1); break;
        case 0x50: cycles = BIT_n_r(regBC.high, 2); break;
        case 0x51: cycles = BIT_n_r(regBC.low, 2); break;
        case 0x52: cycles = BIT_n_r(regDE.high, 2); break;
        case 0x53: cycles = BIT_n_r(regDE.low, 2); break;
        case 0x54: cycles = BIT_n_r(regHL.high, 2); break;
        case 0x55: cycles = BIT_n_r(regHL.low, 2); break;
        case 0x56: cycles = BIT_n_HL(2); break;
        case 0x57: cycles = BIT_n_r(regAF.high, 2); break;
        case 0x58: cycles = BIT_n_r(regBC.high, 3); break;
        case 0x59: cycles = BIT_n_r(regBC.low, 3); break;
        case 0x5A: cycles = BIT_n_r(regDE.high, 3); break;
        case 0x5B: cycles = BIT_n_r(regDE.low, 3); break;
        case 0x5C: cycles = BIT_n_r(regHL.high, 3); break;
        case 0x5D: cycles = BIT_n_r(regHL.low, 3); break;
        case 0x5E: cycles = BIT_n_HL(3); break;
        case 0x5F: cycles = BIT_n_r(regAF.high, 3); break;
        case 0x60: cycles = BIT_n_r(regBC.high, 4); break;
        case 0x61: cycles = BIT_n_r(regBC.low, 4); break;
        case 0x62: cycles = BIT_n_r(regDE.high, 4); break;
        case 0x63: cycles = BIT_n_r(regDE.low, 4); break;
        case 0x64: cycles = BIT_n_r(regHL.high, 4); break;
        case 0x65: cycles = BIT_n_r(regHL.low, 4); break;
        case 0x66: cycles = BIT_n_HL(4); break;
        case 0x67: cycles = BIT_n_r(regAF.high, 4); break;
        case 0x68: cycles = BIT_n_r(regBC.high, 5); break;
        case 0x69: cycles = BIT_n_r(regBC.low, 5); break;
        case 0x6A: cycles = BIT_n_r(regDE.high, 5); break;
        case 0x6B: cycles = BIT_n_r(regDE.low, 5); break;
        case 0x6C: cycles = BIT_n_r(regHL.high, 5); break;
        case 0x6D: cycles = BIT_n_r(regHL.low, 5); break;
        case 0x6E: cycles = BIT_n_HL(5); break;
        case 0x6F: cycles = BIT_n_r(regAF.high, 5); break;
        case 0x70: cycles = BIT_n_r(regBC.high, 6); break;
        case 0x71: cycles = BIT_n_r(regBC.low, 6); break;
        case 0x72: cycles = BIT_n_r(regDE.high, 6); break;
        case 0x73: cycles = BIT_n_r(regDE.low, 6); break;
        case 0x74: cycles = BIT_n_r(regHL.high, 6); break;
        case 0x75: cycles = BIT_n_r(regHL.low, 6); break;
        case 0x76: cycles = BIT_n_HL(6); break;
        case 0x77: cycles = BIT_n_r(regAF.high, 6); break;
        case 0x78: cycles = BIT_n_r(regBC.high, 7); break;
        case 0x79: cycles = BIT_n_r(regBC.low, 7); break;
        case 0x7A: cycles = BIT_n_r(regDE.high, 7); break;
        case 0x7B: cycles = BIT_n_r(regDE.low, 7); break;
        case 0x7C: cycles = BIT_n_r(regHL.high, 7); break;
        case 0x7D: cycles = BIT_n_r(regHL.low, 7); break;
        case 0x7E: cycles = BIT_n_HL(7); break;
        case 0x7F: cycles = BIT_n_r(regAF.high, 7); break;

        // Reset bit n of R/(HL)
        case 0x80: cycles = RES_n_r(regBC.high, 0); break;
        case 0x81: cycles = RES_n_r(regBC.low, 0); break;
        case 0x82: cycles = RES_n_r(regDE.high, 0); break;
        case 0x83: cycles = RES_n_r(regDE.low, 0); break;
        case 0x84: cycles = RES_n_r(regHL.high, 0); break;
        case 0x85: cycles = RES_n_r(regHL.low, 0); break;
        case 0x86: cycles = RES_n_HL(0); break;
        case 0x87: cycles = RES_n_r(regAF.high, 0); break;
        case 0x88: cycles = RES_n_r(regBC.high, 1); break;
        case 0x89: cycles = RES_n_r(regBC.low, 1); break;
        case 0x8A: cycles = RES_n_r(regDE.high, 1); break;
        case 0x8B: cycles = RES_n_r(regDE.low, 1); break;
        case 0x8C: cycles = RES_n_r(regHL.high, 1); break;
        case 0x8D: cycles = RES_n_r(regHL.low, 1); break;
        case 0x8E: cycles = RES_n_HL(1); break;
        case 0x8F: cycles = RES_n_r(regAF.high, 1); break;
        case 0x90: cycles = RES_n_r(regBC.high, 2); break;
        case 0x91: cycles = RES_n_r(regBC.low, 2); break;
        case 0x92: cycles = RES_n_r(regDE.high, 2); break;
        case 0x93: cycles = RES_n_r(regDE.low, 2); break;
        case 0x94: cycles = RES_n_r(regHL.high, 2); break;
        case 0x95: cycles = RES_n_r(regHL.low, 2); break;
        case 0x96: cycles = RES_n_HL(2); break;
        case 0x97: cycles = RES_n_r(regAF.high, 2); break;
        case 0x98: cycles = RES_n_r(regBC.high, 3); break;
        case 0x99: cycles = RES_n_r(regBC.low, 3); break;
        case 0x9A: cycles = RES_n_r(regDE.high, 3); break;
        case 0x9B: cycles = RES_n_r(regDE.low, 3); break;
        case 0x9C: cycles = RES_n_r(regHL.high, 3); break;
        case 0x9D: cycles = RES_n_r(regHL.low, 3); break;
        case 0x9E: cycles = RES_n_HL(3); break;
        case 0x9F: cycles = RES_n_r(regAF.high, 3); break;
        case 0xA0: cycles = RES_n_r(regBC.high, 4); break;
        case 0xA1: cycles = RES_n_r(regBC.low, 4); break;
        case 0xA2: cycles = RES_n_r(regDE.high, 4); break;
        case 0xA3: cycles = RES_n_r(regDE.low, 4); break;
        case 0xA4: cycles = RES_n_r(regHL.high, 4); break;
        case 0xA5: cycles = RES_n_r(regHL.low, 4); break;
        case 0xA6: cycles = RES_n_HL(4); break;
        case 0xA7: cycles = RES_n_r(regAF.high, 4); break;
        case 0xA8: cycles = RES_n_r(regBC.high, 5); break;
        case 0xA9: cycles = RES_n_r(regBC.low, 5); break;
        case 0xAA: cycles = RES_n_r(regDE.high, 5); break;
        case 0xAB: cycles = RES_n_r(regDE.low, 5); break;
        case 0xAC: cycles = RES_n_r(regHL.high, 5); break;
        case 0xAD: cycles = RES_n_r(regHL.low, 5); break;
        case 0xAE: cycles = RES_n_HL(5); break;
        case 0xAF: cycles = RES_n_r(regAF.high, 5); break;
        case 0xB0: cycles = RES_n_r(regBC.high, 6); break;
        case 0xB1: cycles = RES_n_r(regBC.low, 6); break;
        case 0xB2: cycles = RES_n_r(regDE.high, 6); break;
        case 0xB3: cycles = RES_n_r(regDE.low, 6); break;
        case 0xB4: cycles = RES_n_r(regHL.high, 6); break;
        case 0xB5: cycles = RES_n_r(regHL.low, 6); break;
        case 0xB6: cycles = RES_n_HL(6); break;
        case 0xB7: cycles = RES_n_r(regAF.high, 6); break;
        case 0xB8: cycles = RES_n_r(regBC.high, 7); break;
        case 0xB9: cycles = RES_n_r(regBC.low, 7); break;
        case 0xBA: cycles = RES_n_r(regDE.high, 7); break;
        case 0xBB: cycles = RES_n_r(regDE.low, 7); break;
        case 0xBC: cycles = RES_n_r(regHL.high, 7); break;
        case 0xBD: cycles = RES_n_r(regHL.low, 7); break;
        case 0xBE: cycles = RES_n_HL(7); break;
        case 0xBF: cycles = RES_n_r(regAF.high, 7); break;

        // Set bit n of R/(HL)
        case 0xC0: cycles = SET_n_r(regBC.high, 0); break;
        case 0xC1: cycles = SET_n_r(regBC.low, 0); break;
        case 0xC2: cycles = SET_n_r(regDE.high, 0); break;
        case 0xC3: cycles = SET_n_r(regDE.low, 0); break;
        case 0xC4: cycles = SET_n_r(regHL.high, 0); break;
        case 0xC5: cycles = SET_n_r(regHL.low, 0); break;
        case 0xC6: cycles = SET_n_HL(0); break;
        case 0xC7: cycles = SET_n_r(regAF.high, 0); break;
        case 0xC8: cycles = SET_n_r(regBC.high, 1); break;
        case 0xC9: cycles = SET_n_r(regBC.low, 1); break;
        case 0xCA: cycles = SET_n_r(regDE.high, 1); break;
        case 0xCB: cycles = SET_n_r(regDE.low, 1); break;
        case 0xCC: cycles = SET_n_r(regHL.high, 1); break;
        case 0xCD: cycles = SET_n_r(regHL.low, 1); break;
        case 0xCE: cycles = SET_n_HL(1); break;
        case 0xCF: cycles = SET_n_r(regAF.high, 1); break;
        case 0xD0: cycles = SET_n_r(regBC.high, 2); break;
        case 0xD1: cycles = SET_n_r(regBC.low, 2); break;
        case 0xD2: cycles = SET_n_r(regDE.high, 2); break;
        case 0xD3: cycles = SET_n_r(regDE.low, 2); break;
        case 0xD4: cycles = SET_n_r(regHL.high, 2); break;
        case 0xD5: cycles = SET_n_r(regHL.low, 2); break;
        case 0xD6: cycles = SET_n_HL(2); break;
        case 0xD7: cycles = SET_n_r(regAF.high, 2); break;
        case 0xD8: cycles = SET_n_r(regBC.high, 3); break;
        case 0xD9: cycles = SET_n_r(regBC.low, 3); break;
        case 0xDA: cycles = SET_n_r(regDE.high, 3); break;
        case 0xDB: cycles = SET_n_r(regDE.low, 3); break;
        case 0xDC: cycles = SET_n_r(regHL.high, 3); break;
        case 0xDD: cycles = SET_n_r(regHL.low, 3); break;
        case 0xDE: cycles = SET_n_HL(3); break;
        case 0xDF: cycles = SET_n_r(regAF.high, 3); break;
        case 0xE0: cycles = SET_n_r(regBC.high, 4); break;
        case 0xE1: cycles = SET_n_r(regBC.low, 4); break;
        case 0xE2: cycles = SET_n_r(regDE.high, 4); break;
        case 0xE3: cycles = SET_n_r(regDE.low, 4); break;
        case 0xE4: cycles = SET_n_r(regHL.high, 4); break;
        case 0xE5: cycles = SET_n_r(regHL.low, 4); break;
        case 0xE6: cycles = SET_n_HL(4); break;
        case 0xE7: cycles = SET_n_r(regAF.high, 4); break;
        case 0xE8: cycles = SET_n_r(regBC.high, 5); break;
        case 0xE9: cycles = SET_n_r(regBC.low, 5); break;
        case 0xEA: cycles = SET_n_r(regDE.high, 5); break;
        case 0xEB: cycles = SET_n_r(regDE.low, 5); break;
        case 0xEC: cycles = SET_n_r(regHL.high, 5); break;
        case 0xED: cycles = SET_n_r(regHL.low, 5); break;
        case 0xEE: cycles = SET_n_HL(5); break;
        case 0xEF: cycles = SET_n_r(regAF.high, 5); break;
        case 0xF0: cycles = SET_n_r(regBC.high, 6); break;
        case 0xF1: cycles = SET_n_r(regBC.low, 6); break;
        case 0xF2: cycles = SET_n_r(regDE.high, 6); break;
        case 0xF3: cycles = SET_n_r(regDE.low, 6); break;
        case 0xF4: cycles = SET_n_r(regHL.high, 6); break;
        case 0xF5: cycles = SET_n_r(regHL.low, 6); break;
        case 0xF6: cycles = SET_n_HL(6); break;
        case 0xF7: cycles = SET_n_r(regAF.high, 6); break;
        case 0xF8: cycles = SET_n_r(regBC.high, 7); break;
        case 0xF9: cycles = SET_n_r(regBC.low, 7); break;
        case 0xFA: cycles = SET_n_r(regDE.high, 7); break;
        case 0xFB: cycles = SET_n_r(regDE.low, 7); break;
        case 0xFC: cycles = SET_n_r(regHL.high, 7); break;
        case 0xFD: cycles = SET_n_r(regHL.low, 7); break;
        case 0xFE: cycles = SET_n_HL(7); break;
        case 0xFF: cycles = SET_n_r(regAF.high, 7); break;

    }

    return cycles;
}

/*
********************************************************************************
8 bit Load Commands
********************************************************************************
*/

/*
    LD r, R  (0x40 - 0x7F except for (HL) forms and 0x76)

    Loads content of register R into register r.
    r and R can be (B, C, D, E, H, L, A)

    1 cycle

    Flags affected(znhc): ----
*/
int CPU::LD_r_R(BYTE& regR1, BYTE regR2) {
    regR1 = regR2;
    return 1;
}

/*
    LD r, n  (0x06, 0x0E, 0x16, 0x1E, 0x26, 0x2E, 0x3E)

    Loads 8 bit immediate n into register r.

    2 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_r_n(BYTE& regR) {
    regR = readImmediate();
    return 2;
}

/*
    LD r, (HL)

    Loads the byte at address HL into register r.

    2 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_r_HL(BYTE& regR) {
    regR = bus.read8(regHL.regstr);
    return 2;
}

/*
    LD (HL), r  (0x70 - 0x77 except for 0x76)

    Stores register r at address HL.

    2 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_HL_r(BYTE regR) {
    bus.write8(regHL.regstr, regR);
    return 2;
}

/*
    LD (HL), n  (0x36)

    3 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_HL_n() {
    bus.write8(regHL.regstr, readImmediate());
    return 3;
}

// LD A, (BC)  (0x0A), 2 cycles
int CPU::LD_A_BC() {
    regAF.high = bus.read8(regBC.regstr);
    return 2;
}

// LD A, (DE)  (0x1A), 2 cycles
int CPU::LD_A_DE() {
    regAF.high = bus.read8(regDE.regstr);
    return 2;
}

/*
    LD A, (nn)  (0xFA)

    Loads the byte at 16 bit immediate address nn into A.

    4 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_A_nn() {
    WORD address = readImmediateWord();
    regAF.high = bus.read8(address);
    return 4;
}

// LD (BC), A  (0x02), 2 cycles
int CPU::LD_BC_A() {
    bus.write8(regBC.regstr, regAF.high);
    return 2;
}

// LD (DE), A  (0x12), 2 cycles
int CPU::LD_DE_A() {
    bus.write8(regDE.regstr, regAF.high);
    return 2;
}

/*
    LD (nn), A  (0xEA)

    4 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_nn_A() {
    WORD address = readImmediateWord();
    bus.write8(address, regAF.high);
    return 4;
}

/*
    LD A, (FF00+n)  (0xF0)

    Loads the byte at 0xFF00 + n into A. Used for the I/O registers.

    3 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_A_FF00n() {
    WORD address = 0xFF00 + readImmediate();
    regAF.high = bus.read8(address);
    return 3;
}

/*
    LD (FF00+n), A  (0xE0)

    3 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_FF00n_A() {
    WORD address = 0xFF00 + readImmediate();
    bus.write8(address, regAF.high);
    return 3;
}

// LD A, (FF00+C)  (0xF2), 2 cycles
int CPU::LD_A_FF00C() {
    regAF.high = bus.read8(0xFF00 + regBC.low);
    return 2;
}

// LD (FF00+C), A  (0xE2), 2 cycles
int CPU::LD_FF00C_A() {
    bus.write8(0xFF00 + regBC.low, regAF.high);
    return 2;
}

/*
    LDI (HL), A  (0x22)

    Stores A at address HL, then increments HL.

    2 cycles

    Flags affected(znhc): ----
*/
int CPU::LDI_HL_A() {
    bus.write8(regHL.regstr, regAF.high);
    regHL.regstr++;
    return 2;
}

/*
    LDI A, (HL)  (0x2A)

    Loads the byte at address HL into A, then increments HL.

    2 cycles

    Flags affected(znhc): ----
*/
int CPU::LDI_A_HL() {
    regAF.high = bus.read8(regHL.regstr);
    regHL.regstr++;
    return 2;
}

// LDD (HL), A  (0x32), 2 cycles
int CPU::LDD_HL_A() {
    bus.write8(regHL.regstr, regAF.high);
    regHL.regstr--;
    return 2;
}

// LDD A, (HL)  (0x3A), 2 cycles
int CPU::LDD_A_HL() {
    regAF.high = bus.read8(regHL.regstr);
    regHL.regstr--;
    return 2;
}

/*
********************************************************************************
16 bit Load Commands
********************************************************************************
*/

/*
    LD rr, nn  (0x01, 0x11, 0x21, 0x31)

    Loads 16 bit immediate nn into register pair rr.
    rr can be (BC, DE, HL, SP)

    3 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_rr_nn(Register& regRR) {
    regRR.regstr = readImmediateWord();
    return 3;
}

// LD SP, HL  (0xF9), 2 cycles
int CPU::LD_SP_HL() {
    stackPointer.regstr = regHL.regstr;
    return 2;
}

/*
    LD (nn), SP  (0x08)

    Stores SP at address nn, low byte first.

    5 cycles

    Flags affected(znhc): ----
*/
int CPU::LD_nn_SP() {
    WORD address = readImmediateWord();
    bus.write16(address, stackPointer.regstr);
    return 5;
}

/*
    PUSH rr  (0xC5, 0xD5, 0xE5, 0xF5)

    Decrements SP by 2 and stores rr on the stack.
    rr can be (BC, DE, HL, AF)

    4 cycles

    Flags affected(znhc): ----
*/
int CPU::PUSH_rr(Register regRR) {
    pushWord(regRR.regstr);
    return 4;
}

/*
    POP rr  (0xC1, 0xD1, 0xE1, 0xF1)

    Loads rr from the stack and increments SP by 2.
    rr can be (BC, DE, HL, AF). For AF the low nibble of F always reads 0.

    3 cycles

    Flags affected(znhc): ---- (znhc for POP AF)
*/
int CPU::POP_rr(Register& regRR) {
    regRR.regstr = popWord();
    if (&regRR == &regAF) {
        regAF.low &= 0xF0;
    }
    return 3;
}

/*
********************************************************************************
8 bit Arithmetic/Logical Commands
********************************************************************************
*/

/*
    ADD A, r  (0x80 - 0x87 except for 0x86)

    Adds content of register r to register A.
    r can be (B, C, D, E, H, L, A)

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 0
    - h: Set if carry from bit 3
    - c: Set if carry from bit 7
*/
int CPU::ADD_A_r(BYTE regR) {
    int result = regAF.high + regR;

    setFlag(FLAG_ZERO, (result & 0xFF) == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, ((regAF.high & 0x0F) + (regR & 0x0F)) > 0x0F);
    setFlag(FLAG_CARRY, result > 0xFF);

    regAF.high = result & 0xFF;

    return 1;
}

// ADD A, n  (0xC6), 2 cycles
int CPU::ADD_A_n() {
    ADD_A_r(readImmediate());
    return 2;
}

// ADD A, (HL)  (0x86), 2 cycles
int CPU::ADD_A_HL() {
    ADD_A_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    ADC A, r  (0x88 - 0x8F except for 0x8E)

    Adds content of register r and the carry flag to register A.

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 0
    - h: Set if carry from bit 3
    - c: Set if carry from bit 7
*/
int CPU::ADC_A_r(BYTE regR) {
    int carry = getFlag(FLAG_CARRY) ? 1 : 0;
    int result = regAF.high + regR + carry;

    setFlag(FLAG_ZERO, (result & 0xFF) == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, ((regAF.high & 0x0F) + (regR & 0x0F) + carry) > 0x0F);
    setFlag(FLAG_CARRY, result > 0xFF);

    regAF.high = result & 0xFF;

    return 1;
}

// ADC A, n  (0xCE), 2 cycles
int CPU::ADC_A_n() {
    ADC_A_r(readImmediate());
    return 2;
}

// ADC A, (HL)  (0x8E), 2 cycles
int CPU::ADC_A_HL() {
    ADC_A_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    SUB r  (0x90 - 0x97 except for 0x96)

    Subtracts content of register r from register A.

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 1
    - h: Set if borrow from bit 4
    - c: Set if borrow
*/
int CPU::SUB_r(BYTE regR) {
    int result = regAF.high - regR;

    setFlag(FLAG_ZERO, (result & 0xFF) == 0);
    setFlag(FLAG_SUB, true);
    setFlag(FLAG_HALFCARRY, (regAF.high & 0x0F) < (regR & 0x0F));
    setFlag(FLAG_CARRY, result < 0);

    regAF.high = result & 0xFF;

    return 1;
}

// SUB n  (0xD6), 2 cycles
int CPU::SUB_n() {
    SUB_r(readImmediate());
    return 2;
}

// SUB (HL)  (0x96), 2 cycles
int CPU::SUB_HL() {
    SUB_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    SBC A, r  (0x98 - 0x9F except for 0x9E)

    Subtracts content of register r and the carry flag from register A.

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 1
    - h: Set if borrow from bit 4
    - c: Set if borrow
*/
int CPU::SBC_A_r(BYTE regR) {
    int carry = getFlag(FLAG_CARRY) ? 1 : 0;
    int result = regAF.high - regR - carry;

    setFlag(FLAG_ZERO, (result & 0xFF) == 0);
    setFlag(FLAG_SUB, true);
    setFlag(FLAG_HALFCARRY, (regAF.high & 0x0F) < ((regR & 0x0F) + carry));
    setFlag(FLAG_CARRY, result < 0);

    regAF.high = result & 0xFF;

    return 1;
}

// SBC A, n  (0xDE), 2 cycles
int CPU::SBC_A_n() {
    SBC_A_r(readImmediate());
    return 2;
}

// SBC A, (HL)  (0x9E), 2 cycles
int CPU::SBC_A_HL() {
    SBC_A_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    AND r  (0xA0 - 0xA7 except for 0xA6)

    1 cycle

    Flags affected(znhc): z010
*/
int CPU::AND_r(BYTE regR) {
    regAF.high &= regR;

    setFlag(FLAG_ZERO, regAF.high == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, true);
    setFlag(FLAG_CARRY, false);

    return 1;
}

int CPU::AND_n() {
    AND_r(readImmediate());
    return 2;
}

int CPU::AND_HL() {
    AND_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    XOR r  (0xA8 - 0xAF except for 0xAE)

    1 cycle

    Flags affected(znhc): z000
*/
int CPU::XOR_r(BYTE regR) {
    regAF.high ^= regR;

    setFlag(FLAG_ZERO, regAF.high == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, false);

    return 1;
}

int CPU::XOR_n() {
    XOR_r(readImmediate());
    return 2;
}

int CPU::XOR_HL() {
    XOR_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    OR r  (0xB0 - 0xB7 except for 0xB6)

    1 cycle

    Flags affected(znhc): z000
*/
int CPU::OR_r(BYTE regR) {
    regAF.high |= regR;

    setFlag(FLAG_ZERO, regAF.high == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, false);

    return 1;
}

int CPU::OR_n() {
    OR_r(readImmediate());
    return 2;
}

int CPU::OR_HL() {
    OR_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    CP r  (0xB8 - 0xBF except for 0xBE)

    Compares A with register r by subtracting, the result is thrown away.

    1 cycle

    Flags affected(znhc): same as SUB r
*/
int CPU::CP_r(BYTE regR) {
    BYTE value = regAF.high;
    SUB_r(regR);
    regAF.high = value;
    return 1;
}

int CPU::CP_n() {
    CP_r(readImmediate());
    return 2;
}

int CPU::CP_HL() {
    CP_r(bus.read8(regHL.regstr));
    return 2;
}

/*
    INC r  (0x04, 0x0C, 0x14, 0x1C, 0x24, 0x2C, 0x3C)

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 0
    - h: Set if carry from bit 3
    - c: unchanged
*/
int CPU::INC_r(BYTE& regR) {
    setFlag(FLAG_HALFCARRY, (regR & 0x0F) == 0x0F);
    regR++;
    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    return 1;
}

// INC (HL)  (0x34), 3 cycles
int CPU::INC_HL() {
    BYTE data = bus.read8(regHL.regstr);
    INC_r(data);
    bus.write8(regHL.regstr, data);
    return 3;
}

/*
    DEC r  (0x05, 0x0D, 0x15, 0x1D, 0x25, 0x2D, 0x3D)

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: 1
    - h: Set if borrow from bit 4
    - c: unchanged
*/
int CPU::DEC_r(BYTE& regR) {
    setFlag(FLAG_HALFCARRY, (regR & 0x0F) == 0x00);
    regR--;
    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, true);
    return 1;
}

// DEC (HL)  (0x35), 3 cycles
int CPU::DEC_HL() {
    BYTE data = bus.read8(regHL.regstr);
    DEC_r(data);
    bus.write8(regHL.regstr, data);
    return 3;
}

/*
    DAA  (0x27)

    Adjusts A to binary coded decimal after an addition or subtraction,
    using the n, h and c flags left by that operation.

    1 cycle

    Flags affected(znhc):
    - z: Set if result is zero
    - n: unchanged
    - h: 0
    - c: Set if a correction of 0x60 was applied
*/
int CPU::DAA() {
    BYTE correction = 0x00;
    bool carry = getFlag(FLAG_CARRY);

    if (getFlag(FLAG_HALFCARRY) || (!getFlag(FLAG_SUB) && (regAF.high & 0x0F) > 0x09)) {
        correction |= 0x06;
    }

    if (carry || (!getFlag(FLAG_SUB) && regAF.high > 0x99)) {
        correction |= 0x60;
        carry = true;
    }

    if (getFlag(FLAG_SUB)) {
        regAF.high -= correction;
    } else {
        regAF.high += correction;
    }

    setFlag(FLAG_ZERO, regAF.high == 0);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 1;
}

/*
    CPL  (0x2F)

    Complements A.

    1 cycle

    Flags affected(znhc): -11-
*/
int CPU::CPL() {
    regAF.high = ~regAF.high;
    setFlag(FLAG_SUB, true);
    setFlag(FLAG_HALFCARRY, true);
    return 1;
}

/*
********************************************************************************
16 bit Arithmetic/Logical Commands
********************************************************************************
*/

/*
    ADD HL, rr  (0x09, 0x19, 0x29, 0x39)

    2 cycles

    Flags affected(znhc):
    - z: unchanged
    - n: 0
    - h: Set if carry from bit 11
    - c: Set if carry from bit 15
*/
int CPU::ADD_HL_rr(WORD regRR) {
    int result = regHL.regstr + regRR;

    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, ((regHL.regstr & 0x0FFF) + (regRR & 0x0FFF)) > 0x0FFF);
    setFlag(FLAG_CARRY, result > 0xFFFF);

    regHL.regstr = result & 0xFFFF;

    return 2;
}

// INC rr  (0x03, 0x13, 0x23, 0x33), 2 cycles, no flags
int CPU::INC_rr(WORD& regRR) {
    regRR++;
    return 2;
}

// DEC rr  (0x0B, 0x1B, 0x2B, 0x3B), 2 cycles, no flags
int CPU::DEC_rr(WORD& regRR) {
    regRR--;
    return 2;
}

/*
    ADD SP, dd  (0xE8)

    Adds signed 8 bit immediate dd to SP. The carries are those of an
    unsigned add on the low byte.

    4 cycles

    Flags affected(znhc):
    - z: 0
    - n: 0
    - h: Set if carry from bit 3
    - c: Set if carry from bit 7
*/
int CPU::ADD_SP_dd() {
    BYTE data = readImmediate();
    WORD sp = stackPointer.regstr;

    setFlag(FLAG_ZERO, false);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, ((sp & 0x0F) + (data & 0x0F)) > 0x0F);
    setFlag(FLAG_CARRY, ((sp & 0xFF) + data) > 0xFF);

    stackPointer.regstr = sp + (SIGNED_BYTE) data;

    return 4;
}

/*
    LD HL, SP+dd  (0xF8)

    3 cycles

    Flags affected(znhc): same as ADD SP, dd
*/
int CPU::LD_HL_SPdd() {
    BYTE data = readImmediate();
    WORD sp = stackPointer.regstr;

    setFlag(FLAG_ZERO, false);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, ((sp & 0x0F) + (data & 0x0F)) > 0x0F);
    setFlag(FLAG_CARRY, ((sp & 0xFF) + data) > 0xFF);

    regHL.regstr = sp + (SIGNED_BYTE) data;

    return 3;
}

/*
********************************************************************************
Rotate and Shift Commands
********************************************************************************
*/

/*
    RLCA  (0x07)

    Rotates A left, bit 7 goes to carry and bit 0.

    1 cycle

    Flags affected(znhc): 000c
*/
int CPU::RLCA() {
    RLC_r(regAF.high);
    setFlag(FLAG_ZERO, false);
    return 1;
}

/*
    RLA  (0x17)

    Rotates A left through carry.

    1 cycle

    Flags affected(znhc): 000c
*/
int CPU::RLA() {
    RL_r(regAF.high);
    setFlag(FLAG_ZERO, false);
    return 1;
}

// RRCA  (0x0F), 1 cycle, flags 000c
int CPU::RRCA() {
    RRC_r(regAF.high);
    setFlag(FLAG_ZERO, false);
    return 1;
}

// RRA  (0x1F), 1 cycle, flags 000c
int CPU::RRA() {
    RR_r(regAF.high);
    setFlag(FLAG_ZERO, false);
    return 1;
}

/*
    RLC r  (CB 0x00 - 0x07 except for 0x06)

    Rotates r left, bit 7 goes to carry and bit 0.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::RLC_r(BYTE& regR) {
    bool carry = isBitSet(regR, 7);
    regR = (regR << 1) | (carry ? 0x01 : 0x00);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

// RLC (HL)  (CB 0x06), 4 cycles
int CPU::RLC_HL() {
    BYTE data = bus.read8(regHL.regstr);
    RLC_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    RL r  (CB 0x10 - 0x17 except for 0x16)

    Rotates r left through carry.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::RL_r(BYTE& regR) {
    bool carry = isBitSet(regR, 7);
    regR = (regR << 1) | (getFlag(FLAG_CARRY) ? 0x01 : 0x00);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::RL_HL() {
    BYTE data = bus.read8(regHL.regstr);
    RL_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    RRC r  (CB 0x08 - 0x0F except for 0x0E)

    Rotates r right, bit 0 goes to carry and bit 7.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::RRC_r(BYTE& regR) {
    bool carry = isBitSet(regR, 0);
    regR = (regR >> 1) | (carry ? 0x80 : 0x00);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::RRC_HL() {
    BYTE data = bus.read8(regHL.regstr);
    RRC_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    RR r  (CB 0x18 - 0x1F except for 0x1E)

    Rotates r right through carry.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::RR_r(BYTE& regR) {
    bool carry = isBitSet(regR, 0);
    regR = (regR >> 1) | (getFlag(FLAG_CARRY) ? 0x80 : 0x00);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::RR_HL() {
    BYTE data = bus.read8(regHL.regstr);
    RR_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    SLA r  (CB 0x20 - 0x27 except for 0x26)

    Shifts r left into carry, bit 0 becomes 0.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::SLA_r(BYTE& regR) {
    bool carry = isBitSet(regR, 7);
    regR = regR << 1;

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::SLA_HL() {
    BYTE data = bus.read8(regHL.regstr);
    SLA_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    SWAP r  (CB 0x30 - 0x37 except for 0x36)

    Exchanges the low and high nibbles of r.

    2 cycles

    Flags affected(znhc): z000
*/
int CPU::SWAP_r(BYTE& regR) {
    regR = ((regR & 0x0F) << 4) | ((regR & 0xF0) >> 4);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, false);

    return 2;
}

int CPU::SWAP_HL() {
    BYTE data = bus.read8(regHL.regstr);
    SWAP_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    SRA r  (CB 0x28 - 0x2F except for 0x2E)

    Shifts r right into carry, bit 7 keeps its value.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::SRA_r(BYTE& regR) {
    bool carry = isBitSet(regR, 0);
    regR = (regR >> 1) | (regR & 0x80);

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::SRA_HL() {
    BYTE data = bus.read8(regHL.regstr);
    SRA_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
    SRL r  (CB 0x38 - 0x3F except for 0x3E)

    Shifts r right into carry, bit 7 becomes 0.

    2 cycles

    Flags affected(znhc): z00c
*/
int CPU::SRL_r(BYTE& regR) {
    bool carry = isBitSet(regR, 0);
    regR = regR >> 1;

    setFlag(FLAG_ZERO, regR == 0);
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, carry);

    return 2;
}

int CPU::SRL_HL() {
    BYTE data = bus.read8(regHL.regstr);
    SRL_r(data);
    bus.write8(regHL.regstr, data);
    return 4;
}

/*
********************************************************************************
Single Bit Operation Commands
********************************************************************************
*/

/*
    BIT n, r  (CB 0x40 - 0x7F)

    Tests bit n of register r.

    2 cycles, 3 cycles for BIT n, (HL)

    Flags affected(znhc):
    - z: Set if bit n is 0
    - n: 0
    - h: 1
    - c: unchanged
*/
int CPU::BIT_n_r(BYTE regR, int n) {
    setFlag(FLAG_ZERO, !isBitSet(regR, n));
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, true);
    return 2;
}

int CPU::BIT_n_HL(int n) {
    BIT_n_r(bus.read8(regHL.regstr), n);
    return 3;
}

/*
    SET n, r  (CB 0xC0 - 0xFF)

    2 cycles, 4 cycles for SET n, (HL)

    Flags affected(znhc): ----
*/
int CPU::SET_n_r(BYTE& regR, int n) {
    regR = bitSet(regR, n);
    return 2;
}

int CPU::SET_n_HL(int n) {
    bus.write8(regHL.regstr, bitSet(bus.read8(regHL.regstr), n));
    return 4;
}

/*
    RES n, r  (CB 0x80 - 0xBF)

    2 cycles, 4 cycles for RES n, (HL)

    Flags affected(znhc): ----
*/
int CPU::RES_n_r(BYTE& regR, int n) {
    regR = bitReset(regR, n);
    return 2;
}

int CPU::RES_n_HL(int n) {
    bus.write8(regHL.regstr, bitReset(bus.read8(regHL.regstr), n));
    return 4;
}

/*
********************************************************************************
CPU Control Commands
********************************************************************************
*/

/*
    CCF  (0x3F)

    Complements the carry flag.

    1 cycle

    Flags affected(znhc): -00c
*/
int CPU::CCF() {
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, !getFlag(FLAG_CARRY));
    return 1;
}

// SCF  (0x37), 1 cycle, flags -001
int CPU::SCF() {
    setFlag(FLAG_SUB, false);
    setFlag(FLAG_HALFCARRY, false);
    setFlag(FLAG_CARRY, true);
    return 1;
}

int CPU::NOP() {
    return 1;
}

/*
    HALT  (0x76)

    Stops executing until an interrupt is pending in IE & IF.

    1 cycle
*/
int CPU::HALT() {
    runMode = HALTED;
    return 1;
}

/*
    STOP  (0x10 0x00)

    Two byte instruction. Stops the CPU and the divider until a button is
    pressed. A joypad request raised before STOP does not count.

    1 cycle
*/
int CPU::STOP() {
    programCounter.regstr++;
    bus.write8(DIVIDER, 0x00);
    bus.clearInterrupt(INTERRUPT_JOYPAD);
    runMode = STOPPED;
    return 1;
}

// DI  (0xF3), 1 cycle. Also cancels a pending EI
int CPU::DI() {
    InterruptMasterEnabled = false;
    enableInterruptsDelay = 0;
    return 1;
}

/*
    EI  (0xFB)

    Enables interrupts once the next instruction has completed.

    1 cycle
*/
int CPU::EI() {
    if (!InterruptMasterEnabled) {
        enableInterruptsDelay = 2;
    }
    return 1;
}

/*
********************************************************************************
Jump Commands
********************************************************************************
*/

/*
    JP nn  (0xC3)

    4 cycles
*/
int CPU::JP_nn() {
    programCounter.regstr = readImmediateWord();
    return 4;
}

// JP HL  (0xE9), 1 cycle
int CPU::JP_HL() {
    programCounter.regstr = regHL.regstr;
    return 1;
}

/*
    JP f, nn  (0xC2, 0xCA, 0xD2, 0xDA)

    Jumps to nn if condition f (NZ, Z, NC, C) holds.

    4 cycles if taken, 3 cycles if not
*/
int CPU::JP_f_nn(BYTE opcode) {
    WORD address = readImmediateWord();
    if (checkCondition(opcode)) {
        programCounter.regstr = address;
        return 4;
    }
    return 3;
}

/*
    JR PC+dd  (0x18)

    Relative jump by signed 8 bit immediate dd, counted from the next
    instruction.

    3 cycles
*/
int CPU::JR_PCdd() {
    SIGNED_BYTE offset = (SIGNED_BYTE) readImmediate();
    programCounter.regstr += offset;
    return 3;
}

/*
    JR f, PC+dd  (0x20, 0x28, 0x30, 0x38)

    3 cycles if taken, 2 cycles if not
*/
int CPU::JR_f_PCdd(BYTE opcode) {
    SIGNED_BYTE offset = (SIGNED_BYTE) readImmediate();
    if (checkCondition(opcode)) {
        programCounter.regstr += offset;
        return 3;
    }
    return 2;
}

/*
    CALL nn  (0xCD)

    Pushes the address of the next instruction and jumps to nn.

    6 cycles
*/
int CPU::CALL_nn() {
    WORD address = readImmediateWord();
    pushWord(programCounter.regstr);
    programCounter.regstr = address;
    return 6;
}

/*
    CALL f, nn  (0xC4, 0xCC, 0xD4, 0xDC)

    6 cycles if taken, 3 cycles if not
*/
int CPU::CALL_f_nn(BYTE opcode) {
    WORD address = readImmediateWord();
    if (checkCondition(opcode)) {
        pushWord(programCounter.regstr);
        programCounter.regstr = address;
        return 6;
    }
    return 3;
}

// RET  (0xC9), 4 cycles
int CPU::RET() {
    programCounter.regstr = popWord();
    return 4;
}

/*
    RET f  (0xC0, 0xC8, 0xD0, 0xD8)

    5 cycles if taken, 2 cycles if not
*/
int CPU::RET_f(BYTE opcode) {
    if (checkCondition(opcode)) {
        programCounter.regstr = popWord();
        return 5;
    }
    return 2;
}

/*
    RETI  (0xD9)

    Returns and enables interrupts straight away.

    4 cycles
*/
int CPU::RETI() {
    programCounter.regstr = popWord();
    InterruptMasterEnabled = true;
    enableInterruptsDelay = 0;
    return 4;
}

/*
    RST n  (0xC7, 0xCF, 0xD7, 0xDF, 0xE7, 0xEF, 0xF7, 0xFF)

    Calls the fixed address encoded in bits 3-5 of the opcode.

    4 cycles
*/
int CPU::RST_n(BYTE opcode) {
    pushWord(programCounter.regstr);
    programCounter.regstr = opcode & 0x38;
    return 4;
}
