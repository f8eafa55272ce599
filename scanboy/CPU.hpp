#ifndef SCANBOY_CPU_HPP
#define SCANBOY_CPU_HPP

#include "MemoryBus.hpp"

// Cycles taken to jump to an interrupt vector
#define INTERRUPT_DISPATCH_CYCLES 5

enum RUN_MODE {
    RUNNING,
    HALTED,
    STOPPED,
    LOCKED // hit an undefined opcode, never runs again
};

class CPU {

    public:
        explicit CPU(MemoryBus& bus);

        void resetCPU();

        // Runs one instruction or one interrupt dispatch, returns M-cycles
        int run();

        // External wake signal for STOP (and HALT)
        void wake();

        RUN_MODE getRunMode() const;
        BYTE getLockedOpcode() const;
        WORD getLockedAddress() const;

        WORD getAF() const;
        WORD getBC() const;
        WORD getDE() const;
        WORD getHL() const;
        WORD getSP() const;
        WORD getPC() const;
        bool getIME() const;

        void setAF(WORD);
        void setBC(WORD);
        void setDE(WORD);
        void setHL(WORD);
        void setSP(WORD);
        void setPC(WORD);
        void setIME(bool);

        void setTrace(bool);

    private:
        // ATTRIBUTES

        MemoryBus& bus;

        //8 bit registers, which are paired to behave like a 16 bit register
        //To accesss the first register, RegXX.high
        //To access the second register, RegXX.low
        //To access both, RegXX.regstr
        Register regAF;
        Register regBC;
        Register regDE;
        Register regHL;

        //16 bit registers
        Register programCounter;
        Register stackPointer;

        // Interrupt
        bool InterruptMasterEnabled;
        int enableInterruptsDelay; // instructions left until EI takes effect

        RUN_MODE runMode;
        BYTE lockedOpcode;
        WORD lockedAddress;

        bool trace;

        // FUNCTIONS
        int executeNextOpcode();
        int executeOpcode(BYTE);
        int executeCBOpcode();
        int dispatchInterrupt(BYTE);
        int lockUp(BYTE);

        // Helpers
        BYTE readImmediate();
        WORD readImmediateWord();
        void pushWord(WORD);
        WORD popWord();
        void setFlag(int, bool);
        bool getFlag(int) const;
        bool checkCondition(BYTE) const;

        ////////// Start of opcodes //////////
        // 8 bit Load Commands
        int LD_r_R(BYTE&, BYTE);
        int LD_r_n(BYTE&);
        int LD_r_HL(BYTE&);
        int LD_HL_r(BYTE);
        int LD_HL_n();
        int LD_A_BC();
        int LD_A_DE();
        int LD_A_nn();
        int LD_BC_A();
        int LD_DE_A();
        int LD_nn_A();
        int LD_A_FF00n();
        int LD_FF00n_A();
        int LD_A_FF00C();
        int LD_FF00C_A();
        int LDI_HL_A();
        int LDI_A_HL();
        int LDD_HL_A();
        int LDD_A_HL();

        // 16 bit Load Commands
        int LD_rr_nn(Register&);
        int LD_SP_HL();
        int LD_nn_SP();
        int PUSH_rr(Register);
        int POP_rr(Register&);

        // 8 bit Arithmetic/Logical Commands
        int ADD_A_r(BYTE);
        int ADD_A_n();
        int ADD_A_HL();
        int ADC_A_r(BYTE);
        int ADC_A_n();
        int ADC_A_HL();
        int SUB_r(BYTE);
        int SUB_n();
        int SUB_HL();
        int SBC_A_r(BYTE);
        int SBC_A_n();
        int SBC_A_HL();
        int AND_r(BYTE);
        int AND_n();
        int AND_HL();
        int XOR_r(BYTE);
        int XOR_n();
        int XOR_HL();
        int OR_r(BYTE);
        int OR_n();
        int OR_HL();
        int CP_r(BYTE);
        int CP_n();
        int CP_HL();
        int INC_r(BYTE&);
        int INC_HL();
        int DEC_r(BYTE&);
        int DEC_HL();
        int DAA();
        int CPL();

        // 16 bit Arithmetic/Logical Commands
        int ADD_HL_rr(WORD);
        int INC_rr(WORD&);
        int DEC_rr(WORD&);
        int ADD_SP_dd();
        int LD_HL_SPdd();

        // Rotate and Shift Commands
        int RLCA();
        int RLA();
        int RRCA();
        int RRA();
        int RLC_r(BYTE&);
        int RLC_HL();
        int RL_r(BYTE&);
        int RL_HL();
        int RRC_r(BYTE&);
        int RRC_HL();
        int RR_r(BYTE&);
        int RR_HL();
        int SLA_r(BYTE&);
        int SLA_HL();
        int SWAP_r(BYTE&);
        int SWAP_HL();
        int SRA_r(BYTE&);
        int SRA_HL();
        int SRL_r(BYTE&);
        int SRL_HL();

        // Single Bit Operation Commands
        int BIT_n_r(BYTE, int);
        int BIT_n_HL(int);
        int SET_n_r(BYTE&, int);
        int SET_n_HL(int);
        int RES_n_r(BYTE&, int);
        int RES_n_HL(int);

        // CPU Control Commands
        int CCF();
        int SCF();
        int NOP();
        int HALT();
        int STOP();
        int DI();
        int EI();

        // Jump Commands
        int JP_nn();
        int JP_HL();
        int JP_f_nn(BYTE);
        int JR_PCdd();
        int JR_f_PCdd(BYTE);
        int CALL_nn();
        int CALL_f_nn(BYTE);
        int RET();
        int RET_f(BYTE);
        int RETI();
        int RST_n(BYTE);
        ////////// end of opcodes //////////

};

#endif
