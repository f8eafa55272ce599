#ifndef SCANBOY_COMMON_HPP
#define SCANBOY_COMMON_HPP

// For the flag bits in register F
#define FLAG_ZERO 7
#define FLAG_SUB 6
#define FLAG_HALFCARRY 5
#define FLAG_CARRY 4

// Joypad and serial registers
#define JOYPAD 0xFF00
#define SERIAL_DATA 0xFF01
#define SERIAL_CONTROL 0xFF02

// For timer registers
#define DIVIDER 0xFF04
#define TIMA 0xFF05
#define TMA 0xFF06
#define TAC 0xFF07

// Interrupt registers
#define INTERRUPT_FLAG 0xFF0F
#define INTERRUPT_ENABLE 0xFFFF

// LCD registers
#define LCDC 0xFF40
#define STAT 0xFF41
#define SCY 0xFF42
#define SCX 0xFF43
#define LY 0xFF44
#define LYC 0xFF45
#define DMA 0xFF46
#define BGP 0xFF47
#define OBP0 0xFF48
#define OBP1 0xFF49
#define WY 0xFF4A
#define WX 0xFF4B

// Interrupt IDs, also their bit in IE and IF
#define INTERRUPT_VBLANK 0
#define INTERRUPT_STAT 1
#define INTERRUPT_TIMER 2
#define INTERRUPT_SERIAL 3
#define INTERRUPT_JOYPAD 4

typedef unsigned char BYTE;
typedef signed char SIGNED_BYTE;
typedef unsigned short WORD;
typedef signed short SIGNED_WORD;

union Register {
    WORD regstr;
    struct {
        BYTE low;
        BYTE high;
    };
};

enum COLOUR {
    WHITE,
    LIGHT_GRAY,
    DARK_GRAY,
    BLACK
};

// Utility
inline bool isBitSet(BYTE data, int position) {
    return ((data >> position) & 0x1) == 0x1;
}

inline BYTE bitSet(BYTE data, int position) {
    int mask = 1 << position;
    return data | mask;
}

inline BYTE bitReset(BYTE data, int position) {
    int mask = ~(1 << position);
    return data & mask;
}

#endif
