#ifndef SCANBOY_PPU_HPP
#define SCANBOY_PPU_HPP

#include <vector>

#include "FrameBuffer.hpp"
#include "MemoryBus.hpp"

// Mode lengths in dots
#define OAM_SCAN_CYCLES 80
#define PIXEL_DRAW_CYCLES 172
#define HBLANK_CYCLES 204
#define SCANLINE_CYCLES 456
#define FRAME_CYCLES 70224

#define VISIBLE_LINES 144
#define TOTAL_LINES 154
#define MAX_SPRITES_PER_LINE 10

// Values match the mode bits of STAT
enum PPU_MODE {
    HBLANK = 0,
    VBLANK = 1,
    OAM_SCAN = 2,
    PIXEL_DRAW = 3
};

struct Sprite {
    BYTE yPos;
    BYTE xPos;
    BYTE tileNum;
    BYTE attributes;
};

class PPU {

    public:
        explicit PPU(MemoryBus& bus);

        void reset();

        int run(int budget);

        const FrameBuffer::Frame& getFrame() const;
        bool frameReady();

        PPU_MODE getMode() const;
        BYTE getLY() const;
        int getRemainingCycles() const;

    private:
        MemoryBus& bus;
        FrameBuffer frameBuffer;

        PPU_MODE mode;
        int remainingCycles;
        int windowLine; // lines of the window drawn so far this frame
        bool LCDWasEnabled;
        int disabledCycles;

        std::vector<Sprite> lineSprites;
        BYTE backgroundColours[SCREEN_WIDTH]; // colour numbers before the palette

        void advanceMode();
        void enterMode(PPU_MODE, int);
        void setLY(BYTE);
        bool LCDEnabled() const;
        int runDisabled(int);

        void scanOAM();
        void drawScanLine();
        void renderTiles(BYTE, BYTE*);
        void renderSprites(BYTE, BYTE*);
        COLOUR getColour(BYTE, WORD) const;

};

#endif
