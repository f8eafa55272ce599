/*

The LCD controller runs on a 2^22 Hz dot clock, the same as the CPU clock.

An entire frame consists of 154 scanlines
Screen resolution: 160x144 (scanlines 0-143: visible)
10 line vblank (scanlines 144-153: invisible)
Each scanline takes 456 dots -> entire frame 70224 dots

Every visible line goes through three modes:

Mode 2  OAM scan     80 dots    sprites on the line are picked from OAM
Mode 3  Pixel draw  172 dots    the line is sent to the LCD
Mode 0  H-Blank     204 dots

followed by 10 lines of Mode 1 (V-Blank). The real mode 3 gets longer with
sprites, window and scrolling and HBlank gets shorter by the same amount;
here both are fixed.

run() only counts dots down. Everything a mode does (picking sprites,
drawing a line, bumping LY, raising interrupts, swapping buffers) happens
at once when its counter hits zero.

++ Register 0xFF41 (STAT) ++
Bits 1-0: current mode
Bit 2: coincidence flag, LY == LYC
Bit 3: Mode 0 H-Blank interrupt enabled
Bit 4: Mode 1 V-Blank interrupt enabled
Bit 5: Mode 2 OAM interrupt enabled
Bit 6: LY == LYC interrupt enabled
++ End of 0xFF41 ++

++ Register 0xFF40 (LCDC) ++
Bit 7 - LCD Display Enable             (0=Off, 1=On)
Bit 6 - Window Tile Map Display Select (0=9800-9BFF, 1=9C00-9FFF)
Bit 5 - Window Display Enable          (0=Off, 1=On)
Bit 4 - BG & Window Tile Data Select   (0=8800-97FF, 1=8000-8FFF)
Bit 3 - BG Tile Map Display Select     (0=9800-9BFF, 1=9C00-9FFF)
Bit 2 - OBJ (Sprite) Size              (0=8x8, 1=8x16)
Bit 1 - OBJ (Sprite) Display Enable    (0=Off, 1=On)
Bit 0 - BG/Window Display/Priority     (0=Off, 1=On)
++ End of 0xFF40 ++

Tile Data is stored in VRAM at 0x8000-97FF, 16 bytes per tile. The "8000
method" indexes it unsigned from 0x8000, the "8800 method" signed from
0x9000. Sprites always use 8000 addressing, BG and window follow LCDC bit 4.
The tile maps (0x9800 and 0x9C00) are 32x32 tile numbers.

*/

#include <algorithm>

#include "PPU.hpp"

using namespace std;

PPU::PPU(MemoryBus& bus) : bus(bus) {
    reset();
}

void PPU::reset() {

    frameBuffer.reset();
    lineSprites.clear();
    windowLine = 0;
    disabledCycles = 0;
    LCDWasEnabled = LCDEnabled();

    for (int pixel = 0; pixel < SCREEN_WIDTH; pixel++) {
        backgroundColours[pixel] = 0;
    }

    setLY(0);
    enterMode(OAM_SCAN, OAM_SCAN_CYCLES);

}

/*
********************************************************************************
STATE MACHINE
********************************************************************************
*/

int PPU::run(int budget) {

    if (budget <= 0) {
        return 0;
    }

    if (!LCDEnabled()) {
        return runDisabled(budget);
    }

    // Switching the LCD back on starts a fresh frame
    if (!LCDWasEnabled) {
        LCDWasEnabled = true;
        windowLine = 0;
        setLY(0);
        enterMode(OAM_SCAN, OAM_SCAN_CYCLES);
    }

    int consumed = min(budget, remainingCycles);
    remainingCycles -= consumed;

    if (remainingCycles == 0) {
        advanceMode();
    }

    return consumed;

}

void PPU::advanceMode() {

    switch (mode) {

        case OAM_SCAN:
            scanOAM();
            enterMode(PIXEL_DRAW, PIXEL_DRAW_CYCLES);
            break;

        case PIXEL_DRAW:
            drawScanLine();
            enterMode(HBLANK, HBLANK_CYCLES);
            break;

        case HBLANK: {
            BYTE currentLine = getLY() + 1;
            setLY(currentLine);

            // encountered vblank period, the frame in the backbuffer is done
            if (currentLine == VISIBLE_LINES) {
                enterMode(VBLANK, SCANLINE_CYCLES);
                bus.requestInterrupt(INTERRUPT_VBLANK);
                frameBuffer.swap();
            } else {
                enterMode(OAM_SCAN, OAM_SCAN_CYCLES);
            }
            break;
        }

        case VBLANK: {
            BYTE currentLine = getLY() + 1;

            // if gone past scanline 153 reset to 0
            if (currentLine == TOTAL_LINES) {
                windowLine = 0;
                setLY(0);
                enterMode(OAM_SCAN, OAM_SCAN_CYCLES);
            } else {
                setLY(currentLine);
                remainingCycles = SCANLINE_CYCLES;
            }
            break;
        }

    }

}

void PPU::enterMode(PPU_MODE newMode, int cycles) {

    mode = newMode;
    remainingCycles = cycles;

    BYTE status = bus.getRegister(STAT);
    status = (status & 0xFC) | newMode;
    bus.setRegister(STAT, status);

    // Bits 3, 4 and 5 enable the interrupt for modes 0, 1 and 2
    if ((newMode != PIXEL_DRAW) && isBitSet(status, 3 + newMode)) {
        bus.requestInterrupt(INTERRUPT_STAT);
    }

}

void PPU::setLY(BYTE line) {

    // need to update directly since LY is read only through the bus
    bus.setRegister(LY, line);

    // check for the coincidence flag
    BYTE status = bus.getRegister(STAT);
    if (line == bus.getRegister(LYC)) {
        status = bitSet(status, 2);
        // check if coincidence flag interrupt (bit 6) is enabled
        if (isBitSet(status, 6)) {
            bus.requestInterrupt(INTERRUPT_STAT);
        }
    } else {
        status = bitReset(status, 2);
    }
    bus.setRegister(STAT, status);

}

bool PPU::LCDEnabled() const {
    return isBitSet(bus.getRegister(LCDC), 7);
}

/*
With the LCD off, LY stays at 0, STAT reports mode 0 and nothing is drawn.
A white frame still goes out every 70224 dots so the screen blanks and
frame pacing keeps going.
*/
int PPU::runDisabled(int budget) {

    if (LCDWasEnabled) {
        LCDWasEnabled = false;
        disabledCycles = 0;
        bus.setRegister(LY, 0);
        bus.setRegister(STAT, bus.getRegister(STAT) & 0xFC);
        mode = HBLANK;
        remainingCycles = 0;
    }

    int consumed = min(budget, FRAME_CYCLES - disabledCycles);
    disabledCycles += consumed;

    if (disabledCycles == FRAME_CYCLES) {
        disabledCycles = 0;
        frameBuffer.clearBack(WHITE);
        frameBuffer.swap();
    }

    return consumed;

}

/*
********************************************************************************
QUERIES
********************************************************************************
*/

const FrameBuffer::Frame& PPU::getFrame() const {
    return frameBuffer.front();
}

// Clears the flag, so each finished frame is reported exactly once
bool PPU::frameReady() {
    return frameBuffer.consume();
}

PPU_MODE PPU::getMode() const {
    return mode;
}

BYTE PPU::getLY() const {
    return bus.getRegister(LY);
}

int PPU::getRemainingCycles() const {
    return remainingCycles;
}

/*
********************************************************************************
RENDERING
********************************************************************************
*/

/*
Sprite occupies 4 bytes in OAM
BYTE0: Y position + 16
BYTE1: X position + 8
BYTE2: Tile identifier number. Used to look up tile pattern in VRAM
BYTE3: Sprite attributes
    Bit 7: BG priority (1 = hidden behind BG colours 1-3)
    Bit 6: Y flip
    Bit 5: X flip
    Bit 4: Palette (0 = OBP0, 1 = OBP1)

Only the first 10 sprites in OAM order that cover the line are used. Among
those, the one with the smaller X wins, then the one earlier in OAM.
*/
void PPU::scanOAM() {

    lineSprites.clear();

    BYTE lcdControl = bus.getRegister(LCDC);
    int ySize = isBitSet(lcdControl, 2) ? 16 : 8;
    int scanLine = getLY() + 16;

    for (int sprite = 0; sprite < 40; sprite++) {

        WORD index = 0xFE00 + (sprite << 2);
        Sprite entry;
        entry.yPos = bus.read8(index);
        entry.xPos = bus.read8(index + 1);
        entry.tileNum = bus.read8(index + 2);
        entry.attributes = bus.read8(index + 3);

        if ((scanLine >= entry.yPos) && (scanLine < (entry.yPos + ySize))) {
            lineSprites.push_back(entry);
            if (lineSprites.size() == MAX_SPRITES_PER_LINE) break;
        }

    }

    // stable, so equal X keeps OAM order
    stable_sort(lineSprites.begin(), lineSprites.end(),
        [](const Sprite& a, const Sprite& b) { return a.xPos < b.xPos; });

}

void PPU::drawScanLine() {

    BYTE lcdControl = bus.getRegister(LCDC);
    BYTE* row = frameBuffer.backRow(getLY());

    if (isBitSet(lcdControl, 0)) {
        renderTiles(lcdControl, row);
    } else {
        // BG and window off, the line is blank and sprites always win
        for (int pixel = 0; pixel < SCREEN_WIDTH; pixel++) {
            row[pixel] = WHITE;
            backgroundColours[pixel] = 0;
        }
    }

    if (isBitSet(lcdControl, 1)) {
        renderSprites(lcdControl, row);
    }

}

void PPU::renderTiles(BYTE lcdControl, BYTE* row) {

    /*
    Steps to render tiles:
    1. Find out tile identifier number from background or window tile map
    2. Using the tile identifier number, get the tile data from VRAM
    3. Using the tile data, draw out the tile
    */

    // Get coordinates of viewport
    BYTE scrollY = bus.getRegister(SCY);
    BYTE scrollX = bus.getRegister(SCX);
    BYTE windowY = bus.getRegister(WY);
    int windowX = bus.getRegister(WX) - 7;
    BYTE currentLine = getLY();

    // Check if window is enabled and if current scanline is within windowY
    bool windowOnLine = isBitSet(lcdControl, 5) && (windowY <= currentLine)
        && (windowX < SCREEN_WIDTH);
    bool windowDrawn = false;

    // Get Tile Data location & addressing mode
    WORD tileDataLocation;
    bool unsignedAddressing;

    if (isBitSet(lcdControl, 4)) {
        // location: 0x8000-8FFF
        tileDataLocation = 0x8000;
        unsignedAddressing = true;
    } else {
        // location: 0x8800-97FF
        // Tile #0 is actually at 0x9000
        tileDataLocation = 0x9000;
        unsignedAddressing = false;
    }

    WORD backgroundMap = isBitSet(lcdControl, 3) ? 0x9C00 : 0x9800;
    WORD windowMap = isBitSet(lcdControl, 6) ? 0x9C00 : 0x9800;

    for (int pixel = 0; pixel < SCREEN_WIDTH; pixel++) {

        WORD tileMapLocation;
        BYTE xPos;
        BYTE yPos;

        // The window is not scrollable, it has its own line counter and
        // always displays from its top left corner
        if (windowOnLine && (pixel >= windowX)) {
            tileMapLocation = windowMap;
            xPos = pixel - windowX;
            yPos = windowLine;
            windowDrawn = true;
        } else {
            tileMapLocation = backgroundMap;
            xPos = scrollX + pixel; // wraps around the 256x256 map
            yPos = scrollY + currentLine;
        }

        // Calculate tile identifier number from tile row & column
        BYTE tileNum = bus.read8(tileMapLocation + ((yPos / 8) * 32) + (xPos / 8));

        // Get tile data address
        WORD tileDataAddress;
        if (unsignedAddressing) {
            tileDataAddress = tileDataLocation + (tileNum * 16);
        } else {
            tileDataAddress = tileDataLocation + (static_cast<SIGNED_BYTE>(tileNum) * 16);
        }

        // Each line is 2 bytes long, to get the current line, add the offset
        tileDataAddress += (yPos % 8) << 1;

        BYTE b1 = bus.read8(tileDataAddress);
        BYTE b2 = bus.read8(tileDataAddress + 1);

        // pixel 0 of the tile is bit 7
        BYTE bit = 7 - (xPos % 8);
        BYTE colourBit0 = isBitSet(b1, bit) ? 0b01 : 0b00;
        BYTE colourBit1 = isBitSet(b2, bit) ? 0b10 : 0b00;
        BYTE colourNum = colourBit1 + colourBit0;

        backgroundColours[pixel] = colourNum;
        row[pixel] = getColour(colourNum, BGP);

    }

    if (windowDrawn) {
        windowLine++;
    }

}

void PPU::renderSprites(BYTE lcdControl, BYTE* row) {

    bool use8x16 = isBitSet(lcdControl, 2);
    int ySize = use8x16 ? 16 : 8;
    int scanLine = getLY();

    for (int pixel = 0; pixel < SCREEN_WIDTH; pixel++) {

        // Sprites are in priority order, the first non transparent one
        // decides the pixel
        for (size_t i = 0; i < lineSprites.size(); i++) {

            const Sprite& sprite = lineSprites[i];
            int left = sprite.xPos - 8;
            if ((pixel < left) || (pixel >= left + 8)) continue;

            int tileXOffset = pixel - left;
            int tileYOffset = scanLine - (sprite.yPos - 16);

            // Read the sprite backwards if flipped
            if (isBitSet(sprite.attributes, 5)) tileXOffset = 7 - tileXOffset;
            if (isBitSet(sprite.attributes, 6)) tileYOffset = (ySize - 1) - tileYOffset;

            // 8x16 sprites are a pair of tiles, the lower bit of the number
            // is ignored
            BYTE tileNum = sprite.tileNum;
            if (use8x16) {
                tileNum = (tileYOffset < 8) ? (tileNum & 0xFE) : (tileNum | 0x01);
                tileYOffset %= 8;
            }

            WORD lineDataAddress = 0x8000 + (tileNum * 16) + (tileYOffset << 1);
            BYTE b1 = bus.read8(lineDataAddress);
            BYTE b2 = bus.read8(lineDataAddress + 1);

            int colourBit = 7 - tileXOffset;
            BYTE colourBit0 = isBitSet(b1, colourBit) ? 0b01 : 0b00;
            BYTE colourBit1 = isBitSet(b2, colourBit) ? 0b10 : 0b00;
            BYTE colourNum = colourBit1 + colourBit0;

            // Colour 0 is transparent for sprites
            if (colourNum == 0) continue;

            // check if pixel is hidden behind background
            if (isBitSet(sprite.attributes, 7) && (backgroundColours[pixel] != 0)) {
                break;
            }

            WORD palette = isBitSet(sprite.attributes, 4) ? OBP1 : OBP0;
            row[pixel] = getColour(colourNum, palette);
            break;

        }

    }

}

COLOUR PPU::getColour(BYTE colourNum, WORD address) const {

    /*
    A palette register assigns gray shades to the colour numbers:
    Bit 7-6 - Shade for Color Number 3
    Bit 5-4 - Shade for Color Number 2
    Bit 3-2 - Shade for Color Number 1
    Bit 1-0 - Shade for Color Number 0
    */
    BYTE palette = bus.getRegister(address);
    int colourID = (palette >> (colourNum << 1)) & 0b11;

    // Convert ID into emulator colour
    switch (colourID) {
        case 0b00: return WHITE;
        case 0b01: return LIGHT_GRAY;
        case 0b10: return DARK_GRAY;
        default: return BLACK;
    }

}
