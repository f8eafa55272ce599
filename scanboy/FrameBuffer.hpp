#ifndef SCANBOY_FRAMEBUFFER_HPP
#define SCANBOY_FRAMEBUFFER_HPP

#include <array>

#include "Common.hpp"

#define SCREEN_WIDTH 160
#define SCREEN_HEIGHT 144

/*
Two screens of shades (COLOUR values), one being drawn (back) and one
holding the last finished frame (front). swap() exchanges the roles, the
buffers themselves are never reallocated.
*/
class FrameBuffer {

    public:
        typedef std::array<BYTE, SCREEN_WIDTH * SCREEN_HEIGHT> Frame;

        FrameBuffer();

        void reset();

        BYTE* backRow(int line);
        void clearBack(BYTE shade);
        const Frame& front() const;

        void swap();
        bool consume();

    private:
        Frame buffers[2];
        int frontIndex;
        bool ready;

};

#endif
