#include "FrameBuffer.hpp"

FrameBuffer::FrameBuffer() {
    reset();
}

void FrameBuffer::reset() {
    buffers[0].fill(WHITE);
    buffers[1].fill(WHITE);
    frontIndex = 0;
    ready = false;
}

BYTE* FrameBuffer::backRow(int line) {
    return buffers[1 - frontIndex].data() + (line * SCREEN_WIDTH);
}

void FrameBuffer::clearBack(BYTE shade) {
    buffers[1 - frontIndex].fill(shade);
}

const FrameBuffer::Frame& FrameBuffer::front() const {
    return buffers[frontIndex];
}

void FrameBuffer::swap() {
    frontIndex = 1 - frontIndex;
    ready = true;
}

// Reports a finished frame once, then forgets about it
bool FrameBuffer::consume() {
    bool wasReady = ready;
    ready = false;
    return wasReady;
}
