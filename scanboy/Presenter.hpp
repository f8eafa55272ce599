#ifndef SCANBOY_PRESENTER_HPP
#define SCANBOY_PRESENTER_HPP

#include "FrameBuffer.hpp"

// Receives every completed frame from the scheduler
class Presenter {

    public:
        virtual ~Presenter() {}

        virtual void present(const FrameBuffer::Frame& frame) = 0;

};

#endif
