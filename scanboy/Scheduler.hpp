#ifndef SCANBOY_SCHEDULER_HPP
#define SCANBOY_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "CPU.hpp"
#include "MemoryBus.hpp"
#include "PPU.hpp"
#include "Presenter.hpp"

// Nominal DMG refresh rate
#define FRAMES_PER_SECOND 59.7275

enum ENGINE {
    ENGINE_NONE,
    ENGINE_CPU,
    ENGINE_PPU
};

/*
Interleaves the CPU and the PPU by cycle debt. Both counters are in dots.
The engine that is behind runs next, ties go to the CPU.
*/
class Scheduler {

    public:
        Scheduler(CPU& cpu, PPU& ppu, MemoryBus& bus);

        // Runs one engine once. Returns false when the CPU is locked
        bool tick();

        // Ticks until a frame has been presented. Returns false if the CPU
        // locked or a stop was requested before that
        bool runFrame();

        // Not owned, may be nullptr
        void setPresenter(Presenter*);
        void setPacing(bool);

        // Safe to call from any thread, wakes up a pacing wait
        void requestStop();
        bool stopRequested() const;

        long long getCPUCycles() const;
        long long getPPUCycles() const;
        ENGINE getLastEngine() const;
        int getFrameCount() const;

    private:
        CPU& cpu;
        PPU& ppu;
        MemoryBus& bus;
        Presenter* presenter;

        long long cpuCycles;
        long long ppuCycles;
        ENGINE lastEngine;
        int frameCount;
        bool frameDelivered;
        bool lockReported;

        bool pacing;
        std::chrono::high_resolution_clock::time_point previous;

        mutable std::mutex stopMutex;
        std::condition_variable stopSignal;
        bool stopping;

        void reportLock();
        void deliverFrame();
        void waitForNextFrame();

};

#endif
