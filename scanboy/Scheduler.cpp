#include <iomanip>
#include <iostream>

#include "Scheduler.hpp"

using namespace std;

const float millisPerFrame = 1000.0 / FRAMES_PER_SECOND;
const chrono::duration<float, milli> timePerFrame(millisPerFrame);

Scheduler::Scheduler(CPU& cpu, PPU& ppu, MemoryBus& bus) :
    cpu(cpu),
    ppu(ppu),
    bus(bus),
    presenter(nullptr),
    cpuCycles(0),
    ppuCycles(0),
    lastEngine(ENGINE_NONE),
    frameCount(0),
    frameDelivered(false),
    lockReported(false),
    pacing(true),
    previous(chrono::high_resolution_clock::now()),
    stopping(false) {}

bool Scheduler::tick() {

    if (cpu.getRunMode() == LOCKED) {
        reportLock();
        return false;
    }

    if (ppuCycles < cpuCycles) {
        // Never more than one CPU step behind, fits an int
        int budget = (int) (cpuCycles - ppuCycles);
        ppuCycles += ppu.run(budget);
        lastEngine = ENGINE_PPU;
    } else {
        // Timer and serial are frozen while the CPU is stopped
        bool stopped = cpu.getRunMode() == STOPPED;
        int dots = cpu.run() * 4;
        cpuCycles += dots;
        if (!stopped) {
            bus.tick(dots);
        }
        lastEngine = ENGINE_CPU;

        if (cpu.getRunMode() == LOCKED) {
            reportLock();
            return false;
        }
    }

    if (ppu.frameReady()) {
        deliverFrame();
    }

    return true;
}

bool Scheduler::runFrame() {
    frameDelivered = false;

    while (!frameDelivered) {
        if (stopRequested() || !tick()) {
            return false;
        }
    }

    return true;
}

void Scheduler::deliverFrame() {
    frameCount++;
    frameDelivered = true;

    if (presenter != nullptr) {
        presenter->present(ppu.getFrame());
    }

    waitForNextFrame();
}

// Sleep to use up the rest of the frame time
void Scheduler::waitForNextFrame() {
    if (pacing) {
        auto deadline = previous + chrono::duration_cast<chrono::high_resolution_clock::duration>(timePerFrame);
        unique_lock<mutex> lock(stopMutex);
        stopSignal.wait_until(lock, deadline, [this] { return stopping; });
    }

    previous = chrono::high_resolution_clock::now();
}

void Scheduler::reportLock() {
    if (lockReported) {
        return;
    }
    lockReported = true;

    cerr << hex << uppercase << setfill('0')
         << "Emulation stopped: CPU locked by opcode 0x" << setw(2) << (int) cpu.getLockedOpcode()
         << " at 0x" << setw(4) << (int) cpu.getLockedAddress()
         << dec << endl;
}

void Scheduler::setPresenter(Presenter* target) {
    presenter = target;
}

void Scheduler::setPacing(bool enabled) {
    pacing = enabled;
    previous = chrono::high_resolution_clock::now();
}

void Scheduler::requestStop() {
    {
        lock_guard<mutex> lock(stopMutex);
        stopping = true;
    }
    stopSignal.notify_all();
}

bool Scheduler::stopRequested() const {
    lock_guard<mutex> lock(stopMutex);
    return stopping;
}

long long Scheduler::getCPUCycles() const {
    return cpuCycles;
}

long long Scheduler::getPPUCycles() const {
    return ppuCycles;
}

ENGINE Scheduler::getLastEngine() const {
    return lastEngine;
}

int Scheduler::getFrameCount() const {
    return frameCount;
}
