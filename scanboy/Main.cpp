#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <SDL2/SDL.h>

#include "CPU.hpp"
#include "Cartridge.hpp"
#include "Frontend.hpp"
#include "Input.hpp"
#include "MemoryBus.hpp"
#include "PPU.hpp"
#include "Scheduler.hpp"

using namespace std;

struct Config {
    string romPath;
    int scale = 2;
    bool pace = true;
    bool serialEcho = false;
    bool trace = false;
};

void printUsage() {
    cout << "Usage: scanboy <rom> [--scale N] [--no-pace] [--serial] [--trace]" << endl;
}

bool parseArguments(int argc, char** argv, Config& config) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "--scale") == 0) {
            if (i + 1 >= argc) {
                return false;
            }
            config.scale = atoi(argv[++i]);
            if (config.scale < 1 || config.scale > 10) {
                return false;
            }
        } else if (strcmp(arg, "--no-pace") == 0) {
            config.pace = false;
        } else if (strcmp(arg, "--serial") == 0) {
            config.serialEcho = true;
        } else if (strcmp(arg, "--trace") == 0) {
            config.trace = true;
        } else if (arg[0] == '-' || !config.romPath.empty()) {
            return false;
        } else {
            config.romPath = arg;
        }
    }

    return !config.romPath.empty();
}

int main(int argc, char** argv) {

    Config config;
    if (!parseArguments(argc, argv, config)) {
        printUsage();
        return 1;
    }

    // Load game
    unique_ptr<Cartridge> cartridge = loadCartridge(config.romPath);
    if (cartridge == nullptr) {
        cout << "Something wrong occured while loading!" << endl;
        return 4;
    }
    string title = cartridge->getTitle();

    MemoryBus bus(move(cartridge));
    bus.getSerial().setEcho(config.serialEcho);

    CPU cpu(bus);
    cpu.setTrace(config.trace);
    PPU ppu(bus);

    // Initialize SDL
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        printf("SDL could not initialize! SDL_Error: %s\n", SDL_GetError());
        return 1;
    }

    int status = 0;
    {
        SDLPresenter presenter;
        status = presenter.open("scanboy - " + title, config.scale);

        if (status == 0) {
            KeyboardInput keyboard;
            InputHandler inputHandler(bus);
            inputHandler.addDevice(&keyboard);

            Scheduler scheduler(cpu, ppu, bus);
            scheduler.setPresenter(&presenter);
            scheduler.setPacing(config.pace);

            // Emulation loop. SDL turns SIGINT and SIGTERM into SDL_QUIT
            SDL_Event event;

            while (!scheduler.stopRequested()) {

                // Process user input
                while (SDL_PollEvent(&event)) {
                    if (event.type == SDL_QUIT ||
                            (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE)) {
                        scheduler.requestStop();
                        continue;
                    }
                    keyboard.processInput(event);
                }
                inputHandler.poll();

                if (!scheduler.runFrame()) {
                    if (cpu.getRunMode() == LOCKED) {
                        status = 5;
                    }
                    scheduler.requestStop();
                }
            }
        }
    }

    SDL_Quit();

    return status;

}
