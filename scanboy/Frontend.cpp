#include <cstdio>

#include "Frontend.hpp"

using namespace std;

// Shade to ARGB8888
static const Uint32 palette[4] = {
    0xFFFFFFFF, // WHITE
    0xFFCCCCCC, // LIGHT_GRAY
    0xFF777777, // DARK_GRAY
    0xFF000000  // BLACK
};

SDLPresenter::SDLPresenter() :
    window(nullptr),
    sdlRenderer(nullptr),
    sdlTexture(nullptr),
    scale(1) {

    for (int i = 0; i < SCREEN_WIDTH * SCREEN_HEIGHT; i++) {
        displayPixels[i] = palette[WHITE];
    }
}

SDLPresenter::~SDLPresenter() {
    if (sdlTexture != nullptr) {
        SDL_DestroyTexture(sdlTexture);
    }
    if (sdlRenderer != nullptr) {
        SDL_DestroyRenderer(sdlRenderer);
    }
    if (window != nullptr) {
        SDL_DestroyWindow(window);
    }
}

int SDLPresenter::open(const string& title, int windowScale) {
    scale = windowScale;

    // Create window
    window = SDL_CreateWindow(
        title.c_str(),
        SDL_WINDOWPOS_UNDEFINED,
        SDL_WINDOWPOS_UNDEFINED,
        SCREEN_WIDTH * scale,
        SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN
    );
    if (window == nullptr) {
        printf("Window could not be created! SDL_Error: %s\n", SDL_GetError());
        return 2;
    }

    // Create renderer
    sdlRenderer = SDL_CreateRenderer(
        window,
        -1,
        SDL_RENDERER_ACCELERATED
    );
    if (sdlRenderer == nullptr) {
        printf("Renderer could not be created! SDL_Error: %s\n", SDL_GetError());
        return 3;
    }

    // Create texture
    sdlTexture = SDL_CreateTexture(
        sdlRenderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        SCREEN_WIDTH, SCREEN_HEIGHT
    );
    if (sdlTexture == nullptr) {
        printf("Texture could not be created! SDL_Error: %s\n", SDL_GetError());
        return 3;
    }

    return 0;
}

void SDLPresenter::present(const FrameBuffer::Frame& frame) {
    if (sdlTexture == nullptr) {
        return;
    }

    for (int i = 0; i < SCREEN_WIDTH * SCREEN_HEIGHT; i++) {
        displayPixels[i] = palette[frame[i] & 0x03];
    }

    SDL_UpdateTexture(sdlTexture, NULL, displayPixels, SCREEN_WIDTH * sizeof(Uint32));
    SDL_RenderClear(sdlRenderer);
    SDL_Rect dest;
    dest.x = 0;
    dest.y = 0;
    dest.w = SCREEN_WIDTH * scale;
    dest.h = SCREEN_HEIGHT * scale;
    SDL_RenderCopy(sdlRenderer, sdlTexture, NULL, &dest);
    SDL_RenderPresent(sdlRenderer);
}

KeyboardInput::KeyboardInput() : keyState(0xFF) {}

void KeyboardInput::processInput(const SDL_Event& event) {

    if (event.type == SDL_KEYDOWN) {
        int key = keyToButton(event.key.keysym.sym);
        if (key != -1) {
            keyState = bitReset(keyState, key);
        }
    } else if (event.type == SDL_KEYUP) {
        int key = keyToButton(event.key.keysym.sym);
        if (key != -1) {
            keyState = bitSet(keyState, key);
        }
    }
}

BYTE KeyboardInput::buttonState() const {
    return keyState;
}

int KeyboardInput::keyToButton(SDL_Keycode keycode) const {
    switch (keycode) {
        case SDLK_a:        return BUTTON_A;
        case SDLK_s:        return BUTTON_B;
        case SDLK_RETURN:   return BUTTON_START;
        case SDLK_SPACE:    return BUTTON_SELECT;
        case SDLK_RIGHT:    return BUTTON_RIGHT;
        case SDLK_LEFT:     return BUTTON_LEFT;
        case SDLK_UP:       return BUTTON_UP;
        case SDLK_DOWN:     return BUTTON_DOWN;
        default:            return -1;
    }
}
