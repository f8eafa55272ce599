#ifndef SCANBOY_FRONTEND_HPP
#define SCANBOY_FRONTEND_HPP

#include <string>

#include <SDL2/SDL.h>

#include "Input.hpp"
#include "Presenter.hpp"

/*
Window, renderer and streaming texture. Shades are turned into ARGB8888
pixels and the 160x144 texture is stretched over the whole window.
*/
class SDLPresenter : public Presenter {

    public:
        SDLPresenter();
        ~SDLPresenter();

        // Returns 0, or the exit status for the step that failed
        int open(const std::string& title, int scale);

        void present(const FrameBuffer::Frame& frame);

    private:
        SDL_Window* window;
        SDL_Renderer* sdlRenderer;
        SDL_Texture* sdlTexture;
        int scale;
        Uint32 displayPixels[SCREEN_WIDTH * SCREEN_HEIGHT];

};

/*
Keyboard buttons:
SDLK_a : A
SDLK_s : B
SDLK_RETURN : Start
SDLK_SPACE : Select
Arrow keys : directions
*/
class KeyboardInput : public InputDevice {

    public:
        KeyboardInput();

        void processInput(const SDL_Event& event);

        BYTE buttonState() const;

    private:
        BYTE keyState; // 1 = unpressed

        int keyToButton(SDL_Keycode) const;

};

#endif
