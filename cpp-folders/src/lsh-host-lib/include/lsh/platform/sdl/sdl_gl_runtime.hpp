#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sdl_gl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 цонх + OpenGL ES 3 context. Event-үүдийг PlatformInputState болгоно,
            SDL keycode-ыг DOM keyCode руу хөрвүүлнэ.
*/


#include <cstdint>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "lsh/core/log.hpp"
#include "lsh/core/time.hpp"
#include "lsh/platform/platform_runtime.hpp"

namespace lsh
{
    // SDL_Init-ийн дараа дуудна.
    inline TickSource sdl_tick_source()
    {
        TickSource s{};
        s.now = []() -> uint64_t { return (uint64_t)SDL_GetPerformanceCounter(); };
        s.tick_hz = (double)SDL_GetPerformanceFrequency();
        return s;
    }

    // Танигдаагүй түлхүүр -1.
    inline int dom_key_code(SDL_Keycode sym)
    {
        if (sym >= SDLK_a && sym <= SDLK_z) return 65 + (int)(sym - SDLK_a);
        if (sym >= SDLK_0 && sym <= SDLK_9) return 48 + (int)(sym - SDLK_0);
        if (sym >= SDLK_F1 && sym <= SDLK_F12) return 112 + (int)(sym - SDLK_F1);
        if (sym >= SDLK_KP_1 && sym <= SDLK_KP_9) return 97 + (int)(sym - SDLK_KP_1);
        switch (sym)
        {
            case SDLK_BACKSPACE: return 8;
            case SDLK_TAB: return 9;
            case SDLK_RETURN: return 13;
            case SDLK_LSHIFT:
            case SDLK_RSHIFT: return 16;
            case SDLK_LCTRL:
            case SDLK_RCTRL: return 17;
            case SDLK_LALT:
            case SDLK_RALT: return 18;
            case SDLK_PAUSE: return 19;
            case SDLK_CAPSLOCK: return 20;
            case SDLK_ESCAPE: return 27;
            case SDLK_SPACE: return 32;
            case SDLK_PAGEUP: return 33;
            case SDLK_PAGEDOWN: return 34;
            case SDLK_END: return 35;
            case SDLK_HOME: return 36;
            case SDLK_LEFT: return 37;
            case SDLK_UP: return 38;
            case SDLK_RIGHT: return 39;
            case SDLK_DOWN: return 40;
            case SDLK_INSERT: return 45;
            case SDLK_DELETE: return 46;
            case SDLK_KP_0: return 96;
            case SDLK_SEMICOLON: return 186;
            case SDLK_EQUALS: return 187;
            case SDLK_COMMA: return 188;
            case SDLK_MINUS: return 189;
            case SDLK_PERIOD: return 190;
            case SDLK_SLASH: return 191;
            case SDLK_BACKQUOTE: return 192;
            case SDLK_LEFTBRACKET: return 219;
            case SDLK_BACKSLASH: return 220;
            case SDLK_RIGHTBRACKET: return 221;
            case SDLK_QUOTE: return 222;
            default: return -1;
        }
    }

    // SDL_GetMouseState маскийг DOM buttons маск болгоно (баруун = 2, дунд = 4).
    inline uint32_t dom_button_mask(uint32_t sdl_state)
    {
        uint32_t out = 0;
        if (sdl_state & SDL_BUTTON(SDL_BUTTON_LEFT)) out |= 1u;
        if (sdl_state & SDL_BUTTON(SDL_BUTTON_RIGHT)) out |= 2u;
        if (sdl_state & SDL_BUTTON(SDL_BUTTON_MIDDLE)) out |= 4u;
        return out;
    }

    class SdlGlRuntime final : public IPlatformRuntime
    {
    public:
        explicit SdlGlRuntime(const WindowDesc& win)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }
            sdl_started_ = true;

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                log_warn(std::string("IMG_Init: ") + IMG_GetError());
            }

            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
            SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
            SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN | SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
            );
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            context_ = SDL_GL_CreateContext(window_);
            if (!context_)
            {
                log_error(std::string("OpenGL ES 3 context creation failed: ") + SDL_GetError());
                return;
            }
            SDL_GL_MakeCurrent(window_, context_);
            if (SDL_GL_SetSwapInterval(win.vsync ? 1 : 0) != 0)
            {
                log_warn(std::string("swap interval: ") + SDL_GetError());
            }

            valid_ = true;
        }

        ~SdlGlRuntime() override
        {
            if (context_) SDL_GL_DeleteContext(context_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_started_)
            {
                IMG_Quit();
                SDL_Quit();
            }
        }

        SdlGlRuntime(const SdlGlRuntime&) = delete;
        SdlGlRuntime& operator=(const SdlGlRuntime&) = delete;

        bool valid() const override { return valid_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0 && e.key.keysym.sym == SDLK_SPACE) out.toggle_play = true;
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0 && e.key.keysym.sym == SDLK_r) out.reset_time = true;

                if ((e.type == SDL_KEYDOWN || e.type == SDL_KEYUP) && e.key.repeat == 0)
                {
                    const int code = dom_key_code(e.key.keysym.sym);
                    if (code >= 0) out.keys.push_back(KeyEvent{code, e.type == SDL_KEYDOWN});
                }

                if (e.type == SDL_MOUSEMOTION)
                {
                    out.pointer_moved = true;
                    out.pointer_x = (double)e.motion.x;
                    out.pointer_y = (double)e.motion.y;
                }
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
                {
                    out.resized = true;
                }
            }

            out.buttons = dom_button_mask(SDL_GetMouseState(nullptr, nullptr));
            SDL_GetWindowSize(window_, &out.width, &out.height);
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void drawable_size(int& width, int& height) const override
        {
            width = 1;
            height = 1;
            if (window_) SDL_GL_GetDrawableSize(window_, &width, &height);
        }

        void present() override
        {
            if (window_) SDL_GL_SwapWindow(window_);
        }

        SDL_Window* window() const { return window_; }

    private:
        bool valid_ = false;
        bool sdl_started_ = false;
        SDL_Window* window_ = nullptr;
        SDL_GLContext context_ = nullptr;
    };
}
