#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sdl_gamepad_source.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: SDL2 GameController-ийн эхний төхөөрөмжийг уншина. Салгагдвал дараагийн poll-д дахин хайна.
*/


#include <string>

#include <SDL2/SDL.h>

#include "lsh/core/log.hpp"
#include "lsh/loader/gamepad_provider.hpp"

namespace lsh
{
    class SdlGamepadSource final : public IGamepadSource
    {
    public:
        ~SdlGamepadSource() override
        {
            close();
        }

        Status open() override
        {
            if (opened_) return Status::success();
            if (SDL_InitSubSystem(SDL_INIT_GAMECONTROLLER) != 0)
            {
                return Status::failure(std::string("SDL game controller init failed: ") + SDL_GetError(), ErrorKind::Resource);
            }
            opened_ = true;
            attach();
            return Status::success();
        }

        void close() override
        {
            if (!opened_) return;
            if (pad_) SDL_GameControllerClose(pad_);
            pad_ = nullptr;
            SDL_QuitSubSystem(SDL_INIT_GAMECONTROLLER);
            opened_ = false;
        }

        bool poll(GamepadState& out) override
        {
            if (!opened_) return false;
            SDL_GameControllerUpdate();
            if (pad_ && !SDL_GameControllerGetAttached(pad_))
            {
                SDL_GameControllerClose(pad_);
                pad_ = nullptr;
                log_info("gamepad detached");
            }
            if (!pad_) attach();
            if (!pad_) return false;

            out.buttons.assign(SDL_CONTROLLER_BUTTON_MAX, false);
            for (int b = 0; b < SDL_CONTROLLER_BUTTON_MAX; ++b)
            {
                out.buttons[(size_t)b] = SDL_GameControllerGetButton(pad_, (SDL_GameControllerButton)b) != 0;
            }
            out.axes.assign(SDL_CONTROLLER_AXIS_MAX, 0.0f);
            for (int a = 0; a < SDL_CONTROLLER_AXIS_MAX; ++a)
            {
                const Sint16 v = SDL_GameControllerGetAxis(pad_, (SDL_GameControllerAxis)a);
                out.axes[(size_t)a] = v < 0 ? (float)v / 32768.0f : (float)v / 32767.0f;
            }
            return true;
        }

    private:
        void attach()
        {
            const int n = SDL_NumJoysticks();
            for (int i = 0; i < n; ++i)
            {
                if (!SDL_IsGameController(i)) continue;
                pad_ = SDL_GameControllerOpen(i);
                if (pad_)
                {
                    const char* name = SDL_GameControllerName(pad_);
                    log_info(std::string("gamepad attached: ") + (name ? name : "unknown"));
                    return;
                }
            }
        }

        bool opened_ = false;
        SDL_GameController* pad_ = nullptr;
    };
}
