#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sdl_image_pixels.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: SDL_Surface-ийг RGBA8 мөр болгон хуулна. GL-ийн texel эх нь доод мөр тул y-г эргүүлнэ.
*/


#include <cstdint>
#include <cstring>
#include <vector>

#include <SDL2/SDL.h>

namespace lsh
{
    // Амжилтгүй бол false. out нь w*h*4 хэмжээтэй болно.
    inline bool sdl_surface_to_rgba8(SDL_Surface* src, std::vector<uint8_t>& out, int& w, int& h, bool flip_y = true)
    {
        if (!src) return false;
        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(src, SDL_PIXELFORMAT_RGBA32, 0);
        if (!rgba) return false;

        w = rgba->w;
        h = rgba->h;
        out.resize((size_t)w * (size_t)h * 4u);

        if (SDL_MUSTLOCK(rgba)) SDL_LockSurface(rgba);
        const auto* pixels = static_cast<const uint8_t*>(rgba->pixels);
        const size_t row_bytes = (size_t)w * 4u;
        for (int y = 0; y < h; ++y)
        {
            const int dst_y = flip_y ? (h - 1 - y) : y;
            std::memcpy(&out[(size_t)dst_y * row_bytes], pixels + (size_t)y * (size_t)rgba->pitch, row_bytes);
        }
        if (SDL_MUSTLOCK(rgba)) SDL_UnlockSurface(rgba);

        SDL_FreeSurface(rgba);
        return true;
    }
}
