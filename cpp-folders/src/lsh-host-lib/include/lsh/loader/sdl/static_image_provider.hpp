#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: static_image_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: PNG/JPG г.м. зургийг SDL2_image-аар decode хийж RGBA8 texture болгоно. URL-аар memoize.
*/


#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "lsh/core/log.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/sdl/sdl_image_pixels.hpp"
#include "lsh/loader/texture_provider.hpp"

namespace lsh
{
    class StaticImageProvider final : public ITextureProvider
    {
    public:
        explicit StaticImageProvider(IGpuDevice& device)
            : device_(&device)
        {}

        ~StaticImageProvider() override
        {
            for (auto& kv : images_)
            {
                if (kv.second.valid()) device_->destroy_texture(kv.second);
            }
        }

        const char* provider_name() const override { return "image"; }

        Result<TextureHandle> load(const std::string& key, const std::string& url, const TextureLoadParams&) override
        {
            auto it = images_.find(url);
            if (it != images_.end() && it->second.valid()) return Result<TextureHandle>::success(it->second);

            SDL_Surface* loaded = IMG_Load(url.c_str());
            if (!loaded)
            {
                const std::string msg = "image '" + url + "': " + IMG_GetError();
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            int w = 0;
            int h = 0;
            const bool converted = sdl_surface_to_rgba8(loaded, pixels_, w, h);
            SDL_FreeSurface(loaded);
            if (!converted)
            {
                const std::string msg = "image '" + url + "': " + SDL_GetError();
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            TextureDesc desc{};
            desc.width = w;
            desc.height = h;
            const TextureHandle tex = device_->create_texture(desc);
            device_->update_texture(tex, w, h, pixels_);
            images_[url] = tex;
            log_info("image '" + url + "' loaded as '" + key + "' (" + std::to_string(w) + "x" + std::to_string(h) + ")");
            return Result<TextureHandle>::success(tex);
        }

        void update() override {}

        void release_texture(const std::string& url) override
        {
            unload(url);
        }

        void unload(const std::string& url) override
        {
            auto it = images_.find(url);
            if (it == images_.end()) return;
            if (it->second.valid()) device_->destroy_texture(it->second);
            images_.erase(it);
        }

    private:
        IGpuDevice* device_ = nullptr;
        std::unordered_map<std::string, TextureHandle> images_{};
        std::vector<uint8_t> pixels_{};
    };
}
