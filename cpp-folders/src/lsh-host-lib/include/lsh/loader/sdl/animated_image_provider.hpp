#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: animated_image_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: GIF-ийн бүх кадрыг SDL2_image (IMG_LoadAnimation)-аар нэг удаа decode хийж,
            update() бүрт өнгөрсөн хугацаагаар кадрыг урагшлуулан нэг тогтвортой texture руу upload хийнэ.
*/


#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "lsh/core/log.hpp"
#include "lsh/core/time.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/animation_timeline.hpp"
#include "lsh/loader/sdl/sdl_image_pixels.hpp"
#include "lsh/loader/texture_provider.hpp"

namespace lsh
{
    class AnimatedImageProvider final : public ITextureProvider
    {
    public:
        explicit AnimatedImageProvider(IGpuDevice& device, TickSource clock = TickSource::steady())
            : device_(&device)
            , clock_(std::move(clock))
        {
            frame_clock_.tick_hz = clock_.tick_hz;
        }

        ~AnimatedImageProvider() override
        {
            for (auto& kv : sessions_) destroy_texture(kv.second);
        }

        const char* provider_name() const override { return "gif"; }

        Result<TextureHandle> load(const std::string& key, const std::string& url, const TextureLoadParams& params) override
        {
            auto it = sessions_.find(url);
            if (it != sessions_.end())
            {
                Session& s = it->second;
                s.timeline.set_speed(params.speed);
                if (!s.tex.valid())
                {
                    s.tex = create_texture(s.width, s.height);
                    upload_frame(s);
                }
                return Result<TextureHandle>::success(s.tex);
            }

            IMG_Animation* anim = IMG_LoadAnimation(url.c_str());
            if (!anim || anim->count <= 0)
            {
                if (anim) IMG_FreeAnimation(anim);
                const std::string msg = "gif '" + url + "': " + IMG_GetError();
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            Session s{};
            s.width = anim->w;
            s.height = anim->h;
            std::vector<int> delays{};
            for (int i = 0; i < anim->count; ++i)
            {
                std::vector<uint8_t> rgba{};
                int w = 0;
                int h = 0;
                if (!sdl_surface_to_rgba8(anim->frames[i], rgba, w, h) || w != s.width || h != s.height) continue;
                s.frames.push_back(std::move(rgba));
                delays.push_back(anim->delays ? anim->delays[i] : 0);
            }
            IMG_FreeAnimation(anim);

            if (s.frames.empty())
            {
                const std::string msg = "gif '" + url + "': no decodable frames";
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            s.timeline = AnimationTimeline(delays);
            s.timeline.set_speed(params.speed);
            s.tex = create_texture(s.width, s.height);
            upload_frame(s);
            const TextureHandle tex = s.tex;
            log_info("gif '" + url + "' loaded as '" + key + "' (" + std::to_string(s.frames.size()) + " frames)");
            sessions_.emplace(url, std::move(s));
            return Result<TextureHandle>::success(tex);
        }

        void update() override
        {
            const double dt_ms = frame_clock_.begin_frame(clock_.read()) * 1000.0;
            for (auto& kv : sessions_)
            {
                Session& s = kv.second;
                if (!s.tex.valid()) continue;
                if (s.timeline.advance(dt_ms)) upload_frame(s);
            }
        }

        void release_texture(const std::string& url) override
        {
            auto it = sessions_.find(url);
            if (it != sessions_.end()) destroy_texture(it->second);
        }

        void unload(const std::string& url) override
        {
            auto it = sessions_.find(url);
            if (it == sessions_.end()) return;
            destroy_texture(it->second);
            sessions_.erase(it);
        }

    private:
        struct Session
        {
            int width = 0;
            int height = 0;
            std::vector<std::vector<uint8_t>> frames{};
            AnimationTimeline timeline{};
            TextureHandle tex{};
        };

        TextureHandle create_texture(int w, int h)
        {
            TextureDesc desc{};
            desc.width = w;
            desc.height = h;
            return device_->create_texture(desc);
        }

        void upload_frame(Session& s)
        {
            device_->update_texture(s.tex, s.width, s.height, s.frames[s.timeline.current_frame()]);
        }

        void destroy_texture(Session& s)
        {
            if (s.tex.valid()) device_->destroy_texture(s.tex);
            s.tex = TextureHandle{};
        }

        IGpuDevice* device_ = nullptr;
        TickSource clock_{};
        FrameClock frame_clock_{};
        std::unordered_map<std::string, Session> sessions_{};
    };
}
