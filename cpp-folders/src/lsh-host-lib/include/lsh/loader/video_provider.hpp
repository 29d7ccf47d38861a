#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: video_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Видео texture provider. URL бүрт нэг decode session (memoize),
            давтан load нь зөвхөн тоглуулах хурдыг шинэчилнэ.
*/


#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/frame_source.hpp"
#include "lsh/loader/texture_provider.hpp"

namespace lsh
{
    class VideoProvider final : public ITextureProvider
    {
    public:
        VideoProvider(IGpuDevice& device, IVideoStreamFactory* factory)
            : device_(&device)
            , factory_(factory)
        {}

        ~VideoProvider() override
        {
            for (auto& kv : sessions_) destroy_texture(kv.second);
        }

        const char* provider_name() const override { return "video"; }

        Result<TextureHandle> load(const std::string& key, const std::string& url, const TextureLoadParams& params) override
        {
            auto it = sessions_.find(url);
            if (it != sessions_.end())
            {
                Session& s = it->second;
                s.stream->set_playback_rate(params.speed);
                if (!s.tex.valid()) s.tex = create_texture();
                return Result<TextureHandle>::success(s.tex);
            }

            if (!factory_)
            {
                const std::string msg = "video '" + url + "': no video decoder available";
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            Result<std::unique_ptr<IVideoStream>> opened = factory_->open(url, params.speed);
            if (!opened.ok || !opened.value)
            {
                const std::string msg = "video '" + url + "': " + (opened.error.empty() ? "open failed" : opened.error);
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            Session s{};
            s.key = key;
            s.stream = std::move(opened.value);
            s.tex = create_texture();
            const TextureHandle tex = s.tex;
            sessions_.emplace(url, std::move(s));
            log_info("video '" + url + "' loaded as '" + key + "'");
            return Result<TextureHandle>::success(tex);
        }

        void update() override
        {
            for (auto& kv : sessions_)
            {
                Session& s = kv.second;
                if (!s.tex.valid()) continue;
                int w = 0;
                int h = 0;
                if (!s.stream->poll_frame(frame_, w, h)) continue;
                if (w <= 0 || h <= 0 || frame_.size() < (size_t)w * (size_t)h * 4u) continue;
                device_->update_texture(s.tex, w, h, frame_);
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

        size_t session_count() const { return sessions_.size(); }

        double playback_rate(const std::string& url) const
        {
            auto it = sessions_.find(url);
            return it == sessions_.end() ? 0.0 : it->second.stream->playback_rate();
        }

    private:
        struct Session
        {
            std::string key{};
            std::unique_ptr<IVideoStream> stream{};
            TextureHandle tex{};
        };

        TextureHandle create_texture()
        {
            TextureDesc desc{};
            desc.min_filter = TextureFilter::Linear;
            desc.mag_filter = TextureFilter::Linear;
            return device_->create_texture(desc);
        }

        void destroy_texture(Session& s)
        {
            if (s.tex.valid()) device_->destroy_texture(s.tex);
            s.tex = TextureHandle{};
        }

        IGpuDevice* device_ = nullptr;
        IVideoStreamFactory* factory_ = nullptr;
        std::unordered_map<std::string, Session> sessions_{};
        std::vector<uint8_t> frame_{};
    };
}
