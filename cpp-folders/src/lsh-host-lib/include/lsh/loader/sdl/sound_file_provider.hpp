#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sound_file_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: WAV файлыг SDL2-оор уншиж, float stereo болгон хөрвүүлээд waveform texture болгоно.
            MP3 codec стект байхгүй тул Resource алдаа.
*/


#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <SDL2/SDL.h>

#include "lsh/core/log.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/media_kind.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/loader/waveform_texels.hpp"

namespace lsh
{
    class SoundFileProvider final : public ITextureProvider
    {
    public:
        explicit SoundFileProvider(IGpuDevice& device)
            : device_(&device)
        {}

        ~SoundFileProvider() override
        {
            for (auto& kv : sounds_)
            {
                if (kv.second.valid()) device_->destroy_texture(kv.second);
            }
        }

        const char* provider_name() const override { return "sound"; }

        Result<TextureHandle> load(const std::string& key, const std::string& url, const TextureLoadParams&) override
        {
            auto it = sounds_.find(url);
            if (it != sounds_.end() && it->second.valid()) return Result<TextureHandle>::success(it->second);

            if (url_extension(url) != "wav")
            {
                const std::string msg = "sound '" + url + "': only WAV files can be decoded";
                log_error(msg);
                return Result<TextureHandle>::failure(msg, ErrorKind::Resource);
            }

            std::vector<float> stereo{};
            Status st = decode_wav(url, stereo);
            if (!st.ok)
            {
                log_error(st.error);
                return Result<TextureHandle>::failure(st.error, ErrorKind::Resource);
            }

            const int rows = encode_waveform_texels(stereo, texels_);
            TextureDesc desc{};
            desc.width = kWaveformWidth;
            desc.height = rows;
            desc.min_filter = TextureFilter::Nearest;
            desc.mag_filter = TextureFilter::Nearest;
            const TextureHandle tex = device_->create_texture(desc);
            device_->update_texture(tex, kWaveformWidth, rows, texels_);
            sounds_[url] = tex;
            log_info("sound '" + url + "' loaded as '" + key + "' (" + std::to_string(stereo.size() / 2u) + " frames)");
            return Result<TextureHandle>::success(tex);
        }

        void update() override {}

        void release_texture(const std::string& url) override
        {
            unload(url);
        }

        void unload(const std::string& url) override
        {
            auto it = sounds_.find(url);
            if (it == sounds_.end()) return;
            if (it->second.valid()) device_->destroy_texture(it->second);
            sounds_.erase(it);
        }

    private:
        static Status decode_wav(const std::string& url, std::vector<float>& out)
        {
            SDL_AudioSpec spec{};
            Uint8* buf = nullptr;
            Uint32 len = 0;
            if (!SDL_LoadWAV(url.c_str(), &spec, &buf, &len))
            {
                return Status::failure("sound '" + url + "': " + SDL_GetError(), ErrorKind::Resource);
            }

            SDL_AudioStream* stream = SDL_NewAudioStream(spec.format, spec.channels, spec.freq, AUDIO_F32SYS, 2, spec.freq);
            if (!stream)
            {
                SDL_FreeWAV(buf);
                return Status::failure("sound '" + url + "': " + SDL_GetError(), ErrorKind::Resource);
            }

            const int put = SDL_AudioStreamPut(stream, buf, (int)len);
            SDL_FreeWAV(buf);
            if (put != 0 || SDL_AudioStreamFlush(stream) != 0)
            {
                SDL_FreeAudioStream(stream);
                return Status::failure("sound '" + url + "': " + SDL_GetError(), ErrorKind::Resource);
            }

            const int avail = SDL_AudioStreamAvailable(stream);
            out.resize((size_t)avail / sizeof(float));
            const int got = avail > 0 ? SDL_AudioStreamGet(stream, out.data(), avail) : 0;
            SDL_FreeAudioStream(stream);
            if (got < 0) return Status::failure("sound '" + url + "': " + SDL_GetError(), ErrorKind::Resource);
            out.resize((size_t)got / sizeof(float));
            return Status::success();
        }

        IGpuDevice* device_ = nullptr;
        std::unordered_map<std::string, TextureHandle> sounds_{};
        std::vector<uint8_t> texels_{};
    };
}
