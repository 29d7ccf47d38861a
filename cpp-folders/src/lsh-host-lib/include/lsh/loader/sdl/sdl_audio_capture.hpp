#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sdl_audio_capture.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: SDL2 audio capture төхөөрөмж. Audio thread дээр mono float дээжийг
            mutex-ээр хамгаалсан ring buffer руу бичнэ. Кадрын thread зөвхөн хуулна.
*/


#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <SDL2/SDL.h>

#include "lsh/core/log.hpp"
#include "lsh/loader/audio_input_provider.hpp"

namespace lsh
{
    class SdlAudioCapture final : public IAudioCaptureSource
    {
    public:
        static constexpr size_t kRingCapacity = 32768;

        explicit SdlAudioCapture(int sample_rate = 44100)
            : sample_rate_(sample_rate)
            , ring_(kRingCapacity, 0.0f)
        {}

        ~SdlAudioCapture() override
        {
            close();
        }

        Status open() override
        {
            if (device_ != 0) return Status::success();
            if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0)
            {
                return Status::failure(std::string("SDL audio init failed: ") + SDL_GetError(), ErrorKind::Resource);
            }

            SDL_AudioSpec want{};
            want.freq = sample_rate_;
            want.format = AUDIO_F32SYS;
            want.channels = 1;
            want.samples = 1024;
            want.callback = &SdlAudioCapture::on_audio;
            want.userdata = this;

            SDL_AudioSpec have{};
            device_ = SDL_OpenAudioDevice(nullptr, 1, &want, &have, 0);
            if (device_ == 0)
            {
                SDL_QuitSubSystem(SDL_INIT_AUDIO);
                return Status::failure(std::string("cannot open capture device: ") + SDL_GetError(), ErrorKind::Resource);
            }
            SDL_PauseAudioDevice(device_, 0);
            log_info("audio capture opened at " + std::to_string(have.freq) + " Hz");
            return Status::success();
        }

        void close() override
        {
            if (device_ == 0) return;
            SDL_CloseAudioDevice(device_);
            device_ = 0;
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            std::lock_guard<std::mutex> lock(mutex_);
            std::fill(ring_.begin(), ring_.end(), 0.0f);
            write_ = 0;
        }

        void copy_latest(std::vector<float>& out, size_t count) override
        {
            count = std::min(count, ring_.size());
            out.resize(count);
            std::lock_guard<std::mutex> lock(mutex_);
            const size_t start = (write_ + ring_.size() - count) % ring_.size();
            for (size_t i = 0; i < count; ++i) out[i] = ring_[(start + i) % ring_.size()];
        }

    private:
        static void SDLCALL on_audio(void* userdata, Uint8* stream, int len)
        {
            auto* self = static_cast<SdlAudioCapture*>(userdata);
            const auto* samples = reinterpret_cast<const float*>(stream);
            const size_t n = (size_t)len / sizeof(float);
            std::lock_guard<std::mutex> lock(self->mutex_);
            for (size_t i = 0; i < n; ++i)
            {
                self->ring_[self->write_] = samples[i];
                self->write_ = (self->write_ + 1) % self->ring_.size();
            }
        }

        int sample_rate_ = 44100;
        SDL_AudioDeviceID device_ = 0;
        std::mutex mutex_{};
        std::vector<float> ring_{};
        size_t write_ = 0;
    };
}
