#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sdl_audio_sink.hpp
    МОДУЛЬ: sound
    ЗОРИЛГО: Дуу shader-ийн гаргасан stereo float дээжийг SDL2 гаралтын төхөөрөмж рүү дараалуулна.
*/


#include <string>

#include <SDL2/SDL.h>

#include "lsh/core/log.hpp"
#include "lsh/sound/sound_shader_renderer.hpp"

namespace lsh
{
    class SdlAudioSink final : public IAudioSink
    {
    public:
        SdlAudioSink() = default;

        ~SdlAudioSink() override
        {
            close();
        }

        SdlAudioSink(const SdlAudioSink&) = delete;
        SdlAudioSink& operator=(const SdlAudioSink&) = delete;

        Status queue(std::span<const float> interleaved_stereo, int sample_rate) override
        {
            Status st = ensure_open(sample_rate);
            if (!st.ok) return st;
            const Uint32 bytes = (Uint32)(interleaved_stereo.size() * sizeof(float));
            if (SDL_QueueAudio(device_, interleaved_stereo.data(), bytes) != 0)
            {
                return Status::failure(std::string("queue audio failed: ") + SDL_GetError(), ErrorKind::Resource);
            }
            SDL_PauseAudioDevice(device_, 0);
            return Status::success();
        }

        void stop() override
        {
            if (device_ == 0) return;
            SDL_PauseAudioDevice(device_, 1);
            SDL_ClearQueuedAudio(device_);
        }

        bool playing() const override
        {
            return device_ != 0 && SDL_GetQueuedAudioSize(device_) > 0;
        }

    private:
        Status ensure_open(int sample_rate)
        {
            if (device_ != 0 && rate_ == sample_rate) return Status::success();
            close();
            if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0)
            {
                return Status::failure(std::string("SDL audio init failed: ") + SDL_GetError(), ErrorKind::Resource);
            }

            SDL_AudioSpec want{};
            want.freq = sample_rate;
            want.format = AUDIO_F32SYS;
            want.channels = 2;
            want.samples = 4096;
            want.callback = nullptr;

            device_ = SDL_OpenAudioDevice(nullptr, 0, &want, nullptr, 0);
            if (device_ == 0)
            {
                SDL_QuitSubSystem(SDL_INIT_AUDIO);
                return Status::failure(std::string("cannot open audio output: ") + SDL_GetError(), ErrorKind::Resource);
            }
            rate_ = sample_rate;
            log_debug("audio output opened at " + std::to_string(sample_rate) + " Hz");
            return Status::success();
        }

        void close()
        {
            if (device_ == 0) return;
            SDL_CloseAudioDevice(device_);
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            device_ = 0;
            rate_ = 0;
        }

        SDL_AudioDeviceID device_ = 0;
        int rate_ = 0;
    };
}
