#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: audio_input_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Микрофоны дууг "spectrum" (fftSize/2 x 1), "samples" (fftSize x 1) texture болон
            "volume" scalar болгоно. Capture нь өөрийн thread дээр ring buffer дүүргэж,
            update() нь сүүлийн fftSize дээжийг хуулж шинжилнэ.
*/


#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/loader/audio_analyser.hpp"
#include "lsh/loader/data_texture.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    class IAudioCaptureSource
    {
    public:
        virtual ~IAudioCaptureSource() = default;
        virtual Status open() = 0;
        virtual void close() = 0;
        // Хамгийн сүүлийн count хүртэлх mono дээжийг хуулна. Хүлээхгүй.
        virtual void copy_latest(std::vector<float>& out, size_t count) = 0;
    };

    class AudioInputProvider final : public IAudioInputProvider
    {
    public:
        AudioInputProvider(IGpuDevice& device, std::unique_ptr<IAudioCaptureSource> source, uint32_t fft_size, double smoothing)
            : device_(&device)
            , source_(std::move(source))
            , analyser_(fft_size, smoothing)
        {}

        ~AudioInputProvider() override
        {
            disable();
        }

        const char* provider_name() const override { return "audio"; }

        Status enable() override
        {
            if (enabled_) return Status::success();
            if (!source_)
            {
                log_error("audio: no capture device available");
                return Status::failure("audio: no capture device available", ErrorKind::Resource);
            }
            Status st = source_->open();
            if (!st.ok)
            {
                log_error("audio: " + st.error);
                return Status::failure("audio: " + st.error, ErrorKind::Resource);
            }
            create_textures();
            enabled_ = true;
            return Status::success();
        }

        void disable() override
        {
            if (!enabled_) return;
            enabled_ = false;
            source_->close();
            spectrum_.reset();
            samples_.reset();
        }

        bool is_enabled() const override { return enabled_; }

        void set_fft_size(uint32_t fft_size) override
        {
            const uint32_t before = analyser_.fft_size();
            if (!analyser_.set_fft_size(fft_size))
            {
                log_warn("audio: ignoring fft size " + std::to_string(fft_size));
                return;
            }
            if (enabled_ && before != analyser_.fft_size()) create_textures();
        }

        void set_smoothing(double smoothing) override
        {
            if (!analyser_.set_smoothing(smoothing))
            {
                log_warn("audio: ignoring smoothing " + std::to_string(smoothing));
            }
        }

        float volume() const override { return analyser_.volume(); }

        void update() override
        {
            if (!enabled_) return;
            source_->copy_latest(buffer_, analyser_.fft_size());
            analyser_.analyse(buffer_);

            const std::vector<uint8_t>& spec = analyser_.spectrum();
            for (size_t i = 0; i < spec.size(); ++i) spectrum_->set_luminance((int)i, 0, spec[i]);
            const std::vector<uint8_t>& wave = analyser_.waveform();
            for (size_t i = 0; i < wave.size(); ++i) samples_->set_luminance((int)i, 0, wave[i]);
            spectrum_->upload();
            samples_->upload();
        }

        void publish(UniformTable& table) const override
        {
            table.set_float(uniform_names::kVolume, analyser_.volume());
            table.set_texture(uniform_names::kSpectrum, spectrum_ ? spectrum_->handle() : TextureHandle{});
            table.set_texture(uniform_names::kSamples, samples_ ? samples_->handle() : TextureHandle{});
        }

        std::vector<std::string> published_uniforms() const override
        {
            return {uniform_names::kVolume, uniform_names::kSpectrum, uniform_names::kSamples};
        }

        const AudioAnalyser& analyser() const { return analyser_; }

    private:
        void create_textures()
        {
            const int n = (int)analyser_.fft_size();
            spectrum_ = std::make_unique<DataTexture>(*device_, n / 2, 1);
            samples_ = std::make_unique<DataTexture>(*device_, n, 1);
        }

        IGpuDevice* device_ = nullptr;
        std::unique_ptr<IAudioCaptureSource> source_{};
        AudioAnalyser analyser_;
        std::unique_ptr<DataTexture> spectrum_{};
        std::unique_ptr<DataTexture> samples_{};
        std::vector<float> buffer_{};
        bool enabled_ = false;
    };
}
