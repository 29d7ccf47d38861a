#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: audio_analyser.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Хугацааны домэйн дээжээс spectrum/waveform байт массив болон volume тооцно.
            Blackman цонх -> radix-2 FFT -> хугацааны smoothing -> dB [-100, -30] -> 0..255.
            Thread, төхөөрөмжөөс хамааралгүй цэвэр тооцоо.
*/


#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include <glm/gtc/constants.hpp>

#include "lsh/core/options.hpp"

namespace lsh
{
    class AudioAnalyser
    {
    public:
        static constexpr double kMinDecibels = -100.0;
        static constexpr double kMaxDecibels = -30.0;

        AudioAnalyser(uint32_t fft_size = 2048, double smoothing = 0.8)
        {
            if (!set_fft_size(fft_size)) set_fft_size(2048);
            set_smoothing(smoothing);
        }

        // Хүчингүй хэмжээ өгвөл өмнөх утга хэвээр.
        bool set_fft_size(uint32_t fft_size)
        {
            if (!valid_fft_size(fft_size)) return false;
            if (fft_size == fft_size_ && !window_.empty()) return true;
            fft_size_ = fft_size;
            window_.resize(fft_size_);
            const double n = (double)fft_size_;
            const double two_pi = glm::two_pi<double>();
            for (uint32_t i = 0; i < fft_size_; ++i)
            {
                const double x = (double)i / n;
                window_[i] = 0.42 - 0.5 * std::cos(two_pi * x) + 0.08 * std::cos(2.0 * two_pi * x);
            }
            smoothed_.assign(fft_size_ / 2u, 0.0);
            spectrum_.assign(fft_size_ / 2u, 0u);
            waveform_.assign(fft_size_, 128u);
            scratch_.assign(fft_size_, std::complex<double>{});
            volume_ = 0.0f;
            return true;
        }

        bool set_smoothing(double smoothing)
        {
            if (!valid_fft_smoothing(smoothing)) return false;
            smoothing_ = smoothing;
            return true;
        }

        // samples.size() < fft_size бол эхлэл нь чимээгүй (0) гэж үзнэ. Сүүлийн fft_size дээжийг авна.
        void analyse(std::span<const float> samples)
        {
            const size_t n = fft_size_;
            const size_t have = std::min(samples.size(), n);
            const size_t pad = n - have;
            const float* src = samples.data() + (samples.size() - have);

            for (size_t i = 0; i < n; ++i)
            {
                const float s = i < pad ? 0.0f : src[i - pad];
                const double b = std::floor(128.0 * (1.0 + (double)s));
                waveform_[i] = (uint8_t)std::clamp(b, 0.0, 255.0);
                scratch_[i] = std::complex<double>((double)s * window_[i], 0.0);
            }

            fft_in_place(scratch_);

            const double range = kMaxDecibels - kMinDecibels;
            double sum = 0.0;
            for (size_t k = 0; k < n / 2u; ++k)
            {
                const double mag = std::abs(scratch_[k]) / (double)n;
                smoothed_[k] = smoothing_ * smoothed_[k] + (1.0 - smoothing_) * mag;
                const double db = smoothed_[k] > 0.0 ? 20.0 * std::log10(smoothed_[k]) : -1.0e9;
                const double scaled = std::floor(255.0 * (db - kMinDecibels) / range);
                spectrum_[k] = (uint8_t)std::clamp(scaled, 0.0, 255.0);
                sum += (double)spectrum_[k];
            }
            volume_ = n >= 2u ? (float)(sum / (double)(n / 2u)) : 0.0f;
        }

        uint32_t fft_size() const { return fft_size_; }
        double smoothing() const { return smoothing_; }
        const std::vector<uint8_t>& spectrum() const { return spectrum_; }
        const std::vector<uint8_t>& waveform() const { return waveform_; }
        // Spectrum байтуудын дундаж, 0..255.
        float volume() const { return volume_; }

    private:
        static void fft_in_place(std::vector<std::complex<double>>& a)
        {
            const size_t n = a.size();
            for (size_t i = 1, j = 0; i < n; ++i)
            {
                size_t bit = n >> 1;
                for (; j & bit; bit >>= 1) j ^= bit;
                j ^= bit;
                if (i < j) std::swap(a[i], a[j]);
            }
            for (size_t len = 2; len <= n; len <<= 1)
            {
                const double ang = -glm::two_pi<double>() / (double)len;
                const std::complex<double> wlen(std::cos(ang), std::sin(ang));
                for (size_t i = 0; i < n; i += len)
                {
                    std::complex<double> w(1.0, 0.0);
                    for (size_t k = 0; k < len / 2; ++k)
                    {
                        const std::complex<double> u = a[i + k];
                        const std::complex<double> v = a[i + k + len / 2] * w;
                        a[i + k] = u + v;
                        a[i + k + len / 2] = u - v;
                        w *= wlen;
                    }
                }
            }
        }

        uint32_t fft_size_ = 0;
        double smoothing_ = 0.8;
        std::vector<double> window_{};
        std::vector<double> smoothed_{};
        std::vector<uint8_t> spectrum_{};
        std::vector<uint8_t> waveform_{};
        std::vector<std::complex<double>> scratch_{};
        float volume_ = 0.0f;
    };
}
