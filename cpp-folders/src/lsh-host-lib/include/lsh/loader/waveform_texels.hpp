#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: waveform_texels.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Interleaved stereo дээжийг мөр бүр kWaveformWidth texel-тэй RGBA8 зураг болгоно.
            R = зүүн, G = баруун, 128 = чимээгүй.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <vector>

namespace lsh
{
    inline constexpr int kWaveformWidth = 2048;
    inline constexpr int kWaveformMaxRows = 4096;

    inline uint8_t waveform_byte(float s)
    {
        const float c = std::clamp(s, -1.0f, 1.0f);
        return (uint8_t)std::clamp((int)std::lround(127.5f + 127.5f * c), 0, 255);
    }

    // Буцаах утга нь мөрийн тоо (>= 1). kWaveformMaxRows-оос хэтэрсэн хэсэг таслагдана.
    inline int encode_waveform_texels(std::span<const float> interleaved_stereo, std::vector<uint8_t>& out)
    {
        const size_t frames = interleaved_stereo.size() / 2u;
        const size_t max_frames = (size_t)kWaveformWidth * (size_t)kWaveformMaxRows;
        const size_t used = std::min(frames, max_frames);
        const int rows = std::max(1, (int)((used + (size_t)kWaveformWidth - 1u) / (size_t)kWaveformWidth));

        out.assign((size_t)kWaveformWidth * (size_t)rows * 4u, 0u);
        for (size_t i = 0; i < out.size(); i += 4)
        {
            out[i + 0] = 128u;
            out[i + 1] = 128u;
            out[i + 3] = 255u;
        }
        for (size_t f = 0; f < used; ++f)
        {
            out[f * 4u + 0u] = waveform_byte(interleaved_stereo[f * 2u + 0u]);
            out[f * 4u + 1u] = waveform_byte(interleaved_stereo[f * 2u + 1u]);
        }
        return rows;
    }
}
