#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: options.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Хостын тохиргооны бүтэц (HostOptions), анхны утгууд болон
            LSH_* орчны хувьсагчаас давхарлан унших туслах функцууд.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include "lsh/core/log.hpp"

namespace lsh
{
    struct HostOptions
    {
        // Дэлгэцийн хэмжээг render buffer руу хуваах коэффициент.
        double pixel_ratio = 1.0;
        uint32_t frameskip = 1;
        std::string vertex_mode = "TRIANGLES";
        uint32_t vertex_count = 3000;
        uint32_t fft_size = 2048;
        double fft_smoothing = 0.8;
        double sound_length = 3.0;

        int window_width = 1280;
        int window_height = 720;
        uint32_t reload_poll_ms = 250;
        LogLevel log_level = LogLevel::Info;
    };

    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    inline uint32_t parse_env_u32(const char* value, uint32_t fallback, uint32_t min_value = 1u)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const unsigned long parsed = std::strtoul(value, &end, 10);
        if (end == value || *end != '\0') return fallback;
        const uint32_t out = static_cast<uint32_t>(std::min<unsigned long>(
            parsed,
            static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())));
        return std::max(min_value, out);
    }

    inline double parse_env_f64(const char* value, double fallback)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || *end != '\0' || !std::isfinite(parsed)) return fallback;
        return parsed;
    }

    inline bool is_power_of_two(uint32_t v)
    {
        return v != 0u && (v & (v - 1u)) == 0u;
    }

    // Хүчинтэй FFT хэмжээ: [32, 32768] муж дахь 2-ын зэрэг.
    inline bool valid_fft_size(uint32_t v)
    {
        return is_power_of_two(v) && v >= 32u && v <= 32768u;
    }

    inline bool valid_fft_smoothing(double v)
    {
        return std::isfinite(v) && v >= 0.0 && v < 1.0;
    }

    inline bool valid_pixel_ratio(double v)
    {
        return std::isfinite(v) && v > 0.0;
    }

    // Тохирохгүй утгыг анхааруулж өмнөх давхаргын утгыг хэвээр үлдээнэ.
    inline void apply_env_options(HostOptions& opts)
    {
        if (const char* v = std::getenv("LSH_LOG_LEVEL"))
        {
            LogLevel level = opts.log_level;
            if (parse_log_level(v, level)) opts.log_level = level;
            else log_warn(std::string("LSH_LOG_LEVEL: unknown level '") + v + "'");
        }

        if (const char* v = std::getenv("LSH_PIXEL_RATIO"))
        {
            const double pr = parse_env_f64(v, -1.0);
            if (valid_pixel_ratio(pr)) opts.pixel_ratio = pr;
            else log_warn(std::string("LSH_PIXEL_RATIO: ignoring '") + v + "'");
        }

        opts.frameskip = parse_env_u32(std::getenv("LSH_FRAMESKIP"), opts.frameskip, 1u);
        opts.vertex_count = parse_env_u32(std::getenv("LSH_VERTEX_COUNT"), opts.vertex_count, 1u);
        if (const char* v = std::getenv("LSH_VERTEX_MODE"))
        {
            if (*v != '\0') opts.vertex_mode = v;
        }

        if (const char* v = std::getenv("LSH_FFT_SIZE"))
        {
            const uint32_t n = parse_env_u32(v, 0u, 0u);
            if (valid_fft_size(n)) opts.fft_size = n;
            else log_warn(std::string("LSH_FFT_SIZE: ignoring '") + v + "'");
        }

        if (const char* v = std::getenv("LSH_FFT_SMOOTHING"))
        {
            const double s = parse_env_f64(v, -1.0);
            if (valid_fft_smoothing(s)) opts.fft_smoothing = s;
            else log_warn(std::string("LSH_FFT_SMOOTHING: ignoring '") + v + "'");
        }

        if (const char* v = std::getenv("LSH_SOUND_LENGTH"))
        {
            const double s = parse_env_f64(v, -1.0);
            if (s > 0.0) opts.sound_length = s;
            else log_warn(std::string("LSH_SOUND_LENGTH: ignoring '") + v + "'");
        }

        opts.window_width = (int)parse_env_u32(std::getenv("LSH_WIDTH"), (uint32_t)opts.window_width, 16u);
        opts.window_height = (int)parse_env_u32(std::getenv("LSH_HEIGHT"), (uint32_t)opts.window_height, 16u);
    }
}
