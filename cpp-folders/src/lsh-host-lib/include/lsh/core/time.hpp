#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Монотон цагийн эх үүсвэр, reset хийгдэх хүртэлх өнгөрсөн хугацааны цаг
            болон кадр хоорондын dt тооцоолох FrameClock.
*/


#include <chrono>
#include <cstdint>
#include <functional>

namespace lsh
{
    struct TickSource
    {
        std::function<uint64_t()> now{};
        double tick_hz = 1.0;

        static TickSource steady()
        {
            TickSource s{};
            s.now = []() -> uint64_t {
                const auto t = std::chrono::steady_clock::now().time_since_epoch();
                return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(t).count();
            };
            s.tick_hz = 1000000.0;
            return s;
        }

        uint64_t read() const
        {
            return now ? now() : 0u;
        }
    };

    // reset() хийсэн агшнаас хойш хэдэн секунд өнгөрснийг буцаана.
    struct ElapsedClock
    {
        uint64_t start_ticks = 0;
        double tick_hz = 1.0;

        void reset(uint64_t ticks_now)
        {
            start_ticks = ticks_now;
        }

        double elapsed_seconds(uint64_t ticks_now) const
        {
            if (ticks_now <= start_ticks || tick_hz <= 0.0) return 0.0;
            return (double)(ticks_now - start_ticks) / tick_hz;
        }
    };

    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;
        bool started = false;

        float begin_frame(uint64_t ticks_now)
        {
            if (!started || ticks_now < ticks_prev)
            {
                started = true;
                ticks_prev = ticks_now;
                return 0.0f;
            }
            const float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            return dt;
        }
    };
}
