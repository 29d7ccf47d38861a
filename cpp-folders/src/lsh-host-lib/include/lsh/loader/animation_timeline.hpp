#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: animation_timeline.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Кадр бүрийн delay (ms)-тэй хөдөлгөөнт зургийн одоогийн кадрыг
            өнгөрсөн хугацаа ба тоглуулах хурдаар тодорхойлно. Төгсгөлд нь эхэнд буцна.
*/


#include <cmath>
#include <cstdint>
#include <vector>

namespace lsh
{
    class AnimationTimeline
    {
    public:
        // 0 эсвэл сөрөг delay-г браузерууд шиг 100 ms гэж үзнэ.
        static constexpr double kDefaultDelayMs = 100.0;

        AnimationTimeline() = default;

        explicit AnimationTimeline(const std::vector<int>& delays_ms)
        {
            delays_.reserve(delays_ms.size());
            for (int d : delays_ms) delays_.push_back(d > 0 ? (double)d : kDefaultDelayMs);
        }

        void set_speed(double speed) { speed_ = speed > 0.0 && std::isfinite(speed) ? speed : 1.0; }
        double speed() const { return speed_; }

        size_t frame_count() const { return delays_.size(); }
        size_t current_frame() const { return frame_; }

        // Кадр солигдсон бол true.
        bool advance(double elapsed_ms)
        {
            if (delays_.size() < 2 || !(elapsed_ms > 0.0)) return false;
            const size_t before = frame_;
            accum_ms_ += elapsed_ms * speed_;

            double total = 0.0;
            for (double d : delays_) total += d;
            if (accum_ms_ >= total * 2.0) accum_ms_ = std::fmod(accum_ms_, total);

            while (accum_ms_ >= delays_[frame_])
            {
                accum_ms_ -= delays_[frame_];
                frame_ = (frame_ + 1) % delays_.size();
            }
            return frame_ != before;
        }

        void rewind()
        {
            frame_ = 0;
            accum_ms_ = 0.0;
        }

    private:
        std::vector<double> delays_{};
        size_t frame_ = 0;
        double accum_ms_ = 0.0;
        double speed_ = 1.0;
    };
}
