#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: frame_source.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Decode нь provider-ийн гадна (өөр thread/процесст) явагддаг видео болон
            камерын frame эх сурвалжийн интерфэйсүүд. Codec/capture хэрэгжүүлэлтийг
            хост програм inject хийнэ.
*/


#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lsh/core/result.hpp"

namespace lsh
{
    class IFrameSource
    {
    public:
        virtual ~IFrameSource() = default;

        // Шинэ frame бэлэн бол RGBA8 (мөр доороос дээш) хуулж true буцаана. Хүлээхгүй.
        virtual bool poll_frame(std::vector<uint8_t>& rgba8, int& width, int& height) = 0;
    };

    class IVideoStream : public IFrameSource
    {
    public:
        virtual void set_playback_rate(double rate) = 0;
        virtual double playback_rate() const = 0;
    };

    class IVideoStreamFactory
    {
    public:
        virtual ~IVideoStreamFactory() = default;
        // Үргэлж loop хийж, дуугүй тоглоно.
        virtual Result<std::unique_ptr<IVideoStream>> open(const std::string& url, double playback_rate) = 0;
    };

    class ICaptureSource : public IFrameSource
    {
    public:
        virtual Status open() = 0;
        virtual void close() = 0;
    };
}
