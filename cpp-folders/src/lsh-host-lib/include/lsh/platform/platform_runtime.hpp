#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Цонх, GL context, оролтын цикл, дэлгэц рүү present хийх интерфэйс.
*/


#include <string>

#include "lsh/platform/platform_input.hpp"

namespace lsh
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
        bool vsync = true;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void drawable_size(int& width, int& height) const = 0;
        virtual void present() = 0;
    };
}
