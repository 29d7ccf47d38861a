#pragma once
/*
    LSH ШЭЙДЕР ХОСТ САН - GPU HANDLE

    ЗОРИЛГО:
    - GLuint/VkImage гэх мэт backend объектын оронд type-safe handle ашиглах
    - Texture, framebuffer, program, geometry handle-уудыг compile үед ялгах
*/

#include <cstdint>

namespace lsh
{
    // id == 0 бол хүчингүй.
    struct TextureHandle
    {
        uint32_t id = 0;
        constexpr bool valid() const { return id != 0; }
        constexpr bool operator==(const TextureHandle&) const = default;
    };

    struct FramebufferHandle
    {
        uint32_t id = 0;
        constexpr bool valid() const { return id != 0; }
        constexpr bool operator==(const FramebufferHandle&) const = default;
    };

    struct ProgramHandle
    {
        uint32_t id = 0;
        constexpr bool valid() const { return id != 0; }
        constexpr bool operator==(const ProgramHandle&) const = default;
    };

    struct GeometryHandle
    {
        uint32_t id = 0;
        constexpr bool valid() const { return id != 0; }
        constexpr bool operator==(const GeometryHandle&) const = default;
    };

    struct Extent2D
    {
        int w = 0;
        int h = 0;
        bool valid() const { return w > 0 && h > 0; }
        constexpr bool operator==(const Extent2D&) const = default;
    };
}
