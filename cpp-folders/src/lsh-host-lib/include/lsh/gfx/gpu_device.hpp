#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: gpu_device.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Core-ын GPU-ээс шаарддаг нарийн интерфэйс. Framebuffer үүсгэх/resize/устгах,
            texture upload, program compile + reflection, scene-ийг target эсвэл дэлгэц рүү зурах.
*/


#include <cstdint>
#include <span>
#include <vector>

#include "lsh/core/result.hpp"
#include "lsh/gfx/gpu_types.hpp"

namespace lsh
{
    class IGpuDevice
    {
    public:
        virtual ~IGpuDevice() = default;

        virtual const char* backend_name() const = 0;

        virtual FramebufferHandle create_framebuffer(const FramebufferDesc& desc) = 0;
        virtual void resize_framebuffer(FramebufferHandle fb, int width, int height) = 0;
        virtual TextureHandle framebuffer_texture(FramebufferHandle fb) const = 0;
        virtual void destroy_framebuffer(FramebufferHandle fb) = 0;

        virtual TextureHandle create_texture(const TextureDesc& desc) = 0;
        // rgba8.size() == width * height * 4. Хэмжээ өөр бол texture дахин хуваарилагдана.
        virtual void update_texture(TextureHandle tex, int width, int height, std::span<const uint8_t> rgba8) = 0;
        virtual void destroy_texture(TextureHandle tex) = 0;

        virtual Result<ProgramHandle> compile_program(const ProgramSource& src) = 0;
        virtual std::vector<ActiveUniform> active_uniforms(ProgramHandle program) const = 0;
        virtual void destroy_program(ProgramHandle program) = 0;

        virtual GeometryHandle create_geometry(const GeometryDesc& desc) = 0;
        virtual void destroy_geometry(GeometryHandle geometry) = 0;

        virtual void set_display_size(int width, int height) = 0;

        // Хүчингүй target бол дэлгэц. Зурахын өмнө очих газрыг color+depth цэвэрлэнэ.
        virtual void render(const DrawCall& call, FramebufferHandle target) = 0;

        virtual bool read_pixels_rgba8(FramebufferHandle fb, int width, int height, std::vector<uint8_t>& out) = 0;
    };
}
