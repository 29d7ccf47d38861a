#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: render_target_pair.hpp
    МОДУЛЬ: target
    ЗОРИЛГО: Нэртэй ping-pong framebuffer хос. Front нь сүүлд дууссан бичлэг (уншигдана),
            back нь дараагийн бичих газар. swap() нь GPU ажилгүй O(1).
            dispose() хийсний дараах бүх хэрэглээ ProgrammingError шиднэ.
*/


#include <algorithm>
#include <string>
#include <utility>

#include "lsh/core/result.hpp"
#include "lsh/gfx/gpu_device.hpp"

namespace lsh
{
    class RenderTargetPair
    {
    public:
        RenderTargetPair(IGpuDevice& device, std::string name, int width, int height, TextureFormat format)
            : device_(&device)
            , name_(std::move(name))
            , format_(format)
        {
            const Extent2D ext = clamp_extent(width, height);
            FramebufferDesc desc{};
            desc.width = ext.w;
            desc.height = ext.h;
            desc.format = format_;
            desc.depth = true;
            for (int i = 0; i < 2; ++i)
            {
                fb_[i] = device_->create_framebuffer(desc);
                ext_[i] = ext;
            }
        }

        ~RenderTargetPair()
        {
            dispose();
        }

        RenderTargetPair(const RenderTargetPair&) = delete;
        RenderTargetPair& operator=(const RenderTargetPair&) = delete;

        static Extent2D clamp_extent(int width, int height)
        {
            return Extent2D{std::max(1, width), std::max(1, height)};
        }

        // Хоёр buffer-ийг шинэ хэмжээнд оруулна. Front/back үүрэг хадгалагдана.
        void resize(int width, int height)
        {
            require_live("resize");
            const Extent2D ext = clamp_extent(width, height);
            for (int i = 0; i < 2; ++i)
            {
                if (ext_[i] == ext) continue;
                device_->resize_framebuffer(fb_[i], ext.w, ext.h);
                ext_[i] = ext;
            }
        }

        // Зөвхөн back buffer. Pass бүрийн өмнө дуудагддаг тул өөрчлөлтгүй бол юу ч хийхгүй.
        void resize_back(int width, int height)
        {
            require_live("resize_back");
            const Extent2D ext = clamp_extent(width, height);
            const int back = 1 - front_;
            if (ext_[back] == ext) return;
            device_->resize_framebuffer(fb_[back], ext.w, ext.h);
            ext_[back] = ext;
        }

        void swap()
        {
            require_live("swap");
            front_ = 1 - front_;
        }

        TextureHandle current_texture() const
        {
            require_live("current_texture");
            return device_->framebuffer_texture(fb_[front_]);
        }

        FramebufferHandle front_framebuffer() const
        {
            require_live("front_framebuffer");
            return fb_[front_];
        }

        FramebufferHandle back_framebuffer() const
        {
            require_live("back_framebuffer");
            return fb_[1 - front_];
        }

        Extent2D front_extent() const
        {
            require_live("front_extent");
            return ext_[front_];
        }

        Extent2D back_extent() const
        {
            require_live("back_extent");
            return ext_[1 - front_];
        }

        // Дахин дуудахад аюулгүй.
        void dispose()
        {
            if (disposed_) return;
            disposed_ = true;
            for (int i = 0; i < 2; ++i)
            {
                if (fb_[i].valid()) device_->destroy_framebuffer(fb_[i]);
                fb_[i] = FramebufferHandle{};
            }
        }

        bool disposed() const { return disposed_; }
        const std::string& name() const { return name_; }
        TextureFormat format() const { return format_; }

    private:
        void require_live(const char* op) const
        {
            if (disposed_)
            {
                throw ProgrammingError("render target '" + name_ + "': " + op + "() after dispose()");
            }
        }

        IGpuDevice* device_ = nullptr;
        std::string name_{};
        TextureFormat format_ = TextureFormat::RGBA8;
        FramebufferHandle fb_[2]{};
        Extent2D ext_[2]{};
        int front_ = 0;
        bool disposed_ = false;
    };
}
