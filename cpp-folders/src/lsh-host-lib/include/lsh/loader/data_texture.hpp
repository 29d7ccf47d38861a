#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: data_texture.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: CPU талын RGBA8 texel buffer + түүнийг эзэмших GPU texture.
            Оролтын provider-ууд (keyboard, MIDI, gamepad, audio) luminance утга бичээд
            dirty үед л upload хийнэ.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

#include "lsh/gfx/gpu_device.hpp"

namespace lsh
{
    class DataTexture
    {
    public:
        DataTexture(IGpuDevice& device, int width, int height, TextureFilter filter = TextureFilter::Nearest)
            : device_(&device)
            , w_(std::max(1, width))
            , h_(std::max(1, height))
            , texels_((size_t)w_ * (size_t)h_ * 4u, 0u)
        {
            TextureDesc desc{};
            desc.width = w_;
            desc.height = h_;
            desc.min_filter = filter;
            desc.mag_filter = filter;
            tex_ = device_->create_texture(desc);
            clear();
            upload();
        }

        ~DataTexture()
        {
            if (tex_.valid()) device_->destroy_texture(tex_);
        }

        DataTexture(const DataTexture&) = delete;
        DataTexture& operator=(const DataTexture&) = delete;

        void clear(uint8_t value = 0)
        {
            for (size_t i = 0; i < texels_.size(); i += 4)
            {
                texels_[i + 0] = value;
                texels_[i + 1] = value;
                texels_[i + 2] = value;
                texels_[i + 3] = 255;
            }
            dirty_ = true;
        }

        // r = g = b = v. Shader аль сувгаас уншсан ч адилхан.
        void set_luminance(int x, int y, uint8_t v)
        {
            if (x < 0 || y < 0 || x >= w_ || y >= h_) return;
            uint8_t* p = &texels_[((size_t)y * (size_t)w_ + (size_t)x) * 4u];
            if (p[0] == v && p[1] == v && p[2] == v) return;
            p[0] = v;
            p[1] = v;
            p[2] = v;
            p[3] = 255;
            dirty_ = true;
        }

        uint8_t luminance(int x, int y) const
        {
            if (x < 0 || y < 0 || x >= w_ || y >= h_) return 0;
            return texels_[((size_t)y * (size_t)w_ + (size_t)x) * 4u];
        }

        void upload()
        {
            if (!dirty_) return;
            device_->update_texture(tex_, w_, h_, texels_);
            dirty_ = false;
        }

        TextureHandle handle() const { return tex_; }
        int width() const { return w_; }
        int height() const { return h_; }
        bool dirty() const { return dirty_; }

    private:
        IGpuDevice* device_ = nullptr;
        int w_ = 1;
        int h_ = 1;
        std::vector<uint8_t> texels_{};
        TextureHandle tex_{};
        bool dirty_ = true;
    };
}
