#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: keyboard_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: 256x1 "key" texture. Texel x = keyCode, дарагдсан үед 255.
            Цонхны key event-үүдээр тэжээгдэнэ.
*/


#include <memory>
#include <string>
#include <vector>

#include "lsh/loader/data_texture.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    class KeyboardProvider final : public IInputProvider
    {
    public:
        explicit KeyboardProvider(IGpuDevice& device)
            : device_(&device)
        {}

        const char* provider_name() const override { return "keyboard"; }

        Status enable() override
        {
            if (!texture_) texture_ = std::make_unique<DataTexture>(*device_, 256, 1);
            enabled_ = true;
            return Status::success();
        }

        void disable() override
        {
            enabled_ = false;
            texture_.reset();
        }

        bool is_enabled() const override { return enabled_; }

        void on_key(int key_code, bool down)
        {
            if (!enabled_ || key_code < 0 || key_code > 255) return;
            texture_->set_luminance(key_code, 0, down ? 255 : 0);
        }

        bool is_down(int key_code) const
        {
            return enabled_ && texture_->luminance(key_code, 0) != 0;
        }

        void update() override
        {
            if (enabled_) texture_->upload();
        }

        void publish(UniformTable& table) const override
        {
            table.set_texture(uniform_names::kKey, texture_ ? texture_->handle() : TextureHandle{});
        }

        std::vector<std::string> published_uniforms() const override
        {
            return {uniform_names::kKey};
        }

    private:
        IGpuDevice* device_ = nullptr;
        std::unique_ptr<DataTexture> texture_{};
        bool enabled_ = false;
    };
}
