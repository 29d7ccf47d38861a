#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: gamepad_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Gamepad төлвийг 128x2 "gamepad" texture болгоно.
            Мөр 0: товч (255 = дарагдсан). Мөр 1: тэнхлэг [-1, 1] -> [0, 255].
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/loader/data_texture.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    struct GamepadState
    {
        std::vector<bool> buttons{};
        std::vector<float> axes{};
    };

    class IGamepadSource
    {
    public:
        virtual ~IGamepadSource() = default;
        virtual Status open() = 0;
        virtual void close() = 0;
        // Холбогдсон controller байхгүй бол false.
        virtual bool poll(GamepadState& out) = 0;
    };

    inline uint8_t gamepad_axis_byte(float v)
    {
        const float c = std::clamp(v, -1.0f, 1.0f);
        return (uint8_t)std::clamp((int)std::lround((c + 1.0f) * 127.5f), 0, 255);
    }

    class GamepadProvider final : public IInputProvider
    {
    public:
        static constexpr int kWidth = 128;

        GamepadProvider(IGpuDevice& device, std::unique_ptr<IGamepadSource> source)
            : device_(&device)
            , source_(std::move(source))
        {}

        ~GamepadProvider() override
        {
            disable();
        }

        const char* provider_name() const override { return "gamepad"; }

        Status enable() override
        {
            if (enabled_) return Status::success();
            if (!source_)
            {
                log_error("gamepad: no controller backend available");
                return Status::failure("gamepad: no controller backend available", ErrorKind::Resource);
            }
            Status st = source_->open();
            if (!st.ok)
            {
                log_error("gamepad: " + st.error);
                return Status::failure("gamepad: " + st.error, ErrorKind::Resource);
            }
            texture_ = std::make_unique<DataTexture>(*device_, kWidth, 2);
            reset_axes();
            enabled_ = true;
            return Status::success();
        }

        void disable() override
        {
            if (!enabled_) return;
            enabled_ = false;
            source_->close();
            texture_.reset();
        }

        bool is_enabled() const override { return enabled_; }

        void update() override
        {
            if (!enabled_) return;
            if (source_->poll(state_))
            {
                for (int i = 0; i < kWidth; ++i)
                {
                    const bool down = i < (int)state_.buttons.size() && state_.buttons[(size_t)i];
                    texture_->set_luminance(i, 0, down ? 255 : 0);
                    const float axis = i < (int)state_.axes.size() ? state_.axes[(size_t)i] : 0.0f;
                    texture_->set_luminance(i, 1, gamepad_axis_byte(axis));
                }
            }
            texture_->upload();
        }

        void publish(UniformTable& table) const override
        {
            table.set_texture(uniform_names::kGamepad, texture_ ? texture_->handle() : TextureHandle{});
        }

        std::vector<std::string> published_uniforms() const override
        {
            return {uniform_names::kGamepad};
        }

        uint8_t button_value(int index) const { return texture_ ? texture_->luminance(index, 0) : 0; }
        uint8_t axis_value(int index) const { return texture_ ? texture_->luminance(index, 1) : 0; }

    private:
        void reset_axes()
        {
            for (int i = 0; i < kWidth; ++i) texture_->set_luminance(i, 1, gamepad_axis_byte(0.0f));
        }

        IGpuDevice* device_ = nullptr;
        std::unique_ptr<IGamepadSource> source_{};
        std::unique_ptr<DataTexture> texture_{};
        GamepadState state_{};
        bool enabled_ = false;
    };
}
