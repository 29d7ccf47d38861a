#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: camera_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Камерын capture-ийг "camera" texture uniform болгон нийлүүлнэ.
            Capture эх сурвалжгүй эсвэл нээгдэхгүй бол Resource алдаа, идэвхгүй хэвээр.
*/


#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/frame_source.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    class CameraProvider final : public IInputProvider
    {
    public:
        CameraProvider(IGpuDevice& device, std::unique_ptr<ICaptureSource> source)
            : device_(&device)
            , source_(std::move(source))
        {}

        ~CameraProvider() override
        {
            disable();
        }

        const char* provider_name() const override { return "camera"; }

        Status enable() override
        {
            if (enabled_) return Status::success();
            if (!source_)
            {
                log_error("camera: no capture source available");
                return Status::failure("camera: no capture source available", ErrorKind::Resource);
            }
            Status st = source_->open();
            if (!st.ok)
            {
                log_error("camera: " + st.error);
                return Status::failure("camera: " + st.error, ErrorKind::Resource);
            }

            TextureDesc desc{};
            desc.min_filter = TextureFilter::Linear;
            desc.mag_filter = TextureFilter::Linear;
            tex_ = device_->create_texture(desc);
            enabled_ = true;
            return Status::success();
        }

        void disable() override
        {
            if (!enabled_) return;
            enabled_ = false;
            source_->close();
            if (tex_.valid()) device_->destroy_texture(tex_);
            tex_ = TextureHandle{};
        }

        bool is_enabled() const override { return enabled_; }

        void update() override
        {
            if (!enabled_) return;
            int w = 0;
            int h = 0;
            if (!source_->poll_frame(frame_, w, h)) return;
            if (w <= 0 || h <= 0 || frame_.size() < (size_t)w * (size_t)h * 4u) return;
            device_->update_texture(tex_, w, h, frame_);
        }

        void publish(UniformTable& table) const override
        {
            table.set_texture(uniform_names::kCamera, tex_);
        }

        std::vector<std::string> published_uniforms() const override
        {
            return {uniform_names::kCamera};
        }

        TextureHandle texture() const { return tex_; }

    private:
        IGpuDevice* device_ = nullptr;
        std::unique_ptr<ICaptureSource> source_{};
        TextureHandle tex_{};
        std::vector<uint8_t> frame_{};
        bool enabled_ = false;
    };
}
