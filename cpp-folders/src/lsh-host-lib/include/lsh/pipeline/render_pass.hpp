#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: render_pass.hpp
    МОДУЛЬ: pipeline
    ЗОРИЛГО: Нэг pass: program + geometry + ортографик камер + сонголттой нэртэй target.
            Uniform slot бүрийн tag-ийг build үед шалгаж, кадр бүрт хүснэгтийн утгыг
            program руу түлхээд нэг draw хийнэ.
*/


#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lsh/camera/ortho_camera.hpp"
#include "lsh/core/log.hpp"
#include "lsh/core/result.hpp"
#include "lsh/expr/size_expression.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/target/render_target_pair.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"
#include "lsh/uniform/uniform_table.hpp"

namespace lsh
{
    // Build үеийн хүснэгтийн харагдац: nullopt = устах нэр, утга = шинээр орох tag.
    using UniformLayoutOverrides = std::unordered_map<std::string, std::optional<UniformType>>;

    struct RenderPassResources
    {
        ProgramHandle program{};
        GeometryHandle geometry{};
        DrawPrimitive primitive = DrawPrimitive::Triangles;
        RasterState raster{};
    };

    class RenderPass
    {
    public:
        RenderPass(
            IGpuDevice& device,
            uint32_t index,
            RenderPassResources resources,
            RenderTargetPair* target,
            SizeExpression width_expr,
            SizeExpression height_expr)
            : device_(&device)
            , index_(index)
            , res_(resources)
            , target_(target)
            , width_expr_(std::move(width_expr))
            , height_expr_(std::move(height_expr))
        {
            projection_ = camera_.projection_matrix();
            model_view_ = camera_.model_view_matrix();
        }

        ~RenderPass()
        {
            if (res_.program.valid()) device_->destroy_program(res_.program);
            if (res_.geometry.valid()) device_->destroy_geometry(res_.geometry);
        }

        RenderPass(const RenderPass&) = delete;
        RenderPass& operator=(const RenderPass&) = delete;

        // Program-ын идэвхтэй uniform бүрийг хүснэгт (+ build үеийн overrides)-тэй тулгана.
        // Зарласан tag зөрвөл Configuration алдаа.
        Status bind(const UniformTable& table, const UniformLayoutOverrides& overrides)
        {
            slots_.clear();
            const std::vector<ActiveUniform> active = device_->active_uniforms(res_.program);
            for (const ActiveUniform& au : active)
            {
                Slot slot{};
                slot.info = au;
                if (au.name == uniform_names::kProjectionMatrix || au.name == uniform_names::kModelViewMatrix)
                {
                    if (au.type != UniformType::Mat4)
                    {
                        return Status::failure(describe() + ": camera uniform '" + au.name + "' must be mat4");
                    }
                    slot.camera_local = true;
                    slots_.push_back(std::move(slot));
                    continue;
                }

                std::optional<UniformType> have{};
                auto ov = overrides.find(au.name);
                if (ov != overrides.end())
                {
                    have = ov->second;
                }
                else
                {
                    UniformType t{};
                    if (table.type_of(au.name, t)) have = t;
                }

                if (have && *have != au.type)
                {
                    return Status::failure(
                        describe() + ": uniform '" + au.name + "' is declared " + uniform_type_name(au.type)
                        + " but the host provides " + uniform_type_name(*have));
                }
                if (!have)
                {
                    log_debug(describe() + ": uniform '" + au.name + "' has no host value yet");
                }
                slots_.push_back(std::move(slot));
            }
            bound_version_ = 0;
            return Status::success();
        }

        // Хүснэгтийн утгыг түлхээд dst руу зурна. dst хүчингүй бол дэлгэц.
        void execute(const UniformTable& table, FramebufferHandle dst)
        {
            if (!res_.program.valid())
            {
                throw ProgrammingError(describe() + ": execute() on a pass without program");
            }
            if (bound_version_ != table.layout_version()) resolve_slots(table);

            uploads_.clear();
            for (const Slot& s : slots_)
            {
                const UniformValue* v = s.value;
                if (s.camera_local)
                {
                    v = s.info.name == uniform_names::kProjectionMatrix ? &projection_ : &model_view_;
                }
                if (!v) continue;
                uploads_.push_back(UniformUpload{s.info.location, s.info.type, s.info.array_size, v});
            }

            DrawCall call{};
            call.program = res_.program;
            call.geometry = res_.geometry;
            call.primitive = res_.primitive;
            call.raster = res_.raster;
            call.uniforms = uploads_;
            device_->render(call, dst);
        }

        // Target-ын хэмжээ: WIDTH/HEIGHT илэрхийллийг buffer хэмжээн дээр үнэлнэ.
        Extent2D resolve_size(double buffer_width, double buffer_height) const
        {
            return Extent2D{
                width_expr_.evaluate(buffer_width, buffer_height),
                height_expr_.evaluate(buffer_width, buffer_height)};
        }

        uint32_t index() const { return index_; }
        RenderTargetPair* target() const { return target_; }
        bool has_target() const { return target_ != nullptr; }
        const RenderPassResources& resources() const { return res_; }
        const OrthoCamera& camera() const { return camera_; }
        const SizeExpression& width_expression() const { return width_expr_; }
        const SizeExpression& height_expression() const { return height_expr_; }

        std::string describe() const
        {
            std::string s = "pass " + std::to_string(index_);
            if (target_) s += " ('" + target_->name() + "')";
            return s;
        }

    private:
        struct Slot
        {
            ActiveUniform info{};
            bool camera_local = false;
            const UniformValue* value = nullptr;
            bool warned = false;
        };

        // Layout version өөрчлөгдсөн үед (pass ажиллахаас өмнө) заагчуудыг шинэчилнэ.
        void resolve_slots(const UniformTable& table)
        {
            for (Slot& s : slots_)
            {
                if (s.camera_local) continue;
                s.value = nullptr;
                const UniformValue* v = table.find(s.info.name);
                if (!v) continue;
                if (uniform_type_of(*v) != s.info.type)
                {
                    if (!s.warned)
                    {
                        log_warn(describe() + ": uniform '" + s.info.name + "' changed to "
                            + uniform_type_name(uniform_type_of(*v)) + ", shader expects "
                            + uniform_type_name(s.info.type) + "; skipping");
                        s.warned = true;
                    }
                    continue;
                }
                s.value = v;
            }
            bound_version_ = table.layout_version();
        }

        IGpuDevice* device_ = nullptr;
        uint32_t index_ = 0;
        RenderPassResources res_{};
        RenderTargetPair* target_ = nullptr;
        SizeExpression width_expr_{};
        SizeExpression height_expr_{};
        OrthoCamera camera_{};
        UniformValue projection_{glm::mat4(1.0f)};
        UniformValue model_view_{glm::mat4(1.0f)};

        std::vector<Slot> slots_{};
        std::vector<UniformUpload> uploads_{};
        uint64_t bound_version_ = 0;
    };
}
