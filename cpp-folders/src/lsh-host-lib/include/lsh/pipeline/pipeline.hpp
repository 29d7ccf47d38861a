#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: pipeline.hpp
    МОДУЛЬ: pipeline
    ЗОРИЛГО: Дараалсан pass-ууд болон тэдгээрийн нэртэй target хосуудыг эзэмшинэ.
            Shader (дахин) ачаалах бүрт бүтнээр нь шинээр build хийнэ. Build алдаа гарвал
            хагас бүтсэн pipeline хэзээ ч суулгагдахгүй, хуучин нь хэвээр ажиллана.
*/


#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/core/result.hpp"
#include "lsh/pipeline/pass_spec.hpp"
#include "lsh/pipeline/render_pass.hpp"
#include "lsh/shader/builtin_shaders.hpp"
#include "lsh/target/target_registry.hpp"

namespace lsh
{
    struct PipelineBuildContext
    {
        IGpuDevice* device = nullptr;
        const UniformTable* uniforms = nullptr;
        // canvas / pixel ratio. Шинэ target хосын анхны хэмжээ.
        double buffer_width = 1.0;
        double buffer_height = 1.0;
        DrawPrimitive primitive = DrawPrimitive::Triangles;
        uint32_t vertex_count = 3000;
        // Одоо ажиллаж буй pipeline-ын target нэрс. Шинэ pipeline-д байхгүй бол хүснэгтээс устна.
        std::vector<std::string> retiring_targets{};
    };

    class Pipeline
    {
    public:
        explicit Pipeline(IGpuDevice& device)
            : targets_(device)
        {}

        ~Pipeline()
        {
            dispose();
        }

        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;

        static Result<std::unique_ptr<Pipeline>> build(const std::vector<PassSpec>& specs, const PipelineBuildContext& ctx)
        {
            using R = Result<std::unique_ptr<Pipeline>>;
            if (!ctx.device || !ctx.uniforms)
            {
                throw ProgrammingError("Pipeline::build: device and uniform table are required");
            }
            if (specs.empty())
            {
                return R::failure("pipeline needs at least one pass");
            }

            // GPU объект үүсгэхээс өмнө бүх spec-ийг шалгана.
            for (size_t i = 0; i < specs.size(); ++i)
            {
                if (!specs[i].has_fs() && !specs[i].has_vs())
                {
                    return R::failure("pass " + std::to_string(i) + ": shaders must have fs or vs");
                }
            }

            auto pipe = std::make_unique<Pipeline>(*ctx.device);
            const int init_w = (int)ctx.buffer_width;
            const int init_h = (int)ctx.buffer_height;

            for (size_t i = 0; i < specs.size(); ++i)
            {
                const PassSpec& spec = specs[i];
                RenderPassResources res{};

                ProgramSource src{};
                GeometryDesc geo{};
                if (spec.has_vs())
                {
                    src.vertex = *spec.vs;
                    src.fragment = spec.has_fs() ? *spec.fs : std::string(kDefaultFragmentShader);
                    src.enable_derivatives = false;
                    geo.kind = GeometryKind::ProceduralVertices;
                    geo.vertex_count = std::max<uint32_t>(1u, ctx.vertex_count);
                    res.primitive = ctx.primitive;
                    res.raster.blend = BlendMode::Additive;
                    res.raster.depth_test = true;
                    res.raster.double_sided = true;
                }
                else
                {
                    src.vertex = kDefaultVertexShader;
                    src.fragment = *spec.fs;
                    src.enable_derivatives = true;
                    geo.kind = GeometryKind::FullscreenQuad;
                    res.primitive = DrawPrimitive::Triangles;
                }

                Result<ProgramHandle> prog = ctx.device->compile_program(src);
                if (!prog.ok)
                {
                    return R::failure("pass " + std::to_string(i) + ": " + prog.error, prog.kind);
                }
                res.program = prog.value;
                res.geometry = ctx.device->create_geometry(geo);

                RenderTargetPair* pair = nullptr;
                SizeExpression wexpr = SizeExpression::identity(SizeAxis::Width);
                SizeExpression hexpr = SizeExpression::identity(SizeAxis::Height);
                if (spec.has_target())
                {
                    const TextureFormat fmt = spec.float_texture ? TextureFormat::RGBA32F : TextureFormat::RGBA8;
                    pair = &pipe->targets_.ensure(*spec.target, init_w, init_h, fmt);
                    wexpr = SizeExpression::compile_or_identity(spec.width.value_or(""), SizeAxis::Width);
                    hexpr = SizeExpression::compile_or_identity(spec.height.value_or(""), SizeAxis::Height);
                }

                pipe->passes_.push_back(std::make_unique<RenderPass>(
                    *ctx.device, (uint32_t)i, res, pair, std::move(wexpr), std::move(hexpr)));
            }

            UniformLayoutOverrides staged{};
            for (const std::string& name : ctx.retiring_targets) staged[name] = std::nullopt;
            for (const std::string& name : pipe->targets_.names()) staged[name] = UniformType::Texture;

            for (auto& pass : pipe->passes_)
            {
                Status st = pass->bind(*ctx.uniforms, staged);
                if (!st.ok) return R::failure(st.error, st.kind);
            }

            return R::success(std::move(pipe));
        }

        // Target бүрийн front texture-ийг нэрээр нь хүснэгтэд бичнэ.
        void install_target_uniforms(UniformTable& table) const
        {
            for (const std::string& name : targets_.names())
            {
                const RenderTargetPair* pair = targets_.find(name);
                if (pair) table.set_texture(name, pair->current_texture());
            }
        }

        // Canvas өөрчлөгдөхөд бүх хосыг buffer хэмжээнд оруулна. WIDTH/HEIGHT нь дараагийн кадрт үйлчилнэ.
        void resize_targets(int width, int height)
        {
            for (const std::string& name : targets_.names())
            {
                RenderTargetPair* pair = targets_.find(name);
                if (pair) pair->resize(width, height);
            }
        }

        void dispose()
        {
            if (disposed_) return;
            disposed_ = true;
            passes_.clear();
            targets_.dispose_all();
        }

        size_t size() const { return passes_.size(); }
        bool empty() const { return passes_.empty(); }
        RenderPass& pass(size_t i) { return *passes_.at(i); }
        const RenderPass& pass(size_t i) const { return *passes_.at(i); }
        TargetRegistry& targets() { return targets_; }
        const TargetRegistry& targets() const { return targets_; }
        const std::vector<std::string>& target_names() const { return targets_.names(); }
        bool disposed() const { return disposed_; }

    private:
        TargetRegistry targets_;
        // targets_-аас хойш зарлагдсан тул түрүүлж устна.
        std::vector<std::unique_ptr<RenderPass>> passes_{};
        bool disposed_ = false;
    };
}
