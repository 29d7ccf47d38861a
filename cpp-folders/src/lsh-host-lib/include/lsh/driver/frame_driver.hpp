#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: frame_driver.hpp
    МОДУЛЬ: driver
    ЗОРИЛГО: Кадр бүрийн хуваарь. Uniform хүснэгт, backbuffer хос, идэвхтэй pipeline-ыг эзэмшинэ.

    КАДРЫН ДАРААЛАЛ (өөрчлөхгүй):
        1. time uniform-ийг монотон цагаас шинэчилнэ (tick бүрт).
        2. Backbuffer-ийг swap хийж шинэ front-ыг "backbuffer" uniform-д бичнэ.
        3. Provider-уудаас бэлэн төлвийг татна (gif, audio, gamepad, ...).
        4. Pass бүр: PASSINDEX = i. Target-тай бол хэмжээг тооцож back-ийг resize хийгээд
           back руу зурж, swap хийж, target uniform-ийг шинэ front болгоно. Үгүй бол дэлгэц рүү.
        5. Сүүлийн pass target-тай бол дэлгэц рүү дахин зурна. Үргэлж backbuffer-ийн back руу зурна.
        6. FRAMEINDEX++.
    frameskip = S үед 2-6 нь зөвхөн tick_count % S == 0 үед ажиллана. Бусад tick-т 1 ба 3.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/core/options.hpp"
#include "lsh/core/result.hpp"
#include "lsh/core/time.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/loader/loader_registry.hpp"
#include "lsh/loader/media_kind.hpp"
#include "lsh/pipeline/pipeline.hpp"
#include "lsh/sound/sound_shader_renderer.hpp"
#include "lsh/target/render_target_pair.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"
#include "lsh/uniform/uniform_table.hpp"

namespace lsh
{
    // DOM MouseEvent.buttons-тэй ижил бит: 1 = зүүн, 2 = баруун, 4 = дунд.
    enum PointerButtonBits : uint32_t
    {
        PointerButtonPrimary = 1u << 0,
        PointerButtonSecondary = 1u << 1,
        PointerButtonAuxiliary = 1u << 2
    };

    struct FrameStats
    {
        uint64_t ticks = 0;
        uint64_t frames_rendered = 0;
        uint64_t pass_executions = 0;
    };

    class FrameDriver
    {
    public:
        FrameDriver(IGpuDevice& device, LoaderRegistry loaders, HostOptions options, TickSource clock = TickSource::steady())
            : device_(&device)
            , loaders_(loaders)
            , opts_(std::move(options))
            , clock_(std::move(clock))
        {
            sanitize_options();
            primitive_ = parse_draw_primitive(opts_.vertex_mode);
            install_builtin_uniforms(uniforms_, (float)opts_.vertex_count);
            elapsed_.tick_hz = clock_.tick_hz;
            elapsed_.reset(clock_.read());
            if (loaders_.audio)
            {
                loaders_.audio->set_fft_size(opts_.fft_size);
                loaders_.audio->set_smoothing(opts_.fft_smoothing);
            }
        }

        ~FrameDriver()
        {
            pipeline_.reset();
            backbuffer_.reset();
        }

        FrameDriver(const FrameDriver&) = delete;
        FrameDriver& operator=(const FrameDriver&) = delete;

        // ---- canvas -----------------------------------------------------------------

        // Canvas-ыг холбож render эхлүүлнэ. Backbuffer энд үүснэ, pipeline reload-ыг даван амьдарна.
        void set_canvas(int width, int height)
        {
            canvas_ = Extent2D{std::max(1, width), std::max(1, height)};
            if (!backbuffer_)
            {
                backbuffer_ = std::make_unique<RenderTargetPair>(
                    *device_, uniform_names::kBackbuffer, buffer_width_px(), buffer_height_px(), TextureFormat::RGBA8);
            }
            resize(canvas_.w, canvas_.h);
            tick_count_ = 0;
        }

        bool has_canvas() const { return backbuffer_ != nullptr; }

        void resize(int width, int height)
        {
            canvas_ = Extent2D{std::max(1, width), std::max(1, height)};
            device_->set_display_size(canvas_.w, canvas_.h);
            const int bw = buffer_width_px();
            const int bh = buffer_height_px();
            if (pipeline_) pipeline_->resize_targets(bw, bh);
            if (backbuffer_) backbuffer_->resize(bw, bh);
            uniforms_.set_vec2(uniform_names::kResolution, glm::vec2((float)bw, (float)bh));
        }

        // ---- options ----------------------------------------------------------------

        void set_pixel_ratio(double ratio)
        {
            if (!valid_pixel_ratio(ratio))
            {
                log_warn("pixel ratio must be positive, keeping " + std::to_string(opts_.pixel_ratio));
                return;
            }
            opts_.pixel_ratio = ratio;
            if (has_canvas()) resize(canvas_.w, canvas_.h);
        }

        void set_frameskip(uint32_t frameskip)
        {
            opts_.frameskip = std::max<uint32_t>(1u, frameskip);
        }

        // Дараагийн pipeline build-д үйлчилнэ. vertexCount uniform шууд шинэчлэгдэнэ.
        void set_vertex_count(uint32_t count)
        {
            opts_.vertex_count = std::max<uint32_t>(1u, count);
            uniforms_.set_float(uniform_names::kVertexCount, (float)opts_.vertex_count);
        }

        void set_vertex_mode(std::string_view mode)
        {
            opts_.vertex_mode = std::string(mode);
            primitive_ = parse_draw_primitive(mode);
        }

        void set_fft_size(uint32_t fft_size)
        {
            if (!valid_fft_size(fft_size))
            {
                log_warn("fft size must be a power of two in [32, 32768], got " + std::to_string(fft_size));
                return;
            }
            opts_.fft_size = fft_size;
            if (loaders_.audio) loaders_.audio->set_fft_size(fft_size);
        }

        void set_fft_smoothing(double smoothing)
        {
            if (!valid_fft_smoothing(smoothing))
            {
                log_warn("fft smoothing must be in [0, 1), got " + std::to_string(smoothing));
                return;
            }
            opts_.fft_smoothing = smoothing;
            if (loaders_.audio) loaders_.audio->set_smoothing(smoothing);
        }

        void set_sound_length(double seconds)
        {
            if (!(seconds > 0.0) || !std::isfinite(seconds))
            {
                log_warn("sound length must be positive, keeping " + std::to_string(opts_.sound_length));
                return;
            }
            opts_.sound_length = seconds;
            if (sound_) sound_->set_sound_length(seconds);
        }

        void set_sound_renderer(SoundShaderRenderer* sound)
        {
            sound_ = sound;
            if (sound_) sound_->set_sound_length(opts_.sound_length);
        }

        void reset_time()
        {
            elapsed_.reset(clock_.read());
            uniforms_.set_float(uniform_names::kTime, 0.0f);
        }

        // ---- shaders ----------------------------------------------------------------

        // Pipeline-ыг бүтнээр нь шинээр build хийнэ. Алдаа гарвал хуучин pipeline хэвээр ажиллана.
        Status load_shader(const std::vector<PassSpec>& passes)
        {
            if (!has_canvas())
            {
                throw ProgrammingError("FrameDriver::load_shader: call set_canvas() before loading shaders");
            }

            PipelineBuildContext ctx{};
            ctx.device = device_;
            ctx.uniforms = &uniforms_;
            ctx.buffer_width = buffer_width();
            ctx.buffer_height = buffer_height();
            ctx.primitive = primitive_;
            ctx.vertex_count = opts_.vertex_count;
            if (pipeline_) ctx.retiring_targets = pipeline_->target_names();

            Result<std::unique_ptr<Pipeline>> built = Pipeline::build(passes, ctx);
            if (!built.ok)
            {
                log_error("shader load failed: " + built.error);
                return Status::failure(built.error, built.kind);
            }

            std::vector<std::string> old_targets{};
            if (pipeline_)
            {
                old_targets = pipeline_->target_names();
                pipeline_.reset();
            }
            pipeline_ = std::move(built.value);

            const std::vector<std::string>& fresh = pipeline_->target_names();
            for (const std::string& name : old_targets)
            {
                if (std::find(fresh.begin(), fresh.end(), name) == fresh.end()) uniforms_.erase(name);
            }
            pipeline_->install_target_uniforms(uniforms_);
            uniforms_.set_int(uniform_names::kFrameIndex, 0);

            log_info("pipeline built: " + std::to_string(pipeline_->size()) + " pass(es), "
                + std::to_string(pipeline_->targets().size()) + " target(s)");
            return Status::success();
        }

        Status load_fragment_shader(const std::string& fs)
        {
            return load_shader({fragment_pass(fs)});
        }

        Status load_vertex_shader(const std::string& vs)
        {
            return load_shader({vertex_pass(vs)});
        }

        // ---- textures ---------------------------------------------------------------

        Status load_texture(const std::string& name, const std::string& url, double speed = 1.0)
        {
            const MediaKind kind = classify_media_url(url);
            ITextureProvider* provider = loaders_.texture_provider(kind);
            if (!provider)
            {
                const std::string msg = std::string("no ") + media_kind_name(kind) + " provider for '" + url + "'";
                log_error(msg);
                return Status::failure(msg, ErrorKind::Resource);
            }

            TextureLoadParams params{};
            params.speed = speed;
            Result<TextureHandle> tex = provider->load(name, url, params);
            if (!tex.ok) return Status::from(tex);

            uniforms_.set_texture(name, tex.value);
            bound_urls_[name] = url;
            return Status::success();
        }

        // Uniform-ийн GPU texture-ийг суллана. remove үед provider-ийн decode session-ийг мөн суллана.
        void unload_texture(const std::string& name, const std::string& url, bool remove)
        {
            uniforms_.erase(name);
            bound_urls_.erase(name);

            ITextureProvider* provider = loaders_.texture_provider(classify_media_url(url));
            if (!provider) return;

            for (const auto& kv : bound_urls_)
            {
                // Өөр нэр ижил URL-ыг ашигласаар байвал texture-ийг үлдээнэ.
                if (kv.second == url) return;
            }
            if (remove) provider->unload(url);
            else provider->release_texture(url);
        }

        // typeString-ийг задлаад value-ийн tag-тай тулгана.
        Status set_uniform(const std::string& name, std::string_view type, UniformValue value)
        {
            Result<UniformType> t = parse_uniform_type(type);
            if (!t.ok)
            {
                log_warn("uniform '" + name + "': " + t.error);
                return Status::from(t);
            }
            if (uniform_type_of(value) != t.value)
            {
                const std::string msg = "uniform '" + name + "': type '" + std::string(type) + "' expects "
                    + uniform_type_name(t.value) + ", got " + uniform_type_name(uniform_type_of(value));
                log_warn(msg);
                return Status::failure(msg);
            }
            uniforms_.set(name, std::move(value));
            return Status::success();
        }

        // ---- pointer / keys ---------------------------------------------------------

        // Canvas-ын пиксел координат. mouse нь [0,1], y дээшээ.
        void on_pointer_move(double x, double y)
        {
            const float mx = (float)(x / (double)canvas_.w);
            const float my = (float)(1.0 - y / (double)canvas_.h);
            uniforms_.set_vec2(uniform_names::kMouse, glm::vec2(mx, my));
        }

        void on_pointer_buttons(uint32_t buttons)
        {
            uniforms_.set_vec3(uniform_names::kMouseButtons, glm::vec3(
                (float)((buttons >> 0) & 1u),
                (float)((buttons >> 1) & 1u),
                (float)((buttons >> 2) & 1u)));
        }

        void on_key(int key_code, bool down)
        {
            if (loaders_.keyboard) loaders_.keyboard->on_key(key_code, down);
        }

        // ---- input toggles ----------------------------------------------------------

        Status toggle_audio(bool flag) { return toggle_input(loaders_.audio, flag); }
        Status toggle_midi(bool flag) { return toggle_input(loaders_.midi, flag); }
        Status toggle_camera(bool flag) { return toggle_input(loaders_.camera, flag); }
        Status toggle_keyboard(bool flag) { return toggle_input(loaders_.keyboard, flag); }
        Status toggle_gamepad(bool flag) { return toggle_input(loaders_.gamepad, flag); }

        // ---- sound ------------------------------------------------------------------

        Status load_sound_shader(const std::string& fs)
        {
            if (!sound_) return Status::failure("no sound renderer attached", ErrorKind::Resource);
            return sound_->load_sound_shader(fs);
        }

        Status play_sound()
        {
            if (!sound_) return Status::failure("no sound renderer attached", ErrorKind::Resource);
            return sound_->play_sound();
        }

        void stop_sound()
        {
            if (sound_) sound_->stop_sound();
        }

        // ---- playback ---------------------------------------------------------------

        void play()
        {
            playing_ = true;
        }

        // Tick зогсож input provider-ууд OS нөөцөө суллана. Pipeline-ын GPU объектууд хэвээр.
        void stop()
        {
            playing_ = false;
            toggle_audio(false);
            toggle_camera(false);
            toggle_keyboard(false);
            toggle_midi(false);
            toggle_gamepad(false);
        }

        bool playing() const { return playing_; }

        // Display-тэй синхрончлогдсон callback бүрт нэг удаа.
        void tick()
        {
            ++tick_count_;
            ++stats_.ticks;
            if (!playing_) return;

            update_time();
            if (!pipeline_ || !backbuffer_ || tick_count_ % opts_.frameskip != 0)
            {
                pull_loaders();
                return;
            }
            render_frame();
        }

        // ---- accessors --------------------------------------------------------------

        UniformTable& uniforms() { return uniforms_; }
        const UniformTable& uniforms() const { return uniforms_; }
        Pipeline* pipeline() { return pipeline_.get(); }
        const Pipeline* pipeline() const { return pipeline_.get(); }
        RenderTargetPair* backbuffer() { return backbuffer_.get(); }
        const HostOptions& options() const { return opts_; }
        DrawPrimitive vertex_primitive() const { return primitive_; }
        Extent2D canvas_size() const { return canvas_; }
        const FrameStats& stats() const { return stats_; }
        uint64_t tick_count() const { return tick_count_; }

        double buffer_width() const { return (double)canvas_.w / opts_.pixel_ratio; }
        double buffer_height() const { return (double)canvas_.h / opts_.pixel_ratio; }

    private:
        int buffer_width_px() const { return std::max(1, (int)buffer_width()); }
        int buffer_height_px() const { return std::max(1, (int)buffer_height()); }

        void sanitize_options()
        {
            if (!valid_pixel_ratio(opts_.pixel_ratio)) opts_.pixel_ratio = 1.0;
            opts_.frameskip = std::max<uint32_t>(1u, opts_.frameskip);
            opts_.vertex_count = std::max<uint32_t>(1u, opts_.vertex_count);
            if (!valid_fft_size(opts_.fft_size)) opts_.fft_size = 2048;
            if (!valid_fft_smoothing(opts_.fft_smoothing)) opts_.fft_smoothing = 0.8;
            if (!(opts_.sound_length > 0.0)) opts_.sound_length = 3.0;
        }

        Status toggle_input(IInputProvider* provider, bool flag)
        {
            if (!provider)
            {
                if (!flag) return Status::success();
                return Status::failure("input provider is not available", ErrorKind::Resource);
            }
            if (flag)
            {
                Status st = provider->enable();
                if (!st.ok) return st;
                provider->publish(uniforms_);
                return Status::success();
            }
            if (!provider->is_enabled()) return Status::success();
            for (const std::string& name : provider->published_uniforms()) uniforms_.erase(name);
            provider->disable();
            return Status::success();
        }

        void update_time()
        {
            const double t = elapsed_.elapsed_seconds(clock_.read());
            uniforms_.set_float(uniform_names::kTime, (float)t);
        }

        // Texture provider-уудыг урагшлуулж, идэвхтэй input-уудын бэлэн төлвийг хүснэгтэд бичнэ.
        void pull_loaders()
        {
            if (loaders_.animated_image) loaders_.animated_image->update();
            if (loaders_.video) loaders_.video->update();
            loaders_.for_each_input([this](IInputProvider& p) {
                if (!p.is_enabled()) return;
                p.update();
                p.publish(uniforms_);
            });
        }

        void render_frame()
        {
            // 2
            backbuffer_->swap();
            uniforms_.set_texture(uniform_names::kBackbuffer, backbuffer_->current_texture());

            // 3
            pull_loaders();

            // 4
            const double bw = buffer_width();
            const double bh = buffer_height();
            const size_t count = pipeline_->size();
            for (size_t i = 0; i < count; ++i)
            {
                RenderPass& pass = pipeline_->pass(i);
                uniforms_.set_int(uniform_names::kPassIndex, (int32_t)i);

                RenderTargetPair* target = pass.target();
                if (target)
                {
                    const Extent2D size = pass.resolve_size(bw, bh);
                    target->resize_back(size.w, size.h);
                    pass.execute(uniforms_, target->back_framebuffer());
                    target->swap();
                    uniforms_.set_texture(target->name(), target->current_texture());
                }
                else
                {
                    pass.execute(uniforms_, FramebufferHandle{});
                }
                ++stats_.pass_executions;
            }

            // 5
            RenderPass& last = pipeline_->pass(count - 1);
            if (last.has_target())
            {
                last.execute(uniforms_, FramebufferHandle{});
                ++stats_.pass_executions;
            }
            last.execute(uniforms_, backbuffer_->back_framebuffer());
            ++stats_.pass_executions;

            // 6
            const int32_t* fi = uniforms_.get<int32_t>(uniform_names::kFrameIndex);
            uniforms_.set_int(uniform_names::kFrameIndex, fi ? *fi + 1 : 1);
            ++stats_.frames_rendered;
        }

        IGpuDevice* device_ = nullptr;
        LoaderRegistry loaders_{};
        HostOptions opts_{};
        TickSource clock_{};
        ElapsedClock elapsed_{};
        DrawPrimitive primitive_ = DrawPrimitive::Triangles;

        UniformTable uniforms_{};
        std::unique_ptr<RenderTargetPair> backbuffer_{};
        std::unique_ptr<Pipeline> pipeline_{};
        SoundShaderRenderer* sound_ = nullptr;
        std::unordered_map<std::string, std::string> bound_urls_{};

        Extent2D canvas_{1, 1};
        uint64_t tick_count_ = 0;
        bool playing_ = true;
        FrameStats stats_{};
    };
}
