#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: sound_shader_renderer.hpp
    МОДУЛЬ: sound
    ЗОРИЛГО: "vec2 mainSound(float time)" агуулсан GLSL дуу shader-ийг GPU дээр offscreen
            RGBA8 target руу блокоор зурж, texel бүрийн 16-bit L/R дээжийг уншиж audio sink руу
            дараалуулна. Зөвхөн play_sound() үед ажиллана, кадрын үед биш.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "lsh/camera/ortho_camera.hpp"
#include "lsh/core/log.hpp"
#include "lsh/core/result.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/shader/builtin_shaders.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    class IAudioSink
    {
    public:
        virtual ~IAudioSink() = default;
        // Interleaved stereo float [-1, 1].
        virtual Status queue(std::span<const float> interleaved_stereo, int sample_rate) = 0;
        virtual void stop() = 0;
        virtual bool playing() const = 0;
    };

    inline constexpr const char* kSoundShaderFooter = R"(
uniform float iBlockOffset;
uniform float iSampleRate;
uniform float iBlockWidth;

void main() {
    float t = iBlockOffset + ((gl_FragCoord.x - 0.5) + (gl_FragCoord.y - 0.5) * iBlockWidth) / iSampleRate;
    vec2 y = clamp(mainSound(t), -1.0, 1.0);
    vec2 v = floor((0.5 + 0.5 * y) * 65535.0);
    vec2 vl = mod(v, 256.0) / 255.0;
    vec2 vh = floor(v / 256.0) / 255.0;
    gl_FragColor = vec4(vl.x, vh.x, vl.y, vh.y);
}
)";

    // Texel-ийн 4 байтыг (L lo, L hi, R lo, R hi) хоёр float болгоно.
    inline void decode_sound_texel(const uint8_t* px, float& left, float& right)
    {
        const float l = (float)((int)px[0] + 256 * (int)px[1]) / 65535.0f;
        const float r = (float)((int)px[2] + 256 * (int)px[3]) / 65535.0f;
        left = l * 2.0f - 1.0f;
        right = r * 2.0f - 1.0f;
    }

    class SoundShaderRenderer
    {
    public:
        static constexpr int kBlockWidth = 512;
        static constexpr int kBlockHeight = 512;

        SoundShaderRenderer(IGpuDevice& device, IAudioSink* sink, int sample_rate = 44100, double length_seconds = 3.0)
            : device_(&device)
            , sink_(sink)
            , sample_rate_(std::max(1, sample_rate))
            , length_(length_seconds > 0.0 ? length_seconds : 3.0)
        {}

        ~SoundShaderRenderer()
        {
            release();
        }

        SoundShaderRenderer(const SoundShaderRenderer&) = delete;
        SoundShaderRenderer& operator=(const SoundShaderRenderer&) = delete;

        // Амжилтгүй бол өмнөх shader хэвээр.
        Status load_sound_shader(const std::string& fs)
        {
            if (fs.empty()) return Status::failure("sound shader is empty");

            ProgramSource src{};
            src.vertex = kDefaultVertexShader;
            src.fragment = fs + kSoundShaderFooter;
            Result<ProgramHandle> prog = device_->compile_program(src);
            if (!prog.ok)
            {
                log_error("sound shader: " + prog.error);
                return Status::failure("sound shader: " + prog.error, prog.kind);
            }

            if (program_.valid()) device_->destroy_program(program_);
            program_ = prog.value;
            uniforms_ = device_->active_uniforms(program_);
            if (!quad_.valid())
            {
                GeometryDesc geo{};
                geo.kind = GeometryKind::FullscreenQuad;
                quad_ = device_->create_geometry(geo);
            }
            if (!target_.valid())
            {
                FramebufferDesc desc{};
                desc.width = kBlockWidth;
                desc.height = kBlockHeight;
                desc.format = TextureFormat::RGBA8;
                desc.depth = false;
                target_ = device_->create_framebuffer(desc);
            }
            return Status::success();
        }

        void set_sound_length(double seconds)
        {
            if (!(seconds > 0.0) || !std::isfinite(seconds))
            {
                log_warn("sound length must be positive, keeping " + std::to_string(length_));
                return;
            }
            length_ = seconds;
        }

        double sound_length() const { return length_; }
        int sample_rate() const { return sample_rate_; }
        bool loaded() const { return program_.valid(); }

        // Бүх уртыг зурж sink руу дараалуулна.
        Status play_sound()
        {
            if (!program_.valid()) return Status::failure("no sound shader loaded");
            if (!sink_) return Status::failure("no audio output available", ErrorKind::Resource);

            const size_t total = (size_t)std::ceil(length_ * (double)sample_rate_);
            const size_t per_block = (size_t)kBlockWidth * (size_t)kBlockHeight;
            std::vector<float> out{};
            out.reserve(total * 2u);

            UniformValue offset_v{0.0f};
            UniformValue rate_v{(float)sample_rate_};
            UniformValue width_v{(float)kBlockWidth};
            OrthoCamera cam{};
            UniformValue proj_v{cam.projection_matrix()};
            UniformValue mv_v{cam.model_view_matrix()};

            std::vector<UniformUpload> uploads{};
            for (const ActiveUniform& au : uniforms_)
            {
                const UniformValue* v = nullptr;
                if (au.name == "iBlockOffset") v = &offset_v;
                else if (au.name == "iSampleRate") v = &rate_v;
                else if (au.name == "iBlockWidth") v = &width_v;
                else if (au.name == uniform_names::kProjectionMatrix) v = &proj_v;
                else if (au.name == uniform_names::kModelViewMatrix) v = &mv_v;
                if (v && uniform_type_of(*v) == au.type)
                {
                    uploads.push_back(UniformUpload{au.location, au.type, au.array_size, v});
                }
            }

            DrawCall call{};
            call.program = program_;
            call.geometry = quad_;
            call.primitive = DrawPrimitive::Triangles;
            call.uniforms = uploads;

            std::vector<uint8_t> pixels{};
            for (size_t done = 0; done < total; done += per_block)
            {
                offset_v = (float)((double)done / (double)sample_rate_);
                device_->render(call, target_);
                if (!device_->read_pixels_rgba8(target_, kBlockWidth, kBlockHeight, pixels))
                {
                    return Status::failure("sound shader: reading rendered block failed", ErrorKind::Resource);
                }
                const size_t n = std::min(per_block, total - done);
                for (size_t i = 0; i < n; ++i)
                {
                    float l = 0.0f;
                    float r = 0.0f;
                    decode_sound_texel(&pixels[i * 4u], l, r);
                    out.push_back(l);
                    out.push_back(r);
                }
            }

            sink_->stop();
            Status st = sink_->queue(out, sample_rate_);
            if (!st.ok) log_error("sound: " + st.error);
            return st;
        }

        void stop_sound()
        {
            if (sink_) sink_->stop();
        }

    private:
        void release()
        {
            if (program_.valid()) device_->destroy_program(program_);
            if (quad_.valid()) device_->destroy_geometry(quad_);
            if (target_.valid()) device_->destroy_framebuffer(target_);
            program_ = ProgramHandle{};
            quad_ = GeometryHandle{};
            target_ = FramebufferHandle{};
        }

        IGpuDevice* device_ = nullptr;
        IAudioSink* sink_ = nullptr;
        int sample_rate_ = 44100;
        double length_ = 3.0;
        ProgramHandle program_{};
        GeometryHandle quad_{};
        FramebufferHandle target_{};
        std::vector<ActiveUniform> uniforms_{};
    };
}
