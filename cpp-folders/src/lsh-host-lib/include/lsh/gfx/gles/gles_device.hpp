#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: gles_device.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: IGpuDevice-ийн OpenGL ES 3 хэрэгжүүлэлт. GL context идэвхтэй thread дээр л дуудна.
            Handle нь дотоод хүснэгтийн индекс тул устгагдсан объект дахин ашиглагдахгүй.
*/


#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <GLES3/gl3.h>
#include <glm/gtc/type_ptr.hpp>

#include "lsh/core/log.hpp"
#include "lsh/gfx/gpu_device.hpp"
#include "lsh/shader/builtin_shaders.hpp"

namespace lsh
{
    class GlesDevice final : public IGpuDevice
    {
    public:
        static constexpr GLuint kPositionAttrib = 0;
        static constexpr GLuint kVertexIdAttrib = 1;

        GlesDevice() = default;

        ~GlesDevice() override
        {
            for (auto& kv : framebuffers_)
            {
                textures_.erase(kv.second.color_handle);
                release_framebuffer(kv.second);
            }
            for (auto& kv : textures_) glDeleteTextures(1, &kv.second.id);
            for (auto& kv : programs_) glDeleteProgram(kv.second);
            for (auto& kv : geometries_) release_geometry(kv.second);
        }

        GlesDevice(const GlesDevice&) = delete;
        GlesDevice& operator=(const GlesDevice&) = delete;

        const char* backend_name() const override { return "gles3"; }

        // ---- framebuffers -----------------------------------------------------------

        FramebufferHandle create_framebuffer(const FramebufferDesc& desc) override
        {
            Framebuffer fb{};
            fb.desc = desc;
            fb.desc.width = std::max(1, desc.width);
            fb.desc.height = std::max(1, desc.height);
            if (!allocate_framebuffer(fb) && fb.desc.format == TextureFormat::RGBA32F)
            {
                log_warn("float render targets are not renderable here, falling back to RGBA8");
                release_framebuffer(fb);
                fb.desc.format = TextureFormat::RGBA8;
                if (!allocate_framebuffer(fb)) log_error("framebuffer incomplete after RGBA8 fallback");
            }

            const FramebufferHandle h{next_id_++};
            textures_[fb.color_handle] = Texture{fb.color, fb.desc.width, fb.desc.height, fb.desc.format};
            framebuffers_[h.id] = fb;
            return h;
        }

        void resize_framebuffer(FramebufferHandle handle, int width, int height) override
        {
            auto it = framebuffers_.find(handle.id);
            if (it == framebuffers_.end()) return;
            Framebuffer& fb = it->second;
            width = std::max(1, width);
            height = std::max(1, height);
            if (fb.desc.width == width && fb.desc.height == height) return;

            fb.desc.width = width;
            fb.desc.height = height;
            glBindTexture(GL_TEXTURE_2D, fb.color);
            allocate_color_storage(fb.desc.format, width, height, nullptr);
            if (fb.depth != 0)
            {
                glBindRenderbuffer(GL_RENDERBUFFER, fb.depth);
                glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, width, height);
            }
            Texture& t = textures_[fb.color_handle];
            t.width = width;
            t.height = height;
        }

        TextureHandle framebuffer_texture(FramebufferHandle handle) const override
        {
            auto it = framebuffers_.find(handle.id);
            return it == framebuffers_.end() ? TextureHandle{} : TextureHandle{it->second.color_handle};
        }

        void destroy_framebuffer(FramebufferHandle handle) override
        {
            auto it = framebuffers_.find(handle.id);
            if (it == framebuffers_.end()) return;
            textures_.erase(it->second.color_handle);
            release_framebuffer(it->second);
            framebuffers_.erase(it);
        }

        // ---- textures ---------------------------------------------------------------

        TextureHandle create_texture(const TextureDesc& desc) override
        {
            Texture t{};
            t.width = std::max(1, desc.width);
            t.height = std::max(1, desc.height);
            t.format = TextureFormat::RGBA8;
            glGenTextures(1, &t.id);
            glBindTexture(GL_TEXTURE_2D, t.id);
            apply_sampler(desc.min_filter, desc.mag_filter);
            allocate_color_storage(TextureFormat::RGBA8, t.width, t.height, nullptr);

            const TextureHandle h{next_id_++};
            textures_[h.id] = t;
            return h;
        }

        void update_texture(TextureHandle handle, int width, int height, std::span<const uint8_t> rgba8) override
        {
            auto it = textures_.find(handle.id);
            if (it == textures_.end() || width <= 0 || height <= 0) return;
            if (rgba8.size() < (size_t)width * (size_t)height * 4u) return;

            Texture& t = it->second;
            glBindTexture(GL_TEXTURE_2D, t.id);
            glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
            if (t.width != width || t.height != height)
            {
                t.width = width;
                t.height = height;
                glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba8.data());
            }
            else
            {
                glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, rgba8.data());
            }
        }

        void destroy_texture(TextureHandle handle) override
        {
            auto it = textures_.find(handle.id);
            if (it == textures_.end()) return;
            glDeleteTextures(1, &it->second.id);
            textures_.erase(it);
        }

        // ---- programs ---------------------------------------------------------------

        Result<ProgramHandle> compile_program(const ProgramSource& src) override
        {
            const std::string vs = compose_shader_source(src.vertex, ShaderStage::Vertex, false);
            const std::string fs = compose_shader_source(src.fragment, ShaderStage::Fragment, src.enable_derivatives);

            std::string error{};
            const GLuint v = compile_shader(GL_VERTEX_SHADER, vs, error);
            if (v == 0) return Result<ProgramHandle>::failure("vertex shader: " + error);
            const GLuint f = compile_shader(GL_FRAGMENT_SHADER, fs, error);
            if (f == 0)
            {
                glDeleteShader(v);
                return Result<ProgramHandle>::failure("fragment shader: " + error);
            }

            const GLuint prog = glCreateProgram();
            glAttachShader(prog, v);
            glAttachShader(prog, f);
            glBindAttribLocation(prog, kPositionAttrib, "position");
            glBindAttribLocation(prog, kVertexIdAttrib, "vertexId");
            glLinkProgram(prog);
            glDetachShader(prog, v);
            glDetachShader(prog, f);
            glDeleteShader(v);
            glDeleteShader(f);

            GLint ok = GL_FALSE;
            glGetProgramiv(prog, GL_LINK_STATUS, &ok);
            if (ok != GL_TRUE)
            {
                const std::string log = program_info_log(prog);
                glDeleteProgram(prog);
                return Result<ProgramHandle>::failure("link: " + (log.empty() ? std::string("(no info log)") : log));
            }

            const ProgramHandle h{next_id_++};
            programs_[h.id] = prog;
            return Result<ProgramHandle>::success(h);
        }

        std::vector<ActiveUniform> active_uniforms(ProgramHandle handle) const override
        {
            std::vector<ActiveUniform> out{};
            auto it = programs_.find(handle.id);
            if (it == programs_.end()) return out;
            const GLuint prog = it->second;

            GLint count = 0;
            GLint max_len = 0;
            glGetProgramiv(prog, GL_ACTIVE_UNIFORMS, &count);
            glGetProgramiv(prog, GL_ACTIVE_UNIFORM_MAX_LENGTH, &max_len);
            std::vector<GLchar> name_buf((size_t)std::max(1, max_len));

            for (GLint i = 0; i < count; ++i)
            {
                GLsizei len = 0;
                GLint size = 0;
                GLenum type = 0;
                glGetActiveUniform(prog, (GLuint)i, (GLsizei)name_buf.size(), &len, &size, &type, name_buf.data());
                std::string name(name_buf.data(), (size_t)len);
                if (name.rfind("gl_", 0) == 0) continue;

                const bool is_array = name.size() > 3 && name.compare(name.size() - 3, 3, "[0]") == 0;
                if (is_array) name.resize(name.size() - 3);

                UniformType ut{};
                if (!map_gl_type(type, is_array || size > 1, ut))
                {
                    log_debug("uniform '" + name + "' has a GL type the host does not feed, skipped");
                    continue;
                }

                ActiveUniform au{};
                au.name = name;
                au.type = ut;
                au.location = glGetUniformLocation(prog, name.c_str());
                au.array_size = size;
                out.push_back(au);
            }
            return out;
        }

        void destroy_program(ProgramHandle handle) override
        {
            auto it = programs_.find(handle.id);
            if (it == programs_.end()) return;
            glDeleteProgram(it->second);
            programs_.erase(it);
        }

        // ---- geometry ---------------------------------------------------------------

        GeometryHandle create_geometry(const GeometryDesc& desc) override
        {
            Geometry g{};
            glGenVertexArrays(1, &g.vao);
            glBindVertexArray(g.vao);

            if (desc.kind == GeometryKind::FullscreenQuad)
            {
                static constexpr float quad[] = {
                    -1.0f, -1.0f, 0.0f,
                     1.0f, -1.0f, 0.0f,
                     1.0f,  1.0f, 0.0f,
                    -1.0f, -1.0f, 0.0f,
                     1.0f,  1.0f, 0.0f,
                    -1.0f,  1.0f, 0.0f
                };
                glGenBuffers(1, &g.position_vbo);
                glBindBuffer(GL_ARRAY_BUFFER, g.position_vbo);
                glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
                glEnableVertexAttribArray(kPositionAttrib);
                glVertexAttribPointer(kPositionAttrib, 3, GL_FLOAT, GL_FALSE, 0, nullptr);
                g.count = 6;
            }
            else
            {
                const uint32_t n = std::max<uint32_t>(1u, desc.vertex_count);
                const std::vector<float> positions((size_t)n * 3u, 0.0f);
                std::vector<float> ids((size_t)n);
                for (uint32_t i = 0; i < n; ++i) ids[i] = (float)i;

                glGenBuffers(1, &g.position_vbo);
                glBindBuffer(GL_ARRAY_BUFFER, g.position_vbo);
                glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(positions.size() * sizeof(float)), positions.data(), GL_STATIC_DRAW);
                glEnableVertexAttribArray(kPositionAttrib);
                glVertexAttribPointer(kPositionAttrib, 3, GL_FLOAT, GL_FALSE, 0, nullptr);

                glGenBuffers(1, &g.id_vbo);
                glBindBuffer(GL_ARRAY_BUFFER, g.id_vbo);
                glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(ids.size() * sizeof(float)), ids.data(), GL_STATIC_DRAW);
                glEnableVertexAttribArray(kVertexIdAttrib);
                glVertexAttribPointer(kVertexIdAttrib, 1, GL_FLOAT, GL_FALSE, 0, nullptr);
                g.count = (GLsizei)n;
            }

            glBindVertexArray(0);
            glBindBuffer(GL_ARRAY_BUFFER, 0);

            const GeometryHandle h{next_id_++};
            geometries_[h.id] = g;
            return h;
        }

        void destroy_geometry(GeometryHandle handle) override
        {
            auto it = geometries_.find(handle.id);
            if (it == geometries_.end()) return;
            release_geometry(it->second);
            geometries_.erase(it);
        }

        // ---- drawing ----------------------------------------------------------------

        void set_display_size(int width, int height) override
        {
            display_w_ = std::max(1, width);
            display_h_ = std::max(1, height);
        }

        void render(const DrawCall& call, FramebufferHandle target) override
        {
            auto pit = programs_.find(call.program.id);
            auto git = geometries_.find(call.geometry.id);
            if (pit == programs_.end() || git == geometries_.end()) return;

            int w = display_w_;
            int h = display_h_;
            GLuint fbo = 0;
            if (target.valid())
            {
                auto fit = framebuffers_.find(target.id);
                if (fit == framebuffers_.end()) return;
                fbo = fit->second.fbo;
                w = fit->second.desc.width;
                h = fit->second.desc.height;
            }

            glBindFramebuffer(GL_FRAMEBUFFER, fbo);
            glViewport(0, 0, w, h);
            glDepthMask(GL_TRUE);
            glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            apply_raster(call.raster);
            glUseProgram(pit->second);
            upload_uniforms(call.uniforms);

            glBindVertexArray(git->second.vao);
            glDrawArrays(gl_primitive(call.primitive), 0, git->second.count);
            glBindVertexArray(0);
        }

        bool read_pixels_rgba8(FramebufferHandle handle, int width, int height, std::vector<uint8_t>& out) override
        {
            auto it = framebuffers_.find(handle.id);
            if (it == framebuffers_.end() || width <= 0 || height <= 0) return false;
            out.resize((size_t)width * (size_t)height * 4u);
            glBindFramebuffer(GL_FRAMEBUFFER, it->second.fbo);
            glPixelStorei(GL_PACK_ALIGNMENT, 1);
            glReadPixels(0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, out.data());
            glBindFramebuffer(GL_FRAMEBUFFER, 0);
            return glGetError() == GL_NO_ERROR;
        }

    private:
        struct Texture
        {
            GLuint id = 0;
            int width = 1;
            int height = 1;
            TextureFormat format = TextureFormat::RGBA8;
        };

        struct Framebuffer
        {
            FramebufferDesc desc{};
            GLuint fbo = 0;
            GLuint color = 0;
            GLuint depth = 0;
            uint32_t color_handle = 0;
        };

        struct Geometry
        {
            GLuint vao = 0;
            GLuint position_vbo = 0;
            GLuint id_vbo = 0;
            GLsizei count = 0;
        };

        static void apply_sampler(TextureFilter min_f, TextureFilter mag_f)
        {
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, min_f == TextureFilter::Linear ? GL_LINEAR : GL_NEAREST);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, mag_f == TextureFilter::Linear ? GL_LINEAR : GL_NEAREST);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        }

        static void allocate_color_storage(TextureFormat format, int w, int h, const void* data)
        {
            if (format == TextureFormat::RGBA32F)
            {
                glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA32F, w, h, 0, GL_RGBA, GL_FLOAT, data);
            }
            else
            {
                glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, data);
            }
        }

        bool allocate_framebuffer(Framebuffer& fb)
        {
            glGenTextures(1, &fb.color);
            glBindTexture(GL_TEXTURE_2D, fb.color);
            // Float texture-ийг linear шүүх нь OES_texture_float_linear шаардана.
            apply_sampler(fb.desc.format == TextureFormat::RGBA32F ? TextureFilter::Nearest : TextureFilter::Linear, TextureFilter::Nearest);
            allocate_color_storage(fb.desc.format, fb.desc.width, fb.desc.height, nullptr);

            glGenFramebuffers(1, &fb.fbo);
            glBindFramebuffer(GL_FRAMEBUFFER, fb.fbo);
            glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, fb.color, 0);
            if (fb.desc.depth)
            {
                glGenRenderbuffers(1, &fb.depth);
                glBindRenderbuffer(GL_RENDERBUFFER, fb.depth);
                glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, fb.desc.width, fb.desc.height);
                glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, fb.depth);
            }
            const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
            glBindFramebuffer(GL_FRAMEBUFFER, 0);
            if (fb.color_handle == 0) fb.color_handle = next_id_++;
            return status == GL_FRAMEBUFFER_COMPLETE;
        }

        static void release_framebuffer(Framebuffer& fb)
        {
            if (fb.fbo) glDeleteFramebuffers(1, &fb.fbo);
            if (fb.color) glDeleteTextures(1, &fb.color);
            if (fb.depth) glDeleteRenderbuffers(1, &fb.depth);
            fb.fbo = 0;
            fb.color = 0;
            fb.depth = 0;
        }

        static void release_geometry(Geometry& g)
        {
            if (g.position_vbo) glDeleteBuffers(1, &g.position_vbo);
            if (g.id_vbo) glDeleteBuffers(1, &g.id_vbo);
            if (g.vao) glDeleteVertexArrays(1, &g.vao);
            g = Geometry{};
        }

        static GLuint compile_shader(GLenum stage, const std::string& src, std::string& error)
        {
            const GLuint s = glCreateShader(stage);
            const char* text = src.c_str();
            glShaderSource(s, 1, &text, nullptr);
            glCompileShader(s);

            GLint ok = GL_FALSE;
            glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
            if (ok == GL_TRUE) return s;

            GLint len = 0;
            glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
            std::string log((size_t)std::max(0, len), '\0');
            GLsizei written = 0;
            if (len > 1) glGetShaderInfoLog(s, len, &written, log.data());
            log.resize((size_t)std::max(0, written));
            error = log.empty() ? "(no info log)" : log;
            glDeleteShader(s);
            return 0;
        }

        static std::string program_info_log(GLuint prog)
        {
            GLint len = 0;
            glGetProgramiv(prog, GL_INFO_LOG_LENGTH, &len);
            if (len <= 1) return {};
            std::string log((size_t)len, '\0');
            GLsizei written = 0;
            glGetProgramInfoLog(prog, len, &written, log.data());
            log.resize((size_t)std::max(0, written));
            return log;
        }

        static bool map_gl_type(GLenum type, bool is_array, UniformType& out)
        {
            switch (type)
            {
                case GL_FLOAT: out = is_array ? UniformType::FloatArray : UniformType::Float; return true;
                case GL_INT:
                case GL_BOOL: out = is_array ? UniformType::IntArray : UniformType::Int; return true;
                case GL_FLOAT_VEC2: out = is_array ? UniformType::Vec2Array : UniformType::Vec2; return true;
                case GL_FLOAT_VEC3: out = is_array ? UniformType::Vec3Array : UniformType::Vec3; return true;
                case GL_FLOAT_VEC4: out = is_array ? UniformType::Vec4Array : UniformType::Vec4; return true;
                case GL_FLOAT_MAT3: out = UniformType::Mat3; return !is_array;
                case GL_FLOAT_MAT4: out = UniformType::Mat4; return !is_array;
                case GL_SAMPLER_2D: out = UniformType::Texture; return !is_array;
                default: return false;
            }
        }

        static GLenum gl_primitive(DrawPrimitive p)
        {
            switch (p)
            {
                case DrawPrimitive::Points: return GL_POINTS;
                case DrawPrimitive::LineLoop: return GL_LINE_LOOP;
                case DrawPrimitive::LineStrip: return GL_LINE_STRIP;
                case DrawPrimitive::Lines: return GL_LINES;
                case DrawPrimitive::TriangleStrip: return GL_TRIANGLE_STRIP;
                case DrawPrimitive::TriangleFan: return GL_TRIANGLE_FAN;
                case DrawPrimitive::Triangles: return GL_TRIANGLES;
            }
            return GL_TRIANGLES;
        }

        static void apply_raster(const RasterState& r)
        {
            if (r.blend == BlendMode::Additive)
            {
                glEnable(GL_BLEND);
                glBlendEquation(GL_FUNC_ADD);
                glBlendFunc(GL_SRC_ALPHA, GL_ONE);
            }
            else
            {
                glDisable(GL_BLEND);
            }
            if (r.depth_test) glEnable(GL_DEPTH_TEST);
            else glDisable(GL_DEPTH_TEST);
            if (r.double_sided) glDisable(GL_CULL_FACE);
            else
            {
                glEnable(GL_CULL_FACE);
                glCullFace(GL_BACK);
            }
        }

        void upload_uniforms(std::span<const UniformUpload> uploads)
        {
            GLint unit = 0;
            for (const UniformUpload& u : uploads)
            {
                if (u.location < 0 || !u.value) continue;
                const UniformValue& v = *u.value;
                const GLint loc = u.location;
                switch (u.type)
                {
                    case UniformType::Float: glUniform1f(loc, std::get<float>(v)); break;
                    case UniformType::Int: glUniform1i(loc, std::get<int32_t>(v)); break;
                    case UniformType::Vec2: glUniform2fv(loc, 1, glm::value_ptr(std::get<glm::vec2>(v))); break;
                    case UniformType::Vec3: glUniform3fv(loc, 1, glm::value_ptr(std::get<glm::vec3>(v))); break;
                    case UniformType::Vec4: glUniform4fv(loc, 1, glm::value_ptr(std::get<glm::vec4>(v))); break;
                    case UniformType::Mat3: glUniformMatrix3fv(loc, 1, GL_FALSE, glm::value_ptr(std::get<glm::mat3>(v))); break;
                    case UniformType::Mat4: glUniformMatrix4fv(loc, 1, GL_FALSE, glm::value_ptr(std::get<glm::mat4>(v))); break;
                    case UniformType::Texture:
                    {
                        auto it = textures_.find(std::get<TextureHandle>(v).id);
                        glActiveTexture(GL_TEXTURE0 + (GLenum)unit);
                        glBindTexture(GL_TEXTURE_2D, it == textures_.end() ? 0u : it->second.id);
                        glUniform1i(loc, unit);
                        ++unit;
                        break;
                    }
                    case UniformType::FloatArray:
                    {
                        const auto& a = std::get<std::vector<float>>(v);
                        const GLsizei n = (GLsizei)std::min<size_t>(a.size(), (size_t)u.array_size);
                        if (n > 0) glUniform1fv(loc, n, a.data());
                        break;
                    }
                    case UniformType::IntArray:
                    {
                        const auto& a = std::get<std::vector<int32_t>>(v);
                        const GLsizei n = (GLsizei)std::min<size_t>(a.size(), (size_t)u.array_size);
                        if (n > 0) glUniform1iv(loc, n, a.data());
                        break;
                    }
                    case UniformType::Vec2Array:
                    {
                        const auto& a = std::get<std::vector<glm::vec2>>(v);
                        const GLsizei n = (GLsizei)std::min<size_t>(a.size(), (size_t)u.array_size);
                        if (n > 0) glUniform2fv(loc, n, glm::value_ptr(a[0]));
                        break;
                    }
                    case UniformType::Vec3Array:
                    {
                        const auto& a = std::get<std::vector<glm::vec3>>(v);
                        const GLsizei n = (GLsizei)std::min<size_t>(a.size(), (size_t)u.array_size);
                        if (n > 0) glUniform3fv(loc, n, glm::value_ptr(a[0]));
                        break;
                    }
                    case UniformType::Vec4Array:
                    {
                        const auto& a = std::get<std::vector<glm::vec4>>(v);
                        const GLsizei n = (GLsizei)std::min<size_t>(a.size(), (size_t)u.array_size);
                        if (n > 0) glUniform4fv(loc, n, glm::value_ptr(a[0]));
                        break;
                    }
                }
            }
            glActiveTexture(GL_TEXTURE0);
        }

        uint32_t next_id_ = 1;
        int display_w_ = 1;
        int display_h_ = 1;
        std::unordered_map<uint32_t, Framebuffer> framebuffers_{};
        std::unordered_map<uint32_t, Texture> textures_{};
        std::unordered_map<uint32_t, GLuint> programs_{};
        std::unordered_map<uint32_t, Geometry> geometries_{};
    };
}
