#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: gpu_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: GPU хийсвэрлэлд дамжих тодорхойлолтууд: framebuffer/texture desc,
            draw primitive, geometry, raster төлөв, program эх код, uniform reflection.
*/


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "lsh/gfx/gpu_handle.hpp"
#include "lsh/uniform/uniform_value.hpp"

namespace lsh
{
    enum class TextureFormat : uint8_t
    {
        RGBA8 = 0,
        RGBA32F = 1
    };

    enum class TextureFilter : uint8_t
    {
        Nearest = 0,
        Linear = 1
    };

    struct TextureDesc
    {
        int width = 1;
        int height = 1;
        TextureFormat format = TextureFormat::RGBA8;
        TextureFilter min_filter = TextureFilter::Linear;
        TextureFilter mag_filter = TextureFilter::Linear;
    };

    // Offscreen framebuffer: нэг color texture (min Linear, mag Nearest) ба depth.
    struct FramebufferDesc
    {
        int width = 1;
        int height = 1;
        TextureFormat format = TextureFormat::RGBA8;
        bool depth = true;
    };

    enum class DrawPrimitive : uint8_t
    {
        Points = 0,
        LineLoop = 1,
        LineStrip = 2,
        Lines = 3,
        TriangleStrip = 4,
        TriangleFan = 5,
        Triangles = 6
    };

    inline const char* draw_primitive_name(DrawPrimitive p)
    {
        switch (p)
        {
            case DrawPrimitive::Points: return "POINTS";
            case DrawPrimitive::LineLoop: return "LINE_LOOP";
            case DrawPrimitive::LineStrip: return "LINE_STRIP";
            case DrawPrimitive::Lines: return "LINES";
            case DrawPrimitive::TriangleStrip: return "TRI_STRIP";
            case DrawPrimitive::TriangleFan: return "TRI_FAN";
            case DrawPrimitive::Triangles: return "TRIANGLES";
        }
        return "TRIANGLES";
    }

    // Танигдаагүй нэр TRIANGLES болно.
    inline DrawPrimitive parse_draw_primitive(std::string_view s)
    {
        std::string v(s);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        if (v == "POINTS") return DrawPrimitive::Points;
        if (v == "LINE_LOOP") return DrawPrimitive::LineLoop;
        if (v == "LINE_STRIP") return DrawPrimitive::LineStrip;
        if (v == "LINES") return DrawPrimitive::Lines;
        if (v == "TRI_STRIP") return DrawPrimitive::TriangleStrip;
        if (v == "TRI_FAN") return DrawPrimitive::TriangleFan;
        return DrawPrimitive::Triangles;
    }

    enum class GeometryKind : uint8_t
    {
        FullscreenQuad = 0,
        // vertex_count ширхэг (0,0,0) байрлал + float vertexId attribute.
        ProceduralVertices = 1
    };

    struct GeometryDesc
    {
        GeometryKind kind = GeometryKind::FullscreenQuad;
        uint32_t vertex_count = 0;
    };

    enum class BlendMode : uint8_t
    {
        Opaque = 0,
        Additive = 1
    };

    struct RasterState
    {
        BlendMode blend = BlendMode::Opaque;
        bool depth_test = false;
        bool double_sided = false;
    };

    struct ProgramSource
    {
        std::string vertex{};
        std::string fragment{};
        bool enable_derivatives = false;
    };

    // Холбогдсон program-ын идэвхтэй uniform. Array бол нэрээс "[0]" хасагдсан байна.
    struct ActiveUniform
    {
        std::string name{};
        UniformType type = UniformType::Float;
        int32_t location = -1;
        int32_t array_size = 1;
    };

    struct UniformUpload
    {
        int32_t location = -1;
        UniformType type = UniformType::Float;
        int32_t array_size = 1;
        const UniformValue* value = nullptr;
    };

    struct DrawCall
    {
        ProgramHandle program{};
        GeometryHandle geometry{};
        DrawPrimitive primitive = DrawPrimitive::Triangles;
        RasterState raster{};
        std::span<const UniformUpload> uniforms{};
    };
}
