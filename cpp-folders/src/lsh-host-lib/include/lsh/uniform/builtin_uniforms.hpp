#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: builtin_uniforms.hpp
    МОДУЛЬ: uniform
    ЗОРИЛГО: Хостын суулгадаг uniform нэрс болон эхлэлийн утгыг бүртгэх функц.
*/


#include "lsh/uniform/uniform_table.hpp"

namespace lsh
{
    namespace uniform_names
    {
        inline constexpr const char* kBackbuffer = "backbuffer";
        inline constexpr const char* kMouse = "mouse";
        inline constexpr const char* kMouseButtons = "mouseButtons";
        inline constexpr const char* kResolution = "resolution";
        inline constexpr const char* kTime = "time";
        inline constexpr const char* kVertexCount = "vertexCount";
        inline constexpr const char* kPassIndex = "PASSINDEX";
        inline constexpr const char* kFrameIndex = "FRAMEINDEX";

        // Provider идэвхжихэд суулгагдана.
        inline constexpr const char* kVolume = "volume";
        inline constexpr const char* kSpectrum = "spectrum";
        inline constexpr const char* kSamples = "samples";
        inline constexpr const char* kMidi = "midi";
        inline constexpr const char* kNote = "note";
        inline constexpr const char* kCamera = "camera";
        inline constexpr const char* kKey = "key";
        inline constexpr const char* kGamepad = "gamepad";

        // Pass бүрийн камерын матрицууд.
        inline constexpr const char* kProjectionMatrix = "projectionMatrix";
        inline constexpr const char* kModelViewMatrix = "modelViewMatrix";
    }

    inline void install_builtin_uniforms(UniformTable& table, float vertex_count)
    {
        table.set_texture(uniform_names::kBackbuffer, TextureHandle{});
        table.set_vec2(uniform_names::kMouse, glm::vec2(0.0f));
        table.set_vec3(uniform_names::kMouseButtons, glm::vec3(0.0f));
        table.set_vec2(uniform_names::kResolution, glm::vec2(0.0f));
        table.set_float(uniform_names::kTime, 0.0f);
        table.set_float(uniform_names::kVertexCount, vertex_count);
        table.set_int(uniform_names::kPassIndex, 0);
        table.set_int(uniform_names::kFrameIndex, 0);
    }
}
