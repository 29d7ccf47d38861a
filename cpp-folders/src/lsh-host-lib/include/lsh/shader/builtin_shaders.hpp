#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Суурь vertex/fragment shader-ууд болон хэрэглэгчийн GLSL ES эх кодын урд
            нэмэгдэх preamble (precision, камерын матриц, attribute зарлал).
            #version/#extension мөрүүд preamble-ээс өмнө шилжинэ.
*/


#include <sstream>
#include <string>
#include <string_view>

namespace lsh
{
    // Бүтэн дэлгэцийн quad pass-ын vertex shader.
    inline constexpr const char* kDefaultVertexShader = R"(
void main() {
    gl_Position = projectionMatrix * modelViewMatrix * vec4(position, 1.0);
}
)";

    // Vertex горимд fragment өгөгдөөгүй үед. Vertex shader v_color varying бичнэ гэж үзнэ.
    inline constexpr const char* kDefaultFragmentShader = R"(
varying vec4 v_color;
void main() {
    gl_FragColor = v_color;
}
)";

    enum class ShaderStage : unsigned char
    {
        Vertex = 0,
        Fragment = 1
    };

    struct GlslSplit
    {
        std::string version{};
        std::string extensions{};
        // Шилжүүлсэн мөрүүд хоосон мөрөөр солигдсон тул мөрийн дугаар хадгалагдана.
        std::string body{};
        bool es3 = false;
    };

    inline GlslSplit split_glsl_directives(std::string_view src)
    {
        GlslSplit out{};
        std::istringstream in{std::string(src)};
        std::string line;
        while (std::getline(in, line))
        {
            size_t p = line.find_first_not_of(" \t\r");
            const std::string_view trimmed = p == std::string::npos ? std::string_view{} : std::string_view(line).substr(p);
            if (trimmed.rfind("#version", 0) == 0)
            {
                out.version = std::string(trimmed);
                out.es3 = trimmed.find("300") != std::string_view::npos;
                out.body += "\n";
            }
            else if (trimmed.rfind("#extension", 0) == 0)
            {
                out.extensions += std::string(trimmed) + "\n";
                out.body += "\n";
            }
            else
            {
                out.body += line;
                out.body += "\n";
            }
        }
        return out;
    }

    // GLSL ES 1.00 (эсвэл хэрэглэгч зарласан бол 3.00) эх кодыг бэлэн болгоно.
    inline std::string compose_shader_source(std::string_view user_src, ShaderStage stage, bool enable_derivatives)
    {
        const GlslSplit split = split_glsl_directives(user_src);

        std::string out{};
        out += split.version.empty() ? "#version 100" : split.version;
        out += "\n";
        if (enable_derivatives && !split.es3 && stage == ShaderStage::Fragment)
        {
            out += "#extension GL_OES_standard_derivatives : enable\n";
        }
        out += split.extensions;

        out += "precision highp float;\n";
        out += "precision highp int;\n";
        if (stage == ShaderStage::Vertex)
        {
            out += "uniform mat4 projectionMatrix;\n";
            out += "uniform mat4 modelViewMatrix;\n";
            out += split.es3 ? "in vec3 position;\n" : "attribute vec3 position;\n";
        }
        out += split.body;
        return out;
    }
}
