#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: uniform_value.hpp
    МОДУЛЬ: uniform
    ЗОРИЛГО: Uniform-ийн төрлийн tag болон tagged union утга (UniformValue).
            Хост програмын "1f", "v2", "t" зэрэг төрлийн нэрийг tag руу хөрвүүлнэ.
*/


#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "lsh/core/result.hpp"
#include "lsh/gfx/gpu_handle.hpp"

namespace lsh
{
    // Дараалал нь UniformValue variant-ийн индекстэй яг таарна.
    enum class UniformType : uint8_t
    {
        Float = 0,
        Int = 1,
        Vec2 = 2,
        Vec3 = 3,
        Vec4 = 4,
        Mat3 = 5,
        Mat4 = 6,
        Texture = 7,
        FloatArray = 8,
        IntArray = 9,
        Vec2Array = 10,
        Vec3Array = 11,
        Vec4Array = 12
    };

    using UniformValue = std::variant<
        float,
        int32_t,
        glm::vec2,
        glm::vec3,
        glm::vec4,
        glm::mat3,
        glm::mat4,
        TextureHandle,
        std::vector<float>,
        std::vector<int32_t>,
        std::vector<glm::vec2>,
        std::vector<glm::vec3>,
        std::vector<glm::vec4>
    >;

    static_assert(std::variant_size_v<UniformValue> == 13, "UniformType and UniformValue must stay in sync");

    inline UniformType uniform_type_of(const UniformValue& v)
    {
        return (UniformType)v.index();
    }

    inline bool uniform_type_is_array(UniformType t)
    {
        return t == UniformType::FloatArray
            || t == UniformType::IntArray
            || t == UniformType::Vec2Array
            || t == UniformType::Vec3Array
            || t == UniformType::Vec4Array;
    }

    inline const char* uniform_type_name(UniformType t)
    {
        switch (t)
        {
            case UniformType::Float: return "float";
            case UniformType::Int: return "int";
            case UniformType::Vec2: return "vec2";
            case UniformType::Vec3: return "vec3";
            case UniformType::Vec4: return "vec4";
            case UniformType::Mat3: return "mat3";
            case UniformType::Mat4: return "mat4";
            case UniformType::Texture: return "sampler2D";
            case UniformType::FloatArray: return "float[]";
            case UniformType::IntArray: return "int[]";
            case UniformType::Vec2Array: return "vec2[]";
            case UniformType::Vec3Array: return "vec3[]";
            case UniformType::Vec4Array: return "vec4[]";
        }
        return "unknown";
    }

    // Array uniform-ийн элементийн (scalar/vector) төрлийг буцаана.
    inline UniformType uniform_array_of(UniformType element)
    {
        switch (element)
        {
            case UniformType::Float: return UniformType::FloatArray;
            case UniformType::Int: return UniformType::IntArray;
            case UniformType::Vec2: return UniformType::Vec2Array;
            case UniformType::Vec3: return UniformType::Vec3Array;
            case UniformType::Vec4: return UniformType::Vec4Array;
            default: return element;
        }
    }

    inline Result<UniformType> parse_uniform_type(std::string_view s)
    {
        if (s == "1i" || s == "i") return Result<UniformType>::success(UniformType::Int);
        if (s == "1f" || s == "f") return Result<UniformType>::success(UniformType::Float);
        if (s == "2f" || s == "v2") return Result<UniformType>::success(UniformType::Vec2);
        if (s == "3f" || s == "v3" || s == "c") return Result<UniformType>::success(UniformType::Vec3);
        if (s == "4f" || s == "v4") return Result<UniformType>::success(UniformType::Vec4);
        if (s == "Matrix3fv" || s == "m3") return Result<UniformType>::success(UniformType::Mat3);
        if (s == "Matrix4fv" || s == "Matric4fv" || s == "m4") return Result<UniformType>::success(UniformType::Mat4);
        if (s == "t") return Result<UniformType>::success(UniformType::Texture);
        if (s == "1iv" || s == "iv1" || s == "iv" || s == "3iv") return Result<UniformType>::success(UniformType::IntArray);
        if (s == "1fv" || s == "fv1" || s == "fv") return Result<UniformType>::success(UniformType::FloatArray);
        if (s == "2fv" || s == "v2v") return Result<UniformType>::success(UniformType::Vec2Array);
        if (s == "3fv" || s == "v3v") return Result<UniformType>::success(UniformType::Vec3Array);
        if (s == "4fv" || s == "v4v") return Result<UniformType>::success(UniformType::Vec4Array);
        return Result<UniformType>::failure("unsupported uniform type '" + std::string(s) + "'");
    }
}
