#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: pass_spec.hpp
    МОДУЛЬ: pipeline
    ЗОРИЛГО: Pipeline build-ийн оролт: нэг pass-ын shader эх код, нэртэй target,
            float texture туг, WIDTH/HEIGHT хэмжээний илэрхийлэл.
*/


#include <optional>
#include <string>
#include <utility>

namespace lsh
{
    struct PassSpec
    {
        std::optional<std::string> fs{};
        // Байвал procedural vertex geometry замыг сонгоно.
        std::optional<std::string> vs{};
        std::optional<std::string> target{};
        std::optional<std::string> width{};
        std::optional<std::string> height{};
        bool float_texture = false;

        // Хоосон текст нь өгөгдөөгүйтэй адил.
        bool has_fs() const { return fs.has_value() && !fs->empty(); }
        bool has_vs() const { return vs.has_value() && !vs->empty(); }
        bool has_target() const { return target.has_value() && !target->empty(); }
    };

    inline PassSpec fragment_pass(std::string fs)
    {
        PassSpec s{};
        s.fs = std::move(fs);
        return s;
    }

    inline PassSpec vertex_pass(std::string vs)
    {
        PassSpec s{};
        s.vs = std::move(vs);
        return s;
    }
}
