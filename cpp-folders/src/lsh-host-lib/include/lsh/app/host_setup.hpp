#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: host_setup.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Командын мөрөөр хүссэн input, texture, pass-уудыг FrameDriver-т суулгана.
            Алдаа бүрийг аль тохиргооноос үүссэнийг нь заан log хийж, нэгтгэсэн Status буцаана.
*/


#include <string>
#include <vector>

#include "lsh/app/host_args.hpp"
#include "lsh/app/shader_watch.hpp"
#include "lsh/core/log.hpp"
#include "lsh/core/result.hpp"
#include "lsh/driver/frame_driver.hpp"

namespace lsh
{
    namespace detail
    {
        inline void note_setup_failure(std::string& summary, ErrorKind& kind, const std::string& what, const Status& st)
        {
            log_warn(what + ": " + st.error);
            if (!summary.empty()) summary += "; ";
            summary += what + ": " + st.error;
            if (kind == ErrorKind::None) kind = st.kind;
        }
    }

    // Нэг input амжилтгүй болсон ч бусдыг нь идэвхжүүлсээр байна.
    inline Status enable_requested_inputs(FrameDriver& driver, const HostArgs& args)
    {
        std::string summary{};
        ErrorKind kind = ErrorKind::None;
        auto enable = [&](bool requested, const char* flag, Status (FrameDriver::*toggle)(bool)) {
            if (!requested) return;
            const Status st = (driver.*toggle)(true);
            if (!st.ok) detail::note_setup_failure(summary, kind, flag, st);
        };
        enable(args.audio, "--audio", &FrameDriver::toggle_audio);
        enable(args.midi, "--midi", &FrameDriver::toggle_midi);
        enable(args.camera, "--camera", &FrameDriver::toggle_camera);
        enable(args.keyboard, "--keyboard", &FrameDriver::toggle_keyboard);
        enable(args.gamepad, "--gamepad", &FrameDriver::toggle_gamepad);

        if (summary.empty()) return Status::success();
        return Status::failure(summary, kind);
    }

    inline Status load_requested_textures(FrameDriver& driver, const std::vector<TextureArg>& textures)
    {
        std::string summary{};
        ErrorKind kind = ErrorKind::None;
        for (const TextureArg& t : textures)
        {
            const Status st = driver.load_texture(t.name, t.url, t.speed);
            if (!st.ok) detail::note_setup_failure(summary, kind, "--texture " + t.name, st);
        }
        if (summary.empty()) return Status::success();
        return Status::failure(summary, kind);
    }

    // Файлуудыг дахин уншиж pipeline-ыг бүтнээр нь солино. Алдаа гарвал хуучин pipeline хэвээр.
    inline Status reload_pipeline(FrameDriver& driver, const ShaderWatch& watch)
    {
        Result<std::vector<PassSpec>> specs = watch.load_specs();
        if (!specs.ok)
        {
            log_error("shader reload: " + specs.error);
            return Status::from(specs);
        }
        const Status built = driver.load_shader(specs.value);
        if (!built.ok) log_warn("shader reload: keeping the previous pipeline");
        return built;
    }
}
