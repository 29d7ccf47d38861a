#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: host_args.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: lsh-host-ийн командын мөрийг задлана. Орчны хувьсагчийн дараах сүүлийн давхарга.

    ЖИШЭЭ:
        lsh-host scene.frag
        lsh-host --pass fs=blur.frag:target=A:width=$WIDTH/2:height=$HEIGHT/2 --pass fs=final.frag
        lsh-host --pass vs=points.vert --vertex-mode POINTS --vertex-count 10000 --texture tex=img.png@1.0
*/


#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lsh/core/options.hpp"
#include "lsh/core/result.hpp"

namespace lsh
{
    // Pass-ын эх кодын файлууд. Агуулгыг ShaderWatch уншина.
    struct PassFile
    {
        std::optional<std::string> fs_path{};
        std::optional<std::string> vs_path{};
        std::optional<std::string> target{};
        std::optional<std::string> width{};
        std::optional<std::string> height{};
        bool float_texture = false;
    };

    struct TextureArg
    {
        std::string name{};
        std::string url{};
        double speed = 1.0;
    };

    struct HostArgs
    {
        std::vector<PassFile> passes{};
        std::vector<TextureArg> textures{};
        std::optional<std::string> sound_shader_path{};

        bool audio = false;
        bool midi = false;
        std::string midi_device{};
        bool camera = false;
        bool keyboard = false;
        bool gamepad = false;
        bool show_help = false;
    };

    inline const char* host_usage()
    {
        return
            "usage: lsh-host [options] [shader.frag]\n"
            "  --pass fs=FILE[:vs=FILE][:target=NAME][:width=EXPR][:height=EXPR][:float]\n"
            "  --texture NAME=PATH[@SPEED]\n"
            "  --sound FILE              sound shader exposing vec2 mainSound(float time)\n"
            "  --pixel-ratio R  --frameskip N  --vertex-mode MODE  --vertex-count N\n"
            "  --fft-size N  --fft-smoothing S  --sound-length SECONDS\n"
            "  --audio  --midi[=DEVICE]  --camera  --keyboard  --gamepad\n"
            "  --log-level debug|info|warn|error  --help\n";
    }

    // "fs=a.frag:target=A:float" хэлбэрийг задлана.
    inline Result<PassFile> parse_pass_arg(std::string_view text)
    {
        PassFile pass{};
        size_t pos = 0;
        while (pos <= text.size())
        {
            const size_t colon = text.find(':', pos);
            const std::string_view item = text.substr(pos, colon == std::string_view::npos ? std::string_view::npos : colon - pos);
            pos = colon == std::string_view::npos ? text.size() + 1 : colon + 1;
            if (item.empty()) continue;

            if (item == "float")
            {
                pass.float_texture = true;
                continue;
            }
            const size_t eq = item.find('=');
            if (eq == std::string_view::npos || eq == 0)
            {
                return Result<PassFile>::failure("--pass: expected key=value, got '" + std::string(item) + "'");
            }
            const std::string key(item.substr(0, eq));
            std::string value(item.substr(eq + 1));
            if (key == "fs") pass.fs_path = value;
            else if (key == "vs") pass.vs_path = value;
            else if (key == "target") pass.target = value;
            else if (key == "width") pass.width = value;
            else if (key == "height") pass.height = value;
            else return Result<PassFile>::failure("--pass: unknown key '" + key + "'");
        }
        if (!pass.fs_path && !pass.vs_path)
        {
            return Result<PassFile>::failure("--pass: needs fs=FILE or vs=FILE");
        }
        return Result<PassFile>::success(pass);
    }

    // "name=path@speed". @ нь сүүлийнх бөгөөд тоо байвал л хурд гэж үзнэ.
    inline Result<TextureArg> parse_texture_arg(std::string_view text)
    {
        const size_t eq = text.find('=');
        if (eq == std::string_view::npos || eq == 0 || eq + 1 >= text.size())
        {
            return Result<TextureArg>::failure("--texture: expected NAME=PATH[@SPEED], got '" + std::string(text) + "'");
        }
        TextureArg out{};
        out.name = std::string(text.substr(0, eq));
        out.url = std::string(text.substr(eq + 1));

        const size_t at = out.url.rfind('@');
        if (at != std::string::npos && at > 0)
        {
            const std::string tail = out.url.substr(at + 1);
            const double speed = parse_env_f64(tail.c_str(), -1.0);
            if (speed > 0.0)
            {
                out.speed = speed;
                out.url.resize(at);
            }
        }
        return Result<TextureArg>::success(out);
    }

    // argv[0]-ийг алгасна. Хүчингүй тоон утга анхааруулга өгч өмнөх давхаргыг үлдээнэ.
    inline Result<HostArgs> parse_host_args(int argc, const char* const* argv, HostOptions& opts)
    {
        HostArgs args{};
        auto need_value = [&](int& i) -> const char* {
            return i + 1 < argc ? argv[++i] : nullptr;
        };

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                args.show_help = true;
            }
            else if (a == "--pass" || a == "--texture" || a == "--sound" || a == "--pixel-ratio" || a == "--frameskip"
                || a == "--vertex-mode" || a == "--vertex-count" || a == "--fft-size" || a == "--fft-smoothing"
                || a == "--sound-length" || a == "--log-level")
            {
                const char* v = need_value(i);
                if (!v) return Result<HostArgs>::failure(a + ": missing value");

                if (a == "--pass")
                {
                    Result<PassFile> p = parse_pass_arg(v);
                    if (!p.ok) return Result<HostArgs>::forward(p);
                    args.passes.push_back(p.value);
                }
                else if (a == "--texture")
                {
                    Result<TextureArg> t = parse_texture_arg(v);
                    if (!t.ok) return Result<HostArgs>::forward(t);
                    args.textures.push_back(t.value);
                }
                else if (a == "--sound")
                {
                    args.sound_shader_path = std::string(v);
                }
                else if (a == "--pixel-ratio")
                {
                    const double pr = parse_env_f64(v, -1.0);
                    if (valid_pixel_ratio(pr)) opts.pixel_ratio = pr;
                    else log_warn("--pixel-ratio: ignoring '" + std::string(v) + "'");
                }
                else if (a == "--frameskip")
                {
                    opts.frameskip = parse_env_u32(v, opts.frameskip, 1u);
                }
                else if (a == "--vertex-mode")
                {
                    opts.vertex_mode = v;
                }
                else if (a == "--vertex-count")
                {
                    opts.vertex_count = parse_env_u32(v, opts.vertex_count, 1u);
                }
                else if (a == "--fft-size")
                {
                    const uint32_t n = parse_env_u32(v, 0u, 0u);
                    if (valid_fft_size(n)) opts.fft_size = n;
                    else log_warn("--fft-size: ignoring '" + std::string(v) + "'");
                }
                else if (a == "--fft-smoothing")
                {
                    const double s = parse_env_f64(v, -1.0);
                    if (valid_fft_smoothing(s)) opts.fft_smoothing = s;
                    else log_warn("--fft-smoothing: ignoring '" + std::string(v) + "'");
                }
                else if (a == "--sound-length")
                {
                    const double s = parse_env_f64(v, -1.0);
                    if (s > 0.0) opts.sound_length = s;
                    else log_warn("--sound-length: ignoring '" + std::string(v) + "'");
                }
                else
                {
                    LogLevel level = opts.log_level;
                    if (parse_log_level(v, level)) opts.log_level = level;
                    else log_warn("--log-level: unknown level '" + std::string(v) + "'");
                }
            }
            else if (a == "--audio") args.audio = true;
            else if (a == "--camera") args.camera = true;
            else if (a == "--keyboard") args.keyboard = true;
            else if (a == "--gamepad") args.gamepad = true;
            else if (a == "--midi") args.midi = true;
            else if (a.rfind("--midi=", 0) == 0)
            {
                args.midi = true;
                args.midi_device = a.substr(7);
            }
            else if (a.rfind("--", 0) == 0)
            {
                return Result<HostArgs>::failure("unknown option '" + a + "'");
            }
            else
            {
                PassFile p{};
                p.fs_path = a;
                args.passes.push_back(p);
            }
        }
        return Result<HostArgs>::success(args);
    }
}
