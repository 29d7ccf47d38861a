#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "lsh/app/host_args.hpp"
#include "lsh/app/shader_watch.hpp"
#include "lsh/core/options.hpp"

namespace
{
    lsh::Result<lsh::HostArgs> parse(const std::vector<const char*>& argv, lsh::HostOptions& opts)
    {
        return lsh::parse_host_args((int)argv.size(), argv.data(), opts);
    }

    bool write_file(const std::filesystem::path& p, const std::string& text)
    {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << text;
        return (bool)out;
    }

    bool test_pass_arg_grammar()
    {
        lsh::Result<lsh::PassFile> p = lsh::parse_pass_arg("fs=blur.frag:target=A:width=$WIDTH/2:height=Math.floor($HEIGHT/3):float");
        if (!p.ok) return false;
        if (!p.value.fs_path || *p.value.fs_path != "blur.frag" || p.value.vs_path) return false;
        if (!p.value.target || *p.value.target != "A") return false;
        if (!p.value.width || *p.value.width != "$WIDTH/2") return false;
        if (!p.value.height || *p.value.height != "Math.floor($HEIGHT/3)") return false;
        if (!p.value.float_texture) return false;

        lsh::Result<lsh::PassFile> v = lsh::parse_pass_arg("vs=points.vert");
        if (!v.ok || !v.value.vs_path || v.value.fs_path || v.value.float_texture) return false;

        lsh::Result<lsh::PassFile> no_shader = lsh::parse_pass_arg("target=A");
        if (no_shader.ok || no_shader.error != "--pass: needs fs=FILE or vs=FILE") return false;
        lsh::Result<lsh::PassFile> bad_key = lsh::parse_pass_arg("fs=a.frag:depth=2");
        if (bad_key.ok || bad_key.error != "--pass: unknown key 'depth'") return false;
        lsh::Result<lsh::PassFile> bare = lsh::parse_pass_arg("fs=a.frag:linear");
        return !bare.ok && bare.error == "--pass: expected key=value, got 'linear'";
    }

    bool test_texture_arg_speed_suffix()
    {
        lsh::Result<lsh::TextureArg> a = lsh::parse_texture_arg("tex0=media/loop.gif@0.5");
        if (!a.ok || a.value.name != "tex0" || a.value.url != "media/loop.gif" || a.value.speed != 0.5) return false;

        lsh::Result<lsh::TextureArg> b = lsh::parse_texture_arg("tex1=user@host/img.png");
        if (!b.ok || b.value.url != "user@host/img.png" || b.value.speed != 1.0) return false;

        lsh::Result<lsh::TextureArg> c = lsh::parse_texture_arg("tex2=clip.mp4@-2");
        if (!c.ok || c.value.url != "clip.mp4@-2" || c.value.speed != 1.0) return false;

        return !lsh::parse_texture_arg("=img.png").ok && !lsh::parse_texture_arg("tex").ok
            && !lsh::parse_texture_arg("tex=").ok;
    }

    bool test_host_args_layer_over_options()
    {
        lsh::HostOptions opts{};
        opts.frameskip = 4;
        lsh::Result<lsh::HostArgs> r = parse({
            "lsh-host",
            "--pass", "fs=a.frag:target=A",
            "--frameskip", "2",
            "--pixel-ratio", "0",
            "--fft-size", "1000",
            "--fft-smoothing", "0.5",
            "--vertex-mode", "POINTS",
            "--vertex-count", "10000",
            "--sound-length", "1.5",
            "--log-level", "warn",
            "--texture", "img=cat.png",
            "--sound", "music.frag",
            "--audio", "--keyboard", "--midi=/dev/snd/midiC1D0",
            "final.frag",
        }, opts);
        if (!r.ok) return false;
        const lsh::HostArgs& a = r.value;

        if (a.passes.size() != 2 || !a.passes[1].fs_path || *a.passes[1].fs_path != "final.frag") return false;
        if (a.textures.size() != 1 || a.textures[0].name != "img") return false;
        if (!a.sound_shader_path || *a.sound_shader_path != "music.frag") return false;
        if (!a.audio || !a.keyboard || a.camera || a.gamepad || a.show_help) return false;
        if (!a.midi || a.midi_device != "/dev/snd/midiC1D0") return false;

        if (opts.frameskip != 2 || opts.pixel_ratio != 1.0) return false;
        if (opts.fft_size != 2048 || opts.fft_smoothing != 0.5) return false;
        if (opts.vertex_mode != "POINTS" || opts.vertex_count != 10000) return false;
        return opts.sound_length == 1.5 && opts.log_level == lsh::LogLevel::Warn;
    }

    bool test_host_args_errors()
    {
        lsh::HostOptions opts{};
        lsh::Result<lsh::HostArgs> missing = parse({"lsh-host", "--pass"}, opts);
        if (missing.ok || missing.error != "--pass: missing value") return false;

        lsh::Result<lsh::HostArgs> unknown = parse({"lsh-host", "--fullscreen"}, opts);
        if (unknown.ok || unknown.error != "unknown option '--fullscreen'") return false;

        lsh::Result<lsh::HostArgs> bad_pass = parse({"lsh-host", "--pass", "target=A"}, opts);
        if (bad_pass.ok) return false;

        lsh::Result<lsh::HostArgs> help = parse({"lsh-host", "-h"}, opts);
        return help.ok && help.value.show_help && help.value.passes.empty();
    }

    bool test_shader_watch_reload_cycle()
    {
        std::error_code ec{};
        const std::filesystem::path dir = std::filesystem::temp_directory_path(ec) / "lsh-shader-watch-tests";
        if (ec) return false;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;

        const std::filesystem::path fs = dir / "scene.frag";
        const std::filesystem::path vs = dir / "points.vert";
        if (!write_file(fs, "void main() { gl_FragColor = vec4(1.0); }\n")) return false;
        if (!write_file(vs, "void main() { gl_Position = vec4(0.0); }\n")) return false;

        lsh::PassFile a{};
        a.fs_path = fs.string();
        a.target = "A";
        a.width = "$WIDTH/2";
        a.float_texture = true;
        lsh::PassFile b{};
        b.vs_path = vs.string();

        lsh::ShaderWatch watch({a, b});
        lsh::Result<std::vector<lsh::PassSpec>> specs = watch.load_specs();
        if (!specs.ok || specs.value.size() != 2) return false;
        const lsh::PassSpec& s0 = specs.value[0];
        if (!s0.has_fs() || s0.has_vs() || *s0.target != "A" || *s0.width != "$WIDTH/2" || !s0.float_texture) return false;
        if (!specs.value[1].has_vs() || specs.value[1].has_fs()) return false;

        bool ok = true;
        ok = ok && !watch.poll(0, 250);

        // mtime-ийг шууд урагшлуулна. Файлын системийн нарийвчлалаас хамаарахгүй.
        const auto later = std::filesystem::last_write_time(fs, ec) + std::chrono::seconds(10);
        std::filesystem::last_write_time(fs, later, ec);
        ok = ok && !ec;
        ok = ok && !watch.poll(100, 250);
        ok = ok && watch.poll(300, 250);
        ok = ok && !watch.poll(600, 250);

        std::filesystem::remove(vs, ec);
        ok = ok && watch.poll(900, 250);
        lsh::Result<std::vector<lsh::PassSpec>> gone = watch.load_specs();
        ok = ok && !gone.ok && gone.kind == lsh::ErrorKind::Resource
            && gone.error == "cannot open '" + vs.string() + "'";

        std::filesystem::remove_all(dir, ec);
        return ok;
    }
}

int main()
{
    const bool ok_pass = test_pass_arg_grammar();
    const bool ok_texture = test_texture_arg_speed_suffix();
    const bool ok_layer = test_host_args_layer_over_options();
    const bool ok_errors = test_host_args_errors();
    const bool ok_watch = test_shader_watch_reload_cycle();

    if (!ok_pass) std::fprintf(stderr, "[host-args-tests] --pass grammar failed\n");
    if (!ok_texture) std::fprintf(stderr, "[host-args-tests] --texture speed suffix failed\n");
    if (!ok_layer) std::fprintf(stderr, "[host-args-tests] option layering failed\n");
    if (!ok_errors) std::fprintf(stderr, "[host-args-tests] argument errors failed\n");
    if (!ok_watch) std::fprintf(stderr, "[host-args-tests] shader watch failed\n");

    if (!(ok_pass && ok_texture && ok_layer && ok_errors && ok_watch)) return 1;
    std::fprintf(stderr, "[host-args-tests] all tests passed\n");
    return 0;
}
