/*
    LSH ШЭЙДЕР ХОСТ

    ФАЙЛ: main.cpp
    МОДУЛЬ: lsh-host
    ЗОРИЛГО: SDL2 цонх + GLES3 дээр shader pipeline-ыг ажиллуулж, файл өөрчлөгдөхөд дахин build хийнэ.
            Space = play/stop, R = цаг тэглэх, Esc = гарах.
*/

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include <SDL2/SDL.h>

#include "lsh/app/host_args.hpp"
#include "lsh/app/host_setup.hpp"
#include "lsh/app/shader_watch.hpp"
#include "lsh/core/log.hpp"
#include "lsh/core/options.hpp"
#include "lsh/driver/frame_driver.hpp"
#include "lsh/gfx/gles/gles_device.hpp"
#include "lsh/loader/audio_input_provider.hpp"
#include "lsh/loader/camera_provider.hpp"
#include "lsh/loader/gamepad_provider.hpp"
#include "lsh/loader/keyboard_provider.hpp"
#include "lsh/loader/loader_registry.hpp"
#include "lsh/loader/midi_provider.hpp"
#include "lsh/loader/sdl/animated_image_provider.hpp"
#include "lsh/loader/sdl/sdl_audio_capture.hpp"
#include "lsh/loader/sdl/sdl_gamepad_source.hpp"
#include "lsh/loader/sdl/sound_file_provider.hpp"
#include "lsh/loader/sdl/static_image_provider.hpp"
#include "lsh/loader/video_provider.hpp"
#include "lsh/platform/sdl/sdl_gl_runtime.hpp"
#include "lsh/sound/sdl/sdl_audio_sink.hpp"
#include "lsh/sound/sound_shader_renderer.hpp"

namespace
{
    int display_refresh_hz()
    {
        SDL_DisplayMode mode{};
        if (SDL_GetCurrentDisplayMode(0, &mode) == 0 && mode.refresh_rate > 0) return mode.refresh_rate;
        return 60;
    }
}

int main(int argc, char** argv)
{
    lsh::HostOptions opts{};
    lsh::apply_env_options(opts);
    lsh::Result<lsh::HostArgs> parsed = lsh::parse_host_args(argc, argv, opts);
    if (!parsed.ok)
    {
        std::fprintf(stderr, "%s\n%s", parsed.error.c_str(), lsh::host_usage());
        return 2;
    }
    const lsh::HostArgs& args = parsed.value;
    if (args.show_help || args.passes.empty())
    {
        std::fprintf(stdout, "%s", lsh::host_usage());
        return args.show_help ? 0 : 2;
    }
    lsh::set_log_level(opts.log_level);

    lsh::WindowDesc win{};
    win.title = "lsh";
    win.width = opts.window_width;
    win.height = opts.window_height;
    lsh::SdlGlRuntime runtime(win);
    if (!runtime.valid()) return 1;

    lsh::GlesDevice device{};

    lsh::VideoProvider video(device, nullptr);
    lsh::AnimatedImageProvider gif(device);
    lsh::SoundFileProvider sound_file(device);
    lsh::StaticImageProvider image(device);
    lsh::AudioInputProvider audio(device, std::make_unique<lsh::SdlAudioCapture>(), opts.fft_size, opts.fft_smoothing);
    lsh::MidiProvider midi(device, args.midi_device);
    lsh::CameraProvider camera(device, nullptr);
    lsh::KeyboardProvider keyboard(device);
    lsh::GamepadProvider gamepad(device, std::make_unique<lsh::SdlGamepadSource>());

    lsh::LoaderRegistry loaders{};
    loaders.video = &video;
    loaders.animated_image = &gif;
    loaders.audio_file = &sound_file;
    loaders.static_image = &image;
    loaders.audio = &audio;
    loaders.midi = &midi;
    loaders.camera = &camera;
    loaders.keyboard = &keyboard;
    loaders.gamepad = &gamepad;

    lsh::SdlAudioSink sink{};
    lsh::SoundShaderRenderer sound(device, &sink, 44100, opts.sound_length);

    lsh::FrameDriver driver(device, loaders, opts, lsh::sdl_tick_source());
    driver.set_sound_renderer(&sound);

    int dw = 1;
    int dh = 1;
    runtime.drawable_size(dw, dh);
    driver.set_canvas(dw, dh);

    const lsh::Status inputs = lsh::enable_requested_inputs(driver, args);
    if (!inputs.ok) lsh::log_warn("continuing without some inputs");
    const lsh::Status textures = lsh::load_requested_textures(driver, args.textures);
    if (!textures.ok) lsh::log_warn("continuing without some textures");

    lsh::ShaderWatch watch(args.passes);
    if (!lsh::reload_pipeline(driver, watch).ok) lsh::log_warn("no pipeline yet, waiting for shader edits");

    if (args.sound_shader_path)
    {
        lsh::Result<std::string> src = lsh::read_text_file(*args.sound_shader_path);
        if (!src.ok) lsh::log_error(src.error);
        else
        {
            lsh::Status st = driver.load_sound_shader(src.value);
            if (st.ok) st = driver.play_sound();
            if (!st.ok) lsh::log_error("sound shader '" + *args.sound_shader_path + "': " + st.error);
        }
    }

    const uint32_t idle_delay_ms = (uint32_t)(1000 / display_refresh_hz());
    uint64_t title_ms = SDL_GetTicks64();
    uint64_t title_frames = 0;

    lsh::PlatformInputState input{};
    while (runtime.pump_input(input))
    {
        if (input.resized)
        {
            runtime.drawable_size(dw, dh);
            driver.resize(dw, dh);
        }
        if (input.pointer_moved && input.width > 0 && input.height > 0)
        {
            // Цонхны координатыг drawable (HiDPI) пиксел рүү.
            const double sx = (double)dw / (double)input.width;
            const double sy = (double)dh / (double)input.height;
            driver.on_pointer_move(input.pointer_x * sx, input.pointer_y * sy);
        }
        driver.on_pointer_buttons(input.buttons);
        for (const lsh::KeyEvent& k : input.keys) driver.on_key(k.key_code, k.down);

        if (input.reset_time) driver.reset_time();
        if (input.toggle_play)
        {
            if (driver.playing())
            {
                driver.stop();
                lsh::log_info("stopped");
            }
            else
            {
                driver.play();
                if (!lsh::enable_requested_inputs(driver, args).ok) lsh::log_warn("resumed without some inputs");
                lsh::log_info("playing");
            }
        }

        const uint64_t now_ms = SDL_GetTicks64();
        if (watch.poll(now_ms, opts.reload_poll_ms))
        {
            lsh::log_info("shader files changed, rebuilding pipeline");
            // Амжилтгүй бол reload_pipeline өөрөө log хийж, хуучин pipeline хэвээр ажиллана.
            const lsh::Status reloaded = lsh::reload_pipeline(driver, watch);
            if (reloaded.ok) lsh::log_info("pipeline reloaded");
        }

        const uint64_t frames_before = driver.stats().frames_rendered;
        driver.tick();
        if (driver.stats().frames_rendered != frames_before)
        {
            runtime.present();
            ++title_frames;
        }
        else
        {
            SDL_Delay(idle_delay_ms);
        }

        if (now_ms - title_ms >= 1000)
        {
            const double fps = (double)title_frames * 1000.0 / (double)(now_ms - title_ms);
            runtime.set_title("lsh | " + std::to_string((int)(fps + 0.5)) + " fps | "
                + std::to_string(driver.pipeline() ? driver.pipeline()->size() : 0) + " pass(es)");
            title_ms = now_ms;
            title_frames = 0;
        }
    }

    driver.stop();
    return 0;
}
