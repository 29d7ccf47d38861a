#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <glm/gtc/constants.hpp>

#include "lsh/loader/animation_timeline.hpp"
#include "lsh/loader/audio_analyser.hpp"
#include "lsh/loader/audio_input_provider.hpp"
#include "lsh/loader/camera_provider.hpp"
#include "lsh/loader/data_texture.hpp"
#include "lsh/loader/gamepad_provider.hpp"
#include "lsh/loader/keyboard_provider.hpp"
#include "lsh/loader/media_kind.hpp"
#include "lsh/loader/midi_provider.hpp"
#include "lsh/loader/video_provider.hpp"
#include "lsh/loader/waveform_texels.hpp"
#include "recording_gpu_device.hpp"

namespace
{
    // ---- fakes --------------------------------------------------------------------

    class FakeVideoStream final : public lsh::IVideoStream
    {
    public:
        explicit FakeVideoStream(double rate) : rate_(rate) {}

        bool poll_frame(std::vector<uint8_t>& rgba8, int& width, int& height) override
        {
            if (!pending) return false;
            pending = false;
            width = 2;
            height = 1;
            rgba8.assign(8u, 200u);
            return true;
        }

        void set_playback_rate(double rate) override { rate_ = rate; }
        double playback_rate() const override { return rate_; }

        bool pending = true;

    private:
        double rate_ = 1.0;
    };

    class FakeVideoFactory final : public lsh::IVideoStreamFactory
    {
    public:
        lsh::Result<std::unique_ptr<lsh::IVideoStream>> open(const std::string& url, double playback_rate) override
        {
            using R = lsh::Result<std::unique_ptr<lsh::IVideoStream>>;
            if (url.find("missing") != std::string::npos) return R::failure("no such file", lsh::ErrorKind::Resource);
            ++opens;
            auto s = std::make_unique<FakeVideoStream>(playback_rate);
            last = s.get();
            return R::success(std::move(s));
        }

        int opens = 0;
        FakeVideoStream* last = nullptr;
    };

    class FakeCapture final : public lsh::ICaptureSource
    {
    public:
        lsh::Status open() override
        {
            if (refuse) return lsh::Status::failure("permission denied", lsh::ErrorKind::Resource);
            is_open = true;
            return lsh::Status::success();
        }

        void close() override { is_open = false; }

        bool poll_frame(std::vector<uint8_t>& rgba8, int& width, int& height) override
        {
            width = 2;
            height = 2;
            rgba8.assign(16u, 77u);
            return true;
        }

        bool refuse = false;
        bool is_open = false;
    };

    class FakeAudioCapture final : public lsh::IAudioCaptureSource
    {
    public:
        lsh::Status open() override
        {
            if (refuse) return lsh::Status::failure("device busy", lsh::ErrorKind::Resource);
            is_open = true;
            return lsh::Status::success();
        }

        void close() override { is_open = false; }

        void copy_latest(std::vector<float>& out, size_t count) override
        {
            out.assign(count, level);
            ++copies;
        }

        float level = 0.5f;
        bool refuse = false;
        bool is_open = false;
        int copies = 0;
    };

    class FakeGamepad final : public lsh::IGamepadSource
    {
    public:
        lsh::Status open() override
        {
            is_open = true;
            return lsh::Status::success();
        }

        void close() override { is_open = false; }

        bool poll(lsh::GamepadState& out) override
        {
            if (!connected) return false;
            out = state;
            return true;
        }

        lsh::GamepadState state{};
        bool connected = true;
        bool is_open = false;
    };

    // ---- tests --------------------------------------------------------------------

    bool test_media_kind_classification()
    {
        return lsh::classify_media_url("clips/a.MP4") == lsh::MediaKind::Video
            && lsh::classify_media_url("b.webm#t=3") == lsh::MediaKind::Video
            && lsh::classify_media_url("loop.gif?cache=1") == lsh::MediaKind::AnimatedImage
            && lsh::classify_media_url("kick.mp3") == lsh::MediaKind::AudioFile
            && lsh::classify_media_url("pad.WAV") == lsh::MediaKind::AudioFile
            && lsh::classify_media_url("img.png") == lsh::MediaKind::StaticImage
            && lsh::classify_media_url("noext") == lsh::MediaKind::StaticImage
            && lsh::classify_media_url("dir.mp4/file") == lsh::MediaKind::StaticImage
            && lsh::url_extension("a.b/c?x=1.mp4").empty();
    }

    bool test_video_sessions_are_memoized_by_url()
    {
        lsh_test::RecordingGpuDevice dev{};
        FakeVideoFactory factory{};
        {
            lsh::VideoProvider video(dev, &factory);
            lsh::TextureLoadParams p{};
            p.speed = 1.0;
            lsh::Result<lsh::TextureHandle> a = video.load("tex0", "clip.mp4", p);
            p.speed = 0.5;
            lsh::Result<lsh::TextureHandle> b = video.load("tex1", "clip.mp4", p);
            if (!a.ok || !b.ok || !(a.value == b.value)) return false;
            if (factory.opens != 1 || video.session_count() != 1) return false;
            if (video.playback_rate("clip.mp4") != 0.5) return false;

            video.update();
            if (!(dev.texture_extent(a.value) == lsh::Extent2D{2, 1})) return false;
            const std::vector<uint8_t>* up = dev.last_upload(a.value);
            if (!up || up->size() != 8u || (*up)[0] != 200u) return false;

            // Texture л суллагдаж session үлдэнэ.
            video.release_texture("clip.mp4");
            if (dev.texture_alive(a.value) || video.session_count() != 1) return false;
            lsh::Result<lsh::TextureHandle> c = video.load("tex0", "clip.mp4", p);
            if (!c.ok || !dev.texture_alive(c.value) || factory.opens != 1) return false;

            lsh::Result<lsh::TextureHandle> bad = video.load("tex2", "missing.mp4", p);
            if (bad.ok || bad.kind != lsh::ErrorKind::Resource) return false;

            video.unload("clip.mp4");
            video.unload("never-loaded.mp4");
            if (video.session_count() != 0 || dev.live_textures() != 0) return false;
        }

        lsh::VideoProvider none(dev, nullptr);
        lsh::Result<lsh::TextureHandle> r = none.load("tex", "clip.mp4", lsh::TextureLoadParams{});
        return !r.ok && r.kind == lsh::ErrorKind::Resource && dev.invalid_calls == 0;
    }

    bool test_data_texture_uploads_only_when_dirty()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::DataTexture tex(dev, 4, 2);
        if (dev.texture_uploads != 1) return false;
        tex.upload();
        if (dev.texture_uploads != 1) return false;

        tex.set_luminance(1, 1, 0);
        if (tex.dirty()) return false;
        tex.set_luminance(1, 1, 42);
        tex.set_luminance(9, 9, 42);
        tex.upload();
        const std::vector<uint8_t>* up = dev.last_upload(tex.handle());
        if (dev.texture_uploads != 2 || !up) return false;
        const size_t i = (1u * 4u + 1u) * 4u;
        return (*up)[i] == 42u && (*up)[i + 1] == 42u && (*up)[i + 2] == 42u && (*up)[i + 3] == 255u;
    }

    bool test_keyboard_texture()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::KeyboardProvider kb(dev);
        kb.on_key(65, true);
        if (kb.is_down(65)) return false;

        if (!kb.enable().ok) return false;
        kb.on_key(65, true);
        kb.on_key(300, true);
        kb.on_key(-1, true);
        if (!kb.is_down(65) || kb.is_down(66)) return false;
        kb.on_key(65, false);
        if (kb.is_down(65)) return false;

        lsh::UniformTable t{};
        kb.publish(t);
        const lsh::TextureHandle* key = t.get<lsh::TextureHandle>(lsh::uniform_names::kKey);
        if (!key || !(dev.texture_extent(*key) == lsh::Extent2D{256, 1})) return false;

        kb.disable();
        return !kb.is_enabled() && dev.live_textures() == 0;
    }

    bool test_midi_parser_running_status()
    {
        lsh::MidiByteParser parser{};
        const uint8_t bytes[] = {
            0x90, 60, 100, 62, 90,       // note on + running status
            0xF8,                        // clock
            0x80, 60, 0,                 // note off
            0xC0, 5,                     // program change, нэг data байт
            0xF0, 1, 2, 3, 0xF7,         // sysex
            0xB0, 7, 127};
        std::vector<lsh::MidiMessage> got{};
        parser.feed(std::span<const uint8_t>(bytes, sizeof(bytes)), [&](const lsh::MidiMessage& m) { got.push_back(m); });

        if (got.size() != 5) return false;
        if (got[0].status != 0x90 || got[0].data1 != 60 || got[0].data2 != 100) return false;
        if (got[1].status != 0x90 || got[1].data1 != 62 || got[1].data2 != 90) return false;
        if (got[2].status != 0x80 || got[2].data1 != 60) return false;
        if (got[3].status != 0xC0 || got[3].data1 != 5 || got[3].data2 != 0) return false;
        return got[4].status == 0xB0 && got[4].data1 == 7 && got[4].data2 == 127;
    }

    bool test_midi_provider_textures()
    {
        lsh_test::RecordingGpuDevice dev{};
        {
            lsh::MidiProvider missing(dev, "/nonexistent/midiC9D9");
            lsh::Status st = missing.enable();
            if (st.ok || st.kind != lsh::ErrorKind::Resource || missing.is_enabled()) return false;
        }

        lsh::MidiProvider midi(dev);
        midi.set_use_device(false);
        if (!midi.enable().ok) return false;

        const uint8_t on[] = {0x90, 60, 100, 0x90, 64, 80};
        midi.feed_bytes(std::span<const uint8_t>(on, sizeof(on)));
        midi.inject(lsh::MidiMessage{0x80, 60, 64});
        midi.inject(lsh::MidiMessage{0xB0, 1, 127});

        if (midi.note_velocity(60) != 0 || midi.note_velocity(64) != 80) return false;
        if (midi.midi_value(0x90, 60) != 100 || midi.midi_value(0x80, 60) != 64) return false;
        if (midi.midi_value(0xB0, 1) != 127) return false;

        midi.update();
        lsh::UniformTable t{};
        midi.publish(t);
        const lsh::TextureHandle* m = t.get<lsh::TextureHandle>(lsh::uniform_names::kMidi);
        const lsh::TextureHandle* n = t.get<lsh::TextureHandle>(lsh::uniform_names::kNote);
        if (!m || !n) return false;
        if (!(dev.texture_extent(*m) == lsh::Extent2D{256, 128}) || !(dev.texture_extent(*n) == lsh::Extent2D{128, 1})) return false;
        const std::vector<uint8_t>* up = dev.last_upload(*n);
        if (!up || (*up)[64 * 4] != 80u) return false;

        midi.disable();
        return midi.midi_value(0xB0, 1) == 0 && dev.live_textures() == 0;
    }

    bool test_audio_analyser()
    {
        lsh::AudioAnalyser a(1024, 0.0);
        if (a.set_fft_size(1000) || a.fft_size() != 1024) return false;
        if (a.set_smoothing(1.0) || a.smoothing() != 0.0) return false;

        std::vector<float> silence(1024, 0.0f);
        a.analyse(silence);
        if (a.volume() != 0.0f || a.spectrum().size() != 512u || a.waveform().size() != 1024u) return false;
        for (uint8_t v : a.spectrum()) if (v != 0) return false;
        if (a.waveform()[10] != 128) return false;

        // Bin 32-т яг таарах синус.
        std::vector<float> tone(1024);
        for (size_t i = 0; i < tone.size(); ++i)
        {
            tone[i] = (float)std::sin(glm::two_pi<double>() * 32.0 * (double)i / 1024.0);
        }
        a.analyse(tone);
        if (a.spectrum()[32] != 255 || a.spectrum()[400] >= a.spectrum()[32]) return false;
        if (!(a.volume() > 0.0f)) return false;

        // Богино оролт эхэндээ чимээгүйгээр дүүргэгдэнэ.
        std::vector<float> shortbuf(16, 1.0f);
        a.analyse(shortbuf);
        return a.waveform()[0] == 128 && a.waveform()[1023] == 255;
    }

    bool test_audio_input_provider()
    {
        lsh_test::RecordingGpuDevice dev{};
        {
            lsh::AudioInputProvider none(dev, nullptr, 1024, 0.8);
            if (none.enable().ok) return false;
        }

        auto cap = std::make_unique<FakeAudioCapture>();
        FakeAudioCapture* capture = cap.get();
        capture->refuse = true;
        lsh::AudioInputProvider audio(dev, std::move(cap), 1024, 0.5);
        lsh::Status refused = audio.enable();
        if (refused.ok || refused.kind != lsh::ErrorKind::Resource || audio.is_enabled()) return false;

        capture->refuse = false;
        if (!audio.enable().ok || !capture->is_open) return false;
        audio.update();
        if (capture->copies != 1) return false;

        lsh::UniformTable t{};
        audio.publish(t);
        const lsh::TextureHandle* spec = t.get<lsh::TextureHandle>(lsh::uniform_names::kSpectrum);
        const lsh::TextureHandle* samp = t.get<lsh::TextureHandle>(lsh::uniform_names::kSamples);
        if (!spec || !samp || !t.get<float>(lsh::uniform_names::kVolume)) return false;
        if (!(dev.texture_extent(*spec) == lsh::Extent2D{512, 1}) || !(dev.texture_extent(*samp) == lsh::Extent2D{1024, 1})) return false;
        // DC 0.5 -> floor(128 * 1.5) = 192.
        const std::vector<uint8_t>* up = dev.last_upload(*samp);
        if (!up || (*up)[0] != 192u) return false;

        audio.set_fft_size(256);
        audio.set_fft_size(100);
        if (audio.analyser().fft_size() != 256) return false;
        audio.publish(t);
        spec = t.get<lsh::TextureHandle>(lsh::uniform_names::kSpectrum);
        if (!spec || !(dev.texture_extent(*spec) == lsh::Extent2D{128, 1})) return false;

        audio.disable();
        return !capture->is_open && dev.live_textures() == 0;
    }

    bool test_camera_provider()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::CameraProvider none(dev, nullptr);
        if (none.enable().ok || none.is_enabled()) return false;

        auto src = std::make_unique<FakeCapture>();
        FakeCapture* capture = src.get();
        lsh::CameraProvider cam(dev, std::move(src));
        capture->refuse = true;
        if (cam.enable().ok) return false;
        capture->refuse = false;
        if (!cam.enable().ok || !capture->is_open) return false;

        cam.update();
        if (!(dev.texture_extent(cam.texture()) == lsh::Extent2D{2, 2})) return false;
        lsh::UniformTable t{};
        cam.publish(t);
        const lsh::TextureHandle* h = t.get<lsh::TextureHandle>(lsh::uniform_names::kCamera);
        if (!h || !(*h == cam.texture())) return false;

        cam.disable();
        return !capture->is_open && dev.live_textures() == 0;
    }

    bool test_gamepad_provider()
    {
        if (lsh::gamepad_axis_byte(0.0f) != 128 || lsh::gamepad_axis_byte(-2.0f) != 0 || lsh::gamepad_axis_byte(1.0f) != 255) return false;

        lsh_test::RecordingGpuDevice dev{};
        lsh::GamepadProvider none(dev, nullptr);
        lsh::Status st = none.enable();
        if (st.ok || st.kind != lsh::ErrorKind::Resource) return false;

        auto src = std::make_unique<FakeGamepad>();
        FakeGamepad* pad = src.get();
        lsh::GamepadProvider gp(dev, std::move(src));
        if (!gp.enable().ok || !pad->is_open) return false;
        if (gp.axis_value(0) != 128 || gp.button_value(0) != 0) return false;

        pad->state.buttons = {true, false, true};
        pad->state.axes = {-1.0f, 1.0f, 0.5f};
        gp.update();
        if (gp.button_value(0) != 255 || gp.button_value(1) != 0 || gp.button_value(2) != 255) return false;
        if (gp.axis_value(0) != 0 || gp.axis_value(1) != 255 || gp.axis_value(2) != 191 || gp.axis_value(3) != 128) return false;

        // Controller салсан үед сүүлийн төлөв хэвээр.
        pad->connected = false;
        gp.update();
        if (gp.button_value(0) != 255) return false;

        lsh::UniformTable t{};
        gp.publish(t);
        const lsh::TextureHandle* h = t.get<lsh::TextureHandle>(lsh::uniform_names::kGamepad);
        if (!h || !(dev.texture_extent(*h) == lsh::Extent2D{128, 2})) return false;

        gp.disable();
        return !pad->is_open && gp.button_value(0) == 0;
    }

    bool test_animation_timeline()
    {
        lsh::AnimationTimeline still(std::vector<int>{40});
        if (still.advance(1000.0) || still.current_frame() != 0) return false;

        lsh::AnimationTimeline tl(std::vector<int>{50, 0, 100});
        if (tl.frame_count() != 3) return false;
        if (tl.advance(49.0) || tl.current_frame() != 0) return false;
        if (!tl.advance(1.0) || tl.current_frame() != 1) return false;
        // 0 ms delay -> 100 ms.
        if (tl.advance(99.0) || tl.current_frame() != 1) return false;
        if (!tl.advance(1.0) || tl.current_frame() != 2) return false;

        tl.set_speed(2.0);
        if (!tl.advance(50.0) || tl.current_frame() != 0) return false;
        tl.set_speed(-3.0);
        if (tl.speed() != 1.0) return false;
        if (tl.advance(0.0) || tl.advance(-5.0)) return false;

        tl.advance(20.0);
        tl.rewind();
        return tl.current_frame() == 0 && !tl.advance(49.0);
    }

    bool test_waveform_texels()
    {
        if (lsh::waveform_byte(1.0f) != 255 || lsh::waveform_byte(-1.0f) != 0 || lsh::waveform_byte(0.0f) != 128) return false;

        const std::vector<float> stereo = {1.0f, -1.0f, 0.0f, 0.0f, 0.5f, -0.5f};
        std::vector<uint8_t> out{};
        if (lsh::encode_waveform_texels(stereo, out) != 1) return false;
        if (out.size() != (size_t)lsh::kWaveformWidth * 4u) return false;
        if (out[0] != 255 || out[1] != 0 || out[2] != 0 || out[3] != 255) return false;
        if (out[4] != 128 || out[5] != 128) return false;
        if (out[8] != 191 || out[9] != 64) return false;
        if (out[12] != 128 || out[13] != 128 || out[14] != 0 || out[15] != 255) return false;

        std::vector<float> empty{};
        if (lsh::encode_waveform_texels(empty, out) != 1) return false;
        std::vector<float> longer((size_t)(lsh::kWaveformWidth + 1) * 2u, 0.0f);
        return lsh::encode_waveform_texels(longer, out) == 2 && out.size() == (size_t)lsh::kWaveformWidth * 2u * 4u;
    }
}

int main()
{
    const bool ok_media = test_media_kind_classification();
    const bool ok_video = test_video_sessions_are_memoized_by_url();
    const bool ok_data = test_data_texture_uploads_only_when_dirty();
    const bool ok_keys = test_keyboard_texture();
    const bool ok_midi_parse = test_midi_parser_running_status();
    const bool ok_midi = test_midi_provider_textures();
    const bool ok_analyser = test_audio_analyser();
    const bool ok_audio = test_audio_input_provider();
    const bool ok_camera = test_camera_provider();
    const bool ok_gamepad = test_gamepad_provider();
    const bool ok_gif = test_animation_timeline();
    const bool ok_wave = test_waveform_texels();

    if (!ok_media) std::fprintf(stderr, "[loader-tests] media classification failed\n");
    if (!ok_video) std::fprintf(stderr, "[loader-tests] video memoization failed\n");
    if (!ok_data) std::fprintf(stderr, "[loader-tests] data texture dirty tracking failed\n");
    if (!ok_keys) std::fprintf(stderr, "[loader-tests] keyboard texture failed\n");
    if (!ok_midi_parse) std::fprintf(stderr, "[loader-tests] midi parser failed\n");
    if (!ok_midi) std::fprintf(stderr, "[loader-tests] midi provider failed\n");
    if (!ok_analyser) std::fprintf(stderr, "[loader-tests] audio analyser failed\n");
    if (!ok_audio) std::fprintf(stderr, "[loader-tests] audio input provider failed\n");
    if (!ok_camera) std::fprintf(stderr, "[loader-tests] camera provider failed\n");
    if (!ok_gamepad) std::fprintf(stderr, "[loader-tests] gamepad provider failed\n");
    if (!ok_gif) std::fprintf(stderr, "[loader-tests] animation timeline failed\n");
    if (!ok_wave) std::fprintf(stderr, "[loader-tests] waveform texels failed\n");

    const bool all = ok_media && ok_video && ok_data && ok_keys && ok_midi_parse && ok_midi && ok_analyser
        && ok_audio && ok_camera && ok_gamepad && ok_gif && ok_wave;
    if (!all) return 1;
    std::fprintf(stderr, "[loader-tests] all tests passed\n");
    return 0;
}
