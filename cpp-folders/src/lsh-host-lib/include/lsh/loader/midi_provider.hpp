#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: midi_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: MIDI мессежийг хоёр texture болгоно.
            "midi": 256x128, x = status byte, y = data1, утга = data2.
            "note": 128x1, x = нот, утга = сүүлийн note-on/off velocity.
            Эх сурвалж: Linux raw MIDI төхөөрөмж (/dev/snd/midiC*D*, non-blocking) эсвэл inject.
*/


#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "lsh/core/log.hpp"
#include "lsh/loader/data_texture.hpp"
#include "lsh/loader/texture_provider.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"

namespace lsh
{
    struct MidiMessage
    {
        uint8_t status = 0;
        uint8_t data1 = 0;
        uint8_t data2 = 0;
    };

    // Running status дэмжинэ. Realtime (0xF8+) байт болон SysEx-ийг алгасна.
    class MidiByteParser
    {
    public:
        template<typename Fn>
        void feed(std::span<const uint8_t> bytes, Fn&& on_message)
        {
            for (uint8_t b : bytes)
            {
                if (b >= 0xF8) continue;
                if (b == 0xF0) { in_sysex_ = true; continue; }
                if (b == 0xF7) { in_sysex_ = false; continue; }
                if (in_sysex_) continue;

                if (b & 0x80)
                {
                    if (b >= 0xF0)
                    {
                        // System common: энд хэрэглэхгүй, running status цуцлагдана.
                        status_ = 0;
                        continue;
                    }
                    status_ = b;
                    have_ = 0;
                    continue;
                }
                if (status_ == 0) continue;

                data_[have_++] = b;
                if (have_ >= data_length(status_))
                {
                    MidiMessage m{};
                    m.status = status_;
                    m.data1 = data_[0];
                    m.data2 = have_ > 1 ? data_[1] : 0;
                    have_ = 0;
                    on_message(m);
                }
            }
        }

        static int data_length(uint8_t status)
        {
            const uint8_t kind = status & 0xF0;
            return (kind == 0xC0 || kind == 0xD0) ? 1 : 2;
        }

    private:
        uint8_t status_ = 0;
        uint8_t data_[2]{};
        int have_ = 0;
        bool in_sysex_ = false;
    };

    class MidiProvider final : public IInputProvider
    {
    public:
        // device_path хоосон бол /dev/snd доторх эхний midiC*D* төхөөрөмж.
        MidiProvider(IGpuDevice& device, std::string device_path = {})
            : device_(&device)
            , device_path_(std::move(device_path))
        {}

        ~MidiProvider() override
        {
            close_device();
        }

        const char* provider_name() const override { return "midi"; }

        void set_device_path(std::string path) { device_path_ = std::move(path); }

        // Injected мессежээр л ажиллах горим (төхөөрөмж нээхгүй).
        void set_use_device(bool use_device) { use_device_ = use_device; }

        Status enable() override
        {
            if (enabled_) return Status::success();
            if (use_device_)
            {
                Status st = open_device();
                if (!st.ok)
                {
                    log_error(st.error);
                    return st;
                }
            }
            midi_ = std::make_unique<DataTexture>(*device_, 256, 128);
            note_ = std::make_unique<DataTexture>(*device_, 128, 1);
            enabled_ = true;
            return Status::success();
        }

        void disable() override
        {
            enabled_ = false;
            close_device();
            midi_.reset();
            note_.reset();
        }

        bool is_enabled() const override { return enabled_; }

        void inject(const MidiMessage& m)
        {
            if (!enabled_) return;
            apply(m);
        }

        void feed_bytes(std::span<const uint8_t> bytes)
        {
            if (!enabled_) return;
            parser_.feed(bytes, [this](const MidiMessage& m) { apply(m); });
        }

        void update() override
        {
            if (!enabled_) return;
            read_device();
            midi_->upload();
            note_->upload();
        }

        void publish(UniformTable& table) const override
        {
            table.set_texture(uniform_names::kMidi, midi_ ? midi_->handle() : TextureHandle{});
            table.set_texture(uniform_names::kNote, note_ ? note_->handle() : TextureHandle{});
        }

        std::vector<std::string> published_uniforms() const override
        {
            return {uniform_names::kMidi, uniform_names::kNote};
        }

        uint8_t midi_value(uint8_t status, uint8_t data1) const
        {
            return midi_ ? midi_->luminance(status, data1) : 0;
        }

        uint8_t note_velocity(uint8_t note) const
        {
            return note_ ? note_->luminance(note, 0) : 0;
        }

    private:
        void apply(const MidiMessage& m)
        {
            midi_->set_luminance(m.status, m.data1 & 0x7F, m.data2);
            const uint8_t kind = m.status & 0xF0;
            if (kind == 0x90) note_->set_luminance(m.data1 & 0x7F, 0, m.data2);
            else if (kind == 0x80) note_->set_luminance(m.data1 & 0x7F, 0, 0);
        }

        static std::string find_first_raw_midi()
        {
            std::error_code ec;
            const std::filesystem::path dir("/dev/snd");
            if (!std::filesystem::is_directory(dir, ec)) return {};
            std::vector<std::string> found{};
            for (const auto& entry : std::filesystem::directory_iterator(dir, ec))
            {
                const std::string name = entry.path().filename().string();
                if (name.rfind("midiC", 0) == 0) found.push_back(entry.path().string());
            }
            if (found.empty()) return {};
            std::sort(found.begin(), found.end());
            return found.front();
        }

        Status open_device()
        {
            const std::string path = device_path_.empty() ? find_first_raw_midi() : device_path_;
            if (path.empty())
            {
                return Status::failure("midi: no raw MIDI device under /dev/snd", ErrorKind::Resource);
            }
            fd_ = ::open(path.c_str(), O_RDONLY | O_NONBLOCK);
            if (fd_ < 0)
            {
                const int err = errno;
                return Status::failure(
                    "midi: cannot open '" + path + "': " + std::generic_category().message(err),
                    ErrorKind::Resource);
            }
            log_info("midi: reading from '" + path + "'");
            return Status::success();
        }

        void read_device()
        {
            if (fd_ < 0) return;
            uint8_t buf[256];
            for (;;)
            {
                const ssize_t n = ::read(fd_, buf, sizeof(buf));
                if (n > 0)
                {
                    parser_.feed(std::span<const uint8_t>(buf, (size_t)n), [this](const MidiMessage& m) { apply(m); });
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
                {
                    log_warn("midi: device read failed, closing");
                    close_device();
                }
                break;
            }
        }

        void close_device()
        {
            if (fd_ >= 0) ::close(fd_);
            fd_ = -1;
        }

        IGpuDevice* device_ = nullptr;
        std::string device_path_{};
        bool use_device_ = true;
        int fd_ = -1;
        MidiByteParser parser_{};
        std::unique_ptr<DataTexture> midi_{};
        std::unique_ptr<DataTexture> note_{};
        bool enabled_ = false;
    };
}
