#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: loader_registry.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Frame Driver-ийн асуудаг provider-уудын эзэмшдэггүй бүртгэл.
            Provider-ууд хост програмд амьдарна. Байхгүй slot = тухайн боломж идэвхгүй.
*/


#include "lsh/loader/keyboard_provider.hpp"
#include "lsh/loader/media_kind.hpp"
#include "lsh/loader/midi_provider.hpp"
#include "lsh/loader/texture_provider.hpp"

namespace lsh
{
    struct LoaderRegistry
    {
        ITextureProvider* video = nullptr;
        ITextureProvider* animated_image = nullptr;
        ITextureProvider* audio_file = nullptr;
        ITextureProvider* static_image = nullptr;

        IAudioInputProvider* audio = nullptr;
        MidiProvider* midi = nullptr;
        IInputProvider* camera = nullptr;
        KeyboardProvider* keyboard = nullptr;
        IInputProvider* gamepad = nullptr;

        ITextureProvider* texture_provider(MediaKind kind) const
        {
            switch (kind)
            {
                case MediaKind::Video: return video;
                case MediaKind::AnimatedImage: return animated_image;
                case MediaKind::AudioFile: return audio_file;
                case MediaKind::StaticImage: return static_image;
            }
            return nullptr;
        }

        // Кадр бүр татагдах дараалал: audio, gamepad, midi, camera, keyboard.
        template<typename Fn>
        void for_each_input(Fn&& fn) const
        {
            if (audio) fn(*audio);
            if (gamepad) fn(*gamepad);
            if (midi) fn(*midi);
            if (camera) fn(*camera);
            if (keyboard) fn(*keyboard);
        }
    };
}
