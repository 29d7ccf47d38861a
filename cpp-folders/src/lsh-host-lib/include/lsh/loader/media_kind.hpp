#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: media_kind.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Texture эх сурвалжийн төрлийг өргөтгөлөөр (том жижиг үсэг ялгахгүй) тодорхойлно.
*/


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace lsh
{
    enum class MediaKind : uint8_t
    {
        StaticImage = 0,
        AnimatedImage = 1,
        AudioFile = 2,
        Video = 3
    };

    inline const char* media_kind_name(MediaKind k)
    {
        switch (k)
        {
            case MediaKind::StaticImage: return "image";
            case MediaKind::AnimatedImage: return "animated-image";
            case MediaKind::AudioFile: return "audio";
            case MediaKind::Video: return "video";
        }
        return "unknown";
    }

    // Query string (?...) болон fragment (#...) хасагдана.
    inline std::string url_extension(std::string_view url)
    {
        const size_t cut = url.find_first_of("?#");
        if (cut != std::string_view::npos) url = url.substr(0, cut);
        const size_t slash = url.find_last_of("/\\");
        const size_t dot = url.find_last_of('.');
        if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) return {};
        std::string ext(url.substr(dot + 1));
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return ext;
    }

    inline bool is_video_url(std::string_view url)
    {
        static const char* kVideo[] = {
            "mp4", "m4v", "webm", "ogv", "ogg", "mov", "avi", "mkv", "mpg", "mpeg", "wmv", "flv", "3gp"};
        const std::string ext = url_extension(url);
        for (const char* v : kVideo)
        {
            if (ext == v) return true;
        }
        return false;
    }

    inline bool is_gif_url(std::string_view url)
    {
        return url_extension(url) == "gif";
    }

    inline bool is_sound_url(std::string_view url)
    {
        const std::string ext = url_extension(url);
        return ext == "mp3" || ext == "wav";
    }

    // Шалгах дараалал: video, gif, дуу, бусад нь static зураг.
    inline MediaKind classify_media_url(std::string_view url)
    {
        if (is_video_url(url)) return MediaKind::Video;
        if (is_gif_url(url)) return MediaKind::AnimatedImage;
        if (is_sound_url(url)) return MediaKind::AudioFile;
        return MediaKind::StaticImage;
    }
}
