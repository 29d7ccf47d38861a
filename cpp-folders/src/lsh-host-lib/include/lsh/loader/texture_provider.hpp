#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: texture_provider.hpp
    МОДУЛЬ: loader
    ЗОРИЛГО: Frame Driver-ийн хамаардаг provider-ийн нарийн гэрээ.
            Texture provider: load/update/release_texture/unload, URL-аар memoize хийнэ.
            Input provider: enable/disable/is_enabled, кадр бүрт update + uniform publish.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "lsh/core/result.hpp"
#include "lsh/gfx/gpu_handle.hpp"
#include "lsh/uniform/uniform_table.hpp"

namespace lsh
{
    struct TextureLoadParams
    {
        double speed = 1.0;
    };

    class ITextureProvider
    {
    public:
        virtual ~ITextureProvider() = default;

        virtual const char* provider_name() const = 0;

        // URL-аар idempotent. Дахин дуудвал params (тоглуулах хурд г.м.) л шинэчлэгдэнэ.
        virtual Result<TextureHandle> load(const std::string& key, const std::string& url, const TextureLoadParams& params) = 0;

        // Decode/тоглуулалтын төлвийг нэг tick урагшлуулна. I/O хийхгүй.
        virtual void update() = 0;

        // GPU texture-ийг л суллана. Decode session үлдэж, дараагийн load шинэ texture үүсгэнэ.
        virtual void release_texture(const std::string& url) = 0;

        // Session-ийг бүхэлд нь суллана. Танигдаагүй URL бол юу ч хийхгүй.
        virtual void unload(const std::string& url) = 0;
    };

    class IInputProvider
    {
    public:
        virtual ~IInputProvider() = default;

        virtual const char* provider_name() const = 0;

        // OS capture эхлүүлнэ. Амжилтгүй бол Resource алдаа буцааж идэвхгүй хэвээр үлдэнэ.
        virtual Status enable() = 0;
        virtual void disable() = 0;
        virtual bool is_enabled() const = 0;

        // Аль хэдийн ирсэн төлвийг уншина. Хүлээхгүй.
        virtual void update() = 0;

        // Одоогийн утгуудыг хүснэгтэд бичнэ.
        virtual void publish(UniformTable& table) const = 0;
        virtual std::vector<std::string> published_uniforms() const = 0;
    };

    class IAudioInputProvider : public IInputProvider
    {
    public:
        virtual void set_fft_size(uint32_t fft_size) = 0;
        virtual void set_smoothing(double smoothing) = 0;
        virtual float volume() const = 0;
    };
}
