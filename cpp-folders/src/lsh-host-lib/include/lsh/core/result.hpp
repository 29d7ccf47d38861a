#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Алдааны ангилал (configuration/resource) бүхий Result<T>, Status төрлүүд
            болон инвариант зөрчлийг илэрхийлэх ProgrammingError exception.
*/


#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace lsh
{
    enum class ErrorKind : uint8_t
    {
        None = 0,
        // Хэрэглэгчийн оролт буруу: shader-гүй pass, uniform төрлийн зөрчил, compile алдаа.
        Configuration = 1,
        // Гадаад нөөц ашиглах боломжгүй: файл, төхөөрөмж, codec.
        Resource = 2
    };

    inline const char* error_kind_name(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None: return "none";
            case ErrorKind::Configuration: return "configuration";
            case ErrorKind::Resource: return "resource";
        }
        return "unknown";
    }

    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};
        ErrorKind kind = ErrorKind::None;

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}, ErrorKind::None};
        }

        static Result<T> failure(std::string e, ErrorKind k = ErrorKind::Configuration)
        {
            return Result<T>{false, T{}, std::move(e), k};
        }

        template<typename U>
        static Result<T> forward(const Result<U>& other)
        {
            return failure(other.error, other.kind);
        }
    };

    struct Status
    {
        bool ok = true;
        std::string error{};
        ErrorKind kind = ErrorKind::None;

        static Status success()
        {
            return Status{};
        }

        static Status failure(std::string e, ErrorKind k = ErrorKind::Configuration)
        {
            return Status{false, std::move(e), k};
        }

        template<typename U>
        static Status from(const Result<U>& r)
        {
            if (r.ok) return success();
            return failure(r.error, r.kind);
        }
    };

    // Core инвариант эвдэрсэн үед шидэгдэнэ. Runtime нөхцөл биш тул сэргээхгүй.
    class ProgrammingError : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };
}
