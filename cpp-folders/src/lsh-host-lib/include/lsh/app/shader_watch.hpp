#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: shader_watch.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Pass-уудын shader файлыг уншиж PassSpec болгоно, өөрчлөлтийн хугацааг
            тогтмол интервалаар шалгаж hot reload-ыг өдөөнө.
*/


#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "lsh/app/host_args.hpp"
#include "lsh/core/result.hpp"
#include "lsh/pipeline/pass_spec.hpp"

namespace lsh
{
    inline Result<std::string> read_text_file(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) return Result<std::string>::failure("cannot open '" + path + "'", ErrorKind::Resource);
        std::ostringstream ss;
        ss << in.rdbuf();
        return Result<std::string>::success(ss.str());
    }

    class ShaderWatch
    {
    public:
        ShaderWatch() = default;

        explicit ShaderWatch(std::vector<PassFile> passes)
            : passes_(std::move(passes))
        {
            stamps_ = snapshot();
        }

        const std::vector<PassFile>& passes() const { return passes_; }

        // Бүх файлыг одоогийн агуулгаар нь уншина.
        Result<std::vector<PassSpec>> load_specs() const
        {
            std::vector<PassSpec> specs{};
            specs.reserve(passes_.size());
            for (const PassFile& pf : passes_)
            {
                PassSpec spec{};
                if (pf.fs_path)
                {
                    Result<std::string> src = read_text_file(*pf.fs_path);
                    if (!src.ok) return Result<std::vector<PassSpec>>::forward(src);
                    spec.fs = src.value;
                }
                if (pf.vs_path)
                {
                    Result<std::string> src = read_text_file(*pf.vs_path);
                    if (!src.ok) return Result<std::vector<PassSpec>>::forward(src);
                    spec.vs = src.value;
                }
                spec.target = pf.target;
                spec.width = pf.width;
                spec.height = pf.height;
                spec.float_texture = pf.float_texture;
                specs.push_back(std::move(spec));
            }
            return Result<std::vector<PassSpec>>::success(std::move(specs));
        }

        // Poll интервал өнгөрсөн бөгөөд аль нэг файлын mtime өөрчлөгдсөн бол true.
        bool poll(uint64_t now_ms, uint32_t interval_ms)
        {
            if (now_ms < next_poll_ms_) return false;
            next_poll_ms_ = now_ms + interval_ms;
            std::vector<int64_t> current = snapshot();
            if (current == stamps_) return false;
            stamps_ = std::move(current);
            return true;
        }

    private:
        static int64_t stamp_of(const std::string& path)
        {
            std::error_code ec{};
            const auto t = std::filesystem::last_write_time(path, ec);
            if (ec) return -1;
            return (int64_t)t.time_since_epoch().count();
        }

        std::vector<int64_t> snapshot() const
        {
            std::vector<int64_t> out{};
            for (const PassFile& pf : passes_)
            {
                out.push_back(pf.fs_path ? stamp_of(*pf.fs_path) : 0);
                out.push_back(pf.vs_path ? stamp_of(*pf.vs_path) : 0);
            }
            return out;
        }

        std::vector<PassFile> passes_{};
        std::vector<int64_t> stamps_{};
        uint64_t next_poll_ms_ = 0;
    };
}
