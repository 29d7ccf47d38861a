#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Түвшинтэй энгийн лог. stdout/stderr руу "[LEVEL] msg" мөр бичнэ.
            Босго түвшинг LSH_LOG_LEVEL орчны хувьсагчаар тохируулна.
*/


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace lsh
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4
    };

    inline const char* log_level_name(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    inline bool parse_log_level(std::string_view text, LogLevel& out)
    {
        std::string v(text);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "debug" || v == "trace") { out = LogLevel::Debug; return true; }
        if (v == "info") { out = LogLevel::Info; return true; }
        if (v == "warn" || v == "warning") { out = LogLevel::Warn; return true; }
        if (v == "error") { out = LogLevel::Error; return true; }
        if (v == "off" || v == "none") { out = LogLevel::Off; return true; }
        return false;
    }

    inline LogLevel& log_threshold()
    {
        static LogLevel level = LogLevel::Info;
        return level;
    }

    inline void set_log_level(LogLevel level)
    {
        log_threshold() = level;
    }

    inline bool log_enabled(LogLevel level)
    {
        return level != LogLevel::Off && level >= log_threshold();
    }

    inline void log_debug(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
