#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: log.hpp
    MODULE: core
    PURPOSE: Minimal tagged logging for host-side code (registry, draw executor, config).
             Per-invocation shading math never logs.
*/


#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>

namespace shadecore
{
    enum class LogLevel : uint8_t
    {
        Info = 0,
        Warn = 1,
        Error = 2,
        Off = 3
    };

    inline const char* log_level_name(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "info";
    }

    // Process-wide threshold; messages below it are dropped.
    inline std::atomic<LogLevel>& log_threshold()
    {
        static std::atomic<LogLevel> level{LogLevel::Info};
        return level;
    }

    inline void set_log_level(LogLevel level)
    {
        log_threshold().store(level, std::memory_order_relaxed);
    }

    inline bool log_enabled(LogLevel level)
    {
        return level != LogLevel::Off && level >= log_threshold().load(std::memory_order_relaxed);
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[shadecore][INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[shadecore][WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[shadecore][ERROR] " << msg << std::endl;
    }
}
