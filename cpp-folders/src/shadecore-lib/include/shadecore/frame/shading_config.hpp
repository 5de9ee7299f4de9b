#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: shading_config.hpp
    MODULE: frame
    PURPOSE: Per-frame shading knobs (UI shape bands, optional specular, rasterizer
             controls) and their environment-variable overrides.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <limits>
#include <string>

#include "shadecore/core/log.hpp"
#include "shadecore/core/result.hpp"
#include "shadecore/lighting/illumination.hpp"
#include "shadecore/ui/rounded_rect.hpp"

namespace shadecore
{
    enum class RasterCullMode : uint8_t
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    inline const char* raster_cull_mode_name(RasterCullMode m)
    {
        switch (m)
        {
            case RasterCullMode::None: return "none";
            case RasterCullMode::Back: return "back";
            case RasterCullMode::Front: return "front";
        }
        return "unknown";
    }

    // How a surviving fragment is combined with the color already in the target.
    enum class RasterBlendMode : uint8_t
    {
        Replace = 0,
        // src.rgb * src.a + dst.rgb * (1 - src.a)
        AlphaOver = 1,
        // src.rgb + dst.rgb * (1 - src.a), for colors already scaled by their coverage
        PremultipliedOver = 2
    };

    struct RasterParams
    {
        // UI quads are authored with both windings, so nothing is culled by default.
        RasterCullMode cull_mode = RasterCullMode::None;
        bool front_face_ccw = true;
        bool depth_test = true;
        bool depth_write = true;
        RasterBlendMode blend = RasterBlendMode::Replace;
        // Below this many covered rows a triangle is shaded on the calling thread.
        uint32_t parallel_min_rows = 32;
    };

    struct ShadingConfig
    {
        UiShapeParams ui{};
        SpecularExtension specular{};
        RasterParams raster{};
        LogLevel log_level = LogLevel::Info;
    };

    namespace detail
    {
        inline std::string lower_copy(const char* value)
        {
            std::string v(value ? value : "");
            std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return v;
        }
    }

    inline Result<bool> parse_config_bool(const char* value)
    {
        const std::string v = detail::lower_copy(value);
        if (v == "1" || v == "true" || v == "on" || v == "yes") return Result<bool>::success(true);
        if (v == "0" || v == "false" || v == "off" || v == "no") return Result<bool>::success(false);
        return Result<bool>::failure("not a boolean: '" + v + "'");
    }

    inline Result<float> parse_config_float(const char* value)
    {
        if (!value || *value == '\0') return Result<float>::failure("empty number");
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || *end != '\0') return Result<float>::failure(std::string("not a number: '") + value + "'");
        if (!std::isfinite(parsed) || std::abs(parsed) > (double)std::numeric_limits<float>::max())
        {
            return Result<float>::failure(std::string("number out of range: '") + value + "'");
        }
        return Result<float>::success((float)parsed);
    }

    inline Result<RasterCullMode> parse_cull_mode(const char* value)
    {
        const std::string v = detail::lower_copy(value);
        if (v == "none" || v == "off" || v == "0") return Result<RasterCullMode>::success(RasterCullMode::None);
        if (v == "back") return Result<RasterCullMode>::success(RasterCullMode::Back);
        if (v == "front") return Result<RasterCullMode>::success(RasterCullMode::Front);
        return Result<RasterCullMode>::failure("unknown cull mode: '" + v + "'");
    }

    inline Result<LogLevel> parse_log_level(const char* value)
    {
        const std::string v = detail::lower_copy(value);
        if (v == "info") return Result<LogLevel>::success(LogLevel::Info);
        if (v == "warn" || v == "warning") return Result<LogLevel>::success(LogLevel::Warn);
        if (v == "error") return Result<LogLevel>::success(LogLevel::Error);
        if (v == "off" || v == "none") return Result<LogLevel>::success(LogLevel::Off);
        return Result<LogLevel>::failure("unknown log level: '" + v + "'");
    }

    // Pulls every knob back into the range the shading code is defined for.
    inline ShadingConfig sanitize_shading_config(ShadingConfig cfg)
    {
        const auto finite_or = [](float v, float fallback) { return std::isfinite(v) ? v : fallback; };

        cfg.ui.edge_aa_band = std::clamp(finite_or(cfg.ui.edge_aa_band, 0.1f), 0.0f, 1.0f);
        cfg.ui.max_border_ratio = std::clamp(finite_or(cfg.ui.max_border_ratio, 0.99f), 0.0f, 0.99f);

        cfg.specular.shininess = std::clamp(finite_or(cfg.specular.shininess, 32.0f), 1.0f, 4096.0f);
        cfg.specular.strength = std::max(finite_or(cfg.specular.strength, 0.25f), 0.0f);

        cfg.raster.parallel_min_rows = std::max<uint32_t>(cfg.raster.parallel_min_rows, 1u);
        return cfg;
    }

    using EnvLookup = std::function<const char*(const char*)>;

    // Reads overrides through lookup; unset variables keep base, malformed ones are
    // reported and skipped.
    inline ShadingConfig load_shading_config(const EnvLookup& lookup, ShadingConfig base = {})
    {
        ShadingConfig cfg = base;
        if (!lookup) return sanitize_shading_config(cfg);

        const auto apply = [&](const char* name, const auto& fn) {
            const char* raw = lookup(name);
            if (!raw || *raw == '\0') return;
            const std::string err = fn(raw);
            if (!err.empty()) log_warn(std::string(name) + " ignored: " + err);
        };

        apply("SHADECORE_SPECULAR", [&](const char* raw) {
            const Result<bool> r = parse_config_bool(raw);
            if (r) cfg.specular.enabled = r.value;
            return r.error;
        });
        apply("SHADECORE_SPECULAR_SHININESS", [&](const char* raw) {
            const Result<float> r = parse_config_float(raw);
            if (r) cfg.specular.shininess = r.value;
            return r.error;
        });
        apply("SHADECORE_UI_AA_BAND", [&](const char* raw) {
            const Result<float> r = parse_config_float(raw);
            if (r) cfg.ui.edge_aa_band = r.value;
            return r.error;
        });
        apply("SHADECORE_RASTER_CULL", [&](const char* raw) {
            const Result<RasterCullMode> r = parse_cull_mode(raw);
            if (r) cfg.raster.cull_mode = r.value;
            return r.error;
        });
        apply("SHADECORE_LOG_LEVEL", [&](const char* raw) {
            const Result<LogLevel> r = parse_log_level(raw);
            if (r) cfg.log_level = r.value;
            return r.error;
        });

        return sanitize_shading_config(cfg);
    }

    inline ShadingConfig load_shading_config_from_env(ShadingConfig base = {})
    {
        return load_shading_config([](const char* name) -> const char* { return std::getenv(name); }, base);
    }
}
