#include <cmath>
#include <cstdio>
#include <map>
#include <string>

#include "shadecore/frame/shading_config.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-6f)
    {
        return std::abs(a - b) <= eps;
    }

    shadecore::EnvLookup lookup_from(const std::map<std::string, std::string>& env)
    {
        return [&env](const char* name) -> const char* {
            const auto it = env.find(name);
            return it == env.end() ? nullptr : it->second.c_str();
        };
    }

    bool test_defaults_without_overrides()
    {
        const std::map<std::string, std::string> env{};
        const shadecore::ShadingConfig cfg = shadecore::load_shading_config(lookup_from(env));
        if (cfg.specular.enabled) return false;
        if (!approx_eq(cfg.ui.edge_aa_band, 0.1f) || !approx_eq(cfg.ui.max_border_ratio, 0.99f)) return false;
        if (cfg.raster.cull_mode != shadecore::RasterCullMode::None) return false;
        return cfg.raster.depth_test && cfg.raster.depth_write && cfg.raster.blend == shadecore::RasterBlendMode::Replace;
    }

    bool test_overrides_apply()
    {
        const std::map<std::string, std::string> env{
            {"SHADECORE_SPECULAR", "On"},
            {"SHADECORE_SPECULAR_SHININESS", "64"},
            {"SHADECORE_UI_AA_BAND", "0.05"},
            {"SHADECORE_RASTER_CULL", "BACK"},
            {"SHADECORE_LOG_LEVEL", "Warning"},
        };
        const shadecore::ShadingConfig cfg = shadecore::load_shading_config(lookup_from(env));
        return cfg.specular.enabled &&
               cfg.log_level == shadecore::LogLevel::Warn &&
               approx_eq(cfg.specular.shininess, 64.0f) &&
               approx_eq(cfg.ui.edge_aa_band, 0.05f) &&
               cfg.raster.cull_mode == shadecore::RasterCullMode::Back;
    }

    bool test_malformed_values_keep_base()
    {
        shadecore::ShadingConfig base{};
        base.specular.enabled = true;
        base.specular.shininess = 16.0f;
        base.raster.cull_mode = shadecore::RasterCullMode::Front;

        const std::map<std::string, std::string> env{
            {"SHADECORE_SPECULAR", "maybe"},
            {"SHADECORE_SPECULAR_SHININESS", "12abc"},
            {"SHADECORE_UI_AA_BAND", "nan"},
            {"SHADECORE_RASTER_CULL", "sideways"},
        };
        const shadecore::ShadingConfig cfg = shadecore::load_shading_config(lookup_from(env), base);
        return cfg.specular.enabled &&
               approx_eq(cfg.specular.shininess, 16.0f) &&
               approx_eq(cfg.ui.edge_aa_band, 0.1f) &&
               cfg.raster.cull_mode == shadecore::RasterCullMode::Front;
    }

    bool test_out_of_range_values_are_clamped()
    {
        const std::map<std::string, std::string> env{
            {"SHADECORE_SPECULAR_SHININESS", "0"},
            {"SHADECORE_UI_AA_BAND", "-3"},
        };
        shadecore::ShadingConfig base{};
        base.ui.max_border_ratio = 1.5f;
        base.specular.strength = -1.0f;
        base.raster.parallel_min_rows = 0;

        const shadecore::ShadingConfig cfg = shadecore::load_shading_config(lookup_from(env), base);
        return approx_eq(cfg.specular.shininess, 1.0f) &&
               approx_eq(cfg.ui.edge_aa_band, 0.0f) &&
               approx_eq(cfg.ui.max_border_ratio, 0.99f) &&
               approx_eq(cfg.specular.strength, 0.0f) &&
               cfg.raster.parallel_min_rows == 1u;
    }

    bool test_parsers()
    {
        if (!shadecore::parse_config_bool("YES").value_or(false)) return false;
        if (shadecore::parse_config_bool("0").value_or(true)) return false;
        if (shadecore::parse_config_bool(nullptr).ok) return false;

        const shadecore::Result<float> f = shadecore::parse_config_float("2.5");
        if (!f || !approx_eq(f.value, 2.5f)) return false;
        if (shadecore::parse_config_float("").ok) return false;
        if (shadecore::parse_config_float("1e60").ok) return false;
        if (shadecore::parse_config_float("inf").ok) return false;

        if (shadecore::parse_cull_mode("off").value_or(shadecore::RasterCullMode::Back) != shadecore::RasterCullMode::None) return false;
        const shadecore::Result<shadecore::RasterCullMode> bad = shadecore::parse_cull_mode("both");
        return !bad.ok && !bad.error.empty();
    }

    bool test_log_level_threshold()
    {
        if (shadecore::parse_log_level("OFF").value_or(shadecore::LogLevel::Info) != shadecore::LogLevel::Off) return false;
        if (shadecore::parse_log_level("loud").ok) return false;

        shadecore::set_log_level(shadecore::LogLevel::Error);
        const bool error_only = !shadecore::log_enabled(shadecore::LogLevel::Info) &&
                                !shadecore::log_enabled(shadecore::LogLevel::Warn) &&
                                shadecore::log_enabled(shadecore::LogLevel::Error);
        shadecore::set_log_level(shadecore::LogLevel::Off);
        const bool silent = !shadecore::log_enabled(shadecore::LogLevel::Error);
        shadecore::set_log_level(shadecore::LogLevel::Info);
        const bool all = shadecore::log_enabled(shadecore::LogLevel::Info) &&
                         !shadecore::log_enabled(shadecore::LogLevel::Off);
        return error_only && silent && all;
    }

    bool test_bind_into_draw_bindings()
    {
        shadecore::ShadingConfig cfg{};
        cfg.specular.enabled = true;
        cfg.ui.edge_aa_band = 0.2f;
        shadecore::DrawBindings b{};
        shadecore::bind_shading_config(b, cfg);
        return b.specular.enabled && approx_eq(b.ui.edge_aa_band, 0.2f);
    }
}

int main()
{
    const bool ok_defaults = test_defaults_without_overrides();
    const bool ok_overrides = test_overrides_apply();
    const bool ok_malformed = test_malformed_values_keep_base();
    const bool ok_clamp = test_out_of_range_values_are_clamped();
    const bool ok_parsers = test_parsers();
    const bool ok_bind = test_bind_into_draw_bindings();
    const bool ok_log = test_log_level_threshold();

    if (!ok_defaults) std::fprintf(stderr, "[shading-config-tests] defaults wrong\n");
    if (!ok_overrides) std::fprintf(stderr, "[shading-config-tests] overrides not applied\n");
    if (!ok_malformed) std::fprintf(stderr, "[shading-config-tests] malformed value replaced base\n");
    if (!ok_clamp) std::fprintf(stderr, "[shading-config-tests] out-of-range value not clamped\n");
    if (!ok_parsers) std::fprintf(stderr, "[shading-config-tests] parser result wrong\n");
    if (!ok_bind) std::fprintf(stderr, "[shading-config-tests] config not bound to draw\n");
    if (!ok_log) std::fprintf(stderr, "[shading-config-tests] log level threshold wrong\n");

    if (!(ok_defaults && ok_overrides && ok_malformed && ok_clamp && ok_parsers && ok_bind && ok_log)) return 1;
    std::fprintf(stderr, "[shading-config-tests] all tests passed\n");
    return 0;
}
