#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

#include <glm/glm.hpp>

#include "shadecore/material/material_eval.hpp"
#include "shadecore/resources/material.hpp"
#include "shadecore/resources/texture.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-5f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_eq(const glm::vec4& a, const glm::vec4& b, float eps = 1e-5f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps) && approx_eq(a.w, b.w, eps);
    }

    bool test_mask_cutoff_is_inclusive_on_kept_side()
    {
        const float cutoff = 0.5f;
        const shadecore::MaterialData at_cutoff = shadecore::make_material(glm::vec4(1.0f, 1.0f, 1.0f, cutoff), shadecore::AlphaMode::Mask, cutoff);
        const shadecore::MaterialShade kept = shadecore::evaluate_material(at_cutoff, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        if (kept.discard) return false;
        if (kept.color.a != 1.0f) return false;

        const float below = std::nextafter(cutoff, 0.0f);
        const shadecore::MaterialData under = shadecore::make_material(glm::vec4(1.0f, 1.0f, 1.0f, below), shadecore::AlphaMode::Mask, cutoff);
        const shadecore::MaterialShade cut = shadecore::evaluate_material(under, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        return cut.discard;
    }

    bool test_mask_uses_texel_alpha_times_tint()
    {
        shadecore::MaterialData m = shadecore::make_material(glm::vec4(1.0f, 1.0f, 1.0f, 0.8f), shadecore::AlphaMode::Mask, 0.5f);
        shadecore::MaterialSamples s{};
        s.diffuse = glm::vec4(1.0f, 1.0f, 1.0f, 0.5f);
        // 0.8 * 0.5 = 0.4 < 0.5
        return shadecore::evaluate_material(m, s, glm::vec3(1.0f)).discard;
    }

    bool test_opaque_and_blend_alpha()
    {
        const glm::vec4 tint(1.0f, 1.0f, 1.0f, 0.2f);
        const shadecore::MaterialShade opaque = shadecore::evaluate_material(
            shadecore::make_material(tint, shadecore::AlphaMode::Opaque), shadecore::MaterialSamples{}, glm::vec3(1.0f));
        if (opaque.discard || opaque.color.a != 1.0f) return false;

        const shadecore::MaterialShade blend = shadecore::evaluate_material(
            shadecore::make_material(tint, shadecore::AlphaMode::Blend), shadecore::MaterialSamples{}, glm::vec3(1.0f));
        if (blend.discard || !approx_eq(blend.color.a, 0.2f)) return false;
        return true;
    }

    bool test_unknown_alpha_mode_is_opaque()
    {
        if (shadecore::alpha_mode_from_metadata(7.0f) != shadecore::AlphaMode::Opaque) return false;
        if (shadecore::alpha_mode_from_metadata(-1.0f) != shadecore::AlphaMode::Opaque) return false;
        if (shadecore::alpha_mode_from_metadata(std::numeric_limits<float>::quiet_NaN()) != shadecore::AlphaMode::Opaque) return false;
        if (shadecore::alpha_mode_from_metadata(0.0f) != shadecore::AlphaMode::Opaque) return false;
        if (shadecore::alpha_mode_from_metadata(1.0f) != shadecore::AlphaMode::Opaque) return false;
        if (shadecore::alpha_mode_from_metadata(2.2f) != shadecore::AlphaMode::Mask) return false;
        if (shadecore::alpha_mode_from_metadata(3.0f) != shadecore::AlphaMode::Blend) return false;
        if (std::string(shadecore::alpha_mode_name(shadecore::AlphaMode::Mask)) != "mask") return false;

        shadecore::MaterialData m = shadecore::make_material(glm::vec4(1.0f, 1.0f, 1.0f, 0.0f));
        m.metadata.alpha_mode = 42.0f;
        const shadecore::MaterialShade out = shadecore::evaluate_material(m, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        return !out.discard && out.color.a == 1.0f;
    }

    bool test_metadata_wire_layout()
    {
        const shadecore::MaterialData m = shadecore::make_material(glm::vec4(1.0f), shadecore::AlphaMode::Blend, 0.3f);
        return m.metadata.packed() == glm::vec4(0.0f, 1.0f, 3.0f, 0.3f);
    }

    bool test_raw_mask_selector_discards()
    {
        // A block written straight from the wire: selector 2.0 is mask.
        shadecore::MaterialData m = shadecore::make_material(glm::vec4(1.0f, 1.0f, 1.0f, 0.2f));
        m.metadata.alpha_mode = 2.0f;
        m.metadata.alpha_cutoff = 0.5f;
        const shadecore::MaterialShade cut = shadecore::evaluate_material(m, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        if (!cut.discard) return false;

        // 3.0 is blend: alpha passes through.
        m.metadata.alpha_mode = 3.0f;
        const shadecore::MaterialShade blended = shadecore::evaluate_material(m, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        if (blended.discard || !approx_eq(blended.color.a, 0.2f)) return false;

        // 0.0 is an unset selector and stays opaque.
        m.metadata.alpha_mode = 0.0f;
        const shadecore::MaterialShade unset = shadecore::evaluate_material(m, shadecore::MaterialSamples{}, glm::vec3(1.0f));
        return !unset.discard && unset.color.a == 1.0f;
    }

    bool test_diffuse_is_lit_and_emissive_is_not()
    {
        shadecore::MaterialData m = shadecore::make_material(glm::vec4(1.0f, 0.5f, 1.0f, 1.0f));
        m.emissive_color = glm::vec4(0.0f, 0.0f, 1.0f, 1.0f);
        shadecore::MaterialSamples s{};
        s.diffuse = glm::vec4(0.5f, 1.0f, 1.0f, 1.0f);
        s.emissive = glm::vec4(1.0f, 1.0f, 0.25f, 1.0f);

        const shadecore::MaterialShade lit = shadecore::evaluate_material(m, s, glm::vec3(2.0f));
        if (!approx_eq(lit.color, glm::vec4(1.0f, 1.0f, 2.25f, 1.0f))) return false;

        // In the dark only emissive remains.
        const shadecore::MaterialShade dark = shadecore::evaluate_material(m, s, glm::vec3(0.0f));
        return approx_eq(dark.color, glm::vec4(0.0f, 0.0f, 0.25f, 1.0f));
    }

    bool test_staged_inputs_do_not_change_color()
    {
        if (shadecore::kStagedSurfaceInputsActive) return false;

        const shadecore::MaterialData m = shadecore::make_material(glm::vec4(0.7f, 0.6f, 0.5f, 1.0f));
        shadecore::MaterialSamples a{};
        shadecore::MaterialSamples b{};
        b.roughness = glm::vec4(0.1f);
        b.normal = glm::vec4(0.5f, 0.5f, 1.0f, 1.0f);
        b.occlusion = glm::vec4(0.0f);

        const glm::vec3 illum(0.3f, 0.6f, 0.9f);
        const shadecore::MaterialShade ra = shadecore::evaluate_material(m, a, illum);
        const shadecore::MaterialShade rb = shadecore::evaluate_material(m, b, illum);
        return ra.color == rb.color && ra.discard == rb.discard;
    }

    bool test_unbound_textures_sample_white()
    {
        shadecore::MaterialBindings bindings{};
        const shadecore::MaterialSamples s = shadecore::sample_material(bindings, glm::vec2(0.3f, 0.7f));
        const glm::vec4 white(1.0f);
        if (s.diffuse != white || s.roughness != white || s.emissive != white) return false;
        if (s.normal != white || s.occlusion != white) return false;

        // Bound diffuse texture: linear sampling of a single texel returns it everywhere.
        shadecore::Texture2DData tex(1, 1, shadecore::Color{255, 0, 0, 128});
        bindings.diffuse.texture = &tex;
        bindings.diffuse.sampler.srgb = false;
        const shadecore::MaterialSamples t = shadecore::sample_material(bindings, glm::vec2(0.9f, 0.1f));
        return approx_eq(t.diffuse, glm::vec4(1.0f, 0.0f, 0.0f, 128.0f / 255.0f)) && t.emissive == white;
    }
}

int main()
{
    const bool ok_mask_boundary = test_mask_cutoff_is_inclusive_on_kept_side();
    const bool ok_mask_texel = test_mask_uses_texel_alpha_times_tint();
    const bool ok_alpha = test_opaque_and_blend_alpha();
    const bool ok_unknown = test_unknown_alpha_mode_is_opaque();
    const bool ok_wire = test_metadata_wire_layout();
    const bool ok_raw_mask = test_raw_mask_selector_discards();
    const bool ok_lit = test_diffuse_is_lit_and_emissive_is_not();
    const bool ok_staged = test_staged_inputs_do_not_change_color();
    const bool ok_unbound = test_unbound_textures_sample_white();

    if (!ok_mask_boundary) std::fprintf(stderr, "[material-tests] alpha mask boundary wrong\n");
    if (!ok_mask_texel) std::fprintf(stderr, "[material-tests] alpha mask ignored texel alpha\n");
    if (!ok_alpha) std::fprintf(stderr, "[material-tests] opaque/blend alpha wrong\n");
    if (!ok_unknown) std::fprintf(stderr, "[material-tests] unknown alpha mode not opaque\n");
    if (!ok_wire) std::fprintf(stderr, "[material-tests] metadata wire layout wrong\n");
    if (!ok_raw_mask) std::fprintf(stderr, "[material-tests] wire alpha selector decode wrong\n");
    if (!ok_lit) std::fprintf(stderr, "[material-tests] diffuse/emissive composition wrong\n");
    if (!ok_staged) std::fprintf(stderr, "[material-tests] staged inputs changed color\n");
    if (!ok_unbound) std::fprintf(stderr, "[material-tests] unbound texture sampling wrong\n");

    if (!(ok_mask_boundary && ok_mask_texel && ok_alpha && ok_unknown && ok_wire && ok_raw_mask && ok_lit && ok_staged && ok_unbound)) return 1;
    std::fprintf(stderr, "[material-tests] all tests passed\n");
    return 0;
}
