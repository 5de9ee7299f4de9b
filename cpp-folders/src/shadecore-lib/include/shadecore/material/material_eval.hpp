#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: material_eval.hpp
    MODULE: material
    PURPOSE: Lit-surface material evaluation: tinted diffuse times illumination, additive
             emissive, and the opaque / mask / blend alpha resolution.
*/


#include <cmath>

#include <glm/glm.hpp>

#include "shadecore/resources/material.hpp"
#include "shadecore/resources/texture.hpp"

namespace shadecore
{
    // Per-pixel texture samples. Unbound slots hold the multiplicative identity.
    struct MaterialSamples
    {
        glm::vec4 diffuse{1.0f};
        glm::vec4 roughness{1.0f};
        glm::vec4 emissive{1.0f};
        glm::vec4 normal{1.0f};
        glm::vec4 occlusion{1.0f};
    };

    // Roughness, normal and occlusion are bound and sampled but not yet folded into
    // lighting. They must not change the color until a micro-facet term exists.
    inline constexpr bool kStagedSurfaceInputsActive = false;

    struct MaterialShade
    {
        glm::vec4 color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    inline MaterialSamples sample_material(const MaterialBindings& b, const glm::vec2& uv)
    {
        MaterialSamples s{};
        s.diffuse = sample_rgba(b.diffuse, uv);
        s.roughness = sample_rgba(b.roughness, uv);
        s.emissive = sample_rgba(b.emissive, uv);
        s.normal = sample_rgba(b.normal, uv);
        s.occlusion = sample_rgba(b.occlusion, uv);
        return s;
    }

    // Unknown or non-finite selector values resolve to Opaque, never to transparency.
    inline AlphaMode alpha_mode_from_metadata(float value)
    {
        if (!std::isfinite(value)) return AlphaMode::Opaque;
        const long v = std::lround(value);
        switch (v)
        {
            case (long)AlphaMode::Mask: return AlphaMode::Mask;
            case (long)AlphaMode::Blend: return AlphaMode::Blend;
            case (long)AlphaMode::Opaque:
            default: return AlphaMode::Opaque;
        }
    }

    inline MaterialShade evaluate_material(
        const MaterialData& material,
        const MaterialSamples& samples,
        const glm::vec3& illumination)
    {
        MaterialShade out{};

        const glm::vec4 base = samples.diffuse * material.diffuse_color;
        const glm::vec3 lit = glm::vec3(base) * illumination;
        const glm::vec3 emissive = glm::vec3(samples.emissive) * glm::vec3(material.emissive_color);
        const glm::vec3 rgb = lit + emissive;

        switch (alpha_mode_from_metadata(material.metadata.alpha_mode))
        {
            case AlphaMode::Mask:
                // Inclusive on the kept side: alpha == cutoff survives.
                if (base.a < material.metadata.alpha_cutoff)
                {
                    out.discard = true;
                    out.color = glm::vec4(0.0f);
                    return out;
                }
                out.color = glm::vec4(rgb, 1.0f);
                break;
            case AlphaMode::Blend:
                out.color = glm::vec4(rgb, base.a);
                break;
            case AlphaMode::Opaque:
            default:
                out.color = glm::vec4(rgb, 1.0f);
                break;
        }
        return out;
    }
}
