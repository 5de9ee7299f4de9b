#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: material.hpp
    MODULE: resources
    PURPOSE: Material block as the fragment stage consumes it: five texture/sampler
             slots, diffuse/emissive tints and the metadata quadruple.
*/


#include <cstdint>
#include <string>

#include <glm/glm.hpp>

#include "shadecore/resources/texture.hpp"

namespace shadecore
{
    // Values are the wire encoding of the metadata selector; 0 is reserved for "unset".
    enum class AlphaMode : uint32_t
    {
        Opaque = 1,
        Mask = 2,
        Blend = 3
    };

    inline const char* alpha_mode_name(AlphaMode mode)
    {
        switch (mode)
        {
            case AlphaMode::Opaque: return "opaque";
            case AlphaMode::Mask: return "mask";
            case AlphaMode::Blend: return "blend";
        }
        return "opaque";
    }

    // Wire layout: (metallic_factor, roughness_factor, alpha_mode, alpha_cutoff).
    // alpha_mode travels as a float because the block is a plain vec4.
    struct MaterialMetadata
    {
        float metallic_factor = 0.0f;
        float roughness_factor = 1.0f;
        float alpha_mode = (float)AlphaMode::Opaque;
        float alpha_cutoff = 0.5f;

        glm::vec4 packed() const
        {
            return glm::vec4(metallic_factor, roughness_factor, alpha_mode, alpha_cutoff);
        }
    };

    struct MaterialData
    {
        std::string name{};

        glm::vec4 diffuse_color{1.0f};
        glm::vec4 emissive_color{0.0f, 0.0f, 0.0f, 1.0f};
        MaterialMetadata metadata{};
    };

    struct MaterialBindings
    {
        const MaterialData* material = nullptr;

        TextureBinding diffuse{};
        TextureBinding roughness{};
        TextureBinding emissive{};
        TextureBinding normal{};
        TextureBinding occlusion{};
    };

    inline MaterialData make_material(
        const glm::vec4& diffuse_color,
        AlphaMode mode = AlphaMode::Opaque,
        float alpha_cutoff = 0.5f)
    {
        MaterialData m{};
        m.diffuse_color = diffuse_color;
        m.metadata.alpha_mode = (float)mode;
        m.metadata.alpha_cutoff = alpha_cutoff;
        return m;
    }
}
