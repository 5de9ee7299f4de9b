#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: types.hpp
    MODULE: shader
    PURPOSE: Stage inputs/outputs for the software shading programs: fixed vertex
             layout, per-instance payload, interpolated varyings and the per-draw
             bindings passed explicitly to every invocation.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "shadecore/camera/camera_uniform.hpp"
#include "shadecore/frame/shading_config.hpp"
#include "shadecore/geometry/instance_transform.hpp"
#include "shadecore/gfx/rt_types.hpp"
#include "shadecore/lighting/light_types.hpp"
#include "shadecore/resources/material.hpp"
#include "shadecore/resources/texture.hpp"

namespace shadecore
{
    constexpr uint32_t SHADECORE_MAX_VARYINGS = 8;

    enum class VaryingSemantic : uint32_t
    {
        WorldPos = 0,
        NormalWS = 1,
        UV0 = 2,
        Color0 = 3,
        Custom0 = 4,
        Custom1 = 5,
        Custom2 = 6,
        Custom3 = 7
    };

    inline constexpr uint32_t varying_bit(uint32_t slot) { return (1u << slot); }

    struct ShaderVertex
    {
        glm::vec3 position{0.0f};
        glm::vec2 uv{0.0f};
        glm::vec3 normal{0.0f, 0.0f, 1.0f};
    };

    // Flag lanes of InstanceInput::flags. A lane is on when > 0.5.
    enum class InstanceFlag : uint32_t
    {
        Round = 0,
        Border = 1,
        DrawTexture = 2
    };

    struct InstanceInput
    {
        ModelRows model_rows{glm::vec4(1, 0, 0, 0), glm::vec4(0, 1, 0, 0), glm::vec4(0, 0, 1, 0), glm::vec4(0, 0, 0, 1)};
        NormalRows normal_rows{glm::vec3(1, 0, 0), glm::vec3(0, 1, 0), glm::vec3(0, 0, 1)};
        bool has_normal_matrix = false;

        glm::vec4 color{1.0f};
        glm::vec4 border_color{0.0f};
        glm::vec4 corner_radii{0.0f};
        glm::vec4 border_widths{0.0f};
        glm::vec4 flags{0.0f};
        glm::vec2 extent{1.0f, 1.0f};

        bool flag(InstanceFlag f) const { return flags[(int)f] > 0.5f; }
    };

    inline InstanceInput instance_from_lit(const LitInstance& lit)
    {
        InstanceInput in{};
        in.model_rows = lit.model_rows;
        in.normal_rows = lit.normal_rows;
        in.has_normal_matrix = true;
        return in;
    }

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        std::array<glm::vec4, SHADECORE_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
    };

    struct FragmentIn
    {
        std::array<glm::vec4, SHADECORE_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        // No color and no depth contribution.
        bool discard = false;
    };

    // Everything a program may read besides its own vertex/instance input.
    struct DrawBindings
    {
        CameraUniform camera{};
        LightListView lights{};
        MaterialBindings material{};
        TextureBinding ui_texture{};
        UiShapeParams ui{};
        SpecularExtension specular{};
    };

    inline void bind_shading_config(DrawBindings& b, const ShadingConfig& cfg)
    {
        b.ui = cfg.ui;
        b.specular = cfg.specular;
    }

    inline void set_varying(VertexOut& out, VaryingSemantic semantic, const glm::vec4& v)
    {
        const uint32_t i = (uint32_t)semantic;
        out.varyings[i] = v;
        out.varying_mask |= varying_bit(i);
    }

    inline glm::vec4 get_varying(const FragmentIn& in, VaryingSemantic semantic, const glm::vec4& fallback = glm::vec4(0.0f))
    {
        const uint32_t i = (uint32_t)semantic;
        if ((in.varying_mask & varying_bit(i)) == 0u) return fallback;
        return in.varyings[i];
    }

    inline ColorF to_color_f(const glm::vec4& c)
    {
        return ColorF{c.r, c.g, c.b, c.a};
    }

    inline glm::vec4 to_vec4(const ColorF& c)
    {
        return glm::vec4(c.r, c.g, c.b, c.a);
    }
}
