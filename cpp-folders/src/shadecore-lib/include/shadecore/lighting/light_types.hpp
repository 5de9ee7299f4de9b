#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: light_types.hpp
    MODULE: lighting
    PURPOSE: Packed light record, the per-draw light block (lights + count + ambient)
             and factories for omni and spot lights.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

namespace shadecore
{
    // Any cutoff above 1 means "no cone": cos(half-angle) can never exceed 1.
    inline constexpr float kNoSpotCutoff = 1000.0f;

    // std430-compatible: every vec3 shares its 16 bytes with the scalar that follows.
    struct alignas(16) Light
    {
        glm::vec3 position{0.0f};
        float range = 0.0f;
        glm::vec3 color{0.0f};
        float exponent = 0.0f;
        glm::vec3 direction{1.0f, 0.0f, 0.0f};
        float cutoff = kNoSpotCutoff;

        bool has_cone() const { return cutoff <= 1.0f; }
    };

    static_assert(sizeof(Light) == 48, "Light must keep its 48-byte storage layout");

    struct LightBlock
    {
        std::vector<Light> lights{};
        uint32_t count = 0;
        glm::vec3 ambient{0.0f};
    };

    // Read-only view the accumulator iterates. count never reaches past the storage.
    struct LightListView
    {
        std::span<const Light> lights{};
        uint32_t count = 0;
        glm::vec3 ambient{0.0f};

        uint32_t active_count() const
        {
            return (uint32_t)std::min<size_t>((size_t)count, lights.size());
        }
    };

    inline LightListView view_of(const LightBlock& block)
    {
        return LightListView{std::span<const Light>(block.lights), block.count, block.ambient};
    }

    inline Light make_point_light(const glm::vec3& position, const glm::vec3& color, float range)
    {
        Light l{};
        l.position = position;
        l.color = color;
        l.range = range;
        return l;
    }

    // half_angle_rad is the cone half-angle; exponent sharpens the edge falloff.
    inline Light make_spot_light(
        const glm::vec3& position,
        const glm::vec3& direction,
        const glm::vec3& color,
        float range,
        float half_angle_rad,
        float exponent)
    {
        Light l = make_point_light(position, color, range);
        const float len = glm::length(direction);
        l.direction = len > 1e-6f ? direction / len : glm::vec3(0.0f, -1.0f, 0.0f);
        l.cutoff = std::cos(std::clamp(half_angle_rad, 0.0f, 3.14159265f));
        l.exponent = exponent;
        return l;
    }

    // Inert record used to keep a light storage buffer non-empty.
    inline Light make_placeholder_light()
    {
        return Light{};
    }
}
