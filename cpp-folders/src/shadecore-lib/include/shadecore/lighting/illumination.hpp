#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: illumination.hpp
    MODULE: lighting
    PURPOSE: Multi-light illumination accumulator: Lambertian diffuse from every active
             light with linear range falloff and a soft spotlight cone, plus ambient.
             The Blinn-Phong specular term is an opt-in extension and is off by default.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "shadecore/core/shading_math.hpp"
#include "shadecore/lighting/light_types.hpp"

namespace shadecore
{
    struct SpecularExtension
    {
        bool enabled = false;
        float shininess = 32.0f;
        float strength = 0.25f;
    };

    struct SurfacePoint
    {
        glm::vec3 world_pos{0.0f};
        glm::vec3 world_normal{0.0f, 1.0f, 0.0f};
    };

    // Linear falloff reaching exactly zero at range. A non-positive range lights nothing.
    inline float eval_distance_attenuation(const Light& light, float distance)
    {
        if (!(light.range > 0.0f)) return 0.0f;
        if (distance >= light.range) return 0.0f;
        return saturate(1.0f - distance / light.range);
    }

    // to_light_dir points from the surface to the light (unit length).
    // Points on the cone boundary (spot_cos == cutoff) receive nothing.
    inline float eval_spot_attenuation(const Light& light, const glm::vec3& to_light_dir)
    {
        if (!light.has_cone()) return 1.0f;

        const glm::vec3 axis = normalize_or(light.direction, glm::vec3(0.0f, -1.0f, 0.0f));
        const float spot_cos = glm::dot(-to_light_dir, axis);
        if (spot_cos <= light.cutoff) return 0.0f;

        const float t = saturate((spot_cos - light.cutoff) / (1.0f - light.cutoff));
        return safe_pow(t, light.exponent);
    }

    struct LightSample
    {
        glm::vec3 diffuse{0.0f};
        glm::vec3 specular{0.0f};
    };

    inline LightSample sample_light(
        const Light& light,
        const SurfacePoint& surface,
        const glm::vec3& N,
        const glm::vec3& view_position,
        const SpecularExtension& specular)
    {
        LightSample out{};

        const glm::vec3 to_light = light.position - surface.world_pos;
        const float distance = glm::length(to_light);
        if (!(distance > 0.0f)) return out;
        const glm::vec3 L = to_light / distance;

        const float atten_d = eval_distance_attenuation(light, distance);
        if (atten_d <= 0.0f) return out;
        const float atten_s = eval_spot_attenuation(light, L);
        if (atten_s <= 0.0f) return out;

        const float NdotL = glm::dot(N, L);
        if (NdotL <= 0.0f) return out;

        const glm::vec3 radiance = light.color * (atten_d * atten_s);
        out.diffuse = radiance * NdotL;

        if (specular.enabled)
        {
            const glm::vec3 V = normalize_or(view_position - surface.world_pos, N);
            const glm::vec3 H = normalize_or(L + V, N);
            const float NdotH = std::max(glm::dot(N, H), 0.0f);
            out.specular = radiance * (safe_pow(NdotH, specular.shininess) * std::max(specular.strength, 0.0f));
        }
        return out;
    }

    // Sum over lights[0, count) plus ambient. Unclamped: display clamping is the caller's job.
    inline glm::vec3 accumulate_illumination(
        const SurfacePoint& surface,
        const glm::vec3& view_position,
        const LightListView& lights,
        const SpecularExtension& specular = {})
    {
        glm::vec3 total{0.0f};

        // A zero normal cannot face any light; only ambient survives.
        const glm::vec3 N = normalize_or(surface.world_normal, glm::vec3(0.0f));
        if (glm::dot(N, N) > 0.0f)
        {
            const uint32_t n = lights.active_count();
            for (uint32_t i = 0; i < n; ++i)
            {
                const LightSample s = sample_light(lights.lights[i], surface, N, view_position, specular);
                total += s.diffuse + s.specular;
            }
        }

        return total + lights.ambient;
    }
}
