#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: shading_math.hpp
    MODULE: core
    PURPOSE: Scalar/vector helpers shared by the vertex and fragment stages.
             Every helper returns a finite value for degenerate input.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace shadecore
{
    inline float saturate(float x)
    {
        return std::clamp(x, 0.0f, 1.0f);
    }

    // Hermite step. edge1 <= edge0 degenerates to a hard step at edge1.
    inline float smoothstep(float edge0, float edge1, float x)
    {
        if (!(edge1 > edge0)) return x >= edge1 ? 1.0f : 0.0f;
        const float t = saturate((x - edge0) / (edge1 - edge0));
        return t * t * (3.0f - 2.0f * t);
    }

    inline glm::vec3 normalize_or(const glm::vec3& v, const glm::vec3& fallback)
    {
        const float len2 = glm::dot(v, v);
        if (len2 <= 1e-12f) return fallback;
        return v * (1.0f / std::sqrt(len2));
    }

    // pow() restricted to a non-negative base; 0^0 is defined as 1.
    inline float safe_pow(float base, float exponent)
    {
        const float b = std::max(base, 0.0f);
        if (exponent <= 0.0f) return 1.0f;
        if (b <= 0.0f) return 0.0f;
        return std::pow(b, exponent);
    }
}
