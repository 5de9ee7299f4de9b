#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: rounded_rect.hpp
    MODULE: ui
    PURPOSE: Rounded-rectangle / border signed field for UI surfaces and its three
             consumption modes (hard discard, anti-aliased border blend, raw mask).

    Conventions:
      - p is the surface coordinate in [0,1]^2, x to the right, y downward (v of the UI quad).
      - extent d scales p into shape space; radii and border widths are in shape-space units.
      - corner_radii  = (top_right, top_left, bottom_left, bottom_right)
      - border_widths = (top, bottom, right, left)
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "shadecore/core/shading_math.hpp"

namespace shadecore
{
    enum class ShapeOutputMode : uint8_t
    {
        Discard = 0,
        BorderBlend = 1,
        RawDistance = 2,
    };

    inline const char* shape_output_mode_name(ShapeOutputMode m)
    {
        switch (m)
        {
            case ShapeOutputMode::Discard: return "discard";
            case ShapeOutputMode::BorderBlend: return "border_blend";
            case ShapeOutputMode::RawDistance: return "raw_distance";
        }
        return "unknown";
    }

    enum class ShapeRegion : uint8_t
    {
        Degenerate = 0,
        Corner = 1,
        Edge = 2,
    };

    struct RoundedRectShape
    {
        glm::vec4 corner_radii{0.0f};
        glm::vec4 border_widths{0.0f};
        glm::vec2 extent{1.0f, 1.0f};
    };

    struct RoundedRectSample
    {
        // Positive inside, <= 0 on or outside the boundary, never above 1.
        float edge_signal = 0.0f;
        // Where the border band ends on the edge_signal axis.
        float border_ratio = 0.0f;
        ShapeRegion region = ShapeRegion::Degenerate;
    };

    struct UiShapeParams
    {
        float edge_aa_band = 0.1f;
        float max_border_ratio = 0.99f;
    };

    struct ShapeShade
    {
        glm::vec4 color{0.0f};
        bool discard = false;
    };

    namespace detail
    {
        inline float finite_non_negative(float v)
        {
            return std::isfinite(v) ? std::max(v, 0.0f) : 0.0f;
        }

        // Margin scale at a square corner, as a fraction of the shorter side.
        constexpr float k_square_edge_scale = 0.05f;

        // Depth into the shape along one edge, expressed in units of scale.
        // Without a scale the edge is a hard step: any positive depth is fully inside.
        inline float edge_margin(float depth, float scale)
        {
            if (scale > 0.0f) return saturate(depth / scale);
            return depth > 0.0f ? 1.0f : 0.0f;
        }

        // Margin scale of a borderless edge at position t along it. The scale equals
        // each corner radius where that corner's arc ends and is linear in between,
        // so the field is continuous along the whole edge. Square corners use
        // square_scale instead of zero.
        inline float borderless_edge_scale(float t, float length, float r0, float r1, float square_scale)
        {
            const float s0 = r0 > 0.0f ? r0 : square_scale;
            const float s1 = r1 > 0.0f ? r1 : square_scale;
            const float a = r0;
            const float b = length - r1;
            if (b <= a) return 0.5f * (s0 + s1);
            return glm::mix(s0, s1, saturate((t - a) / (b - a)));
        }
    }

    // Radii are clamped to half the shorter side so opposing corners never overlap.
    inline glm::vec4 clamp_corner_radii(const glm::vec4& radii, const glm::vec2& extent)
    {
        const float limit = 0.5f * std::min(detail::finite_non_negative(extent.x), detail::finite_non_negative(extent.y));
        glm::vec4 out{};
        for (int i = 0; i < 4; ++i) out[i] = std::min(detail::finite_non_negative(radii[i]), limit);
        return out;
    }

    inline RoundedRectSample evaluate_rounded_rect(const RoundedRectShape& shape, const glm::vec2& p)
    {
        RoundedRectSample out{};

        const glm::vec2 d{
            detail::finite_non_negative(shape.extent.x),
            detail::finite_non_negative(shape.extent.y)
        };
        if (d.x <= 0.0f || d.y <= 0.0f || !std::isfinite(p.x) || !std::isfinite(p.y)) return out;

        const glm::vec4 r = clamp_corner_radii(shape.corner_radii, d);
        const float b_top = detail::finite_non_negative(shape.border_widths.x);
        const float b_bottom = detail::finite_non_negative(shape.border_widths.y);
        const float b_right = detail::finite_non_negative(shape.border_widths.z);
        const float b_left = detail::finite_non_negative(shape.border_widths.w);

        const glm::vec2 q = p * d;
        const bool left = q.x < 0.5f * d.x;
        const bool top = q.y < 0.5f * d.y;

        // Quadrant corner, its radius, and the borders of the two edges meeting there.
        float radius = 0.0f;
        glm::vec2 corner{0.0f};
        float corner_border = 0.0f;
        if (top && !left)       { radius = r.x; corner = glm::vec2(d.x, 0.0f); corner_border = std::max(b_top, b_right); }
        else if (top && left)   { radius = r.y; corner = glm::vec2(0.0f, 0.0f); corner_border = std::max(b_top, b_left); }
        else if (!top && left)  { radius = r.z; corner = glm::vec2(0.0f, d.y); corner_border = std::max(b_bottom, b_left); }
        else                    { radius = r.w; corner = glm::vec2(d.x, d.y); corner_border = std::max(b_bottom, b_right); }

        if (radius > 0.0f)
        {
            const glm::vec2 inward{left ? 1.0f : -1.0f, top ? 1.0f : -1.0f};
            const glm::vec2 center = corner + inward * radius;
            // Radius box: the square between the corner and its circle center.
            const glm::vec2 rel = (q - center) * inward;
            if (rel.x < 0.0f && rel.y < 0.0f)
            {
                out.region = ShapeRegion::Corner;
                out.edge_signal = 1.0f - glm::length(q - center) / radius;
                out.border_ratio = corner_border / radius;
                return out;
            }
        }

        // Flat edges: each edge margin uses its own border width. A borderless edge
        // blends between its two corner radii, so it meets both arcs without a seam.
        const float square_scale = detail::k_square_edge_scale * std::min(d.x, d.y);
        struct EdgeTerm { float depth; float width; float along; float length; float r0; float r1; };
        const EdgeTerm edges[4] = {
            { q.y,       b_top,    q.x, d.x, r.y, r.x },
            { q.x,       b_left,   q.y, d.y, r.y, r.z },
            { d.y - q.y, b_bottom, q.x, d.x, r.z, r.w },
            { d.x - q.x, b_right,  q.y, d.y, r.x, r.w },
        };

        float best = 2.0f;
        float best_ratio = 0.0f;
        for (const EdgeTerm& e : edges)
        {
            const float scale = e.width > 0.0f
                ? e.width
                : detail::borderless_edge_scale(e.along, e.length, e.r0, e.r1, square_scale);
            const float m = detail::edge_margin(e.depth, scale);
            if (m < best)
            {
                best = m;
                best_ratio = e.width > 0.0f ? 1.0f : 0.0f;
            }
        }

        out.region = ShapeRegion::Edge;
        out.edge_signal = best;
        out.border_ratio = best_ratio;
        return out;
    }

    // Pure field-to-color mapping; the caller picks the mode.
    inline ShapeShade shade_rounded_rect(
        const RoundedRectSample& sample,
        const glm::vec4& fill_color,
        const glm::vec4& border_color,
        ShapeOutputMode mode,
        const UiShapeParams& params = {})
    {
        ShapeShade out{};
        const float s = sample.edge_signal;

        switch (mode)
        {
            case ShapeOutputMode::Discard:
            {
                if (!(s > 0.0f))
                {
                    out.discard = true;
                    return out;
                }
                out.color = fill_color;
                return out;
            }
            case ShapeOutputMode::RawDistance:
            {
                const float v = std::isfinite(s) ? std::clamp(s, 0.0f, 1.0f) : 0.0f;
                out.color = glm::vec4(v, v, v, 1.0f);
                return out;
            }
            case ShapeOutputMode::BorderBlend:
            default:
            {
                const float band = std::max(params.edge_aa_band, 0.0f);
                const float ratio = std::clamp(sample.border_ratio, 0.0f, std::max(params.max_border_ratio, 0.0f));

                // The outer ramp never runs past the border band, so s == ratio is always pure fill.
                const float outer_hi = ratio > 0.0f ? std::min(band, ratio) : band;
                const float outer = smoothstep(0.0f, outer_hi, s);
                const float inner = smoothstep(std::max(ratio - band, 0.0f), ratio, s);

                out.color = glm::mix(border_color, fill_color, inner) * outer;
                return out;
            }
        }
    }
}
