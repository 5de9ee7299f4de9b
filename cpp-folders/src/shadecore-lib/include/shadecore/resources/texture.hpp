#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: texture.hpp
    MODULE: resources
    PURPOSE: CPU texture storage plus the sampler state a material or UI binding pairs with it.
             An unbound texture (nullptr) samples as opaque white.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "shadecore/gfx/rt_types.hpp"

namespace shadecore
{
    enum class SamplerWrap : uint8_t
    {
        Repeat = 0,
        ClampToEdge = 1
    };

    enum class SamplerFilter : uint8_t
    {
        Nearest = 0,
        Bilinear = 1
    };

    struct Sampler
    {
        SamplerWrap wrap = SamplerWrap::Repeat;
        SamplerFilter filter = SamplerFilter::Bilinear;
        // Texels are stored sRGB-encoded; rgb is linearized on fetch when set.
        bool srgb = true;
    };

    struct Texture2DData
    {
        std::string source_path{};
        int w = 0;
        int h = 0;
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, Color clear = {0, 0, 0, 255})
            : w(W), h(H), texels((size_t)W * (size_t)H, clear)
        {}

        bool valid() const
        {
            return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h;
        }

        Color& at(int x, int y)
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }

        const Color& at(int x, int y) const
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }
    };

    struct TextureBinding
    {
        const Texture2DData* texture = nullptr;
        Sampler sampler{};

        bool bound() const { return texture && texture->valid(); }
    };

    namespace detail
    {
        inline float srgb_channel_to_linear(uint8_t v)
        {
            return std::pow((float)v / 255.0f, 2.2f);
        }

        inline glm::vec4 fetch_texel(const Texture2DData& tex, int x, int y, bool srgb)
        {
            const Color c = tex.at(x, y);
            if (srgb)
            {
                return glm::vec4(
                    srgb_channel_to_linear(c.r),
                    srgb_channel_to_linear(c.g),
                    srgb_channel_to_linear(c.b),
                    (float)c.a / 255.0f);
            }
            return glm::vec4((float)c.r, (float)c.g, (float)c.b, (float)c.a) / 255.0f;
        }

        inline int wrap_coord(int i, int n, SamplerWrap wrap)
        {
            if (wrap == SamplerWrap::ClampToEdge) return std::clamp(i, 0, n - 1);
            const int m = i % n;
            return m < 0 ? m + n : m;
        }
    }

    inline glm::vec4 sample_rgba(const Texture2DData* tex, const Sampler& s, const glm::vec2& uv)
    {
        if (!tex || !tex->valid()) return glm::vec4(1.0f);
        if (!std::isfinite(uv.x) || !std::isfinite(uv.y)) return glm::vec4(1.0f);

        // Texel centers sit at (i + 0.5) / size.
        const float fx = uv.x * (float)tex->w - 0.5f;
        const float fy = uv.y * (float)tex->h - 0.5f;

        if (s.filter == SamplerFilter::Nearest)
        {
            const int x = detail::wrap_coord((int)std::floor(fx + 0.5f), tex->w, s.wrap);
            const int y = detail::wrap_coord((int)std::floor(fy + 0.5f), tex->h, s.wrap);
            return detail::fetch_texel(*tex, x, y, s.srgb);
        }

        const int x0i = (int)std::floor(fx);
        const int y0i = (int)std::floor(fy);
        const float tx = fx - (float)x0i;
        const float ty = fy - (float)y0i;
        const int x0 = detail::wrap_coord(x0i, tex->w, s.wrap);
        const int x1 = detail::wrap_coord(x0i + 1, tex->w, s.wrap);
        const int y0 = detail::wrap_coord(y0i, tex->h, s.wrap);
        const int y1 = detail::wrap_coord(y0i + 1, tex->h, s.wrap);

        const glm::vec4 c00 = detail::fetch_texel(*tex, x0, y0, s.srgb);
        const glm::vec4 c10 = detail::fetch_texel(*tex, x1, y0, s.srgb);
        const glm::vec4 c01 = detail::fetch_texel(*tex, x0, y1, s.srgb);
        const glm::vec4 c11 = detail::fetch_texel(*tex, x1, y1, s.srgb);
        return glm::mix(glm::mix(c00, c10, tx), glm::mix(c01, c11, tx), ty);
    }

    inline glm::vec4 sample_rgba(const TextureBinding& binding, const glm::vec2& uv)
    {
        return sample_rgba(binding.texture, binding.sampler, uv);
    }
}
