#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: rt_types.hpp
    MODULE: gfx
    PURPOSE: CPU render targets the software draw executor writes into:
             HDR color, depth, and an 8-bit resolve target for presentation.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace shadecore
{
    struct Color
    {
        uint8_t r, g, b, a;
    };

    struct ColorF
    {
        float r, g, b, a;
    };

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = std::max(W, 0);
            h = std::max(H, 0);
            data.assign((size_t)w * (size_t)h, clear);
        }

        void clear(const TPixel& clear_value)
        {
            std::fill(data.begin(), data.end(), clear_value);
        }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }
    };

    struct RT_ColorHDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 0.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(ColorF c = {0.0f, 0.0f, 0.0f, 0.0f}) { color.clear(c); }
    };

    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int W, int H) : w(W), h(H), depth(W, H, 1.0f) {}

        void clear(float d = 1.0f) { depth.clear(d); }
    };

    struct RT_ColorLDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int W, int H, Color clear = {0, 0, 0, 255}) : w(W), h(H), color(W, H, clear) {}

        void clear(Color c = {0, 0, 0, 255}) { color.clear(c); }
    };

    inline uint8_t encode_unorm8(float v)
    {
        const float c = std::clamp(v, 0.0f, 1.0f);
        return (uint8_t)std::lround(c * 255.0f);
    }

    // Clamp + gamma resolve. Illumination is unclamped HDR, display clamping happens here.
    inline void resolve_to_ldr(const RT_ColorHDR& src, RT_ColorLDR& dst, float gamma = 2.2f)
    {
        if (src.w != dst.w || src.h != dst.h) return;
        const float inv_gamma = gamma > 0.0f ? 1.0f / gamma : 1.0f;
        for (int y = 0; y < src.h; ++y)
        {
            for (int x = 0; x < src.w; ++x)
            {
                const ColorF c = src.color.at(x, y);
                dst.color.at(x, y) = Color{
                    encode_unorm8(std::pow(std::max(c.r, 0.0f), inv_gamma)),
                    encode_unorm8(std::pow(std::max(c.g, 0.0f), inv_gamma)),
                    encode_unorm8(std::pow(std::max(c.b, 0.0f), inv_gamma)),
                    encode_unorm8(c.a)
                };
            }
        }
    }
}
