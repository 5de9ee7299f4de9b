#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: texture_loader_sdl.hpp
    MODULE: resources
    PURPOSE: Imports an image file into Texture2DData through SDL2_image so it can be
             bound into a material or UI texture slot.
*/


#include <cstdint>
#include <string>
#include <utility>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "shadecore/core/result.hpp"
#include "shadecore/resources/texture.hpp"

namespace shadecore
{
    // Row 0 of the result is the top image row, matching uv.y == 0 at the top.
    inline Result<Texture2DData> load_texture2d_sdl_image(const std::string& path)
    {
        SDL_Surface* loaded = IMG_Load(path.c_str());
        if (!loaded)
        {
            return Result<Texture2DData>::failure("IMG_Load failed for '" + path + "': " + IMG_GetError());
        }

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba)
        {
            return Result<Texture2DData>::failure("RGBA conversion failed for '" + path + "': " + SDL_GetError());
        }

        Texture2DData out{rgba->w, rgba->h, Color{0, 0, 0, 0}};
        out.source_path = path;

        if (SDL_MUSTLOCK(rgba) && SDL_LockSurface(rgba) != 0)
        {
            SDL_FreeSurface(rgba);
            return Result<Texture2DData>::failure("surface lock failed for '" + path + "'");
        }

        const auto* pixels = static_cast<const uint8_t*>(rgba->pixels);
        for (int y = 0; y < out.h; ++y)
        {
            const auto* row = reinterpret_cast<const uint32_t*>(pixels + (size_t)y * (size_t)rgba->pitch);
            for (int x = 0; x < out.w; ++x)
            {
                uint8_t r = 0, g = 0, b = 0, a = 0;
                SDL_GetRGBA(row[x], rgba->format, &r, &g, &b, &a);
                out.at(x, y) = Color{r, g, b, a};
            }
        }

        if (SDL_MUSTLOCK(rgba)) SDL_UnlockSurface(rgba);
        SDL_FreeSurface(rgba);
        return Result<Texture2DData>::success(std::move(out));
    }
}
