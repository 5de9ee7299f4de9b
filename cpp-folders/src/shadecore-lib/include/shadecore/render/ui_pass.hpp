#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: ui_pass.hpp
    MODULE: render
    PURPOSE: Draws laid-out UI instances in tree order with the screen-space camera,
             rebinding the element texture per instance.
*/


#include <vector>

#include "shadecore/render/rasterizer.hpp"
#include "shadecore/ui/ui_layout.hpp"

namespace shadecore
{
    inline void accumulate_stats(RasterizerStats& into, const RasterizerStats& s)
    {
        into.instances += s.instances;
        into.triangles_in += s.triangles_in;
        into.triangles_rasterized += s.triangles_rasterized;
        into.fragments_shaded += s.fragments_shaded;
        into.fragments_discarded += s.fragments_discarded;
        into.fragments_written += s.fragments_written;
    }

    inline RasterizerStats draw_ui_instances(
        const MeshData& quad,
        const std::vector<UiInstance>& elements,
        const ShaderProgram& program,
        DrawBindings bindings,
        RasterizerTarget target,
        const RasterizerConfig& config = {})
    {
        RasterizerStats total{};
        bindings.camera = make_screen_space_camera();
        for (const UiInstance& e : elements)
        {
            bindings.ui_texture.texture = e.texture;
            const RasterizerStats s = draw_instanced(
                quad, std::span<const InstanceInput>(&e.instance, 1), program, bindings, target, config);
            accumulate_stats(total, s);
        }
        return total;
    }
}
