#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: builtin_programs.hpp
    MODULE: shader
    PURPOSE: The two shading pipelines: lit material surfaces (transformer ->
             illumination -> material) and UI shapes (transformer -> rounded-rect SDF).
*/


#include <glm/glm.hpp>

#include "shadecore/geometry/vertex_transform.hpp"
#include "shadecore/lighting/illumination.hpp"
#include "shadecore/material/material_eval.hpp"
#include "shadecore/shader/program.hpp"
#include "shadecore/ui/rounded_rect.hpp"

namespace shadecore
{
    namespace detail
    {
        inline const MaterialData& default_material()
        {
            static const MaterialData m{};
            return m;
        }

        // Instances without explicit normal rows reuse the model's 3x3.
        inline NormalRows normal_rows_or_basis(const InstanceInput& inst)
        {
            if (inst.has_normal_matrix) return inst.normal_rows;
            return NormalRows{
                glm::vec3(inst.model_rows[0]),
                glm::vec3(inst.model_rows[1]),
                glm::vec3(inst.model_rows[2])
            };
        }
    }

    inline VertexOut make_lit_vertex_out(const ShaderVertex& vin, const InstanceInput& inst, const DrawBindings& b)
    {
        const TransformedVertex tv = transform_lit_vertex(
            b.camera, inst.model_rows, detail::normal_rows_or_basis(inst), vin.position, vin.uv, vin.normal);

        VertexOut o{};
        o.clip = tv.clip;
        set_varying(o, VaryingSemantic::WorldPos, glm::vec4(tv.world_pos, 1.0f));
        set_varying(o, VaryingSemantic::NormalWS, glm::vec4(tv.world_normal, 0.0f));
        set_varying(o, VaryingSemantic::UV0, glm::vec4(tv.uv, 0.0f, 0.0f));
        return o;
    }

    inline FragmentOut shade_lit_fragment(const FragmentIn& fin, const InstanceInput&, const DrawBindings& b)
    {
        SurfacePoint surface{};
        surface.world_pos = glm::vec3(get_varying(fin, VaryingSemantic::WorldPos));
        surface.world_normal = glm::vec3(get_varying(fin, VaryingSemantic::NormalWS));
        const glm::vec2 uv = glm::vec2(get_varying(fin, VaryingSemantic::UV0));

        const glm::vec3 illumination = accumulate_illumination(surface, b.camera.eye(), b.lights, b.specular);

        const MaterialData& material = b.material.material ? *b.material.material : detail::default_material();
        const MaterialShade shade = evaluate_material(material, sample_material(b.material, uv), illumination);

        FragmentOut o{};
        o.discard = shade.discard;
        o.color = to_color_f(shade.color);
        return o;
    }

    inline ShaderProgram make_lit_material_program()
    {
        ShaderProgram p{};
        p.name = "lit_material";
        p.vs = make_lit_vertex_out;
        p.fs = shade_lit_fragment;
        return p;
    }

    inline VertexOut make_ui_vertex_out(const ShaderVertex& vin, const InstanceInput& inst, const DrawBindings& b)
    {
        const TransformedVertex tv = transform_ui_vertex(b.camera, inst.model_rows, vin.position, vin.uv);
        VertexOut o{};
        o.clip = tv.clip;
        set_varying(o, VaryingSemantic::UV0, glm::vec4(tv.uv, 0.0f, 0.0f));
        return o;
    }

    // Shape parameters as the instance flags enable them.
    inline RoundedRectShape shape_from_instance(const InstanceInput& inst)
    {
        RoundedRectShape s{};
        s.corner_radii = inst.flag(InstanceFlag::Round) ? inst.corner_radii : glm::vec4(0.0f);
        s.border_widths = inst.flag(InstanceFlag::Border) ? inst.border_widths : glm::vec4(0.0f);
        s.extent = inst.extent;
        return s;
    }

    inline FragmentOut shade_ui_fragment(
        const FragmentIn& fin,
        const InstanceInput& inst,
        const DrawBindings& b,
        ShapeOutputMode mode)
    {
        const glm::vec2 uv = glm::vec2(get_varying(fin, VaryingSemantic::UV0));

        glm::vec4 fill = inst.color;
        if (inst.flag(InstanceFlag::DrawTexture)) fill *= sample_rgba(b.ui_texture, uv);

        const RoundedRectSample sample = evaluate_rounded_rect(shape_from_instance(inst), uv);
        const ShapeShade shade = shade_rounded_rect(sample, fill, inst.border_color, mode, b.ui);

        FragmentOut o{};
        o.discard = shade.discard;
        o.color = to_color_f(shade.color);
        return o;
    }

    inline ShaderProgram make_ui_shape_program(ShapeOutputMode mode)
    {
        ShaderProgram p{};
        p.name = shape_output_mode_name(mode);
        p.vs = make_ui_vertex_out;
        p.fs = [mode](const FragmentIn& fin, const InstanceInput& inst, const DrawBindings& b) -> FragmentOut {
            return shade_ui_fragment(fin, inst, b, mode);
        };
        return p;
    }
}
