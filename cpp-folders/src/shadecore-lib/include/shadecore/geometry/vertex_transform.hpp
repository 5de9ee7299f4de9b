#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: vertex_transform.hpp
    MODULE: geometry
    PURPOSE: Per-vertex contract shared by every shading program: model rows and the
             camera view-projection give the clip position; lit geometry also gets
             world position and a normal carried through the normal-matrix rows.
             No validation: degenerate matrices are the producer's responsibility.
*/


#include <glm/glm.hpp>

#include "shadecore/camera/camera_uniform.hpp"
#include "shadecore/geometry/instance_transform.hpp"

namespace shadecore
{
    struct TransformedVertex
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec3 world_pos{0.0f};
        // Not renormalized here; the fragment stage normalizes after interpolation.
        glm::vec3 world_normal{0.0f, 0.0f, 1.0f};
        glm::vec2 uv{0.0f};
    };

    inline TransformedVertex transform_lit_vertex(
        const CameraUniform& camera,
        const ModelRows& model_rows,
        const NormalRows& normal_rows,
        const glm::vec3& position,
        const glm::vec2& uv,
        const glm::vec3& normal)
    {
        TransformedVertex out{};
        const glm::vec4 world = model_from_rows(model_rows) * glm::vec4(position, 1.0f);
        out.world_pos = glm::vec3(world);
        out.clip = camera.view_projection * world;
        out.world_normal = normal_from_rows(normal_rows) * normal;
        out.uv = uv;
        return out;
    }

    // UI surfaces only need clip position and uv.
    inline TransformedVertex transform_ui_vertex(
        const CameraUniform& camera,
        const ModelRows& model_rows,
        const glm::vec3& position,
        const glm::vec2& uv)
    {
        TransformedVertex out{};
        const glm::vec4 world = model_from_rows(model_rows) * glm::vec4(position, 1.0f);
        out.world_pos = glm::vec3(world);
        out.clip = camera.view_projection * world;
        out.uv = uv;
        return out;
    }
}
