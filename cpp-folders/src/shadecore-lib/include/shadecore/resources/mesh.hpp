#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: mesh.hpp
    MODULE: resources
    PURPOSE: Indexed vertex data in the fixed per-vertex layout (position, uv, normal)
             and the two meshes the shading programs are exercised with.
*/


#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace shadecore
{
    struct MeshData
    {
        std::string source_path{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec2> uvs{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        void clear()
        {
            positions.clear();
            normals.clear();
            uvs.clear();
            indices.clear();
        }
    };

    namespace detail
    {
        inline uint32_t add_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv)
        {
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            return (uint32_t)m.positions.size() - 1;
        }

        inline void add_quad(MeshData& m, const glm::vec3& origin, const glm::vec3& u, const glm::vec3& v, const glm::vec3& n)
        {
            const uint32_t i0 = add_vertex(m, origin, n, {0.0f, 1.0f});
            const uint32_t i1 = add_vertex(m, origin + u, n, {1.0f, 1.0f});
            const uint32_t i2 = add_vertex(m, origin + u + v, n, {1.0f, 0.0f});
            const uint32_t i3 = add_vertex(m, origin + v, n, {0.0f, 0.0f});
            m.indices.insert(m.indices.end(), {i0, i1, i2, i0, i2, i3});
        }
    }

    // Unit UI quad spanning [-1,1]^2. uv (0,0) is the top-left corner, so the SDF
    // renderer's top edge is uv.y == 0.
    inline MeshData make_ui_quad()
    {
        MeshData m{};
        m.source_path = "builtin:ui_quad";
        const glm::vec3 n{0.0f, 0.0f, 1.0f};
        detail::add_vertex(m, {-1.0f, -1.0f, 0.0f}, n, {0.0f, 1.0f});
        detail::add_vertex(m, { 1.0f, -1.0f, 0.0f}, n, {1.0f, 1.0f});
        detail::add_vertex(m, {-1.0f,  1.0f, 0.0f}, n, {0.0f, 0.0f});
        detail::add_vertex(m, { 1.0f,  1.0f, 0.0f}, n, {1.0f, 0.0f});
        m.indices = {0, 1, 2, 1, 3, 2};
        return m;
    }

    inline MeshData make_box(const glm::vec3& size = glm::vec3(1.0f))
    {
        MeshData m{};
        m.source_path = "builtin:box";
        const glm::vec3 h = size * 0.5f;

        detail::add_quad(m, { h.x, -h.y,  h.z}, {0, 0, -size.z}, {0, size.y, 0}, { 1, 0, 0});
        detail::add_quad(m, {-h.x, -h.y, -h.z}, {0, 0,  size.z}, {0, size.y, 0}, {-1, 0, 0});
        detail::add_quad(m, {-h.x,  h.y,  h.z}, {size.x, 0, 0}, {0, 0, -size.z}, {0,  1, 0});
        detail::add_quad(m, {-h.x, -h.y, -h.z}, {size.x, 0, 0}, {0, 0,  size.z}, {0, -1, 0});
        detail::add_quad(m, {-h.x, -h.y,  h.z}, {size.x, 0, 0}, {0, size.y, 0}, {0, 0,  1});
        detail::add_quad(m, { h.x, -h.y, -h.z}, {-size.x, 0, 0}, {0, size.y, 0}, {0, 0, -1});
        return m;
    }
}
