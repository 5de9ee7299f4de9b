#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: rasterizer.hpp
    MODULE: render
    PURPOSE: Instanced software draw executor. Runs the vertex stage per instance,
             clips in homogeneous space, interpolates varyings perspective-correctly
             and runs the fragment stage per covered pixel. Fragment rows of one
             triangle are spread over the job system; every fragment writes only
             its own pixel.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "shadecore/core/log.hpp"
#include "shadecore/job/parallel_for.hpp"
#include "shadecore/resources/mesh.hpp"
#include "shadecore/shader/program.hpp"

namespace shadecore
{
    struct RasterizerConfig
    {
        RasterParams params{};
        IJobSystem* job_system = nullptr;
    };

    inline RasterizerConfig make_rasterizer_config(const ShadingConfig& cfg, IJobSystem* js = nullptr)
    {
        RasterizerConfig rc{};
        rc.params = cfg.raster;
        rc.job_system = js;
        return rc;
    }

    // depth may be null; the depth test is then skipped.
    struct RasterizerTarget
    {
        RT_ColorHDR* color = nullptr;
        RT_DepthBuffer* depth = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t instances = 0;
        uint64_t triangles_in = 0;
        uint64_t triangles_rasterized = 0;
        uint64_t fragments_shaded = 0;
        uint64_t fragments_discarded = 0;
        uint64_t fragments_written = 0;
    };

    namespace detail
    {
        struct ClipVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
            std::array<glm::vec4, SHADECORE_MAX_VARYINGS> varyings{};
            uint32_t varying_mask = 0u;
        };

        inline ClipVertex clip_vertex_from(const VertexOut& v)
        {
            return ClipVertex{v.clip, v.varyings, v.varying_mask};
        }

        inline ClipVertex lerp_clip_vertex(const ClipVertex& a, const ClipVertex& b, float t)
        {
            ClipVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.varying_mask = a.varying_mask | b.varying_mask;
            for (uint32_t i = 0; i < SHADECORE_MAX_VARYINGS; ++i) o.varyings[i] = glm::mix(a.varyings[i], b.varyings[i], t);
            return o;
        }

        // Signed distance of a clip-space vertex to one of the six frustum planes (>= 0 is inside).
        inline float frustum_plane_distance(const glm::vec4& c, int plane)
        {
            switch (plane)
            {
                case 0: return c.w + c.x;
                case 1: return c.w - c.x;
                case 2: return c.w + c.y;
                case 3: return c.w - c.y;
                case 4: return c.w + c.z;
                default: return c.w - c.z;
            }
        }

        // Sutherland-Hodgman against one plane.
        inline void clip_against_plane(const std::vector<ClipVertex>& in, std::vector<ClipVertex>& out, int plane)
        {
            out.clear();
            if (in.empty()) return;
            for (size_t i = 0; i < in.size(); ++i)
            {
                const ClipVertex& a = in[i];
                const ClipVertex& b = in[(i + 1) % in.size()];
                const float da = frustum_plane_distance(a.clip, plane);
                const float db = frustum_plane_distance(b.clip, plane);
                const bool a_in = da >= 0.0f;
                const bool b_in = db >= 0.0f;

                if (a_in != b_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_clip_vertex(a, b, da / denom));
                }
                if (b_in) out.push_back(b);
            }
        }

        inline bool inside_frustum(const glm::vec4& c)
        {
            if (!(c.w > 0.0f)) return false;
            return c.x >= -c.w && c.x <= c.w && c.y >= -c.w && c.y <= c.w && c.z >= -c.w && c.z <= c.w;
        }

        inline std::vector<ClipVertex> clip_triangle(const ClipVertex& a, const ClipVertex& b, const ClipVertex& c)
        {
            std::vector<ClipVertex> poly{a, b, c};
            if (inside_frustum(a.clip) && inside_frustum(b.clip) && inside_frustum(c.clip)) return poly;

            std::vector<ClipVertex> scratch{};
            scratch.reserve(9);
            poly.reserve(9);
            for (int plane = 0; plane < 6 && !poly.empty(); ++plane)
            {
                clip_against_plane(poly, scratch, plane);
                poly.swap(scratch);
            }
            return poly;
        }

        inline glm::vec4 blend_fragment(const glm::vec4& src, const glm::vec4& dst, RasterBlendMode mode)
        {
            switch (mode)
            {
                case RasterBlendMode::AlphaOver:
                {
                    const float a = std::clamp(src.a, 0.0f, 1.0f);
                    return glm::vec4(glm::vec3(src) * a + glm::vec3(dst) * (1.0f - a), a + dst.a * (1.0f - a));
                }
                case RasterBlendMode::PremultipliedOver:
                {
                    const float a = std::clamp(src.a, 0.0f, 1.0f);
                    return src + dst * (1.0f - a);
                }
                case RasterBlendMode::Replace:
                default:
                    return src;
            }
        }

        // Tie-break for pixel centers exactly on an edge: of the two triangles sharing
        // the edge, only the one whose inward normal points +x (or +y when vertical) owns it.
        inline bool edge_owns_ties(const glm::vec2& a, const glm::vec2& b, const glm::vec2& opposite)
        {
            const glm::vec2 e = b - a;
            glm::vec2 n{e.y, -e.x};
            if (glm::dot(n, opposite - a) < 0.0f) n = -n;
            return n.x > 0.0f || (n.x == 0.0f && n.y > 0.0f);
        }

        inline bool covers(float w, bool owns_ties)
        {
            return w > 0.0f || (w == 0.0f && owns_ties);
        }

        inline ShaderVertex read_vertex(const MeshData& mesh, uint32_t idx)
        {
            ShaderVertex v{};
            v.position = mesh.positions[(size_t)idx];
            if (idx < mesh.normals.size()) v.normal = mesh.normals[(size_t)idx];
            if (idx < mesh.uvs.size()) v.uv = mesh.uvs[(size_t)idx];
            return v;
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-12f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        return glm::vec3(1.0f - v - w, v, w);
    }

    // Pixel (x, y) covers NDC [-1,1] with row 0 at NDC y = -1; pixel centers sit at +0.5.
    inline RasterizerStats draw_instanced(
        const MeshData& mesh,
        std::span<const InstanceInput> instances,
        const ShaderProgram& program,
        const DrawBindings& bindings,
        RasterizerTarget target,
        const RasterizerConfig& config = {})
    {
        RasterizerStats stats{};
        if (!program.valid())
        {
            log_warn(std::string("draw_instanced: program '") + program.name + "' has no vertex/fragment stage");
            return stats;
        }
        if (!target.color || target.color->w <= 0 || target.color->h <= 0)
        {
            log_warn("draw_instanced: empty color target");
            return stats;
        }
        if (mesh.empty() || instances.empty()) return stats;

        const int W = target.color->w;
        const int H = target.color->h;
        RT_DepthBuffer* depth = target.depth;
        if (depth && (depth->w != W || depth->h != H))
        {
            log_warn("draw_instanced: depth target size mismatch, depth test disabled");
            depth = nullptr;
        }
        const RasterParams& rp = config.params;
        const bool depth_test = depth && rp.depth_test;
        const bool depth_write = depth && rp.depth_write;

        std::atomic<uint64_t> shaded{0};
        std::atomic<uint64_t> discarded{0};
        std::atomic<uint64_t> written{0};

        const size_t tri_count = mesh.indices.size() / 3;
        for (const InstanceInput& inst : instances)
        {
            stats.instances++;

            // Each mesh vertex runs through the vertex stage once per instance.
            std::vector<VertexOut> vout(mesh.positions.size());
            for (size_t i = 0; i < mesh.positions.size(); ++i)
            {
                vout[i] = program.vs(detail::read_vertex(mesh, (uint32_t)i), inst, bindings);
            }

            for (size_t ti = 0; ti < tri_count; ++ti)
            {
                stats.triangles_in++;
                const uint32_t i0 = mesh.indices[ti * 3 + 0];
                const uint32_t i1 = mesh.indices[ti * 3 + 1];
                const uint32_t i2 = mesh.indices[ti * 3 + 2];
                if (i0 >= vout.size() || i1 >= vout.size() || i2 >= vout.size()) continue;

                const std::vector<detail::ClipVertex> poly = detail::clip_triangle(
                    detail::clip_vertex_from(vout[i0]),
                    detail::clip_vertex_from(vout[i1]),
                    detail::clip_vertex_from(vout[i2]));
                if (poly.size() < 3) continue;

                for (size_t k = 1; k + 1 < poly.size(); ++k)
                {
                    const detail::ClipVertex* tri[3] = {&poly[0], &poly[k], &poly[k + 1]};

                    glm::vec2 s[3]{};
                    float inv_w[3]{};
                    float z_ndc[3]{};
                    bool finite = true;
                    for (int j = 0; j < 3; ++j)
                    {
                        const glm::vec4& c = tri[j]->clip;
                        inv_w[j] = 1.0f / c.w;
                        const glm::vec3 ndc = glm::vec3(c) * inv_w[j];
                        if (!std::isfinite(ndc.x) || !std::isfinite(ndc.y) || !std::isfinite(ndc.z)) finite = false;
                        s[j] = glm::vec2((ndc.x * 0.5f + 0.5f) * (float)W, (ndc.y * 0.5f + 0.5f) * (float)H);
                        z_ndc[j] = ndc.z;
                    }
                    if (!finite) continue;

                    const glm::vec2 e0 = s[1] - s[0];
                    const glm::vec2 e1 = s[2] - s[0];
                    const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
                    if (std::abs(signed_area2) < 1e-12f) continue;
                    const bool is_front = (signed_area2 > 0.0f) == rp.front_face_ccw;
                    if (rp.cull_mode == RasterCullMode::Back && !is_front) continue;
                    if (rp.cull_mode == RasterCullMode::Front && is_front) continue;

                    const int minx = std::max(0, (int)std::floor(std::min({s[0].x, s[1].x, s[2].x})));
                    const int maxx = std::min(W - 1, (int)std::ceil(std::max({s[0].x, s[1].x, s[2].x})));
                    const int miny = std::max(0, (int)std::floor(std::min({s[0].y, s[1].y, s[2].y})));
                    const int maxy = std::min(H - 1, (int)std::ceil(std::max({s[0].y, s[1].y, s[2].y})));
                    if (minx > maxx || miny > maxy) continue;
                    stats.triangles_rasterized++;

                    const bool owns[3] = {
                        detail::edge_owns_ties(s[1], s[2], s[0]),
                        detail::edge_owns_ties(s[2], s[0], s[1]),
                        detail::edge_owns_ties(s[0], s[1], s[2])
                    };
                    const uint32_t mask = tri[0]->varying_mask | tri[1]->varying_mask | tri[2]->varying_mask;
                    // Varyings pre-divided by w for perspective-correct interpolation.
                    std::array<std::array<glm::vec4, SHADECORE_MAX_VARYINGS>, 3> var_w{};
                    for (int j = 0; j < 3; ++j)
                    {
                        for (uint32_t i = 0; i < SHADECORE_MAX_VARYINGS; ++i)
                        {
                            if ((mask & varying_bit(i)) == 0u) continue;
                            var_w[j][i] = tri[j]->varyings[i] * inv_w[j];
                        }
                    }

                    auto shade_rows = [&](int yb, int ye)
                    {
                        uint64_t local_shaded = 0;
                        uint64_t local_discarded = 0;
                        uint64_t local_written = 0;
                        for (int y = yb; y < ye; ++y)
                        {
                            for (int x = minx; x <= maxx; ++x)
                            {
                                const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                                const glm::vec3 bc = barycentric_2d(p, s[0], s[1], s[2]);
                                if (!detail::covers(bc.x, owns[0]) || !detail::covers(bc.y, owns[1]) || !detail::covers(bc.z, owns[2])) continue;

                                const float z = bc.x * z_ndc[0] + bc.y * z_ndc[1] + bc.z * z_ndc[2];
                                const float z01 = std::clamp(z * 0.5f + 0.5f, 0.0f, 1.0f);
                                if (depth_test && z01 >= depth->depth.at(x, y)) continue;

                                const float denom = bc.x * inv_w[0] + bc.y * inv_w[1] + bc.z * inv_w[2];
                                if (!(std::abs(denom) > 1e-12f)) continue;
                                const float inv_denom = 1.0f / denom;

                                FragmentIn fin{};
                                fin.varying_mask = mask;
                                for (uint32_t i = 0; i < SHADECORE_MAX_VARYINGS; ++i)
                                {
                                    if ((mask & varying_bit(i)) == 0u) continue;
                                    fin.varyings[i] = (bc.x * var_w[0][i] + bc.y * var_w[1][i] + bc.z * var_w[2][i]) * inv_denom;
                                }
                                fin.depth01 = z01;
                                fin.px = x;
                                fin.py = y;

                                ++local_shaded;
                                const FragmentOut fout = program.fs(fin, inst, bindings);
                                if (fout.discard)
                                {
                                    ++local_discarded;
                                    continue;
                                }

                                ColorF& dst = target.color->color.at(x, y);
                                dst = to_color_f(detail::blend_fragment(to_vec4(fout.color), to_vec4(dst), rp.blend));
                                if (depth_write) depth->depth.at(x, y) = z01;
                                ++local_written;
                            }
                        }
                        shaded.fetch_add(local_shaded, std::memory_order_relaxed);
                        discarded.fetch_add(local_discarded, std::memory_order_relaxed);
                        written.fetch_add(local_written, std::memory_order_relaxed);
                    };

                    const int rows = maxy - miny + 1;
                    const int min_rows = (int)std::max<uint32_t>(1u, rp.parallel_min_rows);
                    if (config.job_system && rows >= min_rows)
                    {
                        parallel_for_1d(config.job_system, miny, maxy + 1, min_rows / 2 + 1, shade_rows);
                    }
                    else
                    {
                        shade_rows(miny, maxy + 1);
                    }
                }
            }
        }

        stats.fragments_shaded = shaded.load();
        stats.fragments_discarded = discarded.load();
        stats.fragments_written = written.load();
        return stats;
    }

    inline RasterizerStats draw_instanced(
        const MeshData& mesh,
        const std::vector<InstanceInput>& instances,
        const ShaderProgram& program,
        const DrawBindings& bindings,
        RasterizerTarget target,
        const RasterizerConfig& config = {})
    {
        return draw_instanced(mesh, std::span<const InstanceInput>(instances), program, bindings, target, config);
    }
}
