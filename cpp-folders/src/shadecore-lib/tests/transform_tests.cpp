#include <cmath>
#include <cstdio>

#include <glm/glm.hpp>

#include "shadecore/camera/camera_uniform.hpp"
#include "shadecore/geometry/instance_transform.hpp"
#include "shadecore/geometry/vertex_transform.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_eq(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    bool approx_eq(const glm::vec4& a, const glm::vec4& b, float eps = 1e-4f)
    {
        return approx_eq(glm::vec3(a), glm::vec3(b), eps) && approx_eq(a.w, b.w, eps);
    }

    bool test_packed_rows_are_glm_columns()
    {
        shadecore::Transform t{};
        t.position = glm::vec3(5.0f, 6.0f, 7.0f);
        const shadecore::ModelRows rows = shadecore::pack_model_rows(t.to_mat());
        if (rows[3] != glm::vec4(5.0f, 6.0f, 7.0f, 1.0f)) return false;
        if (rows[0] != glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)) return false;
        return shadecore::model_from_rows(rows) == t.to_mat();
    }

    bool test_translate_rotate_scale_order()
    {
        shadecore::Transform t{};
        t.position = glm::vec3(1.0f, 2.0f, 3.0f);
        t.rotation = shadecore::quat_from_euler_deg_z(90.0f);
        t.scale = glm::vec3(2.0f, 1.0f, 1.0f);
        const shadecore::LitInstance inst = shadecore::make_lit_instance(t);

        const shadecore::CameraUniform cam = shadecore::make_screen_space_camera();
        const shadecore::TransformedVertex v = shadecore::transform_lit_vertex(
            cam, inst.model_rows, inst.normal_rows, glm::vec3(1.0f, 0.0f, 0.0f), glm::vec2(0.25f, 0.75f), glm::vec3(0.0f, 0.0f, 1.0f));

        // scale -> (2,0,0), rotate -> (0,2,0), translate -> (1,4,3)
        if (!approx_eq(v.world_pos, glm::vec3(1.0f, 4.0f, 3.0f))) return false;
        if (!approx_eq(v.clip, glm::vec4(1.0f, 4.0f, 3.0f, 1.0f))) return false;
        if (v.uv != glm::vec2(0.25f, 0.75f)) return false;
        return approx_eq(v.world_normal, glm::vec3(0.0f, 0.0f, 1.0f));
    }

    bool test_normal_matrix_under_non_uniform_scale()
    {
        shadecore::Transform t{};
        t.scale = glm::vec3(4.0f, 1.0f, 1.0f);
        const glm::mat4 model = t.to_mat();
        const shadecore::LitInstance inst = shadecore::make_lit_instance(model);

        // Surface spanned by tangent (1,-1,0): object-space normal (1,1,0).
        const glm::vec3 n_obj = glm::normalize(glm::vec3(1.0f, 1.0f, 0.0f));
        const glm::vec3 tangent_ws = glm::vec3(model * glm::vec4(1.0f, -1.0f, 0.0f, 0.0f));

        const shadecore::TransformedVertex v = shadecore::transform_lit_vertex(
            shadecore::make_screen_space_camera(), inst.model_rows, inst.normal_rows, glm::vec3(0.0f), glm::vec2(0.0f), n_obj);
        if (!approx_eq(glm::dot(glm::normalize(v.world_normal), glm::normalize(tangent_ws)), 0.0f)) return false;

        // The plain model basis would tilt the normal off the surface.
        const glm::vec3 naive = glm::mat3(model) * n_obj;
        return std::abs(glm::dot(glm::normalize(naive), glm::normalize(tangent_ws))) > 0.1f;
    }

    bool test_normal_is_not_renormalized()
    {
        shadecore::Transform t{};
        t.scale = glm::vec3(2.0f);
        const shadecore::LitInstance inst = shadecore::make_lit_instance(t);
        const shadecore::TransformedVertex v = shadecore::transform_lit_vertex(
            shadecore::make_screen_space_camera(), inst.model_rows, inst.normal_rows, glm::vec3(0.0f), glm::vec2(0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
        return approx_eq(v.world_normal, glm::vec3(0.0f, 0.0f, 0.5f));
    }

    bool test_singular_model_stays_finite()
    {
        shadecore::Transform t{};
        t.scale = glm::vec3(0.0f, 1.0f, 1.0f);
        const shadecore::NormalRows rows = shadecore::normal_rows_from_model(t.to_mat());
        for (const glm::vec3& r : rows)
        {
            if (!std::isfinite(r.x) || !std::isfinite(r.y) || !std::isfinite(r.z)) return false;
        }
        return true;
    }

    bool test_view_projection_applied()
    {
        shadecore::ViewCamera vc{};
        vc.pos = glm::vec3(0.0f, 0.0f, -3.0f);
        vc.target = glm::vec3(0.0f);
        const shadecore::CameraUniform cam = vc.make_uniform(1.0f);
        if (!approx_eq(cam.eye(), glm::vec3(0.0f, 0.0f, -3.0f))) return false;

        const shadecore::LitInstance inst{};
        const shadecore::TransformedVertex v = shadecore::transform_lit_vertex(
            cam, inst.model_rows, inst.normal_rows, glm::vec3(0.0f), glm::vec2(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        if (!approx_eq(v.clip.x, 0.0f) || !approx_eq(v.clip.y, 0.0f)) return false;
        if (!approx_eq(v.clip.w, 3.0f)) return false;
        const float ndc_z = v.clip.z / v.clip.w;
        if (!(ndc_z > -1.0f && ndc_z < 1.0f)) return false;

        // The UI path uses the same model * view-projection contract.
        const shadecore::TransformedVertex u = shadecore::transform_ui_vertex(cam, inst.model_rows, glm::vec3(0.0f), glm::vec2(0.5f));
        return approx_eq(u.clip, v.clip) && u.uv == glm::vec2(0.5f);
    }
}

int main()
{
    const bool ok_rows = test_packed_rows_are_glm_columns();
    const bool ok_trs = test_translate_rotate_scale_order();
    const bool ok_normal = test_normal_matrix_under_non_uniform_scale();
    const bool ok_raw_normal = test_normal_is_not_renormalized();
    const bool ok_singular = test_singular_model_stays_finite();
    const bool ok_vp = test_view_projection_applied();

    if (!ok_rows) std::fprintf(stderr, "[transform-tests] packed model rows layout wrong\n");
    if (!ok_trs) std::fprintf(stderr, "[transform-tests] translate/rotate/scale order wrong\n");
    if (!ok_normal) std::fprintf(stderr, "[transform-tests] normal matrix under non-uniform scale wrong\n");
    if (!ok_raw_normal) std::fprintf(stderr, "[transform-tests] normal renormalized in vertex stage\n");
    if (!ok_singular) std::fprintf(stderr, "[transform-tests] singular model produced NaN\n");
    if (!ok_vp) std::fprintf(stderr, "[transform-tests] view-projection not applied\n");

    if (!(ok_rows && ok_trs && ok_normal && ok_raw_normal && ok_singular && ok_vp)) return 1;
    std::fprintf(stderr, "[transform-tests] all tests passed\n");
    return 0;
}
