#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: instance_transform.hpp
    MODULE: geometry
    PURPOSE: Instance transform (position / rotation / scale) and its packed wire form:
             four model rows plus, for lit geometry, three normal-matrix rows.
*/


#include <array>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace shadecore
{
    // Packed vector k is glm column k, i.e. the order a mat4 is stored in the instance buffer.
    using ModelRows = std::array<glm::vec4, 4>;
    using NormalRows = std::array<glm::vec3, 3>;

    struct Transform
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};

        // translation * rotation * scale
        glm::mat4 to_mat() const
        {
            const glm::mat4 t = glm::translate(glm::mat4(1.0f), position);
            const glm::mat4 r = glm::mat4_cast(rotation);
            const glm::mat4 s = glm::scale(glm::mat4(1.0f), scale);
            return t * r * s;
        }
    };

    inline glm::quat quat_from_euler_rad(float x, float y, float z)
    {
        return glm::quat(glm::vec3(x, y, z));
    }

    inline glm::quat quat_from_euler_deg(float x, float y, float z)
    {
        return quat_from_euler_rad(glm::radians(x), glm::radians(y), glm::radians(z));
    }

    inline glm::quat quat_from_euler_deg_z(float z)
    {
        return quat_from_euler_deg(0.0f, 0.0f, z);
    }

    inline ModelRows pack_model_rows(const glm::mat4& m)
    {
        return ModelRows{m[0], m[1], m[2], m[3]};
    }

    inline glm::mat4 model_from_rows(const ModelRows& rows)
    {
        return glm::mat4(rows[0], rows[1], rows[2], rows[3]);
    }

    inline glm::mat3 normal_from_rows(const NormalRows& rows)
    {
        return glm::mat3(rows[0], rows[1], rows[2]);
    }

    // Inverse-transpose of the upper 3x3 so normals survive non-uniform scale.
    // A singular basis falls back to the plain 3x3; the producer owns degenerate transforms.
    inline NormalRows normal_rows_from_model(const glm::mat4& model)
    {
        glm::mat3 n = glm::mat3(model);
        const float det = glm::determinant(n);
        if (std::abs(det) > 1e-8f) n = glm::transpose(glm::inverse(n));
        return NormalRows{n[0], n[1], n[2]};
    }

    struct LitInstance
    {
        ModelRows model_rows{glm::vec4(1, 0, 0, 0), glm::vec4(0, 1, 0, 0), glm::vec4(0, 0, 1, 0), glm::vec4(0, 0, 0, 1)};
        NormalRows normal_rows{glm::vec3(1, 0, 0), glm::vec3(0, 1, 0), glm::vec3(0, 0, 1)};
    };

    inline LitInstance make_lit_instance(const glm::mat4& model)
    {
        LitInstance out{};
        out.model_rows = pack_model_rows(model);
        out.normal_rows = normal_rows_from_model(model);
        return out;
    }

    inline LitInstance make_lit_instance(const Transform& t)
    {
        return make_lit_instance(t.to_mat());
    }
}
