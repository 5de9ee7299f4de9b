#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: camera_uniform.hpp
    MODULE: camera
    PURPOSE: Per-draw camera block (view position + view-projection) and the small
             look-at camera that produces it.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace shadecore
{
    // w of view_position is free for program-specific use.
    struct CameraUniform
    {
        glm::vec4 view_position{0.0f, 0.0f, 0.0f, 0.0f};
        glm::mat4 view_projection{1.0f};

        glm::vec3 eye() const { return glm::vec3(view_position); }
    };

    // Screen-space draws (UI) use an identity camera: instance matrices land directly in NDC.
    inline CameraUniform make_screen_space_camera()
    {
        return CameraUniform{};
    }

    struct ViewCamera
    {
        glm::vec3 pos{0.0f, 0.0f, -3.0f};
        glm::vec3 target{0.0f, 0.0f, 0.0f};
        glm::vec3 up{0.0f, 1.0f, 0.0f};

        float fov_y_radians = glm::radians(60.0f);
        float znear = 0.1f;
        float zfar = 200.0f;

        // Left-handed view, NDC z in [-1, 1].
        CameraUniform make_uniform(float aspect) const
        {
            const glm::mat4 view = glm::lookAtLH(pos, target, up);
            const glm::mat4 proj = glm::perspectiveLH_NO(fov_y_radians, aspect > 0.0f ? aspect : 1.0f, znear, zfar);
            CameraUniform u{};
            u.view_position = glm::vec4(pos, 0.0f);
            u.view_projection = proj * view;
            return u;
        }
    };
}
