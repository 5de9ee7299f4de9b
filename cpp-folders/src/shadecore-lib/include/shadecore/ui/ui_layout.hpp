#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: ui_layout.hpp
    MODULE: ui
    PURPOSE: UI element tree -> packed UI shape instances. Pixel layout uses a
             bottom-left origin with y up; instance matrices map the unit quad
             straight into NDC so UI draws use the screen-space camera.
*/


#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "shadecore/geometry/instance_transform.hpp"
#include "shadecore/resources/texture.hpp"
#include "shadecore/shader/types.hpp"

namespace shadecore
{
    enum class SizingKind : uint8_t
    {
        Auto = 0,
        Px = 1,
        PercentWidth = 2,
        PercentHeight = 3
    };

    struct Sizing
    {
        SizingKind kind = SizingKind::Auto;
        float value = 0.0f;

        static Sizing px(float v) { return Sizing{SizingKind::Px, v}; }
        // Fraction of the display width / height (0.5 = half).
        static Sizing percent_width(float v) { return Sizing{SizingKind::PercentWidth, v}; }
        static Sizing percent_height(float v) { return Sizing{SizingKind::PercentHeight, v}; }

        bool is_set() const { return kind != SizingKind::Auto; }

        float resolve(const glm::vec2& display, float fallback) const
        {
            switch (kind)
            {
                case SizingKind::Px: return value;
                case SizingKind::PercentWidth: return display.x * value;
                case SizingKind::PercentHeight: return display.y * value;
                case SizingKind::Auto:
                default: return fallback;
            }
        }
    };

    enum class PositionSetting : uint8_t
    {
        Parent = 0,
        Absolute = 1
    };

    struct UiStyle
    {
        PositionSetting position = PositionSetting::Parent;
        Sizing left{};
        Sizing right{};
        Sizing top{};
        Sizing bottom{};
        // Auto fills the parent.
        Sizing width{};
        Sizing height{};

        glm::vec4 color{1.0f};
        glm::vec4 border_color{0.0f, 0.0f, 0.0f, 1.0f};
        // top_right, top_left, bottom_left, bottom_right
        std::array<Sizing, 4> corner_radii{};
        // top, bottom, right, left
        std::array<Sizing, 4> border_widths{};
        float rotation_deg = 0.0f;

        void set_radius(const Sizing& r) { corner_radii.fill(r); }
        void set_border(const Sizing& b) { border_widths.fill(b); }
    };

    struct UiElement
    {
        UiStyle style{};
        const Texture2DData* texture = nullptr;
        std::vector<UiElement> children{};
    };

    // position is the bottom-left corner in pixels.
    struct UiRect
    {
        glm::vec2 position{0.0f};
        glm::vec2 size{0.0f};
    };

    struct UiInstance
    {
        InstanceInput instance{};
        const Texture2DData* texture = nullptr;
        UiRect rect{};
        float layer = 0.0f;
        int depth = 0;
    };

    inline constexpr float kUiRootLayer = 0.5f;
    inline constexpr float kUiLayerStep = 0.05f;

    // Centered in the parent by default; left wins over right, top wins over bottom.
    inline UiRect calculate_position_size(const UiStyle& style, const UiRect& parent, const glm::vec2& display)
    {
        UiRect out{};
        out.size = glm::vec2(
            std::max(style.width.resolve(display, parent.size.x), 0.0f),
            std::max(style.height.resolve(display, parent.size.y), 0.0f));
        out.position = parent.position + (parent.size - out.size) * 0.5f;

        const bool absolute = style.position == PositionSetting::Absolute;
        const glm::vec2 base = absolute ? glm::vec2(0.0f) : parent.position;
        const glm::vec2 span = absolute ? display : parent.size;

        if (style.left.is_set())
        {
            out.position.x = base.x + style.left.resolve(display, 0.0f);
        }
        else if (style.right.is_set())
        {
            out.position.x = base.x + span.x - out.size.x - style.right.resolve(display, 0.0f);
        }

        if (style.top.is_set())
        {
            out.position.y = base.y + span.y - out.size.y - style.top.resolve(display, 0.0f);
        }
        else if (style.bottom.is_set())
        {
            out.position.y = base.y + style.bottom.resolve(display, 0.0f);
        }

        return out;
    }

    // Unit quad [-1,1]^2 -> the element's rect in NDC at depth layer.
    inline glm::mat4 ui_model_matrix(const UiRect& rect, const glm::vec2& display, float layer, float rotation_deg)
    {
        const glm::vec2 center = rect.position + rect.size * 0.5f;
        Transform t{};
        t.position = glm::vec3(2.0f * center / display - 1.0f, layer);
        t.rotation = quat_from_euler_deg_z(rotation_deg);
        t.scale = glm::vec3(rect.size / display, 1.0f);
        return t.to_mat();
    }

    inline InstanceInput make_ui_instance(const UiStyle& style, const UiRect& rect, const glm::vec2& display, float layer, bool textured)
    {
        InstanceInput inst{};
        inst.model_rows = pack_model_rows(ui_model_matrix(rect, display, layer, style.rotation_deg));
        inst.color = style.color;
        inst.border_color = style.border_color;

        // Radii and borders go to shape space, where the longer side is 1.
        const float longest = std::max(rect.size.x, rect.size.y);
        const float inv = longest > 0.0f ? 1.0f / longest : 0.0f;
        bool any_radius = false;
        bool any_border = false;
        for (int i = 0; i < 4; ++i)
        {
            inst.corner_radii[i] = std::max(style.corner_radii[i].resolve(display, 0.0f), 0.0f) * inv;
            inst.border_widths[i] = std::max(style.border_widths[i].resolve(display, 0.0f), 0.0f) * inv;
            any_radius = any_radius || inst.corner_radii[i] > 0.0f;
            any_border = any_border || inst.border_widths[i] > 0.0f;
        }
        inst.extent = rect.size * inv;
        inst.flags = glm::vec4(any_radius ? 1.0f : 0.0f, any_border ? 1.0f : 0.0f, textured ? 1.0f : 0.0f, 0.0f);
        return inst;
    }

    namespace detail
    {
        inline void layout_ui_level(
            const std::vector<UiElement>& elements,
            const UiRect& parent,
            const glm::vec2& display,
            float layer,
            int depth,
            std::vector<UiInstance>& out)
        {
            for (const UiElement& e : elements)
            {
                const UiRect rect = calculate_position_size(e.style, parent, display);
                // Zero-area elements draw nothing but still place their children.
                if (rect.size.x > 0.0f && rect.size.y > 0.0f)
                {
                    UiInstance ui{};
                    ui.instance = make_ui_instance(e.style, rect, display, layer, e.texture != nullptr);
                    ui.texture = e.texture;
                    ui.rect = rect;
                    ui.layer = layer;
                    ui.depth = depth;
                    out.push_back(ui);
                }
                layout_ui_level(e.children, rect, display, layer - kUiLayerStep, depth + 1, out);
            }
        }
    }

    // Draw order: each element before its children; children sit one layer step nearer.
    inline std::vector<UiInstance> layout_ui_tree(const std::vector<UiElement>& roots, const glm::vec2& display)
    {
        std::vector<UiInstance> out{};
        if (!(display.x > 0.0f) || !(display.y > 0.0f)) return out;
        detail::layout_ui_level(roots, UiRect{glm::vec2(0.0f), display}, display, kUiRootLayer, 0, out);
        return out;
    }
}
