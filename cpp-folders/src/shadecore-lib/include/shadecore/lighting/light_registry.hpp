#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: light_registry.hpp
    MODULE: lighting
    PURPOSE: Scene-side owner of the light list. Lights are keyed by id, edits mark the
             registry dirty, and once per frame the registry flattens into the
             LightBlock the accumulator reads.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>

#include <glm/glm.hpp>

#include "shadecore/core/log.hpp"
#include "shadecore/lighting/light_types.hpp"

namespace shadecore
{
    class LightRegistry
    {
    public:
        explicit LightRegistry(
            const glm::vec3& ambient = glm::vec3(0.0f),
            size_t capacity = std::numeric_limits<size_t>::max())
            : ambient_(ambient), capacity_(capacity)
        {}

        void mark_dirty() { dirty_ = true; }
        bool dirty() const { return dirty_; }

        // Inserts or replaces.
        void add_light(uint32_t id, const Light& light)
        {
            lights_[id] = light;
            mark_dirty();
        }

        bool remove_light(uint32_t id)
        {
            const bool erased = lights_.erase(id) > 0;
            if (erased) mark_dirty();
            return erased;
        }

        void clear_lights()
        {
            lights_.clear();
            mark_dirty();
        }

        const Light* find(uint32_t id) const
        {
            const auto it = lights_.find(id);
            return it == lights_.end() ? nullptr : &it->second;
        }

        size_t size() const { return lights_.size(); }

        void set_ambient_color(const glm::vec3& ambient)
        {
            ambient_ = ambient;
            mark_dirty();
        }

        const glm::vec3& ambient_color() const { return ambient_; }

        // Lights in ascending id order. The storage is never empty: with no lights a
        // single inert placeholder is emitted and count stays 0.
        LightBlock flatten() const
        {
            LightBlock out{};
            out.ambient = ambient_;
            const size_t n = std::min(lights_.size(), capacity_);
            if (n < lights_.size())
            {
                log_warn("light registry holds " + std::to_string(lights_.size()) +
                         " lights, capacity is " + std::to_string(capacity_) + "; extra lights dropped");
            }

            out.lights.reserve(n == 0 ? 1 : n);
            for (const auto& entry : lights_)
            {
                if (out.lights.size() >= n) break;
                out.lights.push_back(entry.second);
            }
            out.count = (uint32_t)out.lights.size();
            if (out.lights.empty()) out.lights.push_back(make_placeholder_light());
            return out;
        }

        // Re-flattens into block only when something changed. Returns true when block was rewritten.
        bool update(LightBlock& block)
        {
            if (!dirty_) return false;
            block = flatten();
            dirty_ = false;
            return true;
        }

    private:
        std::map<uint32_t, Light> lights_{};
        glm::vec3 ambient_{0.0f};
        size_t capacity_ = std::numeric_limits<size_t>::max();
        bool dirty_ = true;
    };
}
