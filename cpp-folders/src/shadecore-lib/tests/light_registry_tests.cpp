#include <cstdio>

#include <glm/glm.hpp>

#include "shadecore/lighting/illumination.hpp"
#include "shadecore/lighting/light_registry.hpp"
#include "shadecore/lighting/light_types.hpp"

namespace
{
    shadecore::Light tagged_light(float tag)
    {
        return shadecore::make_point_light(glm::vec3(tag, 0.0f, 0.0f), glm::vec3(1.0f), 10.0f);
    }

    bool test_flatten_orders_by_id()
    {
        shadecore::LightRegistry reg(glm::vec3(0.1f));
        reg.add_light(30, tagged_light(3.0f));
        reg.add_light(10, tagged_light(1.0f));
        reg.add_light(20, tagged_light(2.0f));

        const shadecore::LightBlock block = reg.flatten();
        if (block.count != 3 || block.lights.size() != 3) return false;
        if (block.ambient != glm::vec3(0.1f)) return false;
        return block.lights[0].position.x == 1.0f &&
               block.lights[1].position.x == 2.0f &&
               block.lights[2].position.x == 3.0f;
    }

    bool test_empty_registry_keeps_placeholder()
    {
        shadecore::LightRegistry reg(glm::vec3(0.25f, 0.5f, 0.75f));
        const shadecore::LightBlock block = reg.flatten();
        if (block.count != 0 || block.lights.size() != 1) return false;

        // The placeholder is never read: only ambient remains.
        const shadecore::SurfacePoint surface{glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
        const glm::vec3 c = shadecore::accumulate_illumination(surface, glm::vec3(0.0f, 1.0f, 0.0f), shadecore::view_of(block));
        return c == glm::vec3(0.25f, 0.5f, 0.75f);
    }

    bool test_update_only_when_dirty()
    {
        shadecore::LightRegistry reg{};
        shadecore::LightBlock block{};

        // A new registry starts dirty so the first frame uploads.
        if (!reg.update(block)) return false;
        if (reg.dirty() || reg.update(block)) return false;

        reg.add_light(1, tagged_light(1.0f));
        if (!reg.dirty()) return false;
        if (!reg.update(block) || block.count != 1) return false;

        // Removing an unknown id changes nothing.
        if (reg.remove_light(99) || reg.dirty()) return false;

        if (!reg.remove_light(1) || !reg.update(block)) return false;
        if (block.count != 0 || block.lights.size() != 1) return false;

        reg.set_ambient_color(glm::vec3(0.5f));
        if (!reg.update(block)) return false;
        return block.ambient == glm::vec3(0.5f);
    }

    bool test_add_replaces_same_id()
    {
        shadecore::LightRegistry reg{};
        reg.add_light(7, tagged_light(1.0f));
        reg.add_light(7, tagged_light(9.0f));
        if (reg.size() != 1) return false;
        const shadecore::Light* l = reg.find(7);
        return l && l->position.x == 9.0f && reg.find(8) == nullptr;
    }

    bool test_capacity_drops_highest_ids()
    {
        shadecore::LightRegistry reg(glm::vec3(0.0f), 2);
        reg.add_light(5, tagged_light(5.0f));
        reg.add_light(1, tagged_light(1.0f));
        reg.add_light(3, tagged_light(3.0f));

        const shadecore::LightBlock block = reg.flatten();
        if (block.count != 2 || block.lights.size() != 2) return false;
        return block.lights[0].position.x == 1.0f && block.lights[1].position.x == 3.0f;
    }

    bool test_view_count_never_exceeds_storage()
    {
        shadecore::LightBlock block{};
        block.lights.push_back(tagged_light(0.0f));
        block.count = 5;
        return shadecore::view_of(block).active_count() == 1;
    }
}

int main()
{
    const bool ok_order = test_flatten_orders_by_id();
    const bool ok_empty = test_empty_registry_keeps_placeholder();
    const bool ok_dirty = test_update_only_when_dirty();
    const bool ok_replace = test_add_replaces_same_id();
    const bool ok_capacity = test_capacity_drops_highest_ids();
    const bool ok_view = test_view_count_never_exceeds_storage();

    if (!ok_order) std::fprintf(stderr, "[light-registry-tests] flatten order wrong\n");
    if (!ok_empty) std::fprintf(stderr, "[light-registry-tests] empty registry placeholder wrong\n");
    if (!ok_dirty) std::fprintf(stderr, "[light-registry-tests] dirty tracking wrong\n");
    if (!ok_replace) std::fprintf(stderr, "[light-registry-tests] add did not replace\n");
    if (!ok_capacity) std::fprintf(stderr, "[light-registry-tests] capacity clamp wrong\n");
    if (!ok_view) std::fprintf(stderr, "[light-registry-tests] view count overruns storage\n");

    if (!(ok_order && ok_empty && ok_dirty && ok_replace && ok_capacity && ok_view)) return 1;
    std::fprintf(stderr, "[light-registry-tests] all tests passed\n");
    return 0;
}
