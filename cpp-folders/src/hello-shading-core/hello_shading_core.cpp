/*
    Shading core demo
    - A row of instanced boxes lit by a point light and a spot light (light registry -> LightBlock)
    - A UI panel tree drawn on top with the rounded-rect shape program
    - Keys:
        1 / 2 / 3 : UI output mode (discard / border blend / raw distance)
        SPACE     : toggle the specular extension
        ESC       : quit
    - Optional argv[1]: image drawn as a textured UI element

    Environment overrides: SHADECORE_SPECULAR, SHADECORE_SPECULAR_SHININESS,
    SHADECORE_UI_AA_BAND, SHADECORE_RASTER_CULL

    NOTE: render targets are bottom-left origin, SDL is top-left; rows are flipped on upload.
*/

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <glm/glm.hpp>

#include "shadecore/camera/camera_uniform.hpp"
#include "shadecore/core/log.hpp"
#include "shadecore/frame/shading_config.hpp"
#include "shadecore/gfx/rt_types.hpp"
#include "shadecore/job/job_system.hpp"
#include "shadecore/lighting/light_registry.hpp"
#include "shadecore/render/rasterizer.hpp"
#include "shadecore/render/ui_pass.hpp"
#include "shadecore/resources/loaders/texture_loader_sdl.hpp"
#include "shadecore/resources/mesh.hpp"
#include "shadecore/shader/builtin_programs.hpp"
#include "shadecore/ui/ui_layout.hpp"

#define WINDOW_WIDTH   960
#define WINDOW_HEIGHT  600
#define CANVAS_WIDTH   480
#define CANVAS_HEIGHT  300
#define BOX_COUNT      5

namespace
{
    std::vector<shadecore::UiElement> build_ui(const shadecore::Texture2DData* image)
    {
        shadecore::UiElement panel{};
        panel.style.width = shadecore::Sizing::percent_width(0.3f);
        panel.style.height = shadecore::Sizing::percent_height(0.45f);
        panel.style.left = shadecore::Sizing::px(12.0f);
        panel.style.top = shadecore::Sizing::px(12.0f);
        panel.style.color = glm::vec4(0.08f, 0.09f, 0.12f, 0.85f);
        panel.style.border_color = glm::vec4(0.95f, 0.65f, 0.2f, 1.0f);
        panel.style.set_radius(shadecore::Sizing::px(18.0f));
        panel.style.set_border(shadecore::Sizing::px(3.0f));

        shadecore::UiElement pill{};
        pill.style.width = shadecore::Sizing::percent_width(0.22f);
        pill.style.height = shadecore::Sizing::px(22.0f);
        pill.style.top = shadecore::Sizing::px(14.0f);
        pill.style.color = glm::vec4(0.2f, 0.55f, 0.95f, 1.0f);
        pill.style.border_color = glm::vec4(1.0f);
        pill.style.set_radius(shadecore::Sizing::px(11.0f));
        pill.style.border_widths[0] = shadecore::Sizing::px(2.0f);
        panel.children.push_back(pill);

        shadecore::UiElement thumb{};
        thumb.style.width = shadecore::Sizing::px(64.0f);
        thumb.style.height = shadecore::Sizing::px(64.0f);
        thumb.style.bottom = shadecore::Sizing::px(14.0f);
        thumb.style.color = image ? glm::vec4(1.0f) : glm::vec4(0.4f, 0.8f, 0.4f, 1.0f);
        thumb.style.corner_radii[0] = shadecore::Sizing::px(24.0f);
        thumb.style.corner_radii[2] = shadecore::Sizing::px(24.0f);
        thumb.style.rotation_deg = 8.0f;
        thumb.texture = image;
        panel.children.push_back(thumb);

        return {panel};
    }

    void upload_flipped(SDL_Texture* tex, const shadecore::RT_ColorLDR& ldr)
    {
        void* dst = nullptr;
        int dst_pitch = 0;
        if (SDL_LockTexture(tex, nullptr, &dst, &dst_pitch) != 0) return;
        auto* d = static_cast<uint8_t*>(dst);
        for (int y = 0; y < ldr.h; ++y)
        {
            const shadecore::Color* src_row = &ldr.color.at(0, ldr.h - 1 - y);
            std::memcpy(d + (size_t)y * (size_t)dst_pitch, src_row, (size_t)ldr.w * 4);
        }
        SDL_UnlockTexture(tex);
    }
}

int main(int argc, char* argv[])
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
    {
        shadecore::log_error(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }
    if ((IMG_Init(IMG_INIT_PNG | IMG_INIT_JPG) & (IMG_INIT_PNG | IMG_INIT_JPG)) == 0)
    {
        shadecore::log_warn(std::string("IMG_Init: ") + IMG_GetError());
    }

    SDL_Window* window = SDL_CreateWindow("shadecore", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, WINDOW_WIDTH, WINDOW_HEIGHT, SDL_WINDOW_SHOWN);
    SDL_Renderer* renderer = window ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC) : nullptr;
    SDL_Texture* screen = renderer ? SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, CANVAS_WIDTH, CANVAS_HEIGHT) : nullptr;
    if (!screen)
    {
        shadecore::log_error(std::string("SDL window setup failed: ") + SDL_GetError());
        if (renderer) SDL_DestroyRenderer(renderer);
        if (window) SDL_DestroyWindow(window);
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    shadecore::Texture2DData image{};
    bool has_image = false;
    if (argc > 1)
    {
        shadecore::Result<shadecore::Texture2DData> loaded = shadecore::load_texture2d_sdl_image(argv[1]);
        if (loaded)
        {
            image = std::move(loaded.value);
            has_image = true;
        }
        else
        {
            shadecore::log_warn(loaded.error);
        }
    }

    shadecore::ShadingConfig config = shadecore::load_shading_config_from_env();
    shadecore::set_log_level(config.log_level);
    shadecore::log_info(std::string("specular: ") + (config.specular.enabled ? "on" : "off") +
                        ", cull: " + shadecore::raster_cull_mode_name(config.raster.cull_mode) +
                        ", ui aa band: " + std::to_string(config.ui.edge_aa_band) +
                        ", log: " + shadecore::log_level_name(config.log_level));
    shadecore::ThreadPoolJobSystem jobs{};

    // Scene
    const shadecore::MeshData box = shadecore::make_box(glm::vec3(1.0f));
    const shadecore::MeshData quad = shadecore::make_ui_quad();

    shadecore::LightRegistry lights(glm::vec3(0.06f, 0.06f, 0.08f));
    lights.add_light(1, shadecore::make_point_light(glm::vec3(-3.0f, 2.5f, -2.0f), glm::vec3(1.0f, 0.9f, 0.8f), 12.0f));
    lights.add_light(2, shadecore::make_spot_light(
        glm::vec3(3.0f, 4.0f, -1.0f), glm::vec3(-0.4f, -1.0f, 0.3f), glm::vec3(0.3f, 0.5f, 1.4f), 14.0f, glm::radians(28.0f), 2.0f));
    shadecore::LightBlock light_block{};

    shadecore::MaterialData box_material = shadecore::make_material(glm::vec4(0.85f, 0.8f, 0.75f, 1.0f));
    box_material.emissive_color = glm::vec4(0.02f, 0.0f, 0.03f, 1.0f);

    shadecore::ViewCamera camera{};
    camera.pos = glm::vec3(0.0f, 2.0f, -7.0f);
    camera.target = glm::vec3(0.0f, 0.0f, 0.0f);

    const std::vector<shadecore::UiInstance> ui = shadecore::layout_ui_tree(
        build_ui(has_image ? &image : nullptr), glm::vec2((float)CANVAS_WIDTH, (float)CANVAS_HEIGHT));
    shadecore::ShapeOutputMode ui_mode = shadecore::ShapeOutputMode::BorderBlend;

    shadecore::RT_ColorHDR hdr(CANVAS_WIDTH, CANVAS_HEIGHT);
    shadecore::RT_DepthBuffer depth(CANVAS_WIDTH, CANVAS_HEIGHT);
    shadecore::RT_ColorLDR ldr(CANVAS_WIDTH, CANVAS_HEIGHT);

    const shadecore::ShaderProgram lit_program = shadecore::make_lit_material_program();

    bool running = true;
    float time_s = 0.0f;
    Uint64 last_ticks = SDL_GetPerformanceCounter();
    while (running)
    {
        SDL_Event e;
        while (SDL_PollEvent(&e))
        {
            if (e.type == SDL_QUIT) running = false;
            if (e.type != SDL_KEYDOWN) continue;
            switch (e.key.keysym.sym)
            {
                case SDLK_ESCAPE: running = false; break;
                case SDLK_1: ui_mode = shadecore::ShapeOutputMode::Discard; break;
                case SDLK_2: ui_mode = shadecore::ShapeOutputMode::BorderBlend; break;
                case SDLK_3: ui_mode = shadecore::ShapeOutputMode::RawDistance; break;
                case SDLK_SPACE: config.specular.enabled = !config.specular.enabled; break;
                default: break;
            }
        }

        const Uint64 now = SDL_GetPerformanceCounter();
        time_s += (float)((double)(now - last_ticks) / (double)SDL_GetPerformanceFrequency());
        last_ticks = now;

        lights.update(light_block);

        std::vector<shadecore::InstanceInput> boxes{};
        boxes.reserve(BOX_COUNT);
        for (int i = 0; i < BOX_COUNT; ++i)
        {
            shadecore::Transform t{};
            t.position = glm::vec3(((float)i - 0.5f * (float)(BOX_COUNT - 1)) * 1.6f, 0.0f, 0.0f);
            t.rotation = shadecore::quat_from_euler_deg(20.0f * (float)i, time_s * 40.0f + 15.0f * (float)i, 0.0f);
            t.scale = glm::vec3(1.0f, 0.6f + 0.25f * (float)i, 1.0f);
            boxes.push_back(shadecore::instance_from_lit(shadecore::make_lit_instance(t)));
        }

        hdr.clear(shadecore::ColorF{0.02f, 0.02f, 0.03f, 1.0f});
        depth.clear();

        shadecore::DrawBindings bindings{};
        shadecore::bind_shading_config(bindings, config);
        bindings.camera = camera.make_uniform((float)CANVAS_WIDTH / (float)CANVAS_HEIGHT);
        bindings.lights = shadecore::view_of(light_block);
        bindings.material.material = &box_material;

        const shadecore::RasterizerConfig scene_cfg = shadecore::make_rasterizer_config(config, &jobs);
        const shadecore::RasterizerStats scene_stats = shadecore::draw_instanced(
            box, boxes, lit_program, bindings, shadecore::RasterizerTarget{&hdr, &depth}, scene_cfg);

        // UI draws over the scene: fresh depth, alpha blended.
        depth.clear();
        shadecore::RasterizerConfig ui_cfg = scene_cfg;
        ui_cfg.params.cull_mode = shadecore::RasterCullMode::None;
        ui_cfg.params.blend = ui_mode == shadecore::ShapeOutputMode::BorderBlend
            ? shadecore::RasterBlendMode::PremultipliedOver
            : shadecore::RasterBlendMode::AlphaOver;
        const shadecore::RasterizerStats ui_stats = shadecore::draw_ui_instances(
            quad, ui, shadecore::make_ui_shape_program(ui_mode), bindings, shadecore::RasterizerTarget{&hdr, &depth}, ui_cfg);

        shadecore::resolve_to_ldr(hdr, ldr);
        upload_flipped(screen, ldr);

        SDL_SetRenderDrawColor(renderer, 10, 10, 14, 255);
        SDL_RenderClear(renderer);
        SDL_RenderCopy(renderer, screen, nullptr, nullptr);
        SDL_RenderPresent(renderer);

        const std::string title = std::string("shadecore | ui: ") + shadecore::shape_output_mode_name(ui_mode) +
            " | specular: " + (config.specular.enabled ? "on" : "off") +
            " | frags: " + std::to_string(scene_stats.fragments_written + ui_stats.fragments_written);
        SDL_SetWindowTitle(window, title.c_str());
    }

    SDL_DestroyTexture(screen);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    IMG_Quit();
    SDL_Quit();
    return 0;
}
