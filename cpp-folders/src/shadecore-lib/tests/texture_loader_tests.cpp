#include <cstdio>
#include <string>

#include "shadecore/resources/loaders/texture_loader_sdl.hpp"
#include "shadecore/resources/texture.hpp"

namespace
{
    bool test_missing_file_reports_failure()
    {
        const std::string path = "definitely/not/here/shadecore_missing.png";
        const shadecore::Result<shadecore::Texture2DData> r = shadecore::load_texture2d_sdl_image(path);
        if (r.ok) return false;
        if (r.error.find(path) == std::string::npos) return false;
        // Failed loads leave an empty, unbound-safe texture.
        return !r.value.valid();
    }

    bool test_invalid_texture_samples_white()
    {
        const shadecore::Texture2DData empty{};
        shadecore::TextureBinding binding{};
        binding.texture = &empty;
        const glm::vec4 c = shadecore::sample_rgba(binding, glm::vec2(0.5f));
        return c == glm::vec4(1.0f);
    }
}

int main()
{
    const bool ok_missing = test_missing_file_reports_failure();
    const bool ok_invalid = test_invalid_texture_samples_white();

    if (!ok_missing) std::fprintf(stderr, "[texture-loader-tests] missing file not reported\n");
    if (!ok_invalid) std::fprintf(stderr, "[texture-loader-tests] invalid texture sampling wrong\n");

    if (!(ok_missing && ok_invalid)) return 1;
    std::fprintf(stderr, "[texture-loader-tests] all tests passed\n");
    return 0;
}
