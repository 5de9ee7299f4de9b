/*
    SHADECORE SHADING LIBRARY

    FILE: shadecore_lib.cpp
    MODULE: shadecore-lib
    PURPOSE: Compiled library target anchor translation unit.
*/

#include "shadecore/frame/shading_config.hpp"
#include "shadecore/lighting/light_registry.hpp"
#include "shadecore/render/ui_pass.hpp"
#include "shadecore/shader/builtin_programs.hpp"

namespace shadecore
{
    int shadecore_compiled_target_anchor()
    {
        return 0;
    }
}
