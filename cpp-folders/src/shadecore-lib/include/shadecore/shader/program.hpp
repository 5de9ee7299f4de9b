#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: program.hpp
    MODULE: shader
    PURPOSE: A shading program is a pair of pure functions over explicit inputs.
*/


#include <functional>

#include "shadecore/shader/types.hpp"

namespace shadecore
{
    using VertexShaderFn = std::function<VertexOut(const ShaderVertex&, const InstanceInput&, const DrawBindings&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const InstanceInput&, const DrawBindings&)>;

    struct ShaderProgram
    {
        const char* name = "unnamed";
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const
        {
            return (bool)vs && (bool)fs;
        }
    };
}
