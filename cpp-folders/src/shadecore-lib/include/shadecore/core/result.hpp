#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: result.hpp
    MODULE: core
    PURPOSE: Value-or-error return type for host-side operations that can fail
             (texture import, configuration parsing).
*/


#include <string>
#include <utility>

namespace shadecore
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        const T& value_or(const T& fallback) const
        {
            return ok ? value : fallback;
        }

        explicit operator bool() const { return ok; }
    };
}
