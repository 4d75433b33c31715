#pragma once

#include <variant>

#include <glfwire/core/types/Types.hpp>

#include "../marshal/Arena.hpp"
#include "../../helpers/Memory.hpp"

namespace Glfwire::Api {

    /*
        The native copy of the last gamma ramp set. The native library may
        still point into it.
    */
    inline UP<CArena> g_gammaArena;

    inline int32_t    orDontCare(const IntOrDontCare& value) {
        if (std::holds_alternative<SDontCare>(value))
            return -1;
        return std::get<int32_t>(value);
    }
};
