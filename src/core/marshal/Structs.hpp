#pragma once

#include <vector>

#include <glfwire/core/types/Types.hpp>

#include "Arena.hpp"
#include "StructLayout.hpp"

namespace Glfwire::Marshal {

    /*
        buffer must be at least the layout's size(). Secondary buffers go into arena
        and share its lifetime.

        Shape violations (pixel count, channel lengths, channel values) throw
        std::invalid_argument before anything is written.
    */
    void serializeInto(const SVideoMode& value, void* buffer);
    void serializeInto(const SImage& value, void* buffer, CArena& arena);
    void serializeInto(const SGammaRamp& value, void* buffer, CArena& arena);
    void serializeInto(const SGamepadState& value, void* buffer);

    template <typename T>
    T deserializeFrom(const void* buffer);

    template <>
    SVideoMode deserializeFrom<SVideoMode>(const void* buffer);
    template <>
    SImage deserializeFrom<SImage>(const void* buffer);
    template <>
    SGammaRamp deserializeFrom<SGammaRamp>(const void* buffer);
    template <>
    SGamepadState deserializeFrom<SGamepadState>(const void* buffer);

    // single record in a fresh arena block
    void* serialize(const SImage& value, CArena& arena);
    void* serialize(const SGammaRamp& value, CArena& arena);

    // contiguous GLFWimage array, nullptr when empty
    void* serializeArray(const std::vector<SImage>& images, CArena& arena);

    // count records laid out at the layout's stride
    std::vector<SVideoMode> deserializeArray(const void* base, size_t count);
};
