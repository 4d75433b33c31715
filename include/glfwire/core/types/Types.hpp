#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "Enums.hpp"

namespace Glfwire {

    /*
        Opaque native objects. Only ever handled by pointer, never defined.
    */
    struct SWindow;
    struct SMonitor;
    struct SCursor;

    /*
        "Let the platform decide". Encoded as -1 where the native library
        accepts it.
    */
    struct SDontCare {
        bool operator==(const SDontCare&) const = default;
    };

    constexpr const SDontCare DONT_CARE{};

    /*
        A native constant the binding does not know about.
    */
    struct SUnrecognized {
        int32_t native = 0;

        bool    operator==(const SUnrecognized&) const = default;
    };

    using IntOrDontCare = std::variant<int32_t, SDontCare>;

    using HintValue = std::variant<bool, int32_t, SDontCare, eClientApi, eContextCreationApi, eContextRobustness, eReleaseBehavior, eOpenGLProfile, std::string, SUnrecognized>;

    using InputModeValue = std::variant<bool, eCursorMode, SUnrecognized>;

    struct SError {
        std::optional<eErrorCode> code;
        int32_t                   nativeCode = 0;
        std::string               description;
    };

    struct SVideoMode {
        int32_t width       = 0;
        int32_t height      = 0;
        int32_t redBits     = 0;
        int32_t greenBits   = 0;
        int32_t blueBits    = 0;
        int32_t refreshRate = 0;

        bool    operator==(const SVideoMode&) const = default;
    };

    /*
        8 bits per channel RGBA, rows from the top left.
        pixels.size() must be width * height * 4.
    */
    struct SImage {
        int32_t              width  = 0;
        int32_t              height = 0;
        std::vector<uint8_t> pixels;

        bool                 operator==(const SImage&) const = default;
    };

    /*
        Channels hold unsigned 16-bit values and must all be the same length.
    */
    struct SGammaRamp {
        std::vector<int32_t> red;
        std::vector<int32_t> green;
        std::vector<int32_t> blue;

        bool                 operator==(const SGammaRamp&) const = default;
    };

    struct SGamepadAxes {
        std::array<float, 2> leftStick    = {0.F, 0.F};
        std::array<float, 2> rightStick   = {0.F, 0.F};
        float                leftTrigger  = 0.F;
        float                rightTrigger = 0.F;

        bool                 operator==(const SGamepadAxes&) const = default;
    };

    struct SGamepadState {
        std::set<eGamepadButton> buttons;
        SGamepadAxes             axes;

        bool                     operator==(const SGamepadState&) const = default;
    };
};
