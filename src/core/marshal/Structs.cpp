#include "Structs.hpp"

#include <cstring>
#include <format>
#include <stdexcept>
#include <utility>

#include <glfwire/core/types/Codecs.hpp>

using namespace Glfwire;
using namespace Glfwire::Marshal;

static void checkImage(const SImage& value) {
    if (value.width < 0 || value.height < 0)
        throw std::invalid_argument(std::format("image: negative dimensions {}x{}", value.width, value.height));

    const auto EXPECTED = sc<size_t>(value.width) * sc<size_t>(value.height) * 4;
    if (value.pixels.size() != EXPECTED)
        throw std::invalid_argument(std::format("image: {}x{} needs {} pixel bytes, got {}", value.width, value.height, EXPECTED, value.pixels.size()));
}

static void checkGammaRamp(const SGammaRamp& value) {
    if (value.red.empty())
        throw std::invalid_argument("gamma ramp: channels are empty");

    if (value.red.size() != value.green.size() || value.red.size() != value.blue.size())
        throw std::invalid_argument(std::format("gamma ramp: channel lengths differ ({}, {}, {})", value.red.size(), value.green.size(), value.blue.size()));

    for (const auto& channel : {&value.red, &value.green, &value.blue}) {
        for (const auto& v : *channel) {
            if (v < 0 || v > 0xFFFF)
                throw std::invalid_argument(std::format("gamma ramp: value {} does not fit an unsigned short", v));
        }
    }
}

static const void* checkedBuffer(const void* buffer, std::string_view what) {
    if (!buffer)
        throw std::invalid_argument(std::format("{}: null record", what));
    return buffer;
}

void Glfwire::Marshal::serializeInto(const SVideoMode& value, void* buffer) {
    const auto& L = Layouts::vidmode();
    L.write<int32_t>(buffer, "width", value.width);
    L.write<int32_t>(buffer, "height", value.height);
    L.write<int32_t>(buffer, "redBits", value.redBits);
    L.write<int32_t>(buffer, "greenBits", value.greenBits);
    L.write<int32_t>(buffer, "blueBits", value.blueBits);
    L.write<int32_t>(buffer, "refreshRate", value.refreshRate);
}

void Glfwire::Marshal::serializeInto(const SImage& value, void* buffer, CArena& arena) {
    checkImage(value);

    auto pixels = arena.allocate<uint8_t>(value.pixels.size());
    if (!value.pixels.empty())
        std::memcpy(pixels, value.pixels.data(), value.pixels.size());

    const auto& L = Layouts::image();
    L.write<int32_t>(buffer, "width", value.width);
    L.write<int32_t>(buffer, "height", value.height);
    L.write<void*>(buffer, "pixels", pixels);
}

void Glfwire::Marshal::serializeInto(const SGammaRamp& value, void* buffer, CArena& arena) {
    checkGammaRamp(value);

    const auto  SIZE = value.red.size();
    const auto& L    = Layouts::gammaRamp();

    for (const auto& [name, channel] : {std::pair{"red", &value.red}, std::pair{"green", &value.green}, std::pair{"blue", &value.blue}}) {
        auto shorts = arena.allocate<uint16_t>(SIZE);
        for (size_t i = 0; i < SIZE; ++i) {
            shorts[i] = sc<uint16_t>((*channel)[i]);
        }
        L.write<void*>(buffer, name, shorts);
    }

    L.write<uint32_t>(buffer, "size", sc<uint32_t>(SIZE));
}

void Glfwire::Marshal::serializeInto(const SGamepadState& value, void* buffer) {
    const auto& L = Layouts::gamepadState();

    for (uint32_t i = 0; i < GW_GAMEPAD_BUTTON_COUNT; ++i) {
        const auto PRESSED = value.buttons.contains(sc<eGamepadButton>(i));
        L.write<uint8_t>(buffer, "buttons", sc<uint8_t>(PRESSED ? GW_PRESS : GW_RELEASE), i);
    }

    const float AXES[GW_GAMEPAD_AXIS_COUNT] = {
        value.axes.leftStick[0], value.axes.leftStick[1], value.axes.rightStick[0], value.axes.rightStick[1], value.axes.leftTrigger, value.axes.rightTrigger,
    };

    for (uint32_t i = 0; i < GW_GAMEPAD_AXIS_COUNT; ++i) {
        L.write<float>(buffer, "axes", AXES[i], i);
    }
}

template <>
SVideoMode Glfwire::Marshal::deserializeFrom<SVideoMode>(const void* buffer) {
    checkedBuffer(buffer, "vidmode");

    const auto& L = Layouts::vidmode();
    return SVideoMode{
        .width       = L.read<int32_t>(buffer, "width"),
        .height      = L.read<int32_t>(buffer, "height"),
        .redBits     = L.read<int32_t>(buffer, "redBits"),
        .greenBits   = L.read<int32_t>(buffer, "greenBits"),
        .blueBits    = L.read<int32_t>(buffer, "blueBits"),
        .refreshRate = L.read<int32_t>(buffer, "refreshRate"),
    };
}

template <>
SImage Glfwire::Marshal::deserializeFrom<SImage>(const void* buffer) {
    checkedBuffer(buffer, "image");

    const auto& L = Layouts::image();
    SImage      image{
             .width  = L.read<int32_t>(buffer, "width"),
             .height = L.read<int32_t>(buffer, "height"),
    };

    const auto PIXELS = rc<const uint8_t*>(L.read<void*>(buffer, "pixels"));
    if (PIXELS && image.width > 0 && image.height > 0)
        image.pixels.assign(PIXELS, PIXELS + sc<size_t>(image.width) * sc<size_t>(image.height) * 4);

    return image;
}

template <>
SGammaRamp Glfwire::Marshal::deserializeFrom<SGammaRamp>(const void* buffer) {
    checkedBuffer(buffer, "gamma ramp");

    const auto& L = Layouts::gammaRamp();

    // size decides how far the channel pointers may be read
    const auto SIZE = L.read<uint32_t>(buffer, "size");

    SGammaRamp ramp;
    for (const auto& [name, channel] : {std::pair{"red", &ramp.red}, std::pair{"green", &ramp.green}, std::pair{"blue", &ramp.blue}}) {
        const auto SHORTS = rc<const uint16_t*>(L.read<void*>(buffer, name));
        if (!SHORTS)
            continue;

        channel->reserve(SIZE);
        for (uint32_t i = 0; i < SIZE; ++i) {
            channel->emplace_back(sc<int32_t>(SHORTS[i]));
        }
    }

    return ramp;
}

template <>
SGamepadState Glfwire::Marshal::deserializeFrom<SGamepadState>(const void* buffer) {
    checkedBuffer(buffer, "gamepad state");

    const auto&   L = Layouts::gamepadState();
    SGamepadState state;

    for (uint32_t i = 0; i < GW_GAMEPAD_BUTTON_COUNT; ++i) {
        if (L.read<uint8_t>(buffer, "buttons", i) == GW_PRESS)
            state.buttons.emplace(sc<eGamepadButton>(i));
    }

    state.axes.leftStick    = {L.read<float>(buffer, "axes", 0), L.read<float>(buffer, "axes", 1)};
    state.axes.rightStick   = {L.read<float>(buffer, "axes", 2), L.read<float>(buffer, "axes", 3)};
    state.axes.leftTrigger  = L.read<float>(buffer, "axes", 4);
    state.axes.rightTrigger = L.read<float>(buffer, "axes", 5);

    return state;
}

void* Glfwire::Marshal::serialize(const SImage& value, CArena& arena) {
    auto record = arena.allocate(Layouts::image().size());
    serializeInto(value, record, arena);
    return record;
}

void* Glfwire::Marshal::serialize(const SGammaRamp& value, CArena& arena) {
    auto record = arena.allocate(Layouts::gammaRamp().size());
    serializeInto(value, record, arena);
    return record;
}

void* Glfwire::Marshal::serializeArray(const std::vector<SImage>& images, CArena& arena) {
    if (images.empty())
        return nullptr;

    for (const auto& i : images) {
        checkImage(i);
    }

    const auto STRIDE = Layouts::image().size();
    auto       base   = rc<uint8_t*>(arena.allocate(STRIDE * images.size()));

    for (size_t i = 0; i < images.size(); ++i) {
        serializeInto(images[i], base + i * STRIDE, arena);
    }

    return base;
}

std::vector<SVideoMode> Glfwire::Marshal::deserializeArray(const void* base, size_t count) {
    std::vector<SVideoMode> result;
    if (!base)
        return result;

    const auto STRIDE = Layouts::vidmode().size();
    result.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        result.emplace_back(deserializeFrom<SVideoMode>(rc<const uint8_t*>(base) + i * STRIDE));
    }

    return result;
}
