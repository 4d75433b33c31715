#include "Descriptors.hpp"

#include <format>
#include <stdexcept>

using namespace Glfwire;

static bool isScalarValue(uint32_t cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

uint32_t Glfwire::Types::Codepoint::serialize(std::string_view value) {
    if (value.empty())
        throw std::invalid_argument("codepoint: empty string");

    const auto LEAD = sc<uint8_t>(value[0]);
    size_t     len  = 0;
    uint32_t   cp   = 0;

    if (LEAD < 0x80) {
        len = 1;
        cp  = LEAD;
    } else if ((LEAD & 0xE0) == 0xC0) {
        len = 2;
        cp  = LEAD & 0x1F;
    } else if ((LEAD & 0xF0) == 0xE0) {
        len = 3;
        cp  = LEAD & 0x0F;
    } else if ((LEAD & 0xF8) == 0xF0) {
        len = 4;
        cp  = LEAD & 0x07;
    } else
        throw std::invalid_argument(std::format("codepoint: invalid UTF-8 lead byte {:#x}", LEAD));

    if (value.size() != len)
        throw std::invalid_argument(std::format("codepoint: expected exactly one character, got {} bytes", value.size()));

    for (size_t i = 1; i < len; ++i) {
        const auto CONT = sc<uint8_t>(value[i]);
        if ((CONT & 0xC0) != 0x80)
            throw std::invalid_argument("codepoint: invalid UTF-8 continuation byte");
        cp = (cp << 6) | (CONT & 0x3F);
    }

    static constexpr uint32_t SHORTEST[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < SHORTEST[len])
        throw std::invalid_argument(std::format("codepoint: overlong encoding of U+{:04X}", cp));

    if (!isScalarValue(cp))
        throw std::invalid_argument(std::format("codepoint: U+{:04X} is not a unicode scalar value", cp));

    return cp;
}

std::string Glfwire::Types::Codepoint::deserialize(uint32_t value) {
    std::string result;

    // surrogates and values past U+10FFFF become U+FFFD
    if (!isScalarValue(value))
        value = 0xFFFD;

    if (value < 0x80)
        result += sc<char>(value);
    else if (value < 0x800) {
        result += sc<char>(0xC0 | (value >> 6));
        result += sc<char>(0x80 | (value & 0x3F));
    } else if (value < 0x10000) {
        result += sc<char>(0xE0 | (value >> 12));
        result += sc<char>(0x80 | ((value >> 6) & 0x3F));
        result += sc<char>(0x80 | (value & 0x3F));
    } else {
        result += sc<char>(0xF0 | ((value >> 18) & 0x07));
        result += sc<char>(0x80 | ((value >> 12) & 0x3F));
        result += sc<char>(0x80 | ((value >> 6) & 0x3F));
        result += sc<char>(0x80 | (value & 0x3F));
    }

    return result;
}
