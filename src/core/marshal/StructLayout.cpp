#include "StructLayout.hpp"
#include "../../helpers/Log.hpp"
#include <glfwire/core/types/Enums.hpp>

#include <format>
#include <stdexcept>

using namespace Glfwire;

CStructLayout::CStructLayout(std::string_view name, std::vector<SStructField>&& fields) : m_name(name), m_fields(std::move(fields)) {
    std::vector<size_t> firstElement;
    firstElement.reserve(m_fields.size());

    for (const auto& f : m_fields) {
        RASSERT(f.count > 0, "{}.{} has no elements", m_name, f.name);

        const auto ELEMENT = FFI::ffiTypeFrom(f.type);
        RASSERT(ELEMENT && ELEMENT != &ffi_type_void, "{}.{} has no native layout", m_name, f.name);

        firstElement.emplace_back(m_elements.size());
        for (size_t i = 0; i < f.count; ++i) {
            m_elements.emplace_back(ELEMENT);
        }
    }

    m_elements.emplace_back(nullptr);

    m_type.type     = FFI_TYPE_STRUCT;
    m_type.elements = m_elements.data();

    std::vector<size_t> offsets(m_elements.size() - 1);
    const auto          STATUS = ffi_get_struct_offsets(FFI_DEFAULT_ABI, &m_type, offsets.data());
    RASSERT(STATUS == FFI_OK, "ffi failed to lay out {}", m_name);

    for (const auto& i : firstElement) {
        m_offsets.emplace_back(offsets.at(i));
    }

    TRACE(Debug::log(TRACE, "struct {}: {} bytes, aligned to {}", m_name, m_type.size, m_type.alignment));
}

const SStructField& CStructLayout::field(std::string_view field) const {
    for (const auto& f : m_fields) {
        if (f.name == field)
            return f;
    }

    throw std::invalid_argument(std::format("struct {} has no field {}", m_name, field));
}

size_t CStructLayout::offsetOf(std::string_view field) const {
    for (size_t i = 0; i < m_fields.size(); ++i) {
        if (m_fields[i].name == field)
            return m_offsets[i];
    }

    throw std::invalid_argument(std::format("struct {} has no field {}", m_name, field));
}

size_t CStructLayout::size() const {
    return m_type.size;
}

size_t CStructLayout::alignment() const {
    return m_type.alignment;
}

std::string_view CStructLayout::name() const {
    return m_name;
}

const CStructLayout& Glfwire::Layouts::vidmode() {
    static const CStructLayout LAYOUT{"GLFWvidmode",
                                      {
                                          {.name = "width", .type = GW_NATIVE_SINT32},
                                          {.name = "height", .type = GW_NATIVE_SINT32},
                                          {.name = "redBits", .type = GW_NATIVE_SINT32},
                                          {.name = "greenBits", .type = GW_NATIVE_SINT32},
                                          {.name = "blueBits", .type = GW_NATIVE_SINT32},
                                          {.name = "refreshRate", .type = GW_NATIVE_SINT32},
                                      }};
    return LAYOUT;
}

const CStructLayout& Glfwire::Layouts::image() {
    static const CStructLayout LAYOUT{"GLFWimage",
                                      {
                                          {.name = "width", .type = GW_NATIVE_SINT32},
                                          {.name = "height", .type = GW_NATIVE_SINT32},
                                          {.name = "pixels", .type = GW_NATIVE_POINTER},
                                      }};
    return LAYOUT;
}

const CStructLayout& Glfwire::Layouts::gammaRamp() {
    static const CStructLayout LAYOUT{"GLFWgammaramp",
                                      {
                                          {.name = "red", .type = GW_NATIVE_POINTER},
                                          {.name = "green", .type = GW_NATIVE_POINTER},
                                          {.name = "blue", .type = GW_NATIVE_POINTER},
                                          {.name = "size", .type = GW_NATIVE_UINT32},
                                      }};
    return LAYOUT;
}

const CStructLayout& Glfwire::Layouts::gamepadState() {
    static const CStructLayout LAYOUT{"GLFWgamepadstate",
                                      {
                                          {.name = "buttons", .type = GW_NATIVE_UINT8, .count = GW_GAMEPAD_BUTTON_COUNT},
                                          {.name = "axes", .type = GW_NATIVE_FLOAT, .count = GW_GAMEPAD_AXIS_COUNT},
                                      }};
    return LAYOUT;
}
