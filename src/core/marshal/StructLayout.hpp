#pragma once

#include <ffi.h>
#include <cstddef>
#include <cstring>
#include <string_view>
#include <vector>

#include <glfwire/core/types/NativeType.hpp>

#include "../../helpers/FFI.hpp"
#include "../../helpers/Memory.hpp"
#include "../../Macros.hpp"

namespace Glfwire {

    struct SStructField {
        std::string_view name;
        eNativeType      type  = GW_NATIVE_VOID;
        size_t           count = 1;
    };

    /*
        The C ABI layout of a native record, computed by libffi.
    */
    class CStructLayout {
      public:
        CStructLayout(std::string_view name, std::vector<SStructField>&& fields);

        CStructLayout(const CStructLayout&)            = delete;
        CStructLayout& operator=(const CStructLayout&) = delete;

        size_t              offsetOf(std::string_view field) const;
        const SStructField& field(std::string_view field) const;

        size_t              size() const;
        size_t              alignment() const;
        std::string_view    name() const;

        template <typename T>
        T read(const void* record, std::string_view field, size_t index = 0) const {
            checked<T>(field, index);
            T value;
            std::memcpy(&value, rc<const uint8_t*>(record) + offsetOf(field) + index * sizeof(T), sizeof(T));
            return value;
        }

        template <typename T>
        void write(void* record, std::string_view field, const T& value, size_t index = 0) const {
            checked<T>(field, index);
            std::memcpy(rc<uint8_t*>(record) + offsetOf(field) + index * sizeof(T), &value, sizeof(T));
        }

      private:
        template <typename T>
        const SStructField& checked(std::string_view field, size_t index) const {
            const auto& F = this->field(field);
            RASSERT(FFI::nativeSizeOf(F.type) == sizeof(T), "{}.{} accessed with a type of the wrong size", m_name, field);
            RASSERT(index < F.count, "{}.{}[{}] out of bounds", m_name, field, index);
            return F;
        }

        std::string_view          m_name;
        std::vector<SStructField> m_fields;
        std::vector<size_t>       m_offsets;

        std::vector<ffi_type*>    m_elements;
        ffi_type                  m_type = {};
    };

    namespace Layouts {
        const CStructLayout& vidmode();
        const CStructLayout& image();
        const CStructLayout& gammaRamp();
        const CStructLayout& gamepadState();
    };
};
