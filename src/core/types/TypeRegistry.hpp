#pragma once

#include <ffi.h>
#include <cstddef>
#include <vector>

#include <glfwire/core/types/NativeType.hpp>

namespace Glfwire {
    struct STypeDescriptor {
        eSemanticType type      = GW_TYPE_VOID;
        eSemanticKind kind      = GW_KIND_PRIMITIVE;
        eNativeType   primitive = GW_NATIVE_VOID;
        const char*   name      = "";
        size_t        size      = 0;
        size_t        align     = 0;
        ffi_type*     ffi       = nullptr;
    };

    /*
        Every semantic type is registered here before any marshaling happens.
        Asking for an unregistered type is a programming error and aborts.
    */
    namespace TypeRegistry {
        const STypeDescriptor&              describe(eSemanticType type);
        const std::vector<STypeDescriptor>& all();
    };
};
