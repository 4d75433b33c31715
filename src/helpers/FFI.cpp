#include "FFI.hpp"

using namespace Glfwire;

ffi_type* Glfwire::FFI::ffiTypeFrom(eNativeType type) {
    switch (type) {
        case GW_NATIVE_VOID: return &ffi_type_void;
        case GW_NATIVE_SINT8: return &ffi_type_sint8;
        case GW_NATIVE_UINT8: return &ffi_type_uint8;
        case GW_NATIVE_SINT16: return &ffi_type_sint16;
        case GW_NATIVE_UINT16: return &ffi_type_uint16;
        case GW_NATIVE_SINT32: return &ffi_type_sint32;
        case GW_NATIVE_UINT32: return &ffi_type_uint32;
        case GW_NATIVE_SINT64: return &ffi_type_sint64;
        case GW_NATIVE_UINT64: return &ffi_type_uint64;
        case GW_NATIVE_FLOAT: return &ffi_type_float;
        case GW_NATIVE_DOUBLE: return &ffi_type_double;
        case GW_NATIVE_POINTER: return &ffi_type_pointer;
        default: return nullptr;
    }

    return nullptr;
}

size_t Glfwire::FFI::nativeSizeOf(eNativeType type) {
    const auto FFITYPE = ffiTypeFrom(type);
    if (!FFITYPE || type == GW_NATIVE_VOID)
        return 0;

    return FFITYPE->size;
}
