#pragma once

#include <ffi.h>
#include <cstddef>
#include <glfwire/core/types/NativeType.hpp>

namespace Glfwire::FFI {
    ffi_type* ffiTypeFrom(eNativeType type);
    size_t    nativeSizeOf(eNativeType type);
}
