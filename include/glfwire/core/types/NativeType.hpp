#pragma once

#include <cstdint>

namespace Glfwire {

    /*
        Primitive layouts at the native boundary.
    */
    enum eNativeType : uint8_t {
        GW_NATIVE_VOID = 0,

        GW_NATIVE_SINT8,
        GW_NATIVE_UINT8,
        GW_NATIVE_SINT16,
        GW_NATIVE_UINT16,
        GW_NATIVE_SINT32,
        GW_NATIVE_UINT32,
        GW_NATIVE_SINT64,
        GW_NATIVE_UINT64,

        GW_NATIVE_FLOAT,
        GW_NATIVE_DOUBLE,

        /*
            Data pointers, function pointers and opaque handles.
        */
        GW_NATIVE_POINTER,
    };

    /*
        How a semantic type is converted between its host and native forms.
    */
    enum eSemanticKind : uint8_t {
        GW_KIND_PRIMITIVE = 0,
        GW_KIND_BOOL,
        GW_KIND_ENUM,
        GW_KIND_BITFLAG,
        GW_KIND_CSTRING,
        GW_KIND_CODEPOINT,
        GW_KIND_HANDLE,

        /*
            Records behind a pointer. Their field layout is a CStructLayout.
        */
        GW_KIND_STRUCT,
    };

    enum eSemanticType : uint8_t {
        GW_TYPE_VOID = 0,

        GW_TYPE_INT,
        GW_TYPE_UINT,
        GW_TYPE_INT64,
        GW_TYPE_UINT64,
        GW_TYPE_SHORT,
        GW_TYPE_BYTE,
        GW_TYPE_FLOAT,
        GW_TYPE_DOUBLE,
        GW_TYPE_POINTER,

        GW_TYPE_BOOL,
        GW_TYPE_CSTRING,
        GW_TYPE_CODEPOINT,

        GW_TYPE_WINDOW,
        GW_TYPE_MONITOR,
        GW_TYPE_CURSOR,

        GW_TYPE_ERROR_CODE,
        GW_TYPE_INIT_HINT,
        GW_TYPE_WINDOW_HINT,
        GW_TYPE_INPUT_MODE,
        GW_TYPE_KEY,
        GW_TYPE_KEY_ACTION,
        GW_TYPE_MOUSE_BUTTON,
        GW_TYPE_CONNECTION_EVENT,
        GW_TYPE_STANDARD_CURSOR,

        GW_TYPE_MODS,
        GW_TYPE_HAT,

        GW_TYPE_IMAGE,
        GW_TYPE_VIDMODE,
        GW_TYPE_GAMMA_RAMP,
        GW_TYPE_GAMEPAD_STATE,

        GW_TYPE_COUNT,
    };
};
