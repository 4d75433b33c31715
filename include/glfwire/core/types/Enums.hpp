#pragma once

#include <cstdint>

/*
    Symbolic constants of the native library. Enumerator values are the
    library's own constants, so they can be compared against anything the
    library documents.
*/

namespace Glfwire {
    enum eErrorCode : int32_t {
        GW_ERROR_NO_ERROR            = 0,
        GW_ERROR_NOT_INITIALIZED     = 0x00010001,
        GW_ERROR_NO_CURRENT_CONTEXT  = 0x00010002,
        GW_ERROR_INVALID_ENUM        = 0x00010003,
        GW_ERROR_INVALID_VALUE       = 0x00010004,
        GW_ERROR_OUT_OF_MEMORY       = 0x00010005,
        GW_ERROR_API_UNAVAILABLE     = 0x00010006,
        GW_ERROR_VERSION_UNAVAILABLE = 0x00010007,
        GW_ERROR_PLATFORM_ERROR      = 0x00010008,
        GW_ERROR_FORMAT_UNAVAILABLE  = 0x00010009,
        GW_ERROR_NO_WINDOW_CONTEXT   = 0x0001000A,
    };

    enum eInitHint : int32_t {
        GW_INIT_HINT_JOYSTICK_HAT_BUTTONS  = 0x00050001,
        GW_INIT_HINT_COCOA_CHDIR_RESOURCES = 0x00051001,
        GW_INIT_HINT_COCOA_MENUBAR         = 0x00051002,
    };

    /*
        Window hints double as window attributes.
    */
    enum eWindowHint : int32_t {
        GW_HINT_FOCUSED                 = 0x00020001,
        GW_HINT_ICONIFIED               = 0x00020002,
        GW_HINT_RESIZABLE               = 0x00020003,
        GW_HINT_VISIBLE                 = 0x00020004,
        GW_HINT_DECORATED               = 0x00020005,
        GW_HINT_AUTO_ICONIFY            = 0x00020006,
        GW_HINT_FLOATING                = 0x00020007,
        GW_HINT_MAXIMIZED               = 0x00020008,
        GW_HINT_CENTER_CURSOR           = 0x00020009,
        GW_HINT_TRANSPARENT_FRAMEBUFFER = 0x0002000A,
        GW_HINT_HOVERED                 = 0x0002000B,
        GW_HINT_FOCUS_ON_SHOW           = 0x0002000C,

        GW_HINT_RED_BITS         = 0x00021001,
        GW_HINT_GREEN_BITS       = 0x00021002,
        GW_HINT_BLUE_BITS        = 0x00021003,
        GW_HINT_ALPHA_BITS       = 0x00021004,
        GW_HINT_DEPTH_BITS       = 0x00021005,
        GW_HINT_STENCIL_BITS     = 0x00021006,
        GW_HINT_ACCUM_RED_BITS   = 0x00021007,
        GW_HINT_ACCUM_GREEN_BITS = 0x00021008,
        GW_HINT_ACCUM_BLUE_BITS  = 0x00021009,
        GW_HINT_ACCUM_ALPHA_BITS = 0x0002100A,
        GW_HINT_AUX_BUFFERS      = 0x0002100B,
        GW_HINT_STEREO           = 0x0002100C,
        GW_HINT_SAMPLES          = 0x0002100D,
        GW_HINT_SRGB_CAPABLE     = 0x0002100E,
        GW_HINT_REFRESH_RATE     = 0x0002100F,
        GW_HINT_DOUBLEBUFFER     = 0x00021010,

        GW_HINT_CLIENT_API               = 0x00022001,
        GW_HINT_CONTEXT_VERSION_MAJOR    = 0x00022002,
        GW_HINT_CONTEXT_VERSION_MINOR    = 0x00022003,
        GW_HINT_CONTEXT_REVISION         = 0x00022004,
        GW_HINT_CONTEXT_ROBUSTNESS       = 0x00022005,
        GW_HINT_OPENGL_FORWARD_COMPAT    = 0x00022006,
        GW_HINT_OPENGL_DEBUG_CONTEXT     = 0x00022007,
        GW_HINT_OPENGL_PROFILE           = 0x00022008,
        GW_HINT_CONTEXT_RELEASE_BEHAVIOR = 0x00022009,
        GW_HINT_CONTEXT_NO_ERROR         = 0x0002200A,
        GW_HINT_CONTEXT_CREATION_API     = 0x0002200B,
        GW_HINT_SCALE_TO_MONITOR         = 0x0002200C,

        GW_HINT_COCOA_RETINA_FRAMEBUFFER = 0x00023001,
        GW_HINT_COCOA_FRAME_NAME         = 0x00023002,
        GW_HINT_COCOA_GRAPHICS_SWITCHING = 0x00023003,

        GW_HINT_X11_CLASS_NAME    = 0x00024001,
        GW_HINT_X11_INSTANCE_NAME = 0x00024002,
    };

    enum eClientApi : int32_t {
        GW_NO_API        = 0,
        GW_OPENGL_API    = 0x00030001,
        GW_OPENGL_ES_API = 0x00030002,
    };

    enum eContextCreationApi : int32_t {
        GW_NATIVE_CONTEXT_API = 0x00036001,
        GW_EGL_CONTEXT_API    = 0x00036002,
        GW_OSMESA_CONTEXT_API = 0x00036003,
    };

    enum eContextRobustness : int32_t {
        GW_NO_ROBUSTNESS         = 0,
        GW_NO_RESET_NOTIFICATION = 0x00031001,
        GW_LOSE_CONTEXT_ON_RESET = 0x00031002,
    };

    enum eReleaseBehavior : int32_t {
        GW_ANY_RELEASE_BEHAVIOR   = 0,
        GW_RELEASE_BEHAVIOR_FLUSH = 0x00035001,
        GW_RELEASE_BEHAVIOR_NONE  = 0x00035002,
    };

    enum eOpenGLProfile : int32_t {
        GW_OPENGL_ANY_PROFILE    = 0,
        GW_OPENGL_CORE_PROFILE   = 0x00032001,
        GW_OPENGL_COMPAT_PROFILE = 0x00032002,
    };

    enum eInputMode : int32_t {
        GW_INPUT_MODE_CURSOR               = 0x00033001,
        GW_INPUT_MODE_STICKY_KEYS          = 0x00033002,
        GW_INPUT_MODE_STICKY_MOUSE_BUTTONS = 0x00033003,
        GW_INPUT_MODE_LOCK_KEY_MODS        = 0x00033004,
        GW_INPUT_MODE_RAW_MOUSE_MOTION     = 0x00033005,
    };

    enum eCursorMode : int32_t {
        GW_CURSOR_NORMAL   = 0x00034001,
        GW_CURSOR_HIDDEN   = 0x00034002,
        GW_CURSOR_DISABLED = 0x00034003,
    };

    enum eKey : int32_t {
        GW_KEY_UNKNOWN = -1,

        GW_KEY_SPACE         = 32,
        GW_KEY_APOSTROPHE    = 39,
        GW_KEY_COMMA         = 44,
        GW_KEY_MINUS         = 45,
        GW_KEY_PERIOD        = 46,
        GW_KEY_SLASH         = 47,
        GW_KEY_0             = 48,
        GW_KEY_1             = 49,
        GW_KEY_2             = 50,
        GW_KEY_3             = 51,
        GW_KEY_4             = 52,
        GW_KEY_5             = 53,
        GW_KEY_6             = 54,
        GW_KEY_7             = 55,
        GW_KEY_8             = 56,
        GW_KEY_9             = 57,
        GW_KEY_SEMICOLON     = 59,
        GW_KEY_EQUAL         = 61,
        GW_KEY_A             = 65,
        GW_KEY_B             = 66,
        GW_KEY_C             = 67,
        GW_KEY_D             = 68,
        GW_KEY_E             = 69,
        GW_KEY_F             = 70,
        GW_KEY_G             = 71,
        GW_KEY_H             = 72,
        GW_KEY_I             = 73,
        GW_KEY_J             = 74,
        GW_KEY_K             = 75,
        GW_KEY_L             = 76,
        GW_KEY_M             = 77,
        GW_KEY_N             = 78,
        GW_KEY_O             = 79,
        GW_KEY_P             = 80,
        GW_KEY_Q             = 81,
        GW_KEY_R             = 82,
        GW_KEY_S             = 83,
        GW_KEY_T             = 84,
        GW_KEY_U             = 85,
        GW_KEY_V             = 86,
        GW_KEY_W             = 87,
        GW_KEY_X             = 88,
        GW_KEY_Y             = 89,
        GW_KEY_Z             = 90,
        GW_KEY_LEFT_BRACKET  = 91,
        GW_KEY_BACKSLASH     = 92,
        GW_KEY_RIGHT_BRACKET = 93,
        GW_KEY_GRAVE_ACCENT  = 96,
        GW_KEY_WORLD_1       = 161,
        GW_KEY_WORLD_2       = 162,

        GW_KEY_ESCAPE        = 256,
        GW_KEY_ENTER         = 257,
        GW_KEY_TAB           = 258,
        GW_KEY_BACKSPACE     = 259,
        GW_KEY_INSERT        = 260,
        GW_KEY_DELETE        = 261,
        GW_KEY_RIGHT         = 262,
        GW_KEY_LEFT          = 263,
        GW_KEY_DOWN          = 264,
        GW_KEY_UP            = 265,
        GW_KEY_PAGE_UP       = 266,
        GW_KEY_PAGE_DOWN     = 267,
        GW_KEY_HOME          = 268,
        GW_KEY_END           = 269,
        GW_KEY_CAPS_LOCK     = 280,
        GW_KEY_SCROLL_LOCK   = 281,
        GW_KEY_NUM_LOCK      = 282,
        GW_KEY_PRINT_SCREEN  = 283,
        GW_KEY_PAUSE         = 284,
        GW_KEY_F1            = 290,
        GW_KEY_F2            = 291,
        GW_KEY_F3            = 292,
        GW_KEY_F4            = 293,
        GW_KEY_F5            = 294,
        GW_KEY_F6            = 295,
        GW_KEY_F7            = 296,
        GW_KEY_F8            = 297,
        GW_KEY_F9            = 298,
        GW_KEY_F10           = 299,
        GW_KEY_F11           = 300,
        GW_KEY_F12           = 301,
        GW_KEY_F13           = 302,
        GW_KEY_F14           = 303,
        GW_KEY_F15           = 304,
        GW_KEY_F16           = 305,
        GW_KEY_F17           = 306,
        GW_KEY_F18           = 307,
        GW_KEY_F19           = 308,
        GW_KEY_F20           = 309,
        GW_KEY_F21           = 310,
        GW_KEY_F22           = 311,
        GW_KEY_F23           = 312,
        GW_KEY_F24           = 313,
        GW_KEY_F25           = 314,
        GW_KEY_KP_0          = 320,
        GW_KEY_KP_1          = 321,
        GW_KEY_KP_2          = 322,
        GW_KEY_KP_3          = 323,
        GW_KEY_KP_4          = 324,
        GW_KEY_KP_5          = 325,
        GW_KEY_KP_6          = 326,
        GW_KEY_KP_7          = 327,
        GW_KEY_KP_8          = 328,
        GW_KEY_KP_9          = 329,
        GW_KEY_KP_DECIMAL    = 330,
        GW_KEY_KP_DIVIDE     = 331,
        GW_KEY_KP_MULTIPLY   = 332,
        GW_KEY_KP_SUBTRACT   = 333,
        GW_KEY_KP_ADD        = 334,
        GW_KEY_KP_ENTER      = 335,
        GW_KEY_KP_EQUAL      = 336,
        GW_KEY_LEFT_SHIFT    = 340,
        GW_KEY_LEFT_CONTROL  = 341,
        GW_KEY_LEFT_ALT      = 342,
        GW_KEY_LEFT_SUPER    = 343,
        GW_KEY_RIGHT_SHIFT   = 344,
        GW_KEY_RIGHT_CONTROL = 345,
        GW_KEY_RIGHT_ALT     = 346,
        GW_KEY_RIGHT_SUPER   = 347,
        GW_KEY_MENU          = 348,
    };

    enum eKeyAction : int32_t {
        GW_RELEASE = 0,
        GW_PRESS   = 1,
        GW_REPEAT  = 2,
    };

    enum eMouseButton : int32_t {
        GW_MOUSE_BUTTON_1 = 0,
        GW_MOUSE_BUTTON_2 = 1,
        GW_MOUSE_BUTTON_3 = 2,
        GW_MOUSE_BUTTON_4 = 3,
        GW_MOUSE_BUTTON_5 = 4,
        GW_MOUSE_BUTTON_6 = 5,
        GW_MOUSE_BUTTON_7 = 6,
        GW_MOUSE_BUTTON_8 = 7,

        /*
            Aliases. Decoding always yields the numbered button.
        */
        GW_MOUSE_BUTTON_LEFT   = GW_MOUSE_BUTTON_1,
        GW_MOUSE_BUTTON_RIGHT  = GW_MOUSE_BUTTON_2,
        GW_MOUSE_BUTTON_MIDDLE = GW_MOUSE_BUTTON_3,
    };

    /*
        Bitflags, combined into a set.
    */
    enum eModifier : int32_t {
        GW_MOD_SHIFT     = 0x0001,
        GW_MOD_CONTROL   = 0x0002,
        GW_MOD_ALT       = 0x0004,
        GW_MOD_SUPER     = 0x0008,
        GW_MOD_CAPS_LOCK = 0x0010,
        GW_MOD_NUM_LOCK  = 0x0020,
    };

    /*
        Bitflags. A centered hat is the empty set.
    */
    enum eHat : int32_t {
        GW_HAT_UP    = 1,
        GW_HAT_RIGHT = 2,
        GW_HAT_DOWN  = 4,
        GW_HAT_LEFT  = 8,
    };

    enum eConnectionEvent : int32_t {
        GW_CONNECTED    = 0x00040001,
        GW_DISCONNECTED = 0x00040002,
    };

    enum eStandardCursor : int32_t {
        GW_ARROW_CURSOR     = 0x00036001,
        GW_IBEAM_CURSOR     = 0x00036002,
        GW_CROSSHAIR_CURSOR = 0x00036003,
        GW_HAND_CURSOR      = 0x00036004,
        GW_HRESIZE_CURSOR   = 0x00036005,
        GW_VRESIZE_CURSOR   = 0x00036006,
    };

    /*
        Indices into the native gamepad state's button array.
    */
    enum eGamepadButton : int32_t {
        GW_GAMEPAD_BUTTON_A            = 0,
        GW_GAMEPAD_BUTTON_B            = 1,
        GW_GAMEPAD_BUTTON_X            = 2,
        GW_GAMEPAD_BUTTON_Y            = 3,
        GW_GAMEPAD_BUTTON_LEFT_BUMPER  = 4,
        GW_GAMEPAD_BUTTON_RIGHT_BUMPER = 5,
        GW_GAMEPAD_BUTTON_BACK         = 6,
        GW_GAMEPAD_BUTTON_START        = 7,
        GW_GAMEPAD_BUTTON_GUIDE        = 8,
        GW_GAMEPAD_BUTTON_LEFT_THUMB   = 9,
        GW_GAMEPAD_BUTTON_RIGHT_THUMB  = 10,
        GW_GAMEPAD_BUTTON_DPAD_UP      = 11,
        GW_GAMEPAD_BUTTON_DPAD_RIGHT   = 12,
        GW_GAMEPAD_BUTTON_DPAD_DOWN    = 13,
        GW_GAMEPAD_BUTTON_DPAD_LEFT    = 14,

        GW_GAMEPAD_BUTTON_CROSS    = GW_GAMEPAD_BUTTON_A,
        GW_GAMEPAD_BUTTON_CIRCLE   = GW_GAMEPAD_BUTTON_B,
        GW_GAMEPAD_BUTTON_SQUARE   = GW_GAMEPAD_BUTTON_X,
        GW_GAMEPAD_BUTTON_TRIANGLE = GW_GAMEPAD_BUTTON_Y,
    };

    constexpr const uint32_t GW_GAMEPAD_BUTTON_COUNT = 15;
    constexpr const uint32_t GW_GAMEPAD_AXIS_COUNT   = 6;
};
