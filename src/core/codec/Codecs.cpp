#include <glfwire/core/types/Codecs.hpp>

using namespace Glfwire;

const CEnumCodec<eErrorCode>& Glfwire::Codecs::errorCodes() {
    static const CEnumCodec<eErrorCode> CODEC{
        "error-code",
        {
            {GW_ERROR_NO_ERROR,            "no-error"},
            {GW_ERROR_NOT_INITIALIZED,     "not-initialized"},
            {GW_ERROR_NO_CURRENT_CONTEXT,  "no-current-context"},
            {GW_ERROR_INVALID_ENUM,        "invalid-enum"},
            {GW_ERROR_INVALID_VALUE,       "invalid-value"},
            {GW_ERROR_OUT_OF_MEMORY,       "out-of-memory"},
            {GW_ERROR_API_UNAVAILABLE,     "api-unavailable"},
            {GW_ERROR_VERSION_UNAVAILABLE, "version-unavailable"},
            {GW_ERROR_PLATFORM_ERROR,      "platform-error"},
            {GW_ERROR_FORMAT_UNAVAILABLE,  "format-unavailable"},
            {GW_ERROR_NO_WINDOW_CONTEXT,   "no-window-context"},
        },
    };
    return CODEC;
}

const CEnumCodec<eInitHint>& Glfwire::Codecs::initHints() {
    static const CEnumCodec<eInitHint> CODEC{
        "init-hint",
        {
            {GW_INIT_HINT_JOYSTICK_HAT_BUTTONS,  "joystick-hat-buttons"},
            {GW_INIT_HINT_COCOA_CHDIR_RESOURCES, "cocoa-chdir-resources"},
            {GW_INIT_HINT_COCOA_MENUBAR,         "cocoa-menubar"},
        },
    };
    return CODEC;
}

const CEnumCodec<eWindowHint>& Glfwire::Codecs::windowHints() {
    static const CEnumCodec<eWindowHint> CODEC{
        "window-hint",
        {
            {GW_HINT_FOCUSED,                  "focused"},
            {GW_HINT_ICONIFIED,                "iconified"},
            {GW_HINT_RESIZABLE,                "resizable"},
            {GW_HINT_VISIBLE,                  "visible"},
            {GW_HINT_DECORATED,                "decorated"},
            {GW_HINT_AUTO_ICONIFY,             "auto-iconify"},
            {GW_HINT_FLOATING,                 "floating"},
            {GW_HINT_MAXIMIZED,                "maximized"},
            {GW_HINT_CENTER_CURSOR,            "center-cursor"},
            {GW_HINT_TRANSPARENT_FRAMEBUFFER,  "transparent-framebuffer"},
            {GW_HINT_HOVERED,                  "hovered"},
            {GW_HINT_FOCUS_ON_SHOW,            "focus-on-show"},
            {GW_HINT_RED_BITS,                 "red-bits"},
            {GW_HINT_GREEN_BITS,               "green-bits"},
            {GW_HINT_BLUE_BITS,                "blue-bits"},
            {GW_HINT_ALPHA_BITS,               "alpha-bits"},
            {GW_HINT_DEPTH_BITS,               "depth-bits"},
            {GW_HINT_STENCIL_BITS,             "stencil-bits"},
            {GW_HINT_ACCUM_RED_BITS,           "accum-red-bits"},
            {GW_HINT_ACCUM_GREEN_BITS,         "accum-green-bits"},
            {GW_HINT_ACCUM_BLUE_BITS,          "accum-blue-bits"},
            {GW_HINT_ACCUM_ALPHA_BITS,         "accum-alpha-bits"},
            {GW_HINT_AUX_BUFFERS,              "aux-buffers"},
            {GW_HINT_STEREO,                   "stereo"},
            {GW_HINT_SAMPLES,                  "samples"},
            {GW_HINT_SRGB_CAPABLE,             "srgb-capable"},
            {GW_HINT_REFRESH_RATE,             "refresh-rate"},
            {GW_HINT_DOUBLEBUFFER,             "doublebuffer"},
            {GW_HINT_CLIENT_API,               "client-api"},
            {GW_HINT_CONTEXT_VERSION_MAJOR,    "context-version-major"},
            {GW_HINT_CONTEXT_VERSION_MINOR,    "context-version-minor"},
            {GW_HINT_CONTEXT_REVISION,         "context-revision"},
            {GW_HINT_CONTEXT_ROBUSTNESS,       "context-robustness"},
            {GW_HINT_OPENGL_FORWARD_COMPAT,    "opengl-forward-compat"},
            {GW_HINT_OPENGL_DEBUG_CONTEXT,     "opengl-debug-context"},
            {GW_HINT_OPENGL_PROFILE,           "opengl-profile"},
            {GW_HINT_CONTEXT_RELEASE_BEHAVIOR, "context-release-behavior"},
            {GW_HINT_CONTEXT_NO_ERROR,         "context-no-error"},
            {GW_HINT_CONTEXT_CREATION_API,     "context-creation-api"},
            {GW_HINT_SCALE_TO_MONITOR,         "scale-to-monitor"},
            {GW_HINT_COCOA_RETINA_FRAMEBUFFER, "cocoa-retina-framebuffer"},
            {GW_HINT_COCOA_FRAME_NAME,         "cocoa-frame-name"},
            {GW_HINT_COCOA_GRAPHICS_SWITCHING, "cocoa-graphics-switching"},
            {GW_HINT_X11_CLASS_NAME,           "x11-class-name"},
            {GW_HINT_X11_INSTANCE_NAME,        "x11-instance-name"},
        },
    };
    return CODEC;
}

const CEnumCodec<eClientApi>& Glfwire::Codecs::clientApis() {
    static const CEnumCodec<eClientApi> CODEC{
        "client-api",
        {
            {GW_NO_API,        "no-api"},
            {GW_OPENGL_API,    "opengl-api"},
            {GW_OPENGL_ES_API, "opengl-es-api"},
        },
    };
    return CODEC;
}

const CEnumCodec<eContextCreationApi>& Glfwire::Codecs::contextCreationApis() {
    static const CEnumCodec<eContextCreationApi> CODEC{
        "context-creation-api",
        {
            {GW_NATIVE_CONTEXT_API, "native-context-api"},
            {GW_EGL_CONTEXT_API,    "egl-context-api"},
            {GW_OSMESA_CONTEXT_API, "osmesa-context-api"},
        },
    };
    return CODEC;
}

const CEnumCodec<eContextRobustness>& Glfwire::Codecs::contextRobustness() {
    static const CEnumCodec<eContextRobustness> CODEC{
        "context-robustness",
        {
            {GW_NO_ROBUSTNESS,         "no-robustness"},
            {GW_NO_RESET_NOTIFICATION, "no-reset-notification"},
            {GW_LOSE_CONTEXT_ON_RESET, "lose-context-on-reset"},
        },
    };
    return CODEC;
}

const CEnumCodec<eReleaseBehavior>& Glfwire::Codecs::releaseBehaviors() {
    static const CEnumCodec<eReleaseBehavior> CODEC{
        "release-behavior",
        {
            {GW_ANY_RELEASE_BEHAVIOR,   "any-release-behavior"},
            {GW_RELEASE_BEHAVIOR_FLUSH, "release-behavior-flush"},
            {GW_RELEASE_BEHAVIOR_NONE,  "release-behavior-none"},
        },
    };
    return CODEC;
}

const CEnumCodec<eOpenGLProfile>& Glfwire::Codecs::openGLProfiles() {
    static const CEnumCodec<eOpenGLProfile> CODEC{
        "opengl-profile",
        {
            {GW_OPENGL_ANY_PROFILE,    "opengl-any-profile"},
            {GW_OPENGL_CORE_PROFILE,   "opengl-core-profile"},
            {GW_OPENGL_COMPAT_PROFILE, "opengl-compat-profile"},
        },
    };
    return CODEC;
}

const CEnumCodec<eInputMode>& Glfwire::Codecs::inputModes() {
    static const CEnumCodec<eInputMode> CODEC{
        "input-mode",
        {
            {GW_INPUT_MODE_CURSOR,               "cursor"},
            {GW_INPUT_MODE_STICKY_KEYS,          "sticky-keys"},
            {GW_INPUT_MODE_STICKY_MOUSE_BUTTONS, "sticky-mouse-buttons"},
            {GW_INPUT_MODE_LOCK_KEY_MODS,        "lock-key-mods"},
            {GW_INPUT_MODE_RAW_MOUSE_MOTION,     "raw-mouse-motion"},
        },
    };
    return CODEC;
}

const CEnumCodec<eCursorMode>& Glfwire::Codecs::cursorModes() {
    static const CEnumCodec<eCursorMode> CODEC{
        "cursor-mode",
        {
            {GW_CURSOR_NORMAL,   "cursor-normal"},
            {GW_CURSOR_HIDDEN,   "cursor-hidden"},
            {GW_CURSOR_DISABLED, "cursor-disabled"},
        },
    };
    return CODEC;
}

const CEnumCodec<eKey>& Glfwire::Codecs::keys() {
    static const CEnumCodec<eKey> CODEC{
        "key",
        {
            {GW_KEY_UNKNOWN,       "key-unknown"},
            {GW_KEY_SPACE,         "key-space"},
            {GW_KEY_APOSTROPHE,    "key-apostrophe"},
            {GW_KEY_COMMA,         "key-comma"},
            {GW_KEY_MINUS,         "key-minus"},
            {GW_KEY_PERIOD,        "key-period"},
            {GW_KEY_SLASH,         "key-slash"},
            {GW_KEY_0,             "key-0"},
            {GW_KEY_1,             "key-1"},
            {GW_KEY_2,             "key-2"},
            {GW_KEY_3,             "key-3"},
            {GW_KEY_4,             "key-4"},
            {GW_KEY_5,             "key-5"},
            {GW_KEY_6,             "key-6"},
            {GW_KEY_7,             "key-7"},
            {GW_KEY_8,             "key-8"},
            {GW_KEY_9,             "key-9"},
            {GW_KEY_SEMICOLON,     "key-semicolon"},
            {GW_KEY_EQUAL,         "key-equal"},
            {GW_KEY_A,             "key-a"},
            {GW_KEY_B,             "key-b"},
            {GW_KEY_C,             "key-c"},
            {GW_KEY_D,             "key-d"},
            {GW_KEY_E,             "key-e"},
            {GW_KEY_F,             "key-f"},
            {GW_KEY_G,             "key-g"},
            {GW_KEY_H,             "key-h"},
            {GW_KEY_I,             "key-i"},
            {GW_KEY_J,             "key-j"},
            {GW_KEY_K,             "key-k"},
            {GW_KEY_L,             "key-l"},
            {GW_KEY_M,             "key-m"},
            {GW_KEY_N,             "key-n"},
            {GW_KEY_O,             "key-o"},
            {GW_KEY_P,             "key-p"},
            {GW_KEY_Q,             "key-q"},
            {GW_KEY_R,             "key-r"},
            {GW_KEY_S,             "key-s"},
            {GW_KEY_T,             "key-t"},
            {GW_KEY_U,             "key-u"},
            {GW_KEY_V,             "key-v"},
            {GW_KEY_W,             "key-w"},
            {GW_KEY_X,             "key-x"},
            {GW_KEY_Y,             "key-y"},
            {GW_KEY_Z,             "key-z"},
            {GW_KEY_LEFT_BRACKET,  "key-left-bracket"},
            {GW_KEY_BACKSLASH,     "key-backslash"},
            {GW_KEY_RIGHT_BRACKET, "key-right-bracket"},
            {GW_KEY_GRAVE_ACCENT,  "key-grave-accent"},
            {GW_KEY_WORLD_1,       "key-world-1"},
            {GW_KEY_WORLD_2,       "key-world-2"},
            {GW_KEY_ESCAPE,        "key-escape"},
            {GW_KEY_ENTER,         "key-enter"},
            {GW_KEY_TAB,           "key-tab"},
            {GW_KEY_BACKSPACE,     "key-backspace"},
            {GW_KEY_INSERT,        "key-insert"},
            {GW_KEY_DELETE,        "key-delete"},
            {GW_KEY_RIGHT,         "key-right"},
            {GW_KEY_LEFT,          "key-left"},
            {GW_KEY_DOWN,          "key-down"},
            {GW_KEY_UP,            "key-up"},
            {GW_KEY_PAGE_UP,       "key-page-up"},
            {GW_KEY_PAGE_DOWN,     "key-page-down"},
            {GW_KEY_HOME,          "key-home"},
            {GW_KEY_END,           "key-end"},
            {GW_KEY_CAPS_LOCK,     "key-caps-lock"},
            {GW_KEY_SCROLL_LOCK,   "key-scroll-lock"},
            {GW_KEY_NUM_LOCK,      "key-num-lock"},
            {GW_KEY_PRINT_SCREEN,  "key-print-screen"},
            {GW_KEY_PAUSE,         "key-pause"},
            {GW_KEY_F1,            "key-f1"},
            {GW_KEY_F2,            "key-f2"},
            {GW_KEY_F3,            "key-f3"},
            {GW_KEY_F4,            "key-f4"},
            {GW_KEY_F5,            "key-f5"},
            {GW_KEY_F6,            "key-f6"},
            {GW_KEY_F7,            "key-f7"},
            {GW_KEY_F8,            "key-f8"},
            {GW_KEY_F9,            "key-f9"},
            {GW_KEY_F10,           "key-f10"},
            {GW_KEY_F11,           "key-f11"},
            {GW_KEY_F12,           "key-f12"},
            {GW_KEY_F13,           "key-f13"},
            {GW_KEY_F14,           "key-f14"},
            {GW_KEY_F15,           "key-f15"},
            {GW_KEY_F16,           "key-f16"},
            {GW_KEY_F17,           "key-f17"},
            {GW_KEY_F18,           "key-f18"},
            {GW_KEY_F19,           "key-f19"},
            {GW_KEY_F20,           "key-f20"},
            {GW_KEY_F21,           "key-f21"},
            {GW_KEY_F22,           "key-f22"},
            {GW_KEY_F23,           "key-f23"},
            {GW_KEY_F24,           "key-f24"},
            {GW_KEY_F25,           "key-f25"},
            {GW_KEY_KP_0,          "key-kp-0"},
            {GW_KEY_KP_1,          "key-kp-1"},
            {GW_KEY_KP_2,          "key-kp-2"},
            {GW_KEY_KP_3,          "key-kp-3"},
            {GW_KEY_KP_4,          "key-kp-4"},
            {GW_KEY_KP_5,          "key-kp-5"},
            {GW_KEY_KP_6,          "key-kp-6"},
            {GW_KEY_KP_7,          "key-kp-7"},
            {GW_KEY_KP_8,          "key-kp-8"},
            {GW_KEY_KP_9,          "key-kp-9"},
            {GW_KEY_KP_DECIMAL,    "key-kp-decimal"},
            {GW_KEY_KP_DIVIDE,     "key-kp-divide"},
            {GW_KEY_KP_MULTIPLY,   "key-kp-multiply"},
            {GW_KEY_KP_SUBTRACT,   "key-kp-subtract"},
            {GW_KEY_KP_ADD,        "key-kp-add"},
            {GW_KEY_KP_ENTER,      "key-kp-enter"},
            {GW_KEY_KP_EQUAL,      "key-kp-equal"},
            {GW_KEY_LEFT_SHIFT,    "key-left-shift"},
            {GW_KEY_LEFT_CONTROL,  "key-left-control"},
            {GW_KEY_LEFT_ALT,      "key-left-alt"},
            {GW_KEY_LEFT_SUPER,    "key-left-super"},
            {GW_KEY_RIGHT_SHIFT,   "key-right-shift"},
            {GW_KEY_RIGHT_CONTROL, "key-right-control"},
            {GW_KEY_RIGHT_ALT,     "key-right-alt"},
            {GW_KEY_RIGHT_SUPER,   "key-right-super"},
            {GW_KEY_MENU,          "key-menu"},
        },
    };
    return CODEC;
}

const CEnumCodec<eKeyAction>& Glfwire::Codecs::keyActions() {
    static const CEnumCodec<eKeyAction> CODEC{
        "key-action",
        {
            {GW_RELEASE, "release"},
            {GW_PRESS,   "press"},
            {GW_REPEAT,  "repeat"},
        },
    };
    return CODEC;
}

const CEnumCodec<eMouseButton>& Glfwire::Codecs::mouseButtons() {
    static const CEnumCodec<eMouseButton> CODEC{
        "mouse-button",
        {
            {GW_MOUSE_BUTTON_1, "mouse-button-1"},
            {GW_MOUSE_BUTTON_2, "mouse-button-2"},
            {GW_MOUSE_BUTTON_3, "mouse-button-3"},
            {GW_MOUSE_BUTTON_4, "mouse-button-4"},
            {GW_MOUSE_BUTTON_5, "mouse-button-5"},
            {GW_MOUSE_BUTTON_6, "mouse-button-6"},
            {GW_MOUSE_BUTTON_7, "mouse-button-7"},
            {GW_MOUSE_BUTTON_8, "mouse-button-8"},
        },
        {
            {"mouse-button-left",   "mouse-button-1"},
            {"mouse-button-right",  "mouse-button-2"},
            {"mouse-button-middle", "mouse-button-3"},
        },
    };
    return CODEC;
}

const CEnumCodec<eConnectionEvent>& Glfwire::Codecs::connectionEvents() {
    static const CEnumCodec<eConnectionEvent> CODEC{
        "connection-event",
        {
            {GW_CONNECTED,    "connected"},
            {GW_DISCONNECTED, "disconnected"},
        },
    };
    return CODEC;
}

const CEnumCodec<eStandardCursor>& Glfwire::Codecs::standardCursors() {
    static const CEnumCodec<eStandardCursor> CODEC{
        "standard-cursor",
        {
            {GW_ARROW_CURSOR,     "arrow-cursor"},
            {GW_IBEAM_CURSOR,     "ibeam-cursor"},
            {GW_CROSSHAIR_CURSOR, "crosshair-cursor"},
            {GW_HAND_CURSOR,      "hand-cursor"},
            {GW_HRESIZE_CURSOR,   "hresize-cursor"},
            {GW_VRESIZE_CURSOR,   "vresize-cursor"},
        },
    };
    return CODEC;
}

const CEnumCodec<eGamepadButton>& Glfwire::Codecs::gamepadButtons() {
    static const CEnumCodec<eGamepadButton> CODEC{
        "gamepad-button",
        {
            {GW_GAMEPAD_BUTTON_A,            "a"},
            {GW_GAMEPAD_BUTTON_B,            "b"},
            {GW_GAMEPAD_BUTTON_X,            "x"},
            {GW_GAMEPAD_BUTTON_Y,            "y"},
            {GW_GAMEPAD_BUTTON_LEFT_BUMPER,  "left-bumper"},
            {GW_GAMEPAD_BUTTON_RIGHT_BUMPER, "right-bumper"},
            {GW_GAMEPAD_BUTTON_BACK,         "back"},
            {GW_GAMEPAD_BUTTON_START,        "start"},
            {GW_GAMEPAD_BUTTON_GUIDE,        "guide"},
            {GW_GAMEPAD_BUTTON_LEFT_THUMB,   "left-thumb"},
            {GW_GAMEPAD_BUTTON_RIGHT_THUMB,  "right-thumb"},
            {GW_GAMEPAD_BUTTON_DPAD_UP,      "dpad-up"},
            {GW_GAMEPAD_BUTTON_DPAD_RIGHT,   "dpad-right"},
            {GW_GAMEPAD_BUTTON_DPAD_DOWN,    "dpad-down"},
            {GW_GAMEPAD_BUTTON_DPAD_LEFT,    "dpad-left"},
        },
        {
            {"cross",    "a"},
            {"circle",   "b"},
            {"square",   "x"},
            {"triangle", "y"},
        },
    };
    return CODEC;
}

const CBitflagCodec<eModifier>& Glfwire::Codecs::modifiers() {
    static const CBitflagCodec<eModifier> CODEC{
        "mods",
        {
            {GW_MOD_SHIFT,     "mod-shift"},
            {GW_MOD_CONTROL,   "mod-control"},
            {GW_MOD_ALT,       "mod-alt"},
            {GW_MOD_SUPER,     "mod-super"},
            {GW_MOD_CAPS_LOCK, "mod-caps-lock"},
            {GW_MOD_NUM_LOCK,  "mod-num-lock"},
        },
    };
    return CODEC;
}

const CBitflagCodec<eHat>& Glfwire::Codecs::hats() {
    static const CBitflagCodec<eHat> CODEC{
        "hat",
        {
            {GW_HAT_UP,    "hat-up"},
            {GW_HAT_RIGHT, "hat-right"},
            {GW_HAT_DOWN,  "hat-down"},
            {GW_HAT_LEFT,  "hat-left"},
        },
    };
    return CODEC;
}
