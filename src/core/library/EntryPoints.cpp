#include "EntryPoints.hpp"
#include "../../Macros.hpp"

using namespace Glfwire;

static const std::vector<SEntryPoint> ENTRY_POINTS = {
    {GW_EP_INIT, "glfwInit", GW_TYPE_BOOL, {}},
    {GW_EP_TERMINATE, "glfwTerminate", GW_TYPE_VOID, {}},
    {GW_EP_INIT_HINT, "glfwInitHint", GW_TYPE_VOID, {GW_TYPE_INIT_HINT, GW_TYPE_INT}},
    {GW_EP_GET_VERSION, "glfwGetVersion", GW_TYPE_VOID, {GW_TYPE_POINTER, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_VERSION_STRING, "glfwGetVersionString", GW_TYPE_CSTRING, {}},
    {GW_EP_GET_ERROR, "glfwGetError", GW_TYPE_INT, {GW_TYPE_POINTER}},
    {GW_EP_SET_ERROR_CALLBACK, "glfwSetErrorCallback", GW_TYPE_POINTER, {GW_TYPE_POINTER}},

    {GW_EP_DEFAULT_WINDOW_HINTS, "glfwDefaultWindowHints", GW_TYPE_VOID, {}},
    {GW_EP_WINDOW_HINT, "glfwWindowHint", GW_TYPE_VOID, {GW_TYPE_WINDOW_HINT, GW_TYPE_INT}},
    {GW_EP_WINDOW_HINT_STRING, "glfwWindowHintString", GW_TYPE_VOID, {GW_TYPE_WINDOW_HINT, GW_TYPE_CSTRING}},
    {GW_EP_CREATE_WINDOW, "glfwCreateWindow", GW_TYPE_WINDOW, {GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_CSTRING, GW_TYPE_MONITOR, GW_TYPE_WINDOW}},
    {GW_EP_DESTROY_WINDOW, "glfwDestroyWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_WINDOW_SHOULD_CLOSE, "glfwWindowShouldClose", GW_TYPE_BOOL, {GW_TYPE_WINDOW}},
    {GW_EP_SET_WINDOW_SHOULD_CLOSE, "glfwSetWindowShouldClose", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_BOOL}},
    {GW_EP_SET_WINDOW_TITLE, "glfwSetWindowTitle", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_CSTRING}},
    {GW_EP_SET_WINDOW_ICON, "glfwSetWindowIcon", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_IMAGE}},
    {GW_EP_GET_WINDOW_POS, "glfwGetWindowPos", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_POS, "glfwSetWindowPos", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_GET_WINDOW_SIZE, "glfwGetWindowSize", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_SIZE_LIMITS, "glfwSetWindowSizeLimits", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_SET_WINDOW_ASPECT_RATIO, "glfwSetWindowAspectRatio", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_SET_WINDOW_SIZE, "glfwSetWindowSize", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_GET_FRAMEBUFFER_SIZE, "glfwGetFramebufferSize", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_WINDOW_FRAME_SIZE, "glfwGetWindowFrameSize", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_WINDOW_CONTENT_SCALE, "glfwGetWindowContentScale", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_WINDOW_OPACITY, "glfwGetWindowOpacity", GW_TYPE_FLOAT, {GW_TYPE_WINDOW}},
    {GW_EP_SET_WINDOW_OPACITY, "glfwSetWindowOpacity", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_FLOAT}},
    {GW_EP_ICONIFY_WINDOW, "glfwIconifyWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_RESTORE_WINDOW, "glfwRestoreWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_MAXIMIZE_WINDOW, "glfwMaximizeWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_SHOW_WINDOW, "glfwShowWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_HIDE_WINDOW, "glfwHideWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_FOCUS_WINDOW, "glfwFocusWindow", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_REQUEST_WINDOW_ATTENTION, "glfwRequestWindowAttention", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_GET_WINDOW_MONITOR, "glfwGetWindowMonitor", GW_TYPE_MONITOR, {GW_TYPE_WINDOW}},
    {GW_EP_SET_WINDOW_MONITOR, "glfwSetWindowMonitor", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_MONITOR, GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_GET_WINDOW_ATTRIB, "glfwGetWindowAttrib", GW_TYPE_INT, {GW_TYPE_WINDOW, GW_TYPE_WINDOW_HINT}},
    {GW_EP_SET_WINDOW_ATTRIB, "glfwSetWindowAttrib", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_WINDOW_HINT, GW_TYPE_INT}},
    {GW_EP_SET_WINDOW_USER_POINTER, "glfwSetWindowUserPointer", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_GET_WINDOW_USER_POINTER, "glfwGetWindowUserPointer", GW_TYPE_POINTER, {GW_TYPE_WINDOW}},
    {GW_EP_SET_WINDOW_POS_CALLBACK, "glfwSetWindowPosCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_SIZE_CALLBACK, "glfwSetWindowSizeCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_CLOSE_CALLBACK, "glfwSetWindowCloseCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_REFRESH_CALLBACK, "glfwSetWindowRefreshCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_FOCUS_CALLBACK, "glfwSetWindowFocusCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_ICONIFY_CALLBACK, "glfwSetWindowIconifyCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_MAXIMIZE_CALLBACK, "glfwSetWindowMaximizeCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_FRAMEBUFFER_SIZE_CALLBACK, "glfwSetFramebufferSizeCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_WINDOW_CONTENT_SCALE_CALLBACK, "glfwSetWindowContentScaleCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_POLL_EVENTS, "glfwPollEvents", GW_TYPE_VOID, {}},
    {GW_EP_WAIT_EVENTS, "glfwWaitEvents", GW_TYPE_VOID, {}},
    {GW_EP_WAIT_EVENTS_TIMEOUT, "glfwWaitEventsTimeout", GW_TYPE_VOID, {GW_TYPE_DOUBLE}},
    {GW_EP_POST_EMPTY_EVENT, "glfwPostEmptyEvent", GW_TYPE_VOID, {}},
    {GW_EP_SWAP_BUFFERS, "glfwSwapBuffers", GW_TYPE_VOID, {GW_TYPE_WINDOW}},

    {GW_EP_MAKE_CONTEXT_CURRENT, "glfwMakeContextCurrent", GW_TYPE_VOID, {GW_TYPE_WINDOW}},
    {GW_EP_GET_CURRENT_CONTEXT, "glfwGetCurrentContext", GW_TYPE_WINDOW, {}},
    {GW_EP_SWAP_INTERVAL, "glfwSwapInterval", GW_TYPE_VOID, {GW_TYPE_INT}},
    {GW_EP_EXTENSION_SUPPORTED, "glfwExtensionSupported", GW_TYPE_BOOL, {GW_TYPE_CSTRING}},
    {GW_EP_GET_PROC_ADDRESS, "glfwGetProcAddress", GW_TYPE_POINTER, {GW_TYPE_CSTRING}},

    {GW_EP_GET_MONITORS, "glfwGetMonitors", GW_TYPE_POINTER, {GW_TYPE_POINTER}},
    {GW_EP_GET_PRIMARY_MONITOR, "glfwGetPrimaryMonitor", GW_TYPE_MONITOR, {}},
    {GW_EP_GET_MONITOR_POS, "glfwGetMonitorPos", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_MONITOR_WORKAREA, "glfwGetMonitorWorkarea", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_POINTER, GW_TYPE_POINTER, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_MONITOR_PHYSICAL_SIZE, "glfwGetMonitorPhysicalSize", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_MONITOR_CONTENT_SCALE, "glfwGetMonitorContentScale", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_GET_MONITOR_NAME, "glfwGetMonitorName", GW_TYPE_CSTRING, {GW_TYPE_MONITOR}},
    {GW_EP_SET_MONITOR_USER_POINTER, "glfwSetMonitorUserPointer", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_POINTER}},
    {GW_EP_GET_MONITOR_USER_POINTER, "glfwGetMonitorUserPointer", GW_TYPE_POINTER, {GW_TYPE_MONITOR}},
    {GW_EP_SET_MONITOR_CALLBACK, "glfwSetMonitorCallback", GW_TYPE_POINTER, {GW_TYPE_POINTER}},
    {GW_EP_GET_VIDEO_MODES, "glfwGetVideoModes", GW_TYPE_VIDMODE, {GW_TYPE_MONITOR, GW_TYPE_POINTER}},
    {GW_EP_GET_VIDEO_MODE, "glfwGetVideoMode", GW_TYPE_VIDMODE, {GW_TYPE_MONITOR}},
    {GW_EP_SET_GAMMA, "glfwSetGamma", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_FLOAT}},
    {GW_EP_GET_GAMMA_RAMP, "glfwGetGammaRamp", GW_TYPE_GAMMA_RAMP, {GW_TYPE_MONITOR}},
    {GW_EP_SET_GAMMA_RAMP, "glfwSetGammaRamp", GW_TYPE_VOID, {GW_TYPE_MONITOR, GW_TYPE_GAMMA_RAMP}},

    {GW_EP_GET_INPUT_MODE, "glfwGetInputMode", GW_TYPE_INT, {GW_TYPE_WINDOW, GW_TYPE_INPUT_MODE}},
    {GW_EP_SET_INPUT_MODE, "glfwSetInputMode", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_INPUT_MODE, GW_TYPE_INT}},
    {GW_EP_RAW_MOUSE_MOTION_SUPPORTED, "glfwRawMouseMotionSupported", GW_TYPE_BOOL, {}},
    {GW_EP_GET_KEY_NAME, "glfwGetKeyName", GW_TYPE_CSTRING, {GW_TYPE_KEY, GW_TYPE_INT}},
    {GW_EP_GET_KEY_SCANCODE, "glfwGetKeyScancode", GW_TYPE_INT, {GW_TYPE_KEY}},
    {GW_EP_GET_KEY, "glfwGetKey", GW_TYPE_KEY_ACTION, {GW_TYPE_WINDOW, GW_TYPE_KEY}},
    {GW_EP_GET_MOUSE_BUTTON, "glfwGetMouseButton", GW_TYPE_KEY_ACTION, {GW_TYPE_WINDOW, GW_TYPE_MOUSE_BUTTON}},
    {GW_EP_GET_CURSOR_POS, "glfwGetCursorPos", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_POINTER, GW_TYPE_POINTER}},
    {GW_EP_SET_CURSOR_POS, "glfwSetCursorPos", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_DOUBLE, GW_TYPE_DOUBLE}},
    {GW_EP_CREATE_CURSOR, "glfwCreateCursor", GW_TYPE_CURSOR, {GW_TYPE_IMAGE, GW_TYPE_INT, GW_TYPE_INT}},
    {GW_EP_CREATE_STANDARD_CURSOR, "glfwCreateStandardCursor", GW_TYPE_CURSOR, {GW_TYPE_STANDARD_CURSOR}},
    {GW_EP_DESTROY_CURSOR, "glfwDestroyCursor", GW_TYPE_VOID, {GW_TYPE_CURSOR}},
    {GW_EP_SET_CURSOR, "glfwSetCursor", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_CURSOR}},
    {GW_EP_SET_KEY_CALLBACK, "glfwSetKeyCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_CHAR_CALLBACK, "glfwSetCharCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_CHAR_MODS_CALLBACK, "glfwSetCharModsCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_MOUSE_BUTTON_CALLBACK, "glfwSetMouseButtonCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_CURSOR_POS_CALLBACK, "glfwSetCursorPosCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_CURSOR_ENTER_CALLBACK, "glfwSetCursorEnterCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_SCROLL_CALLBACK, "glfwSetScrollCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_SET_DROP_CALLBACK, "glfwSetDropCallback", GW_TYPE_POINTER, {GW_TYPE_WINDOW, GW_TYPE_POINTER}},
    {GW_EP_JOYSTICK_PRESENT, "glfwJoystickPresent", GW_TYPE_BOOL, {GW_TYPE_INT}},
    {GW_EP_GET_JOYSTICK_AXES, "glfwGetJoystickAxes", GW_TYPE_POINTER, {GW_TYPE_INT, GW_TYPE_POINTER}},
    {GW_EP_GET_JOYSTICK_BUTTONS, "glfwGetJoystickButtons", GW_TYPE_POINTER, {GW_TYPE_INT, GW_TYPE_POINTER}},
    {GW_EP_GET_JOYSTICK_HATS, "glfwGetJoystickHats", GW_TYPE_POINTER, {GW_TYPE_INT, GW_TYPE_POINTER}},
    {GW_EP_GET_JOYSTICK_NAME, "glfwGetJoystickName", GW_TYPE_CSTRING, {GW_TYPE_INT}},
    {GW_EP_GET_JOYSTICK_GUID, "glfwGetJoystickGUID", GW_TYPE_CSTRING, {GW_TYPE_INT}},
    {GW_EP_SET_JOYSTICK_USER_POINTER, "glfwSetJoystickUserPointer", GW_TYPE_VOID, {GW_TYPE_INT, GW_TYPE_POINTER}},
    {GW_EP_GET_JOYSTICK_USER_POINTER, "glfwGetJoystickUserPointer", GW_TYPE_POINTER, {GW_TYPE_INT}},
    {GW_EP_JOYSTICK_IS_GAMEPAD, "glfwJoystickIsGamepad", GW_TYPE_BOOL, {GW_TYPE_INT}},
    {GW_EP_SET_JOYSTICK_CALLBACK, "glfwSetJoystickCallback", GW_TYPE_POINTER, {GW_TYPE_POINTER}},
    {GW_EP_UPDATE_GAMEPAD_MAPPINGS, "glfwUpdateGamepadMappings", GW_TYPE_BOOL, {GW_TYPE_CSTRING}},
    {GW_EP_GET_GAMEPAD_NAME, "glfwGetGamepadName", GW_TYPE_CSTRING, {GW_TYPE_INT}},
    {GW_EP_GET_GAMEPAD_STATE, "glfwGetGamepadState", GW_TYPE_BOOL, {GW_TYPE_INT, GW_TYPE_GAMEPAD_STATE}},
    {GW_EP_SET_CLIPBOARD_STRING, "glfwSetClipboardString", GW_TYPE_VOID, {GW_TYPE_WINDOW, GW_TYPE_CSTRING}},
    {GW_EP_GET_CLIPBOARD_STRING, "glfwGetClipboardString", GW_TYPE_CSTRING, {GW_TYPE_WINDOW}},

    {GW_EP_GET_TIME, "glfwGetTime", GW_TYPE_DOUBLE, {}},
    {GW_EP_SET_TIME, "glfwSetTime", GW_TYPE_VOID, {GW_TYPE_DOUBLE}},
    {GW_EP_GET_TIMER_VALUE, "glfwGetTimerValue", GW_TYPE_UINT64, {}},
    {GW_EP_GET_TIMER_FREQUENCY, "glfwGetTimerFrequency", GW_TYPE_UINT64, {}},
};

const std::vector<SEntryPoint>& Glfwire::entryPoints() {
    [[maybe_unused]] static const bool CHECKED = [] {
        RASSERT(ENTRY_POINTS.size() == GW_EP_COUNT, "entry point table has {} rows for {} entry points", ENTRY_POINTS.size(), sc<size_t>(GW_EP_COUNT));
        for (size_t i = 0; i < ENTRY_POINTS.size(); ++i) {
            RASSERT(ENTRY_POINTS[i].id == i, "entry point table out of order at {}", ENTRY_POINTS[i].symbol);
        }
        return true;
    }();

    return ENTRY_POINTS;
}
