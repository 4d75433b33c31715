#pragma once

#include <cstdint>
#include <vector>

#include <glfwire/core/types/NativeType.hpp>

namespace Glfwire {

    enum eEntryPoint : uint16_t {
        // initialization and errors
        GW_EP_INIT = 0,
        GW_EP_TERMINATE,
        GW_EP_INIT_HINT,
        GW_EP_GET_VERSION,
        GW_EP_GET_VERSION_STRING,
        GW_EP_GET_ERROR,
        GW_EP_SET_ERROR_CALLBACK,

        // windows
        GW_EP_DEFAULT_WINDOW_HINTS,
        GW_EP_WINDOW_HINT,
        GW_EP_WINDOW_HINT_STRING,
        GW_EP_CREATE_WINDOW,
        GW_EP_DESTROY_WINDOW,
        GW_EP_WINDOW_SHOULD_CLOSE,
        GW_EP_SET_WINDOW_SHOULD_CLOSE,
        GW_EP_SET_WINDOW_TITLE,
        GW_EP_SET_WINDOW_ICON,
        GW_EP_GET_WINDOW_POS,
        GW_EP_SET_WINDOW_POS,
        GW_EP_GET_WINDOW_SIZE,
        GW_EP_SET_WINDOW_SIZE_LIMITS,
        GW_EP_SET_WINDOW_ASPECT_RATIO,
        GW_EP_SET_WINDOW_SIZE,
        GW_EP_GET_FRAMEBUFFER_SIZE,
        GW_EP_GET_WINDOW_FRAME_SIZE,
        GW_EP_GET_WINDOW_CONTENT_SCALE,
        GW_EP_GET_WINDOW_OPACITY,
        GW_EP_SET_WINDOW_OPACITY,
        GW_EP_ICONIFY_WINDOW,
        GW_EP_RESTORE_WINDOW,
        GW_EP_MAXIMIZE_WINDOW,
        GW_EP_SHOW_WINDOW,
        GW_EP_HIDE_WINDOW,
        GW_EP_FOCUS_WINDOW,
        GW_EP_REQUEST_WINDOW_ATTENTION,
        GW_EP_GET_WINDOW_MONITOR,
        GW_EP_SET_WINDOW_MONITOR,
        GW_EP_GET_WINDOW_ATTRIB,
        GW_EP_SET_WINDOW_ATTRIB,
        GW_EP_SET_WINDOW_USER_POINTER,
        GW_EP_GET_WINDOW_USER_POINTER,
        GW_EP_SET_WINDOW_POS_CALLBACK,
        GW_EP_SET_WINDOW_SIZE_CALLBACK,
        GW_EP_SET_WINDOW_CLOSE_CALLBACK,
        GW_EP_SET_WINDOW_REFRESH_CALLBACK,
        GW_EP_SET_WINDOW_FOCUS_CALLBACK,
        GW_EP_SET_WINDOW_ICONIFY_CALLBACK,
        GW_EP_SET_WINDOW_MAXIMIZE_CALLBACK,
        GW_EP_SET_FRAMEBUFFER_SIZE_CALLBACK,
        GW_EP_SET_WINDOW_CONTENT_SCALE_CALLBACK,
        GW_EP_POLL_EVENTS,
        GW_EP_WAIT_EVENTS,
        GW_EP_WAIT_EVENTS_TIMEOUT,
        GW_EP_POST_EMPTY_EVENT,
        GW_EP_SWAP_BUFFERS,

        // context
        GW_EP_MAKE_CONTEXT_CURRENT,
        GW_EP_GET_CURRENT_CONTEXT,
        GW_EP_SWAP_INTERVAL,
        GW_EP_EXTENSION_SUPPORTED,
        GW_EP_GET_PROC_ADDRESS,

        // monitors
        GW_EP_GET_MONITORS,
        GW_EP_GET_PRIMARY_MONITOR,
        GW_EP_GET_MONITOR_POS,
        GW_EP_GET_MONITOR_WORKAREA,
        GW_EP_GET_MONITOR_PHYSICAL_SIZE,
        GW_EP_GET_MONITOR_CONTENT_SCALE,
        GW_EP_GET_MONITOR_NAME,
        GW_EP_SET_MONITOR_USER_POINTER,
        GW_EP_GET_MONITOR_USER_POINTER,
        GW_EP_SET_MONITOR_CALLBACK,
        GW_EP_GET_VIDEO_MODES,
        GW_EP_GET_VIDEO_MODE,
        GW_EP_SET_GAMMA,
        GW_EP_GET_GAMMA_RAMP,
        GW_EP_SET_GAMMA_RAMP,

        // input
        GW_EP_GET_INPUT_MODE,
        GW_EP_SET_INPUT_MODE,
        GW_EP_RAW_MOUSE_MOTION_SUPPORTED,
        GW_EP_GET_KEY_NAME,
        GW_EP_GET_KEY_SCANCODE,
        GW_EP_GET_KEY,
        GW_EP_GET_MOUSE_BUTTON,
        GW_EP_GET_CURSOR_POS,
        GW_EP_SET_CURSOR_POS,
        GW_EP_CREATE_CURSOR,
        GW_EP_CREATE_STANDARD_CURSOR,
        GW_EP_DESTROY_CURSOR,
        GW_EP_SET_CURSOR,
        GW_EP_SET_KEY_CALLBACK,
        GW_EP_SET_CHAR_CALLBACK,
        GW_EP_SET_CHAR_MODS_CALLBACK,
        GW_EP_SET_MOUSE_BUTTON_CALLBACK,
        GW_EP_SET_CURSOR_POS_CALLBACK,
        GW_EP_SET_CURSOR_ENTER_CALLBACK,
        GW_EP_SET_SCROLL_CALLBACK,
        GW_EP_SET_DROP_CALLBACK,
        GW_EP_JOYSTICK_PRESENT,
        GW_EP_GET_JOYSTICK_AXES,
        GW_EP_GET_JOYSTICK_BUTTONS,
        GW_EP_GET_JOYSTICK_HATS,
        GW_EP_GET_JOYSTICK_NAME,
        GW_EP_GET_JOYSTICK_GUID,
        GW_EP_SET_JOYSTICK_USER_POINTER,
        GW_EP_GET_JOYSTICK_USER_POINTER,
        GW_EP_JOYSTICK_IS_GAMEPAD,
        GW_EP_SET_JOYSTICK_CALLBACK,
        GW_EP_UPDATE_GAMEPAD_MAPPINGS,
        GW_EP_GET_GAMEPAD_NAME,
        GW_EP_GET_GAMEPAD_STATE,
        GW_EP_SET_CLIPBOARD_STRING,
        GW_EP_GET_CLIPBOARD_STRING,

        // time
        GW_EP_GET_TIME,
        GW_EP_SET_TIME,
        GW_EP_GET_TIMER_VALUE,
        GW_EP_GET_TIMER_FREQUENCY,

        GW_EP_COUNT,
    };

    struct SEntryPoint {
        eEntryPoint                id      = GW_EP_COUNT;
        const char*                symbol  = "";
        eSemanticType              returns = GW_TYPE_VOID;
        std::vector<eSemanticType> params;
    };

    /*
        Every native function the binding calls, indexed by eEntryPoint.
    */
    const std::vector<SEntryPoint>& entryPoints();
};
