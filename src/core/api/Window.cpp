#include <glfwire/core/Window.hpp>

#include "Shared.hpp"
#include "../callback/Registration.hpp"
#include "../callback/Signatures.hpp"
#include "../library/NativeLibrary.hpp"
#include "../marshal/OutArgs.hpp"
#include "../marshal/Structs.hpp"

#include <format>
#include <stdexcept>
#include <type_traits>

using namespace Glfwire;

static_assert(std::is_same_v<WindowPosFn, Signatures::WindowPos::HostFn>);
static_assert(std::is_same_v<WindowSizeFn, Signatures::WindowSize::HostFn>);
static_assert(std::is_same_v<WindowCloseFn, Signatures::WindowClose::HostFn>);
static_assert(std::is_same_v<WindowRefreshFn, Signatures::WindowRefresh::HostFn>);
static_assert(std::is_same_v<WindowFocusFn, Signatures::WindowFocus::HostFn>);
static_assert(std::is_same_v<WindowIconifyFn, Signatures::WindowIconify::HostFn>);
static_assert(std::is_same_v<WindowMaximizeFn, Signatures::WindowMaximize::HostFn>);
static_assert(std::is_same_v<FramebufferSizeFn, Signatures::FramebufferSize::HostFn>);
static_assert(std::is_same_v<WindowContentScaleFn, Signatures::WindowContentScale::HostFn>);

enum eHintKind : uint8_t {
    HINT_BOOL = 0,
    HINT_INT,
    HINT_INT_OR_DONT_CARE,
    HINT_CLIENT_API,
    HINT_CONTEXT_CREATION_API,
    HINT_CONTEXT_ROBUSTNESS,
    HINT_RELEASE_BEHAVIOR,
    HINT_OPENGL_PROFILE,
    HINT_STRING,
};

static eHintKind hintKind(eWindowHint hint) {
    switch (hint) {
        case GW_HINT_FOCUSED:
        case GW_HINT_ICONIFIED:
        case GW_HINT_RESIZABLE:
        case GW_HINT_VISIBLE:
        case GW_HINT_DECORATED:
        case GW_HINT_AUTO_ICONIFY:
        case GW_HINT_FLOATING:
        case GW_HINT_MAXIMIZED:
        case GW_HINT_CENTER_CURSOR:
        case GW_HINT_TRANSPARENT_FRAMEBUFFER:
        case GW_HINT_HOVERED:
        case GW_HINT_FOCUS_ON_SHOW:
        case GW_HINT_STEREO:
        case GW_HINT_SRGB_CAPABLE:
        case GW_HINT_DOUBLEBUFFER:
        case GW_HINT_OPENGL_FORWARD_COMPAT:
        case GW_HINT_OPENGL_DEBUG_CONTEXT:
        case GW_HINT_CONTEXT_NO_ERROR:
        case GW_HINT_SCALE_TO_MONITOR:
        case GW_HINT_COCOA_RETINA_FRAMEBUFFER:
        case GW_HINT_COCOA_GRAPHICS_SWITCHING: return HINT_BOOL;

        case GW_HINT_RED_BITS:
        case GW_HINT_GREEN_BITS:
        case GW_HINT_BLUE_BITS:
        case GW_HINT_ALPHA_BITS:
        case GW_HINT_DEPTH_BITS:
        case GW_HINT_STENCIL_BITS:
        case GW_HINT_ACCUM_RED_BITS:
        case GW_HINT_ACCUM_GREEN_BITS:
        case GW_HINT_ACCUM_BLUE_BITS:
        case GW_HINT_ACCUM_ALPHA_BITS:
        case GW_HINT_AUX_BUFFERS:
        case GW_HINT_SAMPLES:
        case GW_HINT_REFRESH_RATE: return HINT_INT_OR_DONT_CARE;

        case GW_HINT_CONTEXT_VERSION_MAJOR:
        case GW_HINT_CONTEXT_VERSION_MINOR:
        case GW_HINT_CONTEXT_REVISION: return HINT_INT;

        case GW_HINT_CLIENT_API: return HINT_CLIENT_API;
        case GW_HINT_CONTEXT_CREATION_API: return HINT_CONTEXT_CREATION_API;
        case GW_HINT_CONTEXT_ROBUSTNESS: return HINT_CONTEXT_ROBUSTNESS;
        case GW_HINT_CONTEXT_RELEASE_BEHAVIOR: return HINT_RELEASE_BEHAVIOR;
        case GW_HINT_OPENGL_PROFILE: return HINT_OPENGL_PROFILE;

        case GW_HINT_COCOA_FRAME_NAME:
        case GW_HINT_X11_CLASS_NAME:
        case GW_HINT_X11_INSTANCE_NAME: return HINT_STRING;
    }

    throw std::invalid_argument(std::format("window-hint: {} is not a member of this domain", sc<int32_t>(hint)));
}

static std::invalid_argument wrongKind(eWindowHint hint) {
    return std::invalid_argument(std::format("window hint {} does not take a value of this kind", Codecs::windowHints().name(hint)));
}

template <typename E>
static int32_t encodeEnumHint(eWindowHint hint, const HintValue& value, const CEnumCodec<E>& codec) {
    if (const auto V = std::get_if<E>(&value))
        return codec.encode(*V);

    // handed back from decodeWindowAttrib
    if (const auto U = std::get_if<SUnrecognized>(&value))
        return U->native;

    throw wrongKind(hint);
}

template <typename E>
static HintValue decodeEnumHint(int32_t native, const CEnumCodec<E>& codec) {
    if (const auto V = codec.decode(native); V)
        return *V;

    return SUnrecognized{native};
}

std::variant<int32_t, std::string> Glfwire::encodeWindowHint(eWindowHint hint, const HintValue& value) {
    switch (hintKind(hint)) {
        case HINT_BOOL: {
            if (const auto V = std::get_if<bool>(&value))
                return Types::Bool::serialize(*V);
            throw wrongKind(hint);
        }
        case HINT_INT_OR_DONT_CARE: {
            if (std::holds_alternative<SDontCare>(value))
                return -1;
            [[fallthrough]];
        }
        case HINT_INT: {
            if (const auto V = std::get_if<int32_t>(&value))
                return *V;
            throw wrongKind(hint);
        }
        case HINT_CLIENT_API: return encodeEnumHint(hint, value, Codecs::clientApis());
        case HINT_CONTEXT_CREATION_API: return encodeEnumHint(hint, value, Codecs::contextCreationApis());
        case HINT_CONTEXT_ROBUSTNESS: return encodeEnumHint(hint, value, Codecs::contextRobustness());
        case HINT_RELEASE_BEHAVIOR: return encodeEnumHint(hint, value, Codecs::releaseBehaviors());
        case HINT_OPENGL_PROFILE: return encodeEnumHint(hint, value, Codecs::openGLProfiles());
        case HINT_STRING: {
            if (const auto V = std::get_if<std::string>(&value))
                return *V;
            throw wrongKind(hint);
        }
    }

    UNREACHABLE();
    throw wrongKind(hint);
}

HintValue Glfwire::decodeWindowAttrib(eWindowHint hint, int32_t native) {
    switch (hintKind(hint)) {
        case HINT_BOOL: return Types::Bool::deserialize(native);
        case HINT_INT: return native;
        case HINT_INT_OR_DONT_CARE: {
            if (native == -1)
                return DONT_CARE;
            return native;
        }
        case HINT_CLIENT_API: return decodeEnumHint(native, Codecs::clientApis());
        case HINT_CONTEXT_CREATION_API: return decodeEnumHint(native, Codecs::contextCreationApis());
        case HINT_CONTEXT_ROBUSTNESS: return decodeEnumHint(native, Codecs::contextRobustness());
        case HINT_RELEASE_BEHAVIOR: return decodeEnumHint(native, Codecs::releaseBehaviors());
        case HINT_OPENGL_PROFILE: return decodeEnumHint(native, Codecs::openGLProfiles());
        case HINT_STRING: throw std::invalid_argument(std::format("window hint {} has no integer value", Codecs::windowHints().name(hint)));
    }

    UNREACHABLE();
    return SUnrecognized{native};
}

void Glfwire::defaultWindowHints() {
    library().call<void>(GW_EP_DEFAULT_WINDOW_HINTS);
}

void Glfwire::windowHint(eWindowHint hint, const HintValue& value) {
    const auto HINT    = Types::WindowHint::serialize(hint);
    const auto ENCODED = encodeWindowHint(hint, value);

    if (const auto STR = std::get_if<std::string>(&ENCODED))
        library().call<void>(GW_EP_WINDOW_HINT_STRING, HINT, STR->c_str());
    else
        library().call<void>(GW_EP_WINDOW_HINT, HINT, std::get<int32_t>(ENCODED));
}

void Glfwire::windowHints(const std::vector<std::pair<eWindowHint, HintValue>>& hints) {
    for (const auto& [hint, value] : hints) {
        windowHint(hint, value);
    }
}

SWindow* Glfwire::createWindow(int32_t width, int32_t height, const std::string& title, SMonitor* monitor, SWindow* share) {
    return library().call<SWindow*>(GW_EP_CREATE_WINDOW, width, height, title.c_str(), monitor, share);
}

void Glfwire::destroyWindow(SWindow* window) {
    library().call<void>(GW_EP_DESTROY_WINDOW, window);
    callbacks().dropObject(window);
}

bool Glfwire::windowShouldClose(SWindow* window) {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_WINDOW_SHOULD_CLOSE, window));
}

void Glfwire::setWindowShouldClose(SWindow* window, bool value) {
    library().call<void>(GW_EP_SET_WINDOW_SHOULD_CLOSE, window, Types::Bool::serialize(value));
}

void Glfwire::setWindowTitle(SWindow* window, const std::string& title) {
    library().call<void>(GW_EP_SET_WINDOW_TITLE, window, title.c_str());
}

void Glfwire::setWindowIcon(SWindow* window, const std::vector<SImage>& images) {
    CArena arena;
    auto   array = Marshal::serializeArray(images, arena);
    library().call<void>(GW_EP_SET_WINDOW_ICON, window, sc<int32_t>(images.size()), array);
}

std::tuple<int32_t, int32_t> Glfwire::getWindowPos(SWindow* window) {
    return Marshal::withOutArgs<Types::Int, Types::Int>([window](int32_t* x, int32_t* y) { library().call<void>(GW_EP_GET_WINDOW_POS, window, x, y); });
}

void Glfwire::setWindowPos(SWindow* window, int32_t x, int32_t y) {
    library().call<void>(GW_EP_SET_WINDOW_POS, window, x, y);
}

std::tuple<int32_t, int32_t> Glfwire::getWindowSize(SWindow* window) {
    return Marshal::withOutArgs<Types::Int, Types::Int>([window](int32_t* w, int32_t* h) { library().call<void>(GW_EP_GET_WINDOW_SIZE, window, w, h); });
}

void Glfwire::setWindowSizeLimits(SWindow* window, IntOrDontCare minWidth, IntOrDontCare minHeight, IntOrDontCare maxWidth, IntOrDontCare maxHeight) {
    library().call<void>(GW_EP_SET_WINDOW_SIZE_LIMITS, window, Api::orDontCare(minWidth), Api::orDontCare(minHeight), Api::orDontCare(maxWidth), Api::orDontCare(maxHeight));
}

void Glfwire::setWindowAspectRatio(SWindow* window, IntOrDontCare numerator, IntOrDontCare denominator) {
    library().call<void>(GW_EP_SET_WINDOW_ASPECT_RATIO, window, Api::orDontCare(numerator), Api::orDontCare(denominator));
}

void Glfwire::setWindowSize(SWindow* window, int32_t width, int32_t height) {
    library().call<void>(GW_EP_SET_WINDOW_SIZE, window, width, height);
}

std::tuple<int32_t, int32_t> Glfwire::getFramebufferSize(SWindow* window) {
    return Marshal::withOutArgs<Types::Int, Types::Int>([window](int32_t* w, int32_t* h) { library().call<void>(GW_EP_GET_FRAMEBUFFER_SIZE, window, w, h); });
}

std::tuple<int32_t, int32_t, int32_t, int32_t> Glfwire::getWindowFrameSize(SWindow* window) {
    return Marshal::withOutArgs<Types::Int, Types::Int, Types::Int, Types::Int>(
        [window](int32_t* left, int32_t* top, int32_t* right, int32_t* bottom) { library().call<void>(GW_EP_GET_WINDOW_FRAME_SIZE, window, left, top, right, bottom); });
}

std::tuple<float, float> Glfwire::getWindowContentScale(SWindow* window) {
    return Marshal::withOutArgs<Types::Float, Types::Float>([window](float* x, float* y) { library().call<void>(GW_EP_GET_WINDOW_CONTENT_SCALE, window, x, y); });
}

float Glfwire::getWindowOpacity(SWindow* window) {
    return library().call<float>(GW_EP_GET_WINDOW_OPACITY, window);
}

void Glfwire::setWindowOpacity(SWindow* window, float opacity) {
    library().call<void>(GW_EP_SET_WINDOW_OPACITY, window, opacity);
}

void Glfwire::iconifyWindow(SWindow* window) {
    library().call<void>(GW_EP_ICONIFY_WINDOW, window);
}

void Glfwire::restoreWindow(SWindow* window) {
    library().call<void>(GW_EP_RESTORE_WINDOW, window);
}

void Glfwire::maximizeWindow(SWindow* window) {
    library().call<void>(GW_EP_MAXIMIZE_WINDOW, window);
}

void Glfwire::showWindow(SWindow* window) {
    library().call<void>(GW_EP_SHOW_WINDOW, window);
}

void Glfwire::hideWindow(SWindow* window) {
    library().call<void>(GW_EP_HIDE_WINDOW, window);
}

void Glfwire::focusWindow(SWindow* window) {
    library().call<void>(GW_EP_FOCUS_WINDOW, window);
}

void Glfwire::requestWindowAttention(SWindow* window) {
    library().call<void>(GW_EP_REQUEST_WINDOW_ATTENTION, window);
}

SMonitor* Glfwire::getWindowMonitor(SWindow* window) {
    return library().call<SMonitor*>(GW_EP_GET_WINDOW_MONITOR, window);
}

void Glfwire::setWindowMonitor(SWindow* window, SMonitor* monitor, int32_t x, int32_t y, int32_t width, int32_t height, IntOrDontCare refreshRate) {
    library().call<void>(GW_EP_SET_WINDOW_MONITOR, window, monitor, x, y, width, height, Api::orDontCare(refreshRate));
}

void Glfwire::setWindowMonitor(SWindow* window, SMonitor* monitor, const SVideoMode& mode) {
    setWindowMonitor(window, monitor, 0, 0, mode.width, mode.height, mode.refreshRate);
}

void Glfwire::setWindowMonitor(SWindow* window, int32_t x, int32_t y, int32_t width, int32_t height) {
    setWindowMonitor(window, nullptr, x, y, width, height, DONT_CARE);
}

HintValue Glfwire::getWindowAttrib(SWindow* window, eWindowHint attrib) {
    return decodeWindowAttrib(attrib, library().call<int32_t>(GW_EP_GET_WINDOW_ATTRIB, window, Types::WindowHint::serialize(attrib)));
}

void Glfwire::setWindowAttrib(SWindow* window, eWindowHint attrib, const HintValue& value) {
    const auto ATTRIB  = Types::WindowHint::serialize(attrib);
    const auto ENCODED = encodeWindowHint(attrib, value);

    if (!std::holds_alternative<int32_t>(ENCODED))
        throw std::invalid_argument(std::format("window hint {} cannot be set as an attribute", Codecs::windowHints().name(attrib)));

    library().call<void>(GW_EP_SET_WINDOW_ATTRIB, window, ATTRIB, std::get<int32_t>(ENCODED));
}

void Glfwire::setWindowUserPointer(SWindow* window, void* pointer) {
    library().call<void>(GW_EP_SET_WINDOW_USER_POINTER, window, pointer);
}

void* Glfwire::getWindowUserPointer(SWindow* window) {
    return library().call<void*>(GW_EP_GET_WINDOW_USER_POINTER, window);
}

SP<ITrampoline> Glfwire::setWindowPosCallback(SWindow* window, WindowPosFn&& fn) {
    return setWindowPosCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowPosCallback(SWindow* window, WindowPosFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowPos>(GW_CALLBACK_WINDOW_POS, GW_EP_SET_WINDOW_POS_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowPosCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_POS, GW_EP_SET_WINDOW_POS_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowSizeCallback(SWindow* window, WindowSizeFn&& fn) {
    return setWindowSizeCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowSizeCallback(SWindow* window, WindowSizeFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowSize>(GW_CALLBACK_WINDOW_SIZE, GW_EP_SET_WINDOW_SIZE_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowSizeCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_SIZE, GW_EP_SET_WINDOW_SIZE_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowCloseCallback(SWindow* window, WindowCloseFn&& fn) {
    return setWindowCloseCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowCloseCallback(SWindow* window, WindowCloseFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowClose>(GW_CALLBACK_WINDOW_CLOSE, GW_EP_SET_WINDOW_CLOSE_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowCloseCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_CLOSE, GW_EP_SET_WINDOW_CLOSE_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowRefreshCallback(SWindow* window, WindowRefreshFn&& fn) {
    return setWindowRefreshCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowRefreshCallback(SWindow* window, WindowRefreshFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowRefresh>(GW_CALLBACK_WINDOW_REFRESH, GW_EP_SET_WINDOW_REFRESH_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowRefreshCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_REFRESH, GW_EP_SET_WINDOW_REFRESH_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowFocusCallback(SWindow* window, WindowFocusFn&& fn) {
    return setWindowFocusCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowFocusCallback(SWindow* window, WindowFocusFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowFocus>(GW_CALLBACK_WINDOW_FOCUS, GW_EP_SET_WINDOW_FOCUS_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowFocusCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_FOCUS, GW_EP_SET_WINDOW_FOCUS_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowIconifyCallback(SWindow* window, WindowIconifyFn&& fn) {
    return setWindowIconifyCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowIconifyCallback(SWindow* window, WindowIconifyFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowIconify>(GW_CALLBACK_WINDOW_ICONIFY, GW_EP_SET_WINDOW_ICONIFY_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowIconifyCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_ICONIFY, GW_EP_SET_WINDOW_ICONIFY_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowMaximizeCallback(SWindow* window, WindowMaximizeFn&& fn) {
    return setWindowMaximizeCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowMaximizeCallback(SWindow* window, WindowMaximizeFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowMaximize>(GW_CALLBACK_WINDOW_MAXIMIZE, GW_EP_SET_WINDOW_MAXIMIZE_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowMaximizeCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_MAXIMIZE, GW_EP_SET_WINDOW_MAXIMIZE_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setFramebufferSizeCallback(SWindow* window, FramebufferSizeFn&& fn) {
    return setFramebufferSizeCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setFramebufferSizeCallback(SWindow* window, FramebufferSizeFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::FramebufferSize>(GW_CALLBACK_FRAMEBUFFER_SIZE, GW_EP_SET_FRAMEBUFFER_SIZE_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setFramebufferSizeCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_FRAMEBUFFER_SIZE, GW_EP_SET_FRAMEBUFFER_SIZE_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setWindowContentScaleCallback(SWindow* window, WindowContentScaleFn&& fn) {
    return setWindowContentScaleCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setWindowContentScaleCallback(SWindow* window, WindowContentScaleFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::WindowContentScale>(GW_CALLBACK_WINDOW_CONTENT_SCALE, GW_EP_SET_WINDOW_CONTENT_SCALE_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setWindowContentScaleCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_WINDOW_CONTENT_SCALE, GW_EP_SET_WINDOW_CONTENT_SCALE_CALLBACK, window, trampoline);
}

void Glfwire::pollEvents() {
    library().call<void>(GW_EP_POLL_EVENTS);
}

void Glfwire::waitEvents() {
    library().call<void>(GW_EP_WAIT_EVENTS);
}

void Glfwire::waitEventsTimeout(double timeout) {
    library().call<void>(GW_EP_WAIT_EVENTS_TIMEOUT, timeout);
}

void Glfwire::postEmptyEvent() {
    library().call<void>(GW_EP_POST_EMPTY_EVENT);
}

void Glfwire::swapBuffers(SWindow* window) {
    library().call<void>(GW_EP_SWAP_BUFFERS, window);
}

void Glfwire::makeContextCurrent(SWindow* window) {
    library().call<void>(GW_EP_MAKE_CONTEXT_CURRENT, window);
}

SWindow* Glfwire::getCurrentContext() {
    return library().call<SWindow*>(GW_EP_GET_CURRENT_CONTEXT);
}

void Glfwire::swapInterval(int32_t interval) {
    library().call<void>(GW_EP_SWAP_INTERVAL, interval);
}

bool Glfwire::extensionSupported(const std::string& extension) {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_EXTENSION_SUPPORTED, extension.c_str()));
}

void* Glfwire::getProcAddress(const std::string& procedure) {
    return library().call<void*>(GW_EP_GET_PROC_ADDRESS, procedure.c_str());
}
