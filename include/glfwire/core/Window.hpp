#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "Scope.hpp"
#include "Trampoline.hpp"
#include "types/Types.hpp"

namespace Glfwire {

    /*
        Hints are validated against their kind: boolean hints take a bool,
        framebuffer bit depths, samples and the refresh rate take an int or
        DONT_CARE, context versions take an int, the API and profile hints take
        their enum and the platform name hints take a string.

        A value of the wrong kind throws std::invalid_argument.
    */
    std::variant<int32_t, std::string> encodeWindowHint(eWindowHint hint, const HintValue& value);

    /*
        The inverse of encodeWindowHint for integer valued hints. Enum values
        the binding does not know decode to SUnrecognized.
    */
    HintValue                          decodeWindowAttrib(eWindowHint hint, int32_t native);

    void                               defaultWindowHints();
    void                               windowHint(eWindowHint hint, const HintValue& value);
    void                               windowHints(const std::vector<std::pair<eWindowHint, HintValue>>& hints);

    SWindow*                           createWindow(int32_t width, int32_t height, const std::string& title, SMonitor* monitor = nullptr, SWindow* share = nullptr);

    /*
        Also unsets every callback slot of the window.
    */
    void                                               destroyWindow(SWindow* window);

    bool                                               windowShouldClose(SWindow* window);
    void                                               setWindowShouldClose(SWindow* window, bool value);
    void                                               setWindowTitle(SWindow* window, const std::string& title);

    /*
        An empty list reverts to the default icon.
    */
    void                                               setWindowIcon(SWindow* window, const std::vector<SImage>& images);

    std::tuple<int32_t, int32_t>                       getWindowPos(SWindow* window);
    void                                               setWindowPos(SWindow* window, int32_t x, int32_t y);
    std::tuple<int32_t, int32_t>                       getWindowSize(SWindow* window);
    void                                               setWindowSizeLimits(SWindow* window, IntOrDontCare minWidth, IntOrDontCare minHeight, IntOrDontCare maxWidth,
                                                                           IntOrDontCare maxHeight);
    void                                               setWindowAspectRatio(SWindow* window, IntOrDontCare numerator, IntOrDontCare denominator);
    void                                               setWindowSize(SWindow* window, int32_t width, int32_t height);
    std::tuple<int32_t, int32_t>                       getFramebufferSize(SWindow* window);

    // left, top, right, bottom
    std::tuple<int32_t, int32_t, int32_t, int32_t> getWindowFrameSize(SWindow* window);

    std::tuple<float, float>                       getWindowContentScale(SWindow* window);
    float                                          getWindowOpacity(SWindow* window);
    void                                           setWindowOpacity(SWindow* window, float opacity);

    void                                           iconifyWindow(SWindow* window);
    void                                           restoreWindow(SWindow* window);
    void                                           maximizeWindow(SWindow* window);
    void                                           showWindow(SWindow* window);
    void                                           hideWindow(SWindow* window);
    void                                           focusWindow(SWindow* window);
    void                                           requestWindowAttention(SWindow* window);

    SMonitor*                                      getWindowMonitor(SWindow* window);
    void setWindowMonitor(SWindow* window, SMonitor* monitor, int32_t x, int32_t y, int32_t width, int32_t height, IntOrDontCare refreshRate = DONT_CARE);

    /*
        Full screen on monitor in the given video mode.
    */
    void setWindowMonitor(SWindow* window, SMonitor* monitor, const SVideoMode& mode);

    /*
        Back to windowed mode at the given area.
    */
    void      setWindowMonitor(SWindow* window, int32_t x, int32_t y, int32_t width, int32_t height);

    HintValue getWindowAttrib(SWindow* window, eWindowHint attrib);
    void      setWindowAttrib(SWindow* window, eWindowHint attrib, const HintValue& value);

    void      setWindowUserPointer(SWindow* window, void* pointer);
    void*     getWindowUserPointer(SWindow* window);

    using WindowPosFn          = std::function<void(SWindow* window, int32_t x, int32_t y)>;
    using WindowSizeFn         = std::function<void(SWindow* window, int32_t width, int32_t height)>;
    using WindowCloseFn        = std::function<void(SWindow* window)>;
    using WindowRefreshFn      = std::function<void(SWindow* window)>;
    using WindowFocusFn        = std::function<void(SWindow* window, bool focused)>;
    using WindowIconifyFn      = std::function<void(SWindow* window, bool iconified)>;
    using WindowMaximizeFn     = std::function<void(SWindow* window, bool maximized)>;
    using FramebufferSizeFn    = std::function<void(SWindow* window, int32_t width, int32_t height)>;
    using WindowContentScaleFn = std::function<void(SWindow* window, float x, float y)>;

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowPosCallback(SWindow* window, WindowPosFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowPosCallback(SWindow* window, WindowPosFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowPosCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowSizeCallback(SWindow* window, WindowSizeFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowSizeCallback(SWindow* window, WindowSizeFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowSizeCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowCloseCallback(SWindow* window, WindowCloseFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowCloseCallback(SWindow* window, WindowCloseFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowCloseCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowRefreshCallback(SWindow* window, WindowRefreshFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowRefreshCallback(SWindow* window, WindowRefreshFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowRefreshCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowFocusCallback(SWindow* window, WindowFocusFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowFocusCallback(SWindow* window, WindowFocusFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowFocusCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowIconifyCallback(SWindow* window, WindowIconifyFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowIconifyCallback(SWindow* window, WindowIconifyFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowIconifyCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowMaximizeCallback(SWindow* window, WindowMaximizeFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowMaximizeCallback(SWindow* window, WindowMaximizeFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowMaximizeCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setFramebufferSizeCallback(SWindow* window, FramebufferSizeFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setFramebufferSizeCallback(SWindow* window, FramebufferSizeFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setFramebufferSizeCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowContentScaleCallback(SWindow* window, WindowContentScaleFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowContentScaleCallback(SWindow* window, WindowContentScaleFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setWindowContentScaleCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    /*
        Callbacks run inside these, on the calling thread.
    */
    void pollEvents();
    void waitEvents();
    void waitEventsTimeout(double timeout);
    void postEmptyEvent();
    void swapBuffers(SWindow* window);

    void makeContextCurrent(SWindow* window);
    SWindow* getCurrentContext();
    void     swapInterval(int32_t interval);
    bool     extensionSupported(const std::string& extension);
    void*    getProcAddress(const std::string& procedure);
};
