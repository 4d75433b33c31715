#include "shared.hpp"
#include "fake/FakeGlfw.hpp"

#include <glfwire/glfwire.hpp>

#include "../src/core/callback/CallbackRegistry.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Glfwire;

static std::vector<std::string> logged;

static void testLoading() {
    EXPECT(!load("/nonexistent/libglfw.so.3"));
    EXPECT(!loaded());
    EXPECT_THROW(getTime(), std::logic_error);

    EXPECT(load(FAKE_GLFW_PATH));
    EXPECT(loaded());

    EXPECT(init());

    const auto [major, minor, revision] = getVersion();
    EXPECT(major == 3);
    EXPECT(minor == 3);
    EXPECT(revision == 8);
    EXPECT(getVersionString() == "3.3.8 fake");

    initHint(GW_INIT_HINT_JOYSTICK_HAT_BUTTONS, false);
    int        value = -1;
    const auto HINT  = fakeglfwLastHint(&value);
    EXPECT(HINT == GW_INIT_HINT_JOYSTICK_HAT_BUTTONS);
    EXPECT(value == 0);

    setTime(2.5);
    EXPECT(getTime() == 2.5);
    EXPECT(getTimerValue() == 123456789012ULL);
    EXPECT(getTimerFrequency() == 1000000ULL);
}

static void testErrors() {
    EXPECT(!getError());

    std::optional<eErrorCode> lastCode;
    std::string               lastDescription;
    int                       calls = 0;

    EXPECT(!setErrorCallback([&](std::optional<eErrorCode> code, std::string description) {
        lastCode        = code;
        lastDescription = description;
        ++calls;
    }));

    fakeglfwRaiseError(0x00010003, "bad enum");
    EXPECT(calls == 1);
    EXPECT(lastCode == std::optional{GW_ERROR_INVALID_ENUM});
    EXPECT(lastDescription == "bad enum");

    const auto ERROR = getError();
    EXPECT(ERROR.has_value());
    if (ERROR) {
        EXPECT(ERROR->code == std::optional{GW_ERROR_INVALID_ENUM});
        EXPECT(ERROR->nativeCode == 0x00010003);
        EXPECT(ERROR->description == "bad enum");
    }
    EXPECT(!getError());

    // codes newer than the binding still come through
    fakeglfwRaiseError(0x0001FFFF, "from the future");
    EXPECT(calls == 2);
    EXPECT(lastCode == std::nullopt);
    const auto FUTURE = getError();
    EXPECT(FUTURE && FUTURE->nativeCode == 0x0001FFFF && !FUTURE->code);

    // last write wins, and the previous trampoline comes back
    const auto FIRST = setErrorCallback([&](std::optional<eErrorCode>, std::string) { calls += 100; });
    EXPECT(FIRST && FIRST->kind() == "error" && !FIRST->foreign());

    fakeglfwRaiseError(0x00010001, "not initialized");
    EXPECT(calls == 102);

    const auto SECOND = setErrorCallback(FIRST);
    EXPECT(SECOND && SECOND != FIRST);

    fakeglfwRaiseError(0x00010001, "not initialized");
    EXPECT(calls == 103);

    EXPECT(setErrorCallback(ErrorFn{}) == FIRST);
    fakeglfwRaiseError(0x00010001, "silent");
    EXPECT(calls == 103);
    EXPECT(getError().has_value());

    EXPECT(!setErrorCallback(SECOND));
    EXPECT(setErrorCallback(FIRST) == SECOND);
}

static void testHints(SWindow* window) {
    int value = 0;

    windowHint(GW_HINT_RESIZABLE, true);
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_RESIZABLE);
    EXPECT(value == 1);

    windowHint(GW_HINT_RED_BITS, DONT_CARE);
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_RED_BITS);
    EXPECT(value == -1);

    windowHint(GW_HINT_SAMPLES, 4);
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_SAMPLES);
    EXPECT(value == 4);

    windowHints({{GW_HINT_CLIENT_API, GW_OPENGL_API}, {GW_HINT_OPENGL_PROFILE, GW_OPENGL_CORE_PROFILE}});
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_OPENGL_PROFILE);
    EXPECT(value == GW_OPENGL_CORE_PROFILE);

    windowHint(GW_HINT_X11_CLASS_NAME, std::string{"glfwire"});
    int        stringHint = 0;
    const auto STRING     = fakeglfwLastStringHint(&stringHint);
    EXPECT(stringHint == GW_HINT_X11_CLASS_NAME);
    EXPECT(std::strcmp(STRING, "glfwire") == 0);

    EXPECT_THROW(windowHint(GW_HINT_RESIZABLE, 5), std::invalid_argument);
    EXPECT_THROW(windowHint(GW_HINT_CONTEXT_VERSION_MAJOR, DONT_CARE), std::invalid_argument);
    EXPECT_THROW(windowHint(GW_HINT_CLIENT_API, GW_OPENGL_CORE_PROFILE), std::invalid_argument);
    EXPECT_THROW(windowHint(GW_HINT_X11_CLASS_NAME, true), std::invalid_argument);
    EXPECT_THROW(setWindowAttrib(window, GW_HINT_X11_CLASS_NAME, std::string{"no"}), std::invalid_argument);

    EXPECT(getWindowAttrib(window, GW_HINT_RESIZABLE) == HintValue{true});
    EXPECT(getWindowAttrib(window, GW_HINT_RED_BITS) == HintValue{DONT_CARE});
    EXPECT(getWindowAttrib(window, GW_HINT_CLIENT_API) == HintValue{GW_OPENGL_API});
    EXPECT(getWindowAttrib(window, GW_HINT_OPENGL_PROFILE) == HintValue{SUnrecognized{0x00032999}});

    // an unrecognized value can be handed back as is
    setWindowAttrib(window, GW_HINT_OPENGL_PROFILE, SUnrecognized{0x00032999});
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_OPENGL_PROFILE);
    EXPECT(value == 0x00032999);

    setWindowAttrib(window, GW_HINT_DECORATED, false);
    EXPECT(fakeglfwLastHint(&value) == GW_HINT_DECORATED);
    EXPECT(value == 0);
}

static void testWindow(SWindow* window) {
    EXPECT(getWindowSize(window) == std::make_tuple(640, 480));
    EXPECT(getFramebufferSize(window) == std::make_tuple(1280, 960));
    EXPECT(getWindowFrameSize(window) == std::make_tuple(1, 20, 1, 2));
    EXPECT(getWindowContentScale(window) == std::make_tuple(2.F, 2.F));
    EXPECT(getWindowOpacity(window) == 0.75F);

    setWindowPos(window, 10, -20);
    EXPECT(getWindowPos(window) == std::make_tuple(10, -20));

    EXPECT(!windowShouldClose(window));
    setWindowShouldClose(window, true);
    EXPECT(windowShouldClose(window));

    int limits[4] = {};
    setWindowSizeLimits(window, 200, 100, DONT_CARE, DONT_CARE);
    fakeglfwSizeLimits(limits);
    EXPECT(limits[0] == 200);
    EXPECT(limits[1] == 100);
    EXPECT(limits[2] == -1);
    EXPECT(limits[3] == -1);

    setWindowAspectRatio(window, 16, 9);
    fakeglfwSizeLimits(limits);
    EXPECT(limits[0] == 16);
    EXPECT(limits[1] == 9);

    setWindowIcon(window, {SImage{.width = 1, .height = 1, .pixels = {10, 20, 30, 40}}, SImage{.width = 2, .height = 2, .pixels = std::vector<uint8_t>(16, 0)}});
    auto icon = fakeglfwIcon();
    EXPECT(icon.count == 2);
    EXPECT(icon.width == 1);
    EXPECT(icon.firstPixel[0] == 10);
    EXPECT(icon.firstPixel[3] == 40);

    setWindowIcon(window, {});
    EXPECT(fakeglfwIcon().count == 0);

    EXPECT_THROW(setWindowIcon(window, {SImage{.width = 4, .height = 4, .pixels = {1}}}), std::invalid_argument);

    int userData = 7;
    setWindowUserPointer(window, &userData);
    EXPECT(getWindowUserPointer(window) == &userData);

    makeContextCurrent(window);
    EXPECT(getCurrentContext() == window);
    EXPECT(extensionSupported("GL_ARB_debug_output"));
    EXPECT(!extensionSupported("GL_NV_nothing"));

    // not exported by this library
    EXPECT_THROW(getProcAddress("glClear"), std::logic_error);
    EXPECT_THROW(requestWindowAttention(window), std::logic_error);

    pollEvents();
    waitEventsTimeout(0.01);
}

static void testCallbacks(SWindow* window) {
    std::optional<eKey> lastKey;
    std::set<eModifier> lastMods;
    SWindow*            lastWindow = nullptr;
    int                 keyCalls   = 0;

    EXPECT(!setKeyCallback(window, [&](SWindow* w, std::optional<eKey> key, int32_t, std::optional<eKeyAction>, std::set<eModifier> mods) {
        lastWindow = w;
        lastKey    = key;
        lastMods   = mods;
        ++keyCalls;
    }));

    fakeglfwEmitKey(window, 65, 30, 1, 0x3);
    EXPECT(keyCalls == 1);
    EXPECT(lastWindow == window);
    EXPECT(lastKey == std::optional{GW_KEY_A});
    EXPECT(lastMods == (std::set<eModifier>{GW_MOD_SHIFT, GW_MOD_CONTROL}));

    const auto FIRST = setKeyCallback(window, [&](SWindow*, std::optional<eKey>, int32_t, std::optional<eKeyAction>, std::set<eModifier>) { keyCalls += 10; });
    EXPECT(FIRST && FIRST->kind() == "key");

    fakeglfwEmitKey(window, 65, 30, 0, 0);
    EXPECT(keyCalls == 11);

    // reinstalling the first one hands the second one back
    const auto SECOND = setKeyCallback(window, FIRST);
    EXPECT(SECOND && SECOND != FIRST);

    fakeglfwEmitKey(window, 256, 1, 0, 0);
    EXPECT(keyCalls == 12);
    EXPECT(lastKey == std::optional{GW_KEY_ESCAPE});

    // a trampoline of another kind is rejected before reaching the library
    EXPECT_THROW(setCharCallback(window, FIRST), std::invalid_argument);

    std::string typed;
    setCharCallback(window, [&](SWindow*, std::string c) { typed += c; });
    fakeglfwEmitChar(window, 'h');
    fakeglfwEmitChar(window, 0xE9);
    EXPECT(typed == "h\xC3\xA9");

    std::optional<eMouseButton> lastButton;
    setMouseButtonCallback(window, [&](SWindow*, std::optional<eMouseButton> button, std::optional<eKeyAction>, std::set<eModifier>) { lastButton = button; });
    fakeglfwEmitMouseButton(window, 1, 1, 0);
    EXPECT(lastButton == std::optional{GW_MOUSE_BUTTON_RIGHT});

    std::vector<std::string> dropped;
    setDropCallback(window, [&](SWindow*, std::vector<std::string> paths) { dropped = std::move(paths); });
    const char* PATHS[] = {"/home/user/a.txt", "/home/user/b.txt", "/home/user/c.txt"};
    fakeglfwEmitDrop(window, 3, PATHS);
    EXPECT(dropped.size() == 3);
    EXPECT(dropped.size() == 3 && dropped[2] == "/home/user/c.txt");

    std::optional<eConnectionEvent> lastEvent;
    setMonitorCallback([&](SMonitor*, std::optional<eConnectionEvent> event) { lastEvent = event; });
    fakeglfwEmitMonitor(0x00040002);
    EXPECT(lastEvent == std::optional{GW_DISCONNECTED});

    // a throwing callback is contained and reported
    logged.clear();
    setWindowSizeCallback(window, [](SWindow*, int32_t, int32_t) { throw std::runtime_error("resize failed"); });
    fakeglfwEmitWindowSize(window, 800, 600);
    EXPECT(logged.size() == 1);
    EXPECT(!logged.empty() && logged[0] == "callback window-size threw: resize failed");

    {
        CScope scope;
        int    resized = 0;
        setWindowSizeCallback(window, [&](SWindow*, int32_t, int32_t) { ++resized; }, scope);
        fakeglfwEmitWindowSize(window, 800, 600);
        EXPECT(resized == 1);
        EXPECT(callbacks().get(GW_CALLBACK_WINDOW_SIZE, window));

        EXPECT(setWindowSizeCallback(window, WindowSizeFn{}));
        EXPECT(!callbacks().get(GW_CALLBACK_WINDOW_SIZE, window));

        setWindowSizeCallback(window, [&](SWindow*, int32_t, int32_t) { ++resized; }, scope);
    }

    // the scope is gone but the library still holds its pointer
    EXPECT(!callbacks().get(GW_CALLBACK_WINDOW_SIZE, window));
    auto stale = setWindowSizeCallback(window, WindowSizeFn{});
    EXPECT(stale && stale->foreign());

    // closed scopes take no new callbacks
    CScope closed;
    closed.close();
    EXPECT_THROW(setWindowFocusCallback(window, [](SWindow*, bool) { ; }, closed), std::logic_error);
}

static void testDestroy() {
    auto other = createWindow(320, 240, "other");
    EXPECT(other != nullptr);

    setKeyCallback(other, [](SWindow*, std::optional<eKey>, int32_t, std::optional<eKeyAction>, std::set<eModifier>) { ; });
    setScrollCallback(other, [](SWindow*, double, double) { ; });
    EXPECT(callbacks().get(GW_CALLBACK_KEY, other));

    destroyWindow(other);
    EXPECT(!callbacks().get(GW_CALLBACK_KEY, other));
    EXPECT(!callbacks().get(GW_CALLBACK_SCROLL, other));
}

static void testMonitors() {
    const auto MONITORS = getMonitors();
    EXPECT(MONITORS.size() == 1);
    EXPECT(getPrimaryMonitor() == MONITORS[0]);

    const auto MONITOR = getPrimaryMonitor();
    EXPECT(getMonitorName(MONITOR) == std::optional<std::string>{"Fake Monitor"});
    EXPECT(getMonitorWorkarea(MONITOR) == std::make_tuple(0, 32, 1920, 1048));
    EXPECT(getMonitorPhysicalSize(MONITOR) == std::make_tuple(600, 340));
    EXPECT(getMonitorContentScale(MONITOR) == std::make_tuple(1.5F, 1.5F));

    const auto MODES = getVideoModes(MONITOR);
    EXPECT(MODES.size() == 2);
    EXPECT(MODES.size() == 2 && MODES[1].width == 1280 && MODES[1].refreshRate == 144);

    const auto MODE = getVideoMode(MONITOR);
    EXPECT(MODE && MODE->width == 1920 && MODE->redBits == 8);

    EXPECT(!getGammaRamp(MONITOR));

    const SGammaRamp RAMP{.red = {0, 100, 200, 65535}, .green = {0, 100, 200, 65535}, .blue = {0, 100, 200, 65535}};
    setGammaRamp(MONITOR, RAMP);

    const auto BACK = getGammaRamp(MONITOR);
    EXPECT(BACK && *BACK == RAMP);

    EXPECT_THROW(setGammaRamp(MONITOR, SGammaRamp{.red = {1}, .green = {}, .blue = {}}), std::invalid_argument);
}

static void testInput(SWindow* window) {
    setInputMode(window, GW_INPUT_MODE_CURSOR, GW_CURSOR_DISABLED);
    EXPECT(fakeglfwInputMode(window, GW_INPUT_MODE_CURSOR) == GW_CURSOR_DISABLED);
    EXPECT(getInputMode(window, GW_INPUT_MODE_CURSOR) == InputModeValue{GW_CURSOR_DISABLED});

    setInputMode(window, GW_INPUT_MODE_STICKY_KEYS, true);
    EXPECT(fakeglfwInputMode(window, GW_INPUT_MODE_STICKY_KEYS) == 1);
    EXPECT(getInputMode(window, GW_INPUT_MODE_STICKY_KEYS) == InputModeValue{true});

    EXPECT_THROW(setInputMode(window, GW_INPUT_MODE_CURSOR, true), std::invalid_argument);
    EXPECT_THROW(setInputMode(window, GW_INPUT_MODE_RAW_MOUSE_MOTION, GW_CURSOR_HIDDEN), std::invalid_argument);
    EXPECT(!rawMouseMotionSupported());

    EXPECT(getKeyScancode(GW_KEY_A) == std::optional<int32_t>{30});
    EXPECT(getKeyScancode(GW_KEY_ESCAPE) == std::nullopt);
    EXPECT(getKeyName(GW_KEY_A) == std::optional<std::string>{"a"});
    EXPECT(getKeyName(std::nullopt, 30) == std::optional<std::string>{"a"});
    EXPECT(getKeyName(GW_KEY_ESCAPE) == std::nullopt);

    EXPECT(getKey(window, GW_KEY_A) == std::optional{GW_PRESS});
    EXPECT(getKey(window, GW_KEY_ESCAPE) == std::optional{GW_RELEASE});
    EXPECT(getMouseButton(window, GW_MOUSE_BUTTON_LEFT) == std::optional{GW_PRESS});
    EXPECT(getCursorPos(window) == std::make_tuple(12.5, 40.25));

    EXPECT(createStandardCursor(GW_ARROW_CURSOR) != nullptr);
    const auto CURSOR = createCursor(SImage{.width = 1, .height = 1, .pixels = {0, 0, 0, 255}}, 0, 0);
    EXPECT(CURSOR != nullptr);
    setCursor(window, CURSOR);
    destroyCursor(CURSOR);

    EXPECT(joystickPresent(0));
    EXPECT(!joystickPresent(1));
    EXPECT(getJoystickAxes(0) == (std::vector<float>{0.5F, -1.F, 0.F}));
    EXPECT(getJoystickAxes(1).empty());

    const auto BUTTONS = getJoystickButtons(0);
    EXPECT(BUTTONS.size() == 3);
    EXPECT(BUTTONS.size() == 3 && BUTTONS[0] == std::optional{GW_PRESS} && BUTTONS[1] == std::optional{GW_RELEASE} && !BUTTONS[2]);

    const auto HATS = getJoystickHats(0);
    EXPECT(HATS.size() == 3);
    EXPECT(HATS.size() == 3 && HATS[0].empty() && HATS[1] == (std::set<eHat>{GW_HAT_UP, GW_HAT_RIGHT}) && HATS[2] == std::set<eHat>{GW_HAT_LEFT});

    EXPECT(getJoystickName(0) == std::optional<std::string>{"Fake Pad"});
    EXPECT(getJoystickName(1) == std::nullopt);
    EXPECT(getJoystickGUID(0) == std::optional<std::string>{"03000000fake"});
    EXPECT(joystickIsGamepad(0));
    EXPECT(getGamepadName(0) == std::optional<std::string>{"Fake Gamepad"});
    EXPECT(updateGamepadMappings("03000000fake,Fake Pad,a:b0"));

    const auto STATE = getGamepadState(0);
    EXPECT(STATE.has_value());
    if (STATE) {
        EXPECT(STATE->buttons == (std::set<eGamepadButton>{GW_GAMEPAD_BUTTON_A, GW_GAMEPAD_BUTTON_DPAD_UP}));
        EXPECT(STATE->axes.leftStick[0] == -0.5F);
        EXPECT(STATE->axes.rightTrigger == 1.F);
    }
    EXPECT(!getGamepadState(1));

    int pointer = 0;
    setJoystickUserPointer(0, &pointer);
    EXPECT(getJoystickUserPointer(0) == &pointer);

    EXPECT(!getClipboardString(window));
    setClipboardString(window, "copied");
    EXPECT(getClipboardString(window) == std::optional<std::string>{"copied"});
}

static void testTerminate(SWindow* window) {
    EXPECT(callbacks().get(GW_CALLBACK_KEY, window));

    setErrorCallback([](std::optional<eErrorCode>, std::string) { ; });
    terminate();

    EXPECT(fakeglfwTerminated());
    EXPECT(!callbacks().get(GW_CALLBACK_KEY, window));
    EXPECT(!callbacks().get(GW_CALLBACK_MONITOR, nullptr));
    EXPECT(callbacks().get(GW_CALLBACK_ERROR, nullptr));

    unload();
    EXPECT(!loaded());
    EXPECT(!callbacks().get(GW_CALLBACK_ERROR, nullptr));
    EXPECT_THROW(init(), std::logic_error);
}

int main() {
    setLogHandler([](eLogLevel level, const std::string& message) {
        if (level == ERR)
            logged.emplace_back(message);
    });

    fakeglfwReset();

    testLoading();
    testErrors();

    auto window = createWindow(640, 480, "glfwire");
    EXPECT(window != nullptr);
    if (!window) {
        std::println("err: no window");
        return 1;
    }

    testHints(window);
    testWindow(window);
    testCallbacks(window);
    testDestroy();
    testMonitors();
    testInput(window);
    testTerminate(window);

    if (ret == 0)
        std::println("Binding: ok");

    return ret;
}
