#include "FakeGlfw.hpp"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

/*
    Just enough of the native library for the tests. Symbols the tests need
    to be missing (glfwGetProcAddress, glfwRequestWindowAttention) are not
    defined on purpose.
*/

typedef void (*FakeErrorFn)(int, const char*);
typedef void (*FakeMonitorFn)(void*, int);
typedef void (*FakeJoystickFn)(int, int);
typedef void (*FakeSizeFn)(void*, int, int);
typedef void (*FakeKeyFn)(void*, int, int, int, int);
typedef void (*FakeCharFn)(void*, unsigned int);
typedef void (*FakeMouseButtonFn)(void*, int, int, int);
typedef void (*FakeDropFn)(void*, int, const char**);
typedef void (*FakeFocusFn)(void*, int);

struct SFakeVidmode {
    int width, height, redBits, greenBits, blueBits, refreshRate;
};

struct SFakeImage {
    int            width, height;
    unsigned char* pixels;
};

struct SFakeGammaRamp {
    unsigned short* red;
    unsigned short* green;
    unsigned short* blue;
    unsigned int    size;
};

struct SFakeGamepadState {
    unsigned char buttons[15];
    float         axes[6];
};

struct SFakeWindow {
    int                 width = 0, height = 0;
    int                 x = 0, y = 0;
    bool                shouldClose = false;
    void*               user        = nullptr;
    std::string         title;
    std::string         clipboard;
    std::map<int, int>  inputModes;

    FakeSizeFn          pos = nullptr, size = nullptr, framebufferSize = nullptr;
    FakeFocusFn         focus = nullptr, iconify = nullptr, maximize = nullptr, cursorEnter = nullptr;
    void                (*close)(void*) = nullptr, (*refresh)(void*) = nullptr;
    void                (*contentScale)(void*, float, float) = nullptr;
    void                (*cursorPos)(void*, double, double) = nullptr, (*scroll)(void*, double, double) = nullptr;
    FakeKeyFn           key         = nullptr;
    FakeCharFn          character   = nullptr;
    void                (*charMods)(void*, unsigned int, int) = nullptr;
    FakeMouseButtonFn   mouseButton = nullptr;
    FakeDropFn          drop        = nullptr;
};

static struct {
    FakeErrorFn                  error    = nullptr;
    FakeMonitorFn                monitor  = nullptr;
    FakeJoystickFn               joystick = nullptr;

    int                          errorCode = 0;
    std::string                  errorDescription;

    int                          lastHint = 0, lastHintValue = 0;
    int                          lastStringHint = 0;
    std::string                  lastStringHintValue;
    int                          sizeLimits[4] = {0, 0, 0, 0};
    SFakeIcon                    icon          = {};
    bool                         terminated    = false;

    double                       time = 0.0;

    std::vector<unsigned short>  gamma[3];
    SFakeGammaRamp               gammaRamp = {};

    void*                        joystickUser = nullptr;
} g_state;

static int          g_monitorStorage = 0;
static void*        g_monitors[]     = {&g_monitorStorage};
static SFakeVidmode g_modes[]        = {{1920, 1080, 8, 8, 8, 60}, {1280, 720, 8, 8, 8, 144}};

static const float         g_axes[]    = {0.5F, -1.F, 0.F};
static const unsigned char g_buttons[] = {1, 0, 7};
static const unsigned char g_hats[]    = {0, 1 | 2, 8};

static SFakeWindow* fake(void* window) {
    return static_cast<SFakeWindow*>(window);
}

template <typename T>
static T swap(T& slot, T fn) {
    T previous = slot;
    slot       = fn;
    return previous;
}

extern "C" {

// controls

void fakeglfwReset() {
    g_state.error    = nullptr;
    g_state.monitor  = nullptr;
    g_state.joystick = nullptr;
    g_state.errorCode = 0;
    g_state.errorDescription.clear();
    g_state.lastHint = g_state.lastHintValue = g_state.lastStringHint = 0;
    g_state.lastStringHintValue.clear();
    std::memset(g_state.sizeLimits, 0, sizeof(g_state.sizeLimits));
    g_state.icon       = {};
    g_state.terminated = false;
}

void fakeglfwRaiseError(int code, const char* description) {
    g_state.errorCode        = code;
    g_state.errorDescription = description ? description : "";
    if (g_state.error)
        g_state.error(code, description);
}

void fakeglfwEmitWindowSize(void* window, int width, int height) {
    if (fake(window)->size)
        fake(window)->size(window, width, height);
}

void fakeglfwEmitKey(void* window, int key, int scancode, int action, int mods) {
    if (fake(window)->key)
        fake(window)->key(window, key, scancode, action, mods);
}

void fakeglfwEmitChar(void* window, unsigned int codepoint) {
    if (fake(window)->character)
        fake(window)->character(window, codepoint);
}

void fakeglfwEmitMouseButton(void* window, int button, int action, int mods) {
    if (fake(window)->mouseButton)
        fake(window)->mouseButton(window, button, action, mods);
}

void fakeglfwEmitDrop(void* window, int count, const char** paths) {
    if (fake(window)->drop)
        fake(window)->drop(window, count, paths);
}

void fakeglfwEmitMonitor(int event) {
    if (g_state.monitor)
        g_state.monitor(g_monitors[0], event);
}

int fakeglfwLastHint(int* value) {
    *value = g_state.lastHintValue;
    return g_state.lastHint;
}

const char* fakeglfwLastStringHint(int* hint) {
    *hint = g_state.lastStringHint;
    return g_state.lastStringHintValue.c_str();
}

void fakeglfwSizeLimits(int* limits) {
    std::memcpy(limits, g_state.sizeLimits, sizeof(g_state.sizeLimits));
}

SFakeIcon fakeglfwIcon() {
    return g_state.icon;
}

int fakeglfwInputMode(void* window, int mode) {
    return fake(window)->inputModes[mode];
}

int fakeglfwTerminated() {
    return g_state.terminated;
}

// init, errors, time

int glfwInit() {
    g_state.terminated = false;
    return 1;
}

void glfwTerminate() {
    g_state.terminated = true;
}

void glfwInitHint(int hint, int value) {
    g_state.lastHint      = hint;
    g_state.lastHintValue = value;
}

void glfwGetVersion(int* major, int* minor, int* rev) {
    if (major)
        *major = 3;
    if (minor)
        *minor = 3;
    if (rev)
        *rev = 8;
}

const char* glfwGetVersionString() {
    return "3.3.8 fake";
}

int glfwGetError(const char** description) {
    const int code = g_state.errorCode;
    if (description)
        *description = code ? g_state.errorDescription.c_str() : nullptr;
    g_state.errorCode = 0;
    return code;
}

FakeErrorFn glfwSetErrorCallback(FakeErrorFn fn) {
    return swap(g_state.error, fn);
}

double glfwGetTime() {
    return g_state.time;
}

void glfwSetTime(double time) {
    g_state.time = time;
}

uint64_t glfwGetTimerValue() {
    return 123456789012ULL;
}

uint64_t glfwGetTimerFrequency() {
    return 1000000ULL;
}

// windows

void glfwDefaultWindowHints() {
    g_state.lastHint = g_state.lastHintValue = 0;
}

void glfwWindowHint(int hint, int value) {
    g_state.lastHint      = hint;
    g_state.lastHintValue = value;
}

void glfwWindowHintString(int hint, const char* value) {
    g_state.lastStringHint      = hint;
    g_state.lastStringHintValue = value ? value : "";
}

void* glfwCreateWindow(int width, int height, const char* title, void*, void*) {
    auto window    = new SFakeWindow();
    window->width  = width;
    window->height = height;
    window->title  = title ? title : "";
    return window;
}

void glfwDestroyWindow(void* window) {
    delete fake(window);
}

int glfwWindowShouldClose(void* window) {
    return fake(window)->shouldClose;
}

void glfwSetWindowShouldClose(void* window, int value) {
    fake(window)->shouldClose = value;
}

void glfwSetWindowTitle(void* window, const char* title) {
    fake(window)->title = title;
}

void glfwSetWindowIcon(void*, int count, const SFakeImage* images) {
    g_state.icon       = {};
    g_state.icon.count = count;
    if (count > 0 && images) {
        g_state.icon.width  = images[0].width;
        g_state.icon.height = images[0].height;
        std::memcpy(g_state.icon.firstPixel, images[0].pixels, 4);
    }
}

void glfwGetWindowPos(void* window, int* x, int* y) {
    *x = fake(window)->x;
    *y = fake(window)->y;
}

void glfwSetWindowPos(void* window, int x, int y) {
    fake(window)->x = x;
    fake(window)->y = y;
}

void glfwGetWindowSize(void* window, int* width, int* height) {
    *width  = fake(window)->width;
    *height = fake(window)->height;
}

void glfwSetWindowSizeLimits(void*, int minWidth, int minHeight, int maxWidth, int maxHeight) {
    g_state.sizeLimits[0] = minWidth;
    g_state.sizeLimits[1] = minHeight;
    g_state.sizeLimits[2] = maxWidth;
    g_state.sizeLimits[3] = maxHeight;
}

void glfwSetWindowAspectRatio(void*, int numerator, int denominator) {
    g_state.sizeLimits[0] = numerator;
    g_state.sizeLimits[1] = denominator;
}

void glfwSetWindowSize(void* window, int width, int height) {
    fake(window)->width  = width;
    fake(window)->height = height;
}

void glfwGetFramebufferSize(void* window, int* width, int* height) {
    *width  = fake(window)->width * 2;
    *height = fake(window)->height * 2;
}

void glfwGetWindowFrameSize(void*, int* left, int* top, int* right, int* bottom) {
    *left   = 1;
    *top    = 20;
    *right  = 1;
    *bottom = 2;
}

void glfwGetWindowContentScale(void*, float* x, float* y) {
    *x = 2.F;
    *y = 2.F;
}

float glfwGetWindowOpacity(void*) {
    return 0.75F;
}

void glfwSetWindowOpacity(void*, float) {
    ;
}

void glfwIconifyWindow(void*) {
    ;
}

void glfwRestoreWindow(void*) {
    ;
}

void glfwMaximizeWindow(void*) {
    ;
}

void glfwShowWindow(void*) {
    ;
}

void glfwHideWindow(void*) {
    ;
}

void glfwFocusWindow(void*) {
    ;
}

void* glfwGetWindowMonitor(void*) {
    return nullptr;
}

void glfwSetWindowMonitor(void* window, void*, int x, int y, int width, int height, int refreshRate) {
    fake(window)->x       = x;
    fake(window)->y       = y;
    fake(window)->width   = width;
    fake(window)->height  = height;
    g_state.lastHintValue = refreshRate;
}

int glfwGetWindowAttrib(void*, int attrib) {
    switch (attrib) {
        case 0x00020003: return 1;          // resizable
        case 0x00021001: return -1;         // red bits
        case 0x00022001: return 0x00030001; // client api
        case 0x00022008: return 0x00032999; // opengl profile, unknown value
        default: return 0;
    }
}

void glfwSetWindowAttrib(void*, int attrib, int value) {
    g_state.lastHint      = attrib;
    g_state.lastHintValue = value;
}

void glfwSetWindowUserPointer(void* window, void* pointer) {
    fake(window)->user = pointer;
}

void* glfwGetWindowUserPointer(void* window) {
    return fake(window)->user;
}

FakeSizeFn glfwSetWindowPosCallback(void* window, FakeSizeFn fn) {
    return swap(fake(window)->pos, fn);
}

FakeSizeFn glfwSetWindowSizeCallback(void* window, FakeSizeFn fn) {
    return swap(fake(window)->size, fn);
}

void* glfwSetWindowCloseCallback(void* window, void (*fn)(void*)) {
    return reinterpret_cast<void*>(swap(fake(window)->close, fn));
}

void* glfwSetWindowRefreshCallback(void* window, void (*fn)(void*)) {
    return reinterpret_cast<void*>(swap(fake(window)->refresh, fn));
}

FakeFocusFn glfwSetWindowFocusCallback(void* window, FakeFocusFn fn) {
    return swap(fake(window)->focus, fn);
}

FakeFocusFn glfwSetWindowIconifyCallback(void* window, FakeFocusFn fn) {
    return swap(fake(window)->iconify, fn);
}

FakeFocusFn glfwSetWindowMaximizeCallback(void* window, FakeFocusFn fn) {
    return swap(fake(window)->maximize, fn);
}

FakeSizeFn glfwSetFramebufferSizeCallback(void* window, FakeSizeFn fn) {
    return swap(fake(window)->framebufferSize, fn);
}

void* glfwSetWindowContentScaleCallback(void* window, void (*fn)(void*, float, float)) {
    return reinterpret_cast<void*>(swap(fake(window)->contentScale, fn));
}

void glfwPollEvents() {
    ;
}

void glfwWaitEvents() {
    ;
}

void glfwWaitEventsTimeout(double) {
    ;
}

void glfwPostEmptyEvent() {
    ;
}

void glfwSwapBuffers(void*) {
    ;
}

// context

static void* g_current = nullptr;

void glfwMakeContextCurrent(void* window) {
    g_current = window;
}

void* glfwGetCurrentContext() {
    return g_current;
}

void glfwSwapInterval(int) {
    ;
}

int glfwExtensionSupported(const char* extension) {
    return extension && std::strcmp(extension, "GL_ARB_debug_output") == 0;
}

// monitors

void** glfwGetMonitors(int* count) {
    *count = 1;
    return g_monitors;
}

void* glfwGetPrimaryMonitor() {
    return g_monitors[0];
}

void glfwGetMonitorPos(void*, int* x, int* y) {
    *x = 0;
    *y = 0;
}

void glfwGetMonitorWorkarea(void*, int* x, int* y, int* width, int* height) {
    *x      = 0;
    *y      = 32;
    *width  = 1920;
    *height = 1048;
}

void glfwGetMonitorPhysicalSize(void*, int* width, int* height) {
    *width  = 600;
    *height = 340;
}

void glfwGetMonitorContentScale(void*, float* x, float* y) {
    *x = 1.5F;
    *y = 1.5F;
}

const char* glfwGetMonitorName(void*) {
    return "Fake Monitor";
}

static void* g_monitorUser = nullptr;

void glfwSetMonitorUserPointer(void*, void* pointer) {
    g_monitorUser = pointer;
}

void* glfwGetMonitorUserPointer(void*) {
    return g_monitorUser;
}

FakeMonitorFn glfwSetMonitorCallback(FakeMonitorFn fn) {
    return swap(g_state.monitor, fn);
}

const SFakeVidmode* glfwGetVideoModes(void*, int* count) {
    *count = 2;
    return g_modes;
}

const SFakeVidmode* glfwGetVideoMode(void*) {
    return &g_modes[0];
}

void glfwSetGamma(void*, float) {
    ;
}

const SFakeGammaRamp* glfwGetGammaRamp(void*) {
    if (!g_state.gammaRamp.size)
        return nullptr;
    return &g_state.gammaRamp;
}

void glfwSetGammaRamp(void*, const SFakeGammaRamp* ramp) {
    const unsigned short* channels[3] = {ramp->red, ramp->green, ramp->blue};
    for (int c = 0; c < 3; ++c) {
        g_state.gamma[c].assign(channels[c], channels[c] + ramp->size);
    }

    g_state.gammaRamp = {g_state.gamma[0].data(), g_state.gamma[1].data(), g_state.gamma[2].data(), ramp->size};
}

// input

int glfwGetInputMode(void* window, int mode) {
    return fake(window)->inputModes[mode];
}

void glfwSetInputMode(void* window, int mode, int value) {
    fake(window)->inputModes[mode] = value;
}

int glfwRawMouseMotionSupported() {
    return 0;
}

const char* glfwGetKeyName(int key, int scancode) {
    if (key == 65 || (key == -1 && scancode == 30))
        return "a";
    return nullptr;
}

int glfwGetKeyScancode(int key) {
    return key == 65 ? 30 : -1;
}

int glfwGetKey(void*, int key) {
    return key == 65 ? 1 : 0;
}

int glfwGetMouseButton(void*, int button) {
    return button == 0 ? 1 : 0;
}

void glfwGetCursorPos(void*, double* x, double* y) {
    *x = 12.5;
    *y = 40.25;
}

void glfwSetCursorPos(void*, double, double) {
    ;
}

static int g_cursor = 0;

void* glfwCreateCursor(const SFakeImage* image, int, int) {
    if (!image || !image->pixels)
        return nullptr;
    return &g_cursor;
}

void* glfwCreateStandardCursor(int shape) {
    return shape == 0x00036001 ? &g_cursor : nullptr;
}

void glfwDestroyCursor(void*) {
    ;
}

void glfwSetCursor(void*, void*) {
    ;
}

FakeKeyFn glfwSetKeyCallback(void* window, FakeKeyFn fn) {
    return swap(fake(window)->key, fn);
}

FakeCharFn glfwSetCharCallback(void* window, FakeCharFn fn) {
    return swap(fake(window)->character, fn);
}

void* glfwSetCharModsCallback(void* window, void (*fn)(void*, unsigned int, int)) {
    return reinterpret_cast<void*>(swap(fake(window)->charMods, fn));
}

FakeMouseButtonFn glfwSetMouseButtonCallback(void* window, FakeMouseButtonFn fn) {
    return swap(fake(window)->mouseButton, fn);
}

void* glfwSetCursorPosCallback(void* window, void (*fn)(void*, double, double)) {
    return reinterpret_cast<void*>(swap(fake(window)->cursorPos, fn));
}

FakeFocusFn glfwSetCursorEnterCallback(void* window, FakeFocusFn fn) {
    return swap(fake(window)->cursorEnter, fn);
}

void* glfwSetScrollCallback(void* window, void (*fn)(void*, double, double)) {
    return reinterpret_cast<void*>(swap(fake(window)->scroll, fn));
}

FakeDropFn glfwSetDropCallback(void* window, FakeDropFn fn) {
    return swap(fake(window)->drop, fn);
}

int glfwJoystickPresent(int jid) {
    return jid == 0;
}

const float* glfwGetJoystickAxes(int jid, int* count) {
    if (jid != 0) {
        *count = 0;
        return nullptr;
    }
    *count = 3;
    return g_axes;
}

const unsigned char* glfwGetJoystickButtons(int jid, int* count) {
    if (jid != 0) {
        *count = 0;
        return nullptr;
    }
    *count = 3;
    return g_buttons;
}

const unsigned char* glfwGetJoystickHats(int jid, int* count) {
    if (jid != 0) {
        *count = 0;
        return nullptr;
    }
    *count = 3;
    return g_hats;
}

const char* glfwGetJoystickName(int jid) {
    return jid == 0 ? "Fake Pad" : nullptr;
}

const char* glfwGetJoystickGUID(int jid) {
    return jid == 0 ? "03000000fake" : nullptr;
}

void glfwSetJoystickUserPointer(int, void* pointer) {
    g_state.joystickUser = pointer;
}

void* glfwGetJoystickUserPointer(int) {
    return g_state.joystickUser;
}

int glfwJoystickIsGamepad(int jid) {
    return jid == 0;
}

FakeJoystickFn glfwSetJoystickCallback(FakeJoystickFn fn) {
    return swap(g_state.joystick, fn);
}

int glfwUpdateGamepadMappings(const char* mappings) {
    return mappings && *mappings;
}

const char* glfwGetGamepadName(int jid) {
    return jid == 0 ? "Fake Gamepad" : nullptr;
}

int glfwGetGamepadState(int jid, SFakeGamepadState* state) {
    if (jid != 0)
        return 0;

    std::memset(state, 0, sizeof(*state));
    state->buttons[0]  = 1; // a
    state->buttons[11] = 1; // dpad up
    state->axes[0]     = -0.5F;
    state->axes[5]     = 1.F;
    return 1;
}

void glfwSetClipboardString(void* window, const char* string) {
    if (window)
        fake(window)->clipboard = string;
}

const char* glfwGetClipboardString(void* window) {
    if (!window || fake(window)->clipboard.empty())
        return nullptr;
    return fake(window)->clipboard.c_str();
}
}
