#include <glfwire/core/Input.hpp>

#include "../callback/Registration.hpp"
#include "../callback/Signatures.hpp"
#include "../library/NativeLibrary.hpp"
#include "../marshal/OutArgs.hpp"
#include "../marshal/Structs.hpp"

#include <format>
#include <stdexcept>
#include <type_traits>

using namespace Glfwire;

static_assert(std::is_same_v<KeyFn, Signatures::Key::HostFn>);
static_assert(std::is_same_v<CharFn, Signatures::Char::HostFn>);
static_assert(std::is_same_v<CharModsFn, Signatures::CharMods::HostFn>);
static_assert(std::is_same_v<MouseButtonFn, Signatures::MouseButton::HostFn>);
static_assert(std::is_same_v<CursorPosFn, Signatures::CursorPos::HostFn>);
static_assert(std::is_same_v<CursorEnterFn, Signatures::CursorEnter::HostFn>);
static_assert(std::is_same_v<ScrollFn, Signatures::Scroll::HostFn>);
static_assert(std::is_same_v<DropFn, Signatures::Drop::HostFn>);
static_assert(std::is_same_v<JoystickFn, Signatures::Joystick::HostFn>);

InputModeValue Glfwire::getInputMode(SWindow* window, eInputMode mode) {
    const auto NATIVE = library().call<int32_t>(GW_EP_GET_INPUT_MODE, window, Types::InputMode::serialize(mode));

    if (mode != GW_INPUT_MODE_CURSOR)
        return Types::Bool::deserialize(NATIVE);

    if (const auto CURSOR = Codecs::cursorModes().decode(NATIVE); CURSOR)
        return *CURSOR;

    return SUnrecognized{NATIVE};
}

void Glfwire::setInputMode(SWindow* window, eInputMode mode, const InputModeValue& value) {
    const auto MODE   = Types::InputMode::serialize(mode);
    int32_t    native = 0;

    if (mode == GW_INPUT_MODE_CURSOR) {
        if (const auto V = std::get_if<eCursorMode>(&value))
            native = Codecs::cursorModes().encode(*V);
        else if (const auto U = std::get_if<SUnrecognized>(&value))
            native = U->native;
        else
            throw std::invalid_argument("input mode cursor takes a cursor mode");
    } else {
        const auto V = std::get_if<bool>(&value);
        if (!V)
            throw std::invalid_argument(std::format("input mode {} takes a bool", Codecs::inputModes().name(mode)));
        native = Types::Bool::serialize(*V);
    }

    library().call<void>(GW_EP_SET_INPUT_MODE, window, MODE, native);
}

bool Glfwire::rawMouseMotionSupported() {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_RAW_MOUSE_MOTION_SUPPORTED));
}

std::optional<std::string> Glfwire::getKeyName(std::optional<eKey> key, int32_t scancode) {
    const auto KEY = Types::Key::serialize(key.value_or(GW_KEY_UNKNOWN));
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_KEY_NAME, KEY, scancode));
}

std::optional<int32_t> Glfwire::getKeyScancode(eKey key) {
    const auto SCANCODE = library().call<int32_t>(GW_EP_GET_KEY_SCANCODE, Types::Key::serialize(key));
    if (SCANCODE == -1)
        return std::nullopt;

    return SCANCODE;
}

std::optional<eKeyAction> Glfwire::getKey(SWindow* window, eKey key) {
    return Types::KeyAction::deserialize(library().call<int32_t>(GW_EP_GET_KEY, window, Types::Key::serialize(key)));
}

std::optional<eKeyAction> Glfwire::getMouseButton(SWindow* window, eMouseButton button) {
    return Types::KeyAction::deserialize(library().call<int32_t>(GW_EP_GET_MOUSE_BUTTON, window, Types::MouseButton::serialize(button)));
}

std::tuple<double, double> Glfwire::getCursorPos(SWindow* window) {
    return Marshal::withOutArgs<Types::Double, Types::Double>([window](double* x, double* y) { library().call<void>(GW_EP_GET_CURSOR_POS, window, x, y); });
}

void Glfwire::setCursorPos(SWindow* window, double x, double y) {
    library().call<void>(GW_EP_SET_CURSOR_POS, window, x, y);
}

SCursor* Glfwire::createCursor(const SImage& image, int32_t xhot, int32_t yhot) {
    CArena arena;
    auto   record = Marshal::serialize(image, arena);
    return library().call<SCursor*>(GW_EP_CREATE_CURSOR, record, xhot, yhot);
}

SCursor* Glfwire::createStandardCursor(eStandardCursor shape) {
    return library().call<SCursor*>(GW_EP_CREATE_STANDARD_CURSOR, Types::StandardCursor::serialize(shape));
}

void Glfwire::destroyCursor(SCursor* cursor) {
    library().call<void>(GW_EP_DESTROY_CURSOR, cursor);
    callbacks().dropObject(cursor);
}

void Glfwire::setCursor(SWindow* window, SCursor* cursor) {
    library().call<void>(GW_EP_SET_CURSOR, window, cursor);
}

SP<ITrampoline> Glfwire::setKeyCallback(SWindow* window, KeyFn&& fn) {
    return setKeyCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setKeyCallback(SWindow* window, KeyFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::Key>(GW_CALLBACK_KEY, GW_EP_SET_KEY_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setKeyCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_KEY, GW_EP_SET_KEY_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setCharCallback(SWindow* window, CharFn&& fn) {
    return setCharCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setCharCallback(SWindow* window, CharFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::Char>(GW_CALLBACK_CHAR, GW_EP_SET_CHAR_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setCharCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_CHAR, GW_EP_SET_CHAR_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setCharModsCallback(SWindow* window, CharModsFn&& fn) {
    return setCharModsCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setCharModsCallback(SWindow* window, CharModsFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::CharMods>(GW_CALLBACK_CHAR_MODS, GW_EP_SET_CHAR_MODS_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setCharModsCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_CHAR_MODS, GW_EP_SET_CHAR_MODS_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setMouseButtonCallback(SWindow* window, MouseButtonFn&& fn) {
    return setMouseButtonCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setMouseButtonCallback(SWindow* window, MouseButtonFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::MouseButton>(GW_CALLBACK_MOUSE_BUTTON, GW_EP_SET_MOUSE_BUTTON_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setMouseButtonCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_MOUSE_BUTTON, GW_EP_SET_MOUSE_BUTTON_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setCursorPosCallback(SWindow* window, CursorPosFn&& fn) {
    return setCursorPosCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setCursorPosCallback(SWindow* window, CursorPosFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::CursorPos>(GW_CALLBACK_CURSOR_POS, GW_EP_SET_CURSOR_POS_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setCursorPosCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_CURSOR_POS, GW_EP_SET_CURSOR_POS_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setCursorEnterCallback(SWindow* window, CursorEnterFn&& fn) {
    return setCursorEnterCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setCursorEnterCallback(SWindow* window, CursorEnterFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::CursorEnter>(GW_CALLBACK_CURSOR_ENTER, GW_EP_SET_CURSOR_ENTER_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setCursorEnterCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_CURSOR_ENTER, GW_EP_SET_CURSOR_ENTER_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setScrollCallback(SWindow* window, ScrollFn&& fn) {
    return setScrollCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setScrollCallback(SWindow* window, ScrollFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::Scroll>(GW_CALLBACK_SCROLL, GW_EP_SET_SCROLL_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setScrollCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_SCROLL, GW_EP_SET_SCROLL_CALLBACK, window, trampoline);
}

SP<ITrampoline> Glfwire::setDropCallback(SWindow* window, DropFn&& fn) {
    return setDropCallback(window, std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setDropCallback(SWindow* window, DropFn&& fn, CScope& scope) {
    return Callbacks::setFor<Signatures::Drop>(GW_CALLBACK_DROP, GW_EP_SET_DROP_CALLBACK, window, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setDropCallback(SWindow* window, const SP<ITrampoline>& trampoline) {
    return Callbacks::installFor(GW_CALLBACK_DROP, GW_EP_SET_DROP_CALLBACK, window, trampoline);
}

bool Glfwire::joystickPresent(int32_t jid) {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_JOYSTICK_PRESENT, jid));
}

std::vector<float> Glfwire::getJoystickAxes(int32_t jid) {
    const float* axes = nullptr;

    const auto [COUNT] = Marshal::withOutArgs<Types::Int>([&axes, jid](int32_t* count) { axes = sc<const float*>(library().call<void*>(GW_EP_GET_JOYSTICK_AXES, jid, count)); });

    if (!axes || COUNT <= 0)
        return {};

    return std::vector<float>(axes, axes + COUNT);
}

std::vector<std::optional<eKeyAction>> Glfwire::getJoystickButtons(int32_t jid) {
    const uint8_t* buttons = nullptr;

    const auto [COUNT] =
        Marshal::withOutArgs<Types::Int>([&buttons, jid](int32_t* count) { buttons = sc<const uint8_t*>(library().call<void*>(GW_EP_GET_JOYSTICK_BUTTONS, jid, count)); });

    std::vector<std::optional<eKeyAction>> result;
    if (!buttons || COUNT <= 0)
        return result;

    result.reserve(COUNT);
    for (int32_t i = 0; i < COUNT; ++i) {
        result.emplace_back(Types::KeyAction::deserialize(buttons[i]));
    }

    return result;
}

std::vector<std::set<eHat>> Glfwire::getJoystickHats(int32_t jid) {
    const uint8_t* hats = nullptr;

    const auto [COUNT] = Marshal::withOutArgs<Types::Int>([&hats, jid](int32_t* count) { hats = sc<const uint8_t*>(library().call<void*>(GW_EP_GET_JOYSTICK_HATS, jid, count)); });

    std::vector<std::set<eHat>> result;
    if (!hats || COUNT <= 0)
        return result;

    result.reserve(COUNT);
    for (int32_t i = 0; i < COUNT; ++i) {
        result.emplace_back(Types::Hat::deserialize(hats[i]));
    }

    return result;
}

std::optional<std::string> Glfwire::getJoystickName(int32_t jid) {
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_JOYSTICK_NAME, jid));
}

std::optional<std::string> Glfwire::getJoystickGUID(int32_t jid) {
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_JOYSTICK_GUID, jid));
}

void Glfwire::setJoystickUserPointer(int32_t jid, void* pointer) {
    library().call<void>(GW_EP_SET_JOYSTICK_USER_POINTER, jid, pointer);
}

void* Glfwire::getJoystickUserPointer(int32_t jid) {
    return library().call<void*>(GW_EP_GET_JOYSTICK_USER_POINTER, jid);
}

bool Glfwire::joystickIsGamepad(int32_t jid) {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_JOYSTICK_IS_GAMEPAD, jid));
}

SP<ITrampoline> Glfwire::setJoystickCallback(JoystickFn&& fn) {
    return setJoystickCallback(std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setJoystickCallback(JoystickFn&& fn, CScope& scope) {
    return Callbacks::set<Signatures::Joystick>(GW_CALLBACK_JOYSTICK, GW_EP_SET_JOYSTICK_CALLBACK, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setJoystickCallback(const SP<ITrampoline>& trampoline) {
    return Callbacks::install(GW_CALLBACK_JOYSTICK, GW_EP_SET_JOYSTICK_CALLBACK, trampoline);
}

bool Glfwire::updateGamepadMappings(const std::string& mappings) {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_UPDATE_GAMEPAD_MAPPINGS, mappings.c_str()));
}

std::optional<std::string> Glfwire::getGamepadName(int32_t jid) {
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_GAMEPAD_NAME, jid));
}

std::optional<SGamepadState> Glfwire::getGamepadState(int32_t jid) {
    CArena arena;
    auto   state = arena.allocate(Layouts::gamepadState().size());

    if (!Types::Bool::deserialize(library().call<int32_t>(GW_EP_GET_GAMEPAD_STATE, jid, state)))
        return std::nullopt;

    return Marshal::deserializeFrom<SGamepadState>(state);
}

void Glfwire::setClipboardString(SWindow* window, const std::string& string) {
    library().call<void>(GW_EP_SET_CLIPBOARD_STRING, window, string.c_str());
}

std::optional<std::string> Glfwire::getClipboardString(SWindow* window) {
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_CLIPBOARD_STRING, window));
}
