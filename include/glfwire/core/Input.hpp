#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "Scope.hpp"
#include "Trampoline.hpp"
#include "types/Types.hpp"

namespace Glfwire {

    /*
        The cursor mode is a eCursorMode, every other input mode a bool.
    */
    InputModeValue             getInputMode(SWindow* window, eInputMode mode);
    void                       setInputMode(SWindow* window, eInputMode mode, const InputModeValue& value);
    bool                       rawMouseMotionSupported();

    /*
        Without a key, scancode alone is looked up.
    */
    std::optional<std::string> getKeyName(std::optional<eKey> key, int32_t scancode = 0);

    /*
        std::nullopt if the key has no scancode on this platform.
    */
    std::optional<int32_t>                     getKeyScancode(eKey key);

    std::optional<eKeyAction>                  getKey(SWindow* window, eKey key);
    std::optional<eKeyAction>                  getMouseButton(SWindow* window, eMouseButton button);

    std::tuple<double, double>                 getCursorPos(SWindow* window);
    void                                       setCursorPos(SWindow* window, double x, double y);

    SCursor*                                   createCursor(const SImage& image, int32_t xhot, int32_t yhot);
    SCursor*                                   createStandardCursor(eStandardCursor shape);
    void                                       destroyCursor(SCursor* cursor);
    void                                       setCursor(SWindow* window, SCursor* cursor);

    using KeyFn         = std::function<void(SWindow* window, std::optional<eKey> key, int32_t scancode, std::optional<eKeyAction> action, std::set<eModifier> mods)>;
    using CharFn        = std::function<void(SWindow* window, std::string character)>;
    using CharModsFn    = std::function<void(SWindow* window, std::string character, std::set<eModifier> mods)>;
    using MouseButtonFn = std::function<void(SWindow* window, std::optional<eMouseButton> button, std::optional<eKeyAction> action, std::set<eModifier> mods)>;
    using CursorPosFn   = std::function<void(SWindow* window, double x, double y)>;
    using CursorEnterFn = std::function<void(SWindow* window, bool entered)>;
    using ScrollFn      = std::function<void(SWindow* window, double x, double y)>;
    using DropFn        = std::function<void(SWindow* window, std::vector<std::string> paths)>;
    using JoystickFn    = std::function<void(int32_t jid, std::optional<eConnectionEvent> event)>;

    Hyprutils::Memory::CSharedPointer<ITrampoline> setKeyCallback(SWindow* window, KeyFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setKeyCallback(SWindow* window, KeyFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setKeyCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharCallback(SWindow* window, CharFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharCallback(SWindow* window, CharFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharModsCallback(SWindow* window, CharModsFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharModsCallback(SWindow* window, CharModsFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCharModsCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setMouseButtonCallback(SWindow* window, MouseButtonFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setMouseButtonCallback(SWindow* window, MouseButtonFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setMouseButtonCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorPosCallback(SWindow* window, CursorPosFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorPosCallback(SWindow* window, CursorPosFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorPosCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorEnterCallback(SWindow* window, CursorEnterFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorEnterCallback(SWindow* window, CursorEnterFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setCursorEnterCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setScrollCallback(SWindow* window, ScrollFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setScrollCallback(SWindow* window, ScrollFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setScrollCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setDropCallback(SWindow* window, DropFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setDropCallback(SWindow* window, DropFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setDropCallback(SWindow* window, const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    bool                                           joystickPresent(int32_t jid);
    std::vector<float>                             getJoystickAxes(int32_t jid);

    /*
        Each button byte decodes as a key action.
    */
    std::vector<std::optional<eKeyAction>>         getJoystickButtons(int32_t jid);
    std::vector<std::set<eHat>>                    getJoystickHats(int32_t jid);
    std::optional<std::string>                     getJoystickName(int32_t jid);
    std::optional<std::string>                     getJoystickGUID(int32_t jid);
    void                                           setJoystickUserPointer(int32_t jid, void* pointer);
    void*                                          getJoystickUserPointer(int32_t jid);
    bool                                           joystickIsGamepad(int32_t jid);

    Hyprutils::Memory::CSharedPointer<ITrampoline> setJoystickCallback(JoystickFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setJoystickCallback(JoystickFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setJoystickCallback(const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    bool                                           updateGamepadMappings(const std::string& mappings);
    std::optional<std::string>                     getGamepadName(int32_t jid);

    /*
        std::nullopt if jid is not present or has no gamepad mapping.
    */
    std::optional<SGamepadState> getGamepadState(int32_t jid);

    void                         setClipboardString(SWindow* window, const std::string& string);
    std::optional<std::string>   getClipboardString(SWindow* window);
};
