#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>

#include "Scope.hpp"
#include "Trampoline.hpp"
#include "types/Types.hpp"

namespace Glfwire {

    /*
        Load the native library. Without a path, $GW_LIBRARY_PATH is used if
        set, then libglfw.so.3, then libglfw.so.

        Returns false if nothing could be loaded. Loading again replaces the
        previous library.
    */
    bool load();
    bool load(const std::string& path);
    bool loaded();

    /*
        Clears every callback slot and closes the library. Trampolines stay
        owned by their scopes.
    */
    void unload();

    bool init();

    /*
        Terminates the native library. Every callback slot except the error
        callback is cleared, and the retained gamma ramp is released.
    */
    void                                     terminate();
    void                                     initHint(eInitHint hint, bool value);

    std::tuple<int32_t, int32_t, int32_t>    getVersion();
    std::string                              getVersionString();

    /*
        Returns and clears the last error of the calling thread, or std::nullopt if there was none.
    */
    std::optional<SError>                    getError();

    using ErrorFn = std::function<void(std::optional<eErrorCode> code, std::string description)>;

    /*
        Every set*Callback comes in three forms: a function living in the global
        scope, a function living in the given scope, and a trampoline returned
        by an earlier call. An empty function or trampoline clears the slot.

        Each returns what was installed before, or nullptr.
    */
    Hyprutils::Memory::CSharedPointer<ITrampoline> setErrorCallback(ErrorFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setErrorCallback(ErrorFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setErrorCallback(const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    double                                         getTime();
    void                                           setTime(double time);
    uint64_t                                       getTimerValue();
    uint64_t                                       getTimerFrequency();
};
