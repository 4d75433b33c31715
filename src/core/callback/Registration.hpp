#pragma once

#include <glfwire/core/Scope.hpp>

#include "Trampoline.hpp"
#include "../library/EntryPoints.hpp"

namespace Glfwire::Callbacks {

    /*
        Builds a trampoline for fn owned by scope.
    */
    template <typename Sig>
    SP<ITrampoline> make(eCallbackKind kind, typename Sig::HostFn&& fn, CScope& scope) {
        if (scope.closed())
            throw std::logic_error(std::format("cannot create a {} callback in a closed scope", callbackKindToStr(kind)));

        SP<ITrampoline> trampoline = makeShared<CTrampoline<Sig>>(kind, std::move(fn));
        scope.adopt(trampoline);
        return trampoline;
    }

    /*
        Installs trampoline (or clears the slot on nullptr) through ep and
        records it.

        Returns what was installed before: the trampoline glfwire recorded, a
        foreign trampoline for a pointer installed elsewhere, or nullptr.
    */
    SP<ITrampoline> install(eCallbackKind kind, eEntryPoint ep, const SP<ITrampoline>& trampoline);

    /*
        Same as install() for callbacks owned by a window.
    */
    SP<ITrampoline> installFor(eCallbackKind kind, eEntryPoint ep, SWindow* window, const SP<ITrampoline>& trampoline);

    // throws std::logic_error if ep cannot be called
    void ensureAvailable(eEntryPoint ep);

    /*
        make() followed by install(). An empty fn clears the slot.
    */
    template <typename Sig>
    SP<ITrampoline> set(eCallbackKind kind, eEntryPoint ep, typename Sig::HostFn&& fn, CScope& scope) {
        ensureAvailable(ep);

        if (!fn)
            return install(kind, ep, SP<ITrampoline>{});

        return install(kind, ep, make<Sig>(kind, std::move(fn), scope));
    }

    template <typename Sig>
    SP<ITrampoline> setFor(eCallbackKind kind, eEntryPoint ep, SWindow* window, typename Sig::HostFn&& fn, CScope& scope) {
        ensureAvailable(ep);

        if (!fn)
            return installFor(kind, ep, window, SP<ITrampoline>{});

        return installFor(kind, ep, window, make<Sig>(kind, std::move(fn), scope));
    }
};
