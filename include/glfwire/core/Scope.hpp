#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <vector>

#include "Trampoline.hpp"

namespace Glfwire {

    /*
        Owns the trampolines created in it. Closing the scope frees their native
        code and unsets every callback slot still pointing at them.

        The native library must not invoke a trampoline after its scope closed.
        Keep the scope alive for as long as the callback stays installed.
    */
    class CScope {
      public:
        CScope() = default;
        ~CScope();

        CScope(const CScope&)            = delete;
        CScope& operator=(const CScope&) = delete;

        /*
            The process-wide scope. Never closed.
        */
        static CScope& global();

        void           close();
        bool           closed() const;
        size_t         size() const;

        /*
            Takes shared ownership of a trampoline. Throws std::logic_error if the scope is closed.
        */
        void adopt(const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

      private:
        std::vector<Hyprutils::Memory::CSharedPointer<ITrampoline>> m_trampolines;
        bool                                                        m_closed = false;
        bool                                                        m_global = false;
    };
};
