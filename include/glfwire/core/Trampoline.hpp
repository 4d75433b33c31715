#pragma once

#include <string_view>

namespace Glfwire {
    class CScope;

    /*
        A native function pointer standing in for a host callback.

        Trampolines are owned by a CScope and returned from every
        set*Callback so they can be reinstalled later.
    */
    class ITrampoline {
      public:
        virtual ~ITrampoline() = default;

        /*
            The callback kind, e.g. "key" or "window-size".
        */
        virtual std::string_view kind() const = 0;

        /*
            The address handed to the native library. nullptr once released.
        */
        virtual void* codePointer() const = 0;

        /*
            False after the owning scope closed.
        */
        virtual bool valid() const = 0;

        /*
            True for pointers the native library reported that were not installed through glfwire.
        */
        virtual bool foreign() const = 0;

      protected:
        ITrampoline() = default;

      private:
        virtual void release()    = 0;
        virtual bool busy() const = 0;

        friend class CScope;
    };
};
