#pragma once

#include <ffi.h>
#include <array>
#include <string>
#include <type_traits>
#include <vector>

#include "EntryPoints.hpp"
#include "../types/TypeRegistry.hpp"
#include "../../helpers/Memory.hpp"
#include "../../helpers/Log.hpp"
#include "../../Macros.hpp"

namespace Glfwire {

    /*
        A dlopen'd native library with every entry point bound to a prepared
        ffi call interface.
    */
    class CNativeLibrary {
      public:
        ~CNativeLibrary();

        CNativeLibrary(const CNativeLibrary&)            = delete;
        CNativeLibrary& operator=(const CNativeLibrary&) = delete;

        // nullptr if the library cannot be opened. Missing symbols are not fatal.
        static UP<CNativeLibrary> open(const std::string& path);

        bool                      available(eEntryPoint ep) const;
        const std::string&        path() const;

        /*
            Calls ep with native arguments. Throws std::logic_error if the
            library does not export it.
        */
        template <typename R, typename... Args>
        R call(eEntryPoint ep, Args... args) {
            const auto& B = bound(ep);

            RASSERT(sizeof...(Args) == B.entry->params.size(), "{} takes {} arguments, called with {}", B.entry->symbol, B.entry->params.size(), sizeof...(Args));

            const std::array<size_t, sizeof...(Args)> SIZES = {sizeof(Args)...};
            for (size_t i = 0; i < SIZES.size(); ++i) {
                RASSERT(SIZES[i] == TypeRegistry::describe(B.entry->params[i]).size, "{}: argument {} has the wrong native size", B.entry->symbol, i);
            }

            void* avalues[] = {sc<void*>(&args)..., nullptr};

            TRACE(Debug::log(TRACE, "native call {}", B.entry->symbol));

            if constexpr (std::is_void_v<R>) {
                ffi_call(&B.cif, B.fn, nullptr, avalues);
                return;
            } else if constexpr (std::is_integral_v<R> && sizeof(R) < sizeof(ffi_arg)) {
                // small integral returns are widened to a full register
                ffi_arg ret = 0;
                ffi_call(&B.cif, B.fn, &ret, avalues);
                return sc<R>(ret);
            } else {
                RASSERT(sizeof(R) == TypeRegistry::describe(B.entry->returns).size, "{}: return read with the wrong native size", B.entry->symbol);
                R ret{};
                ffi_call(&B.cif, B.fn, &ret, avalues);
                return ret;
            }
        }

      private:
        CNativeLibrary() = default;

        struct SBinding {
            const SEntryPoint*     entry = nullptr;
            void                   (*fn)() = nullptr;
            ffi_cif                cif     = {};
            std::vector<ffi_type*> types;
        };

        SBinding&             bound(eEntryPoint ep);

        void*                 m_handle = nullptr;
        std::string           m_path;
        std::vector<SBinding> m_bindings;
    };

    inline UP<CNativeLibrary> g_library;

    // throws std::logic_error when nothing is loaded
    CNativeLibrary& library();
};
