#pragma once

#include <ffi.h>
#include <cstring>
#include <format>
#include <new>
#include <stdexcept>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <glfwire/core/Trampoline.hpp>

#include "CallbackRegistry.hpp"
#include "../types/Descriptors.hpp"
#include "../types/TypeRegistry.hpp"

namespace Glfwire {

    /*
        Ret and Args are descriptors from Glfwire::Types. The host function
        receives each argument deserialized.

        A non-void Ret must carry a FALLBACK (see Types::SWithDefault), which is
        what the native caller gets when the host function throws.
    */
    template <typename Ret, typename... Args>
    struct SCallbackSignature {
        using Return                  = Ret;
        using HostFn                  = std::function<typename Ret::Host(typename Args::Host...)>;
        static constexpr bool RETURNS = !std::is_void_v<typename Ret::Host>;

        static_assert(!RETURNS || Types::HasFallback<Ret>, "a callback returning a value needs a fallback for when it throws");

        static std::vector<eSemanticType> params() {
            return {Args::TYPE...};
        }

        static typename Ret::Host dispatch(const HostFn& fn, void** args) {
            return [&]<size_t... I>(std::index_sequence<I...>) -> typename Ret::Host {
                return fn(Args::deserialize(*sc<typename Args::Native*>(args[I]))...);
            }(std::index_sequence_for<Args...>{});
        }
    };

    /*
        void (GLFWwindow*, int count, const char** paths)
    */
    struct SDropSignature {
        using Return                  = Types::Void;
        using HostFn                  = std::function<void(SWindow*, std::vector<std::string>)>;
        static constexpr bool RETURNS = false;

        static std::vector<eSemanticType> params();
        static void                       dispatch(const HostFn& fn, void** args);
    };

    class CTrampolineBase : public ITrampoline {
      public:
        virtual std::string_view kind() const;
        virtual void*            codePointer() const;
        virtual bool             valid() const;
        virtual bool             foreign() const;

        eCallbackKind            callbackKind() const;

        // never throws, whatever the installed log handler does
        static void reportFault(eCallbackKind kind, std::string_view what) noexcept;

        // calls currently running inside any trampoline
        static size_t inFlight();

      protected:
        CTrampolineBase(eCallbackKind kind);

        /*
            Marks a trampoline as running for the lifetime of the guard.
            A busy trampoline is kept alive by its scope past close().
        */
        class CCallGuard {
          public:
            CCallGuard(CTrampolineBase* trampoline);
            ~CCallGuard();

          private:
            CTrampolineBase* m_trampoline = nullptr;
        };

        eCallbackKind m_kind;
        void*         m_code   = nullptr;
        size_t        m_inCall = 0;

      private:
        virtual bool busy() const;
    };

    /*
        A pointer the native library reported that glfwire did not create.
    */
    class CForeignTrampoline : public CTrampolineBase {
      public:
        CForeignTrampoline(eCallbackKind kind, void* code);

        virtual bool foreign() const;

      private:
        virtual void release();
    };

    template <typename Sig>
    class CTrampoline : public CTrampolineBase {
      public:
        // throws std::bad_alloc or std::runtime_error if libffi cannot build the closure
        CTrampoline(eCallbackKind kind, typename Sig::HostFn&& fn) : CTrampolineBase(kind), m_fn(std::move(fn)) {
            for (const auto& p : Sig::params()) {
                m_types.emplace_back(TypeRegistry::describe(p).ffi);
            }

            const auto RETURNS = TypeRegistry::describe(Sig::Return::TYPE).ffi;

            m_closure = sc<ffi_closure*>(ffi_closure_alloc(sizeof(ffi_closure), &m_code));
            if (!m_closure)
                throw std::bad_alloc();

            if (ffi_prep_cif(&m_cif, FFI_DEFAULT_ABI, m_types.size(), RETURNS, m_types.data()) != FFI_OK ||
                ffi_prep_closure_loc(m_closure, &m_cif, &CTrampoline::entry, this, m_code) != FFI_OK) {
                release();
                throw std::runtime_error(std::format("ffi failed to build a {} trampoline", callbackKindToStr(kind)));
            }
        }

        virtual ~CTrampoline() {
            if (m_closure)
                ffi_closure_free(m_closure);
        }

        CTrampoline(const CTrampoline&)            = delete;
        CTrampoline& operator=(const CTrampoline&) = delete;

      private:
        virtual void release() {
            m_code = nullptr;

            // still executing; the destructor frees the closure once the call unwinds
            if (m_inCall > 0)
                return;

            if (m_closure)
                ffi_closure_free(m_closure);

            m_closure = nullptr;
        }

        template <typename H>
        static void writeReturn(void* ret, const H& value) {
            using Native      = typename Sig::Return::Native;
            const auto NATIVE = Sig::Return::serialize(value);

            if constexpr (std::is_integral_v<Native> && sizeof(Native) < sizeof(ffi_arg)) {
                // the closure's return slot is a full register
                if constexpr (std::is_signed_v<Native>)
                    *sc<ffi_sarg*>(ret) = NATIVE;
                else
                    *sc<ffi_arg*>(ret) = NATIVE;
            } else
                std::memcpy(ret, &NATIVE, sizeof(Native));
        }

        static void entry(ffi_cif*, void* ret, void** args, void* data) {
            auto       self = sc<CTrampoline*>(data);
            const auto KIND = self->m_kind;

            CCallGuard guard(self);

            try {
                if constexpr (Sig::RETURNS)
                    writeReturn(ret, Sig::dispatch(self->m_fn, args));
                else
                    Sig::dispatch(self->m_fn, args);
                return;
            } catch (const std::exception& e) {
                reportFault(KIND, e.what());
            } catch (...) {
                reportFault(KIND, "unknown exception");
            }

            // nothing may unwind into the native frame
            if constexpr (Sig::RETURNS)
                writeReturn(ret, Sig::Return::FALLBACK);
        }

        typename Sig::HostFn   m_fn;
        ffi_cif                m_cif     = {};
        ffi_closure*           m_closure = nullptr;
        std::vector<ffi_type*> m_types;
    };
};
