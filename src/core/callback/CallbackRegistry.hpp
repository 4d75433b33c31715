#pragma once

#include <cstdint>
#include <vector>

#include <glfwire/core/Trampoline.hpp>

#include "../../helpers/Memory.hpp"

namespace Glfwire {
    enum eCallbackKind : uint8_t {
        GW_CALLBACK_ERROR = 0,
        GW_CALLBACK_MONITOR,
        GW_CALLBACK_JOYSTICK,

        GW_CALLBACK_WINDOW_POS,
        GW_CALLBACK_WINDOW_SIZE,
        GW_CALLBACK_WINDOW_CLOSE,
        GW_CALLBACK_WINDOW_REFRESH,
        GW_CALLBACK_WINDOW_FOCUS,
        GW_CALLBACK_WINDOW_ICONIFY,
        GW_CALLBACK_WINDOW_MAXIMIZE,
        GW_CALLBACK_FRAMEBUFFER_SIZE,
        GW_CALLBACK_WINDOW_CONTENT_SCALE,

        GW_CALLBACK_KEY,
        GW_CALLBACK_CHAR,
        GW_CALLBACK_CHAR_MODS,
        GW_CALLBACK_MOUSE_BUTTON,
        GW_CALLBACK_CURSOR_POS,
        GW_CALLBACK_CURSOR_ENTER,
        GW_CALLBACK_SCROLL,
        GW_CALLBACK_DROP,

        // for trampolines created outside a registration
        GW_CALLBACK_CUSTOM,
    };

    const char* callbackKindToStr(eCallbackKind kind);

    /*
        One slot per (kind, owning object). Global callbacks use a null object.
    */
    class CCallbackRegistry {
      public:
        SP<ITrampoline> get(eCallbackKind kind, void* object) const;

        // returns the previous slot content. nullptr clears the slot.
        SP<ITrampoline> set(eCallbackKind kind, void* object, const SP<ITrampoline>& trampoline);

        void            dropObject(void* object);
        void            dropTrampoline(const ITrampoline* trampoline);
        void            clear();
        void            clearExcept(eCallbackKind kind);

        size_t          size() const;

      private:
        struct SSlot {
            eCallbackKind   kind   = GW_CALLBACK_ERROR;
            void*           object = nullptr;
            SP<ITrampoline> trampoline;
        };

        std::vector<SSlot> m_slots;
    };

    inline UP<CCallbackRegistry> g_callbacks;

    CCallbackRegistry&           callbacks();
};
