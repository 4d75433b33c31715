#include "CallbackRegistry.hpp"
#include "../../helpers/Log.hpp"

#include <algorithm>

using namespace Glfwire;

const char* Glfwire::callbackKindToStr(eCallbackKind kind) {
    switch (kind) {
        case GW_CALLBACK_ERROR: return "error";
        case GW_CALLBACK_MONITOR: return "monitor";
        case GW_CALLBACK_JOYSTICK: return "joystick";
        case GW_CALLBACK_WINDOW_POS: return "window-pos";
        case GW_CALLBACK_WINDOW_SIZE: return "window-size";
        case GW_CALLBACK_WINDOW_CLOSE: return "window-close";
        case GW_CALLBACK_WINDOW_REFRESH: return "window-refresh";
        case GW_CALLBACK_WINDOW_FOCUS: return "window-focus";
        case GW_CALLBACK_WINDOW_ICONIFY: return "window-iconify";
        case GW_CALLBACK_WINDOW_MAXIMIZE: return "window-maximize";
        case GW_CALLBACK_FRAMEBUFFER_SIZE: return "framebuffer-size";
        case GW_CALLBACK_WINDOW_CONTENT_SCALE: return "window-content-scale";
        case GW_CALLBACK_KEY: return "key";
        case GW_CALLBACK_CHAR: return "char";
        case GW_CALLBACK_CHAR_MODS: return "char-mods";
        case GW_CALLBACK_MOUSE_BUTTON: return "mouse-button";
        case GW_CALLBACK_CURSOR_POS: return "cursor-pos";
        case GW_CALLBACK_CURSOR_ENTER: return "cursor-enter";
        case GW_CALLBACK_SCROLL: return "scroll";
        case GW_CALLBACK_DROP: return "drop";
        case GW_CALLBACK_CUSTOM: return "custom";
    }

    return "unknown";
}

SP<ITrampoline> CCallbackRegistry::get(eCallbackKind kind, void* object) const {
    for (const auto& s : m_slots) {
        if (s.kind == kind && s.object == object)
            return s.trampoline;
    }

    return nullptr;
}

SP<ITrampoline> CCallbackRegistry::set(eCallbackKind kind, void* object, const SP<ITrampoline>& trampoline) {
    for (auto it = m_slots.begin(); it != m_slots.end(); ++it) {
        if (it->kind != kind || it->object != object)
            continue;

        auto previous = it->trampoline;

        if (trampoline)
            it->trampoline = trampoline;
        else
            m_slots.erase(it);

        return previous;
    }

    if (trampoline)
        m_slots.emplace_back(SSlot{.kind = kind, .object = object, .trampoline = trampoline});

    return nullptr;
}

void CCallbackRegistry::dropObject(void* object) {
    std::erase_if(m_slots, [object](const auto& s) { return s.object == object; });
}

void CCallbackRegistry::dropTrampoline(const ITrampoline* trampoline) {
    std::erase_if(m_slots, [trampoline](const auto& s) { return s.trampoline.get() == trampoline; });
}

void CCallbackRegistry::clear() {
    m_slots.clear();
}

void CCallbackRegistry::clearExcept(eCallbackKind kind) {
    std::erase_if(m_slots, [kind](const auto& s) { return s.kind != kind; });
}

size_t CCallbackRegistry::size() const {
    return m_slots.size();
}

CCallbackRegistry& Glfwire::callbacks() {
    if (!g_callbacks)
        g_callbacks = makeUnique<CCallbackRegistry>();

    return *g_callbacks;
}
