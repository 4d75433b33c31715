#include <glfwire/core/Scope.hpp>

#include "CallbackRegistry.hpp"
#include "Trampoline.hpp"
#include "../../helpers/Log.hpp"

#include <stdexcept>

using namespace Glfwire;

// closed while still running, freed by a later close
static std::vector<SP<ITrampoline>> retired;

static void dropRetired() {
    if (CTrampolineBase::inFlight() > 0)
        return;

    retired.clear();
}

CScope::~CScope() {
    if (!m_closed)
        close();
}

CScope& CScope::global() {
    // never freed, its trampolines must survive static destruction
    static CScope* GLOBAL = [] {
        auto scope      = new CScope();
        scope->m_global = true;
        return scope;
    }();

    return *GLOBAL;
}

void CScope::close() {
    if (m_global)
        throw std::logic_error("the global scope cannot be closed");

    if (m_closed)
        return;

    m_closed = true;

    dropRetired();

    for (const auto& t : m_trampolines) {
        if (g_callbacks)
            g_callbacks->dropTrampoline(t.get());
        t->release();

        if (t->busy())
            retired.emplace_back(t);
    }

    TRACE(Debug::log(TRACE, "scope closed, released {} trampolines", m_trampolines.size()));

    m_trampolines.clear();
}

bool CScope::closed() const {
    return m_closed;
}

size_t CScope::size() const {
    return m_trampolines.size();
}

void CScope::adopt(const SP<ITrampoline>& trampoline) {
    if (m_closed)
        throw std::logic_error("cannot create a callback in a closed scope");

    if (trampoline)
        m_trampolines.emplace_back(trampoline);
}
