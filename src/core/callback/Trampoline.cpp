#include "Trampoline.hpp"
#include "../../helpers/Log.hpp"

#include <cstdio>

using namespace Glfwire;

std::vector<eSemanticType> SDropSignature::params() {
    return {GW_TYPE_WINDOW, GW_TYPE_INT, GW_TYPE_POINTER};
}

void SDropSignature::dispatch(const HostFn& fn, void** args) {
    const auto WINDOW = *sc<SWindow**>(args[0]);
    const auto COUNT  = *sc<int32_t*>(args[1]);
    const auto PATHS  = *sc<const char***>(args[2]);

    std::vector<std::string> paths;
    if (PATHS && COUNT > 0) {
        paths.reserve(COUNT);
        for (int32_t i = 0; i < COUNT; ++i) {
            paths.emplace_back(PATHS[i] ? PATHS[i] : "");
        }
    }

    fn(WINDOW, std::move(paths));
}

CTrampolineBase::CTrampolineBase(eCallbackKind kind) : m_kind(kind) {
    ;
}

std::string_view CTrampolineBase::kind() const {
    return callbackKindToStr(m_kind);
}

void* CTrampolineBase::codePointer() const {
    return m_code;
}

bool CTrampolineBase::valid() const {
    return m_code;
}

bool CTrampolineBase::foreign() const {
    return false;
}

eCallbackKind CTrampolineBase::callbackKind() const {
    return m_kind;
}

void CTrampolineBase::reportFault(eCallbackKind kind, std::string_view what) noexcept {
    try {
        Debug::log(ERR, "callback {} threw: {}", callbackKindToStr(kind), what);
    } catch (...) {
        // the log handler itself threw; stderr is all that is left
        std::fprintf(stderr, "[gw] err: callback %s threw\n", callbackKindToStr(kind));
    }
}

static size_t inFlightCalls = 0;

size_t CTrampolineBase::inFlight() {
    return inFlightCalls;
}

bool CTrampolineBase::busy() const {
    return m_inCall > 0;
}

CTrampolineBase::CCallGuard::CCallGuard(CTrampolineBase* trampoline) : m_trampoline(trampoline) {
    m_trampoline->m_inCall++;
    inFlightCalls++;
}

CTrampolineBase::CCallGuard::~CCallGuard() {
    m_trampoline->m_inCall--;
    inFlightCalls--;
}

CForeignTrampoline::CForeignTrampoline(eCallbackKind kind, void* code) : CTrampolineBase(kind) {
    m_code = code;
}

bool CForeignTrampoline::foreign() const {
    return true;
}

void CForeignTrampoline::release() {
    // not ours to free
    m_code = nullptr;
}
