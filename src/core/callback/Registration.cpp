#include "Registration.hpp"
#include "../library/NativeLibrary.hpp"
#include "../../helpers/Log.hpp"

#include <format>
#include <stdexcept>

using namespace Glfwire;

static void* codeFor(eCallbackKind kind, const SP<ITrampoline>& trampoline) {
    if (!trampoline)
        return nullptr;

    if (trampoline->kind() != callbackKindToStr(kind))
        throw std::invalid_argument(std::format("a {} trampoline cannot be installed as a {} callback", trampoline->kind(), callbackKindToStr(kind)));

    if (!trampoline->valid())
        throw std::logic_error(std::format("{} trampoline was released with its scope", trampoline->kind()));

    return trampoline->codePointer();
}

static SP<ITrampoline> record(eCallbackKind kind, void* object, const SP<ITrampoline>& trampoline, void* previousNative) {
    // the native call went through, the slot follows it
    auto previous = callbacks().set(kind, object, trampoline);

    if (!previousNative)
        return nullptr;

    if (previous && previous->codePointer() == previousNative)
        return previous;

    if (previous)
        Debug::log(WARN, "{} callback was replaced outside glfwire", callbackKindToStr(kind));

    return makeShared<CForeignTrampoline>(kind, previousNative);
}

SP<ITrampoline> Glfwire::Callbacks::install(eCallbackKind kind, eEntryPoint ep, const SP<ITrampoline>& trampoline) {
    const auto CODE     = codeFor(kind, trampoline);
    const auto PREVIOUS = library().call<void*>(ep, CODE);
    return record(kind, nullptr, trampoline, PREVIOUS);
}

SP<ITrampoline> Glfwire::Callbacks::installFor(eCallbackKind kind, eEntryPoint ep, SWindow* window, const SP<ITrampoline>& trampoline) {
    const auto CODE     = codeFor(kind, trampoline);
    const auto PREVIOUS = library().call<void*>(ep, window, CODE);
    return record(kind, window, trampoline, PREVIOUS);
}

void Glfwire::Callbacks::ensureAvailable(eEntryPoint ep) {
    if (!library().available(ep))
        throw std::logic_error(std::format("{} is not available in {}", entryPoints().at(ep).symbol, library().path()));
}
