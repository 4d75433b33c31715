#include <glfwire/core/Library.hpp>

#include "Shared.hpp"
#include "../callback/Registration.hpp"
#include "../callback/Signatures.hpp"
#include "../library/NativeLibrary.hpp"
#include "../marshal/OutArgs.hpp"
#include "../../helpers/Env.hpp"
#include "../../helpers/Log.hpp"

#include <type_traits>

using namespace Glfwire;

static_assert(std::is_same_v<ErrorFn, Signatures::Error::HostFn>);

bool Glfwire::load() {
    if (const auto PATH = Env::envValue("GW_LIBRARY_PATH"); PATH)
        return load(*PATH);

    for (const auto& candidate : {"libglfw.so.3", "libglfw.so"}) {
        if (load(candidate))
            return true;
    }

    return false;
}

bool Glfwire::load(const std::string& path) {
    auto lib = CNativeLibrary::open(path);
    if (!lib)
        return false;

    unload();
    g_library = std::move(lib);
    return true;
}

bool Glfwire::loaded() {
    return !!g_library;
}

void Glfwire::unload() {
    if (g_callbacks)
        g_callbacks->clear();

    Api::g_gammaArena.reset();
    g_library.reset();
}

bool Glfwire::init() {
    return Types::Bool::deserialize(library().call<int32_t>(GW_EP_INIT));
}

void Glfwire::terminate() {
    library().call<void>(GW_EP_TERMINATE);

    // terminating does not reset the error callback natively either
    callbacks().clearExcept(GW_CALLBACK_ERROR);
    Api::g_gammaArena.reset();
}

void Glfwire::initHint(eInitHint hint, bool value) {
    library().call<void>(GW_EP_INIT_HINT, Types::InitHint::serialize(hint), Types::Bool::serialize(value));
}

std::tuple<int32_t, int32_t, int32_t> Glfwire::getVersion() {
    return Marshal::withOutArgs<Types::Int, Types::Int, Types::Int>(
        [](int32_t* major, int32_t* minor, int32_t* revision) { library().call<void>(GW_EP_GET_VERSION, major, minor, revision); });
}

std::string Glfwire::getVersionString() {
    return Types::String::deserialize(library().call<const char*>(GW_EP_GET_VERSION_STRING));
}

std::optional<SError> Glfwire::getError() {
    int32_t code = GW_ERROR_NO_ERROR;

    auto [description] = Marshal::withOutArgs<Types::String>([&code](const char** description) { code = library().call<int32_t>(GW_EP_GET_ERROR, description); });

    if (code == GW_ERROR_NO_ERROR)
        return std::nullopt;

    return SError{
        .code        = Types::ErrorCode::deserialize(code),
        .nativeCode  = code,
        .description = std::move(description),
    };
}

SP<ITrampoline> Glfwire::setErrorCallback(ErrorFn&& fn) {
    return setErrorCallback(std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setErrorCallback(ErrorFn&& fn, CScope& scope) {
    return Callbacks::set<Signatures::Error>(GW_CALLBACK_ERROR, GW_EP_SET_ERROR_CALLBACK, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setErrorCallback(const SP<ITrampoline>& trampoline) {
    return Callbacks::install(GW_CALLBACK_ERROR, GW_EP_SET_ERROR_CALLBACK, trampoline);
}

double Glfwire::getTime() {
    return library().call<double>(GW_EP_GET_TIME);
}

void Glfwire::setTime(double time) {
    library().call<void>(GW_EP_SET_TIME, time);
}

uint64_t Glfwire::getTimerValue() {
    return library().call<uint64_t>(GW_EP_GET_TIMER_VALUE);
}

uint64_t Glfwire::getTimerFrequency() {
    return library().call<uint64_t>(GW_EP_GET_TIMER_FREQUENCY);
}
