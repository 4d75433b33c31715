#include <glfwire/core/Monitor.hpp>

#include "Shared.hpp"
#include "../callback/Registration.hpp"
#include "../callback/Signatures.hpp"
#include "../library/NativeLibrary.hpp"
#include "../marshal/OutArgs.hpp"
#include "../marshal/Structs.hpp"

#include <type_traits>

using namespace Glfwire;

static_assert(std::is_same_v<MonitorFn, Signatures::Monitor::HostFn>);

std::vector<SMonitor*> Glfwire::getMonitors() {
    SMonitor** monitors = nullptr;

    const auto [COUNT] = Marshal::withOutArgs<Types::Int>([&monitors](int32_t* count) { monitors = sc<SMonitor**>(library().call<void*>(GW_EP_GET_MONITORS, count)); });

    if (!monitors || COUNT <= 0)
        return {};

    return std::vector<SMonitor*>(monitors, monitors + COUNT);
}

SMonitor* Glfwire::getPrimaryMonitor() {
    return library().call<SMonitor*>(GW_EP_GET_PRIMARY_MONITOR);
}

std::tuple<int32_t, int32_t> Glfwire::getMonitorPos(SMonitor* monitor) {
    return Marshal::withOutArgs<Types::Int, Types::Int>([monitor](int32_t* x, int32_t* y) { library().call<void>(GW_EP_GET_MONITOR_POS, monitor, x, y); });
}

std::tuple<int32_t, int32_t, int32_t, int32_t> Glfwire::getMonitorWorkarea(SMonitor* monitor) {
    return Marshal::withOutArgs<Types::Int, Types::Int, Types::Int, Types::Int>(
        [monitor](int32_t* x, int32_t* y, int32_t* w, int32_t* h) { library().call<void>(GW_EP_GET_MONITOR_WORKAREA, monitor, x, y, w, h); });
}

std::tuple<int32_t, int32_t> Glfwire::getMonitorPhysicalSize(SMonitor* monitor) {
    return Marshal::withOutArgs<Types::Int, Types::Int>([monitor](int32_t* w, int32_t* h) { library().call<void>(GW_EP_GET_MONITOR_PHYSICAL_SIZE, monitor, w, h); });
}

std::tuple<float, float> Glfwire::getMonitorContentScale(SMonitor* monitor) {
    return Marshal::withOutArgs<Types::Float, Types::Float>([monitor](float* x, float* y) { library().call<void>(GW_EP_GET_MONITOR_CONTENT_SCALE, monitor, x, y); });
}

std::optional<std::string> Glfwire::getMonitorName(SMonitor* monitor) {
    return Types::CString::deserialize(library().call<const char*>(GW_EP_GET_MONITOR_NAME, monitor));
}

void Glfwire::setMonitorUserPointer(SMonitor* monitor, void* pointer) {
    library().call<void>(GW_EP_SET_MONITOR_USER_POINTER, monitor, pointer);
}

void* Glfwire::getMonitorUserPointer(SMonitor* monitor) {
    return library().call<void*>(GW_EP_GET_MONITOR_USER_POINTER, monitor);
}

SP<ITrampoline> Glfwire::setMonitorCallback(MonitorFn&& fn) {
    return setMonitorCallback(std::move(fn), CScope::global());
}

SP<ITrampoline> Glfwire::setMonitorCallback(MonitorFn&& fn, CScope& scope) {
    return Callbacks::set<Signatures::Monitor>(GW_CALLBACK_MONITOR, GW_EP_SET_MONITOR_CALLBACK, std::move(fn), scope);
}

SP<ITrampoline> Glfwire::setMonitorCallback(const SP<ITrampoline>& trampoline) {
    return Callbacks::install(GW_CALLBACK_MONITOR, GW_EP_SET_MONITOR_CALLBACK, trampoline);
}

std::vector<SVideoMode> Glfwire::getVideoModes(SMonitor* monitor) {
    const void* modes = nullptr;

    const auto [COUNT] = Marshal::withOutArgs<Types::Int>([&modes, monitor](int32_t* count) { modes = library().call<void*>(GW_EP_GET_VIDEO_MODES, monitor, count); });

    if (COUNT <= 0)
        return {};

    return Marshal::deserializeArray(modes, COUNT);
}

std::optional<SVideoMode> Glfwire::getVideoMode(SMonitor* monitor) {
    const auto MODE = library().call<void*>(GW_EP_GET_VIDEO_MODE, monitor);
    if (!MODE)
        return std::nullopt;

    return Marshal::deserializeFrom<SVideoMode>(MODE);
}

void Glfwire::setGamma(SMonitor* monitor, float gamma) {
    library().call<void>(GW_EP_SET_GAMMA, monitor, gamma);
}

std::optional<SGammaRamp> Glfwire::getGammaRamp(SMonitor* monitor) {
    const auto RAMP = library().call<void*>(GW_EP_GET_GAMMA_RAMP, monitor);
    if (!RAMP)
        return std::nullopt;

    return Marshal::deserializeFrom<SGammaRamp>(RAMP);
}

void Glfwire::setGammaRamp(SMonitor* monitor, const SGammaRamp& ramp) {
    auto arena  = makeUnique<CArena>();
    auto record = Marshal::serialize(ramp, *arena);

    library().call<void>(GW_EP_SET_GAMMA_RAMP, monitor, record);

    // the previous ramp is only released once the native library has the new one
    Api::g_gammaArena = std::move(arena);
}
