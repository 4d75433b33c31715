#pragma once

#include <hyprutils/memory/SharedPtr.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "Scope.hpp"
#include "Trampoline.hpp"
#include "types/Types.hpp"

namespace Glfwire {
    std::vector<SMonitor*>                         getMonitors();
    SMonitor*                                      getPrimaryMonitor();

    std::tuple<int32_t, int32_t>                   getMonitorPos(SMonitor* monitor);

    // x, y, width, height
    std::tuple<int32_t, int32_t, int32_t, int32_t> getMonitorWorkarea(SMonitor* monitor);

    // millimetres
    std::tuple<int32_t, int32_t>               getMonitorPhysicalSize(SMonitor* monitor);
    std::tuple<float, float>                   getMonitorContentScale(SMonitor* monitor);
    std::optional<std::string>                 getMonitorName(SMonitor* monitor);

    void                                       setMonitorUserPointer(SMonitor* monitor, void* pointer);
    void*                                      getMonitorUserPointer(SMonitor* monitor);

    using MonitorFn = std::function<void(SMonitor* monitor, std::optional<eConnectionEvent> event)>;

    Hyprutils::Memory::CSharedPointer<ITrampoline> setMonitorCallback(MonitorFn&& fn);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setMonitorCallback(MonitorFn&& fn, CScope& scope);
    Hyprutils::Memory::CSharedPointer<ITrampoline> setMonitorCallback(const Hyprutils::Memory::CSharedPointer<ITrampoline>& trampoline);

    std::vector<SVideoMode>                        getVideoModes(SMonitor* monitor);
    std::optional<SVideoMode>                      getVideoMode(SMonitor* monitor);

    void                                           setGamma(SMonitor* monitor, float gamma);
    std::optional<SGammaRamp>                      getGammaRamp(SMonitor* monitor);

    /*
        The native library may keep pointing into the ramp, so its native copy
        is kept alive until the next setGammaRamp or terminate.
    */
    void setGammaRamp(SMonitor* monitor, const SGammaRamp& ramp);
};
