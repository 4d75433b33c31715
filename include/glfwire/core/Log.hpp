#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace Glfwire {
    enum eLogLevel : int8_t {
        NONE = -1,
        LOG  = 0,
        WARN,
        ERR,
        CRIT,
        INFO,
        TRACE
    };

    using LogHandler = std::function<void(eLogLevel level, const std::string& message)>;

    /*
        Route glfwire's log output to a handler instead of stdout.
        Faults caught inside callbacks are reported here.
        Pass an empty handler to restore stdout.
    */
    void setLogHandler(LogHandler&& handler);
};
