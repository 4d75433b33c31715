#pragma once

#include <format>
#include <cstdint>
#include <iostream>

#include <glfwire/core/Log.hpp>

#include "Env.hpp"

using Glfwire::eLogLevel;
using Glfwire::NONE;
using Glfwire::LOG;
using Glfwire::WARN;
using Glfwire::ERR;
using Glfwire::CRIT;
using Glfwire::INFO;
using Glfwire::TRACE;

namespace Debug {

    inline bool                trace = Glfwire::Env::isTrace();

    inline Glfwire::LogHandler sink;

    template <typename... Args>
    void log(eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!trace && (level == LOG || level == INFO))
            return;

        const auto MESSAGE = std::vformat(fmt.get(), std::make_format_args(args...));

        if (sink) {
            sink(level, MESSAGE);
            return;
        }

        switch (level) {
            case NONE: break;
            case LOG: std::cout << "[gw] log: "; break;
            case WARN: std::cout << "[gw] warn: "; break;
            case ERR: std::cout << "[gw] err: "; break;
            case CRIT: std::cout << "[gw] crit: "; break;
            case INFO: std::cout << "[gw] info: "; break;
            case TRACE: std::cout << "[gw] trace: "; break;
        }

        std::cout << MESSAGE << std::endl;
    }
};
