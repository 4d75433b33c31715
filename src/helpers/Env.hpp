#pragma once

#include <string>
#include <optional>

namespace Glfwire::Env {
    bool                       envEnabled(const std::string& env);
    std::optional<std::string> envValue(const std::string& env);
    bool                       isTrace();
};
