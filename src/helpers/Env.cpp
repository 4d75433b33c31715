#include "Env.hpp"

#include <cstdlib>
#include <string_view>

using namespace Glfwire;
using namespace Glfwire::Env;

bool Glfwire::Env::envEnabled(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret)
        return false;

    const std::string_view sv = ret;

    return !sv.empty() && sv != "0";
}

std::optional<std::string> Glfwire::Env::envValue(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret || !*ret)
        return std::nullopt;

    return std::string{ret};
}

bool Glfwire::Env::isTrace() {
    static bool TRACE = envEnabled("GW_TRACE");
    return TRACE;
}
