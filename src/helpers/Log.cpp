#include "Log.hpp"

void Glfwire::setLogHandler(LogHandler&& handler) {
    Debug::sink = std::move(handler);
}
