#include "Arena.hpp"

#include <cstdlib>
#include <cstring>
#include <new>

using namespace Glfwire;

std::atomic<size_t> CArena::m_live = 0;

CArena::~CArena() {
    for (const auto& b : m_blocks) {
        free(b);
    }

    m_live -= m_blocks.size();
}

void* CArena::allocate(size_t bytes) {
    m_blocks.reserve(m_blocks.size() + 1);

    auto block = calloc(1, bytes ? bytes : 1);
    if (!block)
        throw std::bad_alloc();

    m_blocks.emplace_back(block);
    ++m_live;
    return block;
}

const char* CArena::string(std::string_view str) {
    auto buf = allocate<char>(str.size() + 1);
    std::memcpy(buf, str.data(), str.size());
    return buf;
}

size_t CArena::blocks() const {
    return m_blocks.size();
}

size_t CArena::liveAllocations() {
    return m_live;
}
