#pragma once

#include <atomic>
#include <cstddef>
#include <string_view>
#include <vector>

namespace Glfwire {

    /*
        A confined native memory region. Every block handed out is zeroed and
        stays valid until the arena is destroyed.
    */
    class CArena {
      public:
        CArena() = default;
        ~CArena();

        CArena(const CArena&)            = delete;
        CArena& operator=(const CArena&) = delete;

        // throws std::bad_alloc
        void* allocate(size_t bytes);

        template <typename T>
        T* allocate(size_t count = 1) {
            return static_cast<T*>(allocate(sizeof(T) * (count ? count : 1)));
        }

        // a NUL terminated copy of str
        const char*   string(std::string_view str);

        size_t        blocks() const;

        static size_t liveAllocations();

      private:
        std::vector<void*>         m_blocks;

        static std::atomic<size_t> m_live;
    };
};
