#include "NativeLibrary.hpp"

#include <dlfcn.h>
#include <format>
#include <stdexcept>

using namespace Glfwire;

UP<CNativeLibrary> CNativeLibrary::open(const std::string& path) {
    auto handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const auto DLERROR = dlerror();
        Debug::log(ERR, "failed to open {}: {}", path, DLERROR ? DLERROR : "unknown error");
        return nullptr;
    }

    UP<CNativeLibrary> lib = UP<CNativeLibrary>(new CNativeLibrary());
    lib->m_handle          = handle;
    lib->m_path            = path;

    const auto& ENTRY_POINTS = entryPoints();
    lib->m_bindings.resize(ENTRY_POINTS.size());

    size_t missing = 0;

    for (size_t i = 0; i < ENTRY_POINTS.size(); ++i) {
        auto& b = lib->m_bindings[i];
        b.entry = &ENTRY_POINTS[i];

        dlerror();
        auto sym = dlsym(handle, b.entry->symbol);
        if (!sym) {
            Debug::log(WARN, "{} does not export {}, calls to it will fail", path, b.entry->symbol);
            ++missing;
            continue;
        }

        b.types.reserve(b.entry->params.size());
        for (const auto& p : b.entry->params) {
            b.types.emplace_back(TypeRegistry::describe(p).ffi);
        }

        const auto RETURNS = TypeRegistry::describe(b.entry->returns).ffi;

        if (ffi_prep_cif(&b.cif, FFI_DEFAULT_ABI, b.types.size(), RETURNS, b.types.empty() ? nullptr : b.types.data())) {
            Debug::log(ERR, "ffi failed to prepare {}", b.entry->symbol);
            ++missing;
            continue;
        }

        b.fn = rc<void (*)()>(sym);
    }

    Debug::log(LOG, "loaded {}: {} entry points bound, {} unavailable", path, ENTRY_POINTS.size() - missing, missing);

    return lib;
}

CNativeLibrary::~CNativeLibrary() {
    if (m_handle)
        dlclose(m_handle);
}

bool CNativeLibrary::available(eEntryPoint ep) const {
    return ep < m_bindings.size() && m_bindings[ep].fn;
}

const std::string& CNativeLibrary::path() const {
    return m_path;
}

CNativeLibrary::SBinding& CNativeLibrary::bound(eEntryPoint ep) {
    RASSERT(ep < m_bindings.size(), "entry point {} is not in the table", sc<int>(ep));

    auto& b = m_bindings[ep];
    if (!b.fn)
        throw std::logic_error(std::format("{} is not available in {}", b.entry->symbol, m_path));

    return b;
}

CNativeLibrary& Glfwire::library() {
    if (!g_library)
        throw std::logic_error("glfwire: the native library is not loaded");

    return *g_library;
}
