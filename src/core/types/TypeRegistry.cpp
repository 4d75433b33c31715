#include "TypeRegistry.hpp"
#include "../../helpers/FFI.hpp"
#include "../../Macros.hpp"

using namespace Glfwire;

struct SRegistration {
    eSemanticType type;
    eSemanticKind kind;
    eNativeType   primitive;
    const char*   name;
};

// ordered by eSemanticType
static constexpr SRegistration REGISTRATIONS[] = {
    {GW_TYPE_VOID, GW_KIND_PRIMITIVE, GW_NATIVE_VOID, "void"},

    {GW_TYPE_INT, GW_KIND_PRIMITIVE, GW_NATIVE_SINT32, "int"},
    {GW_TYPE_UINT, GW_KIND_PRIMITIVE, GW_NATIVE_UINT32, "uint"},
    {GW_TYPE_INT64, GW_KIND_PRIMITIVE, GW_NATIVE_SINT64, "int64"},
    {GW_TYPE_UINT64, GW_KIND_PRIMITIVE, GW_NATIVE_UINT64, "uint64"},
    {GW_TYPE_SHORT, GW_KIND_PRIMITIVE, GW_NATIVE_UINT16, "short"},
    {GW_TYPE_BYTE, GW_KIND_PRIMITIVE, GW_NATIVE_UINT8, "byte"},
    {GW_TYPE_FLOAT, GW_KIND_PRIMITIVE, GW_NATIVE_FLOAT, "float"},
    {GW_TYPE_DOUBLE, GW_KIND_PRIMITIVE, GW_NATIVE_DOUBLE, "double"},
    {GW_TYPE_POINTER, GW_KIND_PRIMITIVE, GW_NATIVE_POINTER, "pointer"},

    {GW_TYPE_BOOL, GW_KIND_BOOL, GW_NATIVE_SINT32, "bool"},
    {GW_TYPE_CSTRING, GW_KIND_CSTRING, GW_NATIVE_POINTER, "c-string"},
    {GW_TYPE_CODEPOINT, GW_KIND_CODEPOINT, GW_NATIVE_UINT32, "codepoint"},

    {GW_TYPE_WINDOW, GW_KIND_HANDLE, GW_NATIVE_POINTER, "window"},
    {GW_TYPE_MONITOR, GW_KIND_HANDLE, GW_NATIVE_POINTER, "monitor"},
    {GW_TYPE_CURSOR, GW_KIND_HANDLE, GW_NATIVE_POINTER, "cursor"},

    {GW_TYPE_ERROR_CODE, GW_KIND_ENUM, GW_NATIVE_SINT32, "error-code"},
    {GW_TYPE_INIT_HINT, GW_KIND_ENUM, GW_NATIVE_SINT32, "init-hint"},
    {GW_TYPE_WINDOW_HINT, GW_KIND_ENUM, GW_NATIVE_SINT32, "window-hint"},
    {GW_TYPE_INPUT_MODE, GW_KIND_ENUM, GW_NATIVE_SINT32, "input-mode"},
    {GW_TYPE_KEY, GW_KIND_ENUM, GW_NATIVE_SINT32, "key"},
    {GW_TYPE_KEY_ACTION, GW_KIND_ENUM, GW_NATIVE_SINT32, "key-action"},
    {GW_TYPE_MOUSE_BUTTON, GW_KIND_ENUM, GW_NATIVE_SINT32, "mouse-button"},
    {GW_TYPE_CONNECTION_EVENT, GW_KIND_ENUM, GW_NATIVE_SINT32, "connection-event"},
    {GW_TYPE_STANDARD_CURSOR, GW_KIND_ENUM, GW_NATIVE_SINT32, "standard-cursor"},

    {GW_TYPE_MODS, GW_KIND_BITFLAG, GW_NATIVE_SINT32, "mods"},
    // hats only cross the boundary as elements of a byte array
    {GW_TYPE_HAT, GW_KIND_BITFLAG, GW_NATIVE_UINT8, "hat"},

    {GW_TYPE_IMAGE, GW_KIND_STRUCT, GW_NATIVE_POINTER, "image"},
    {GW_TYPE_VIDMODE, GW_KIND_STRUCT, GW_NATIVE_POINTER, "vidmode"},
    {GW_TYPE_GAMMA_RAMP, GW_KIND_STRUCT, GW_NATIVE_POINTER, "gamma-ramp"},
    {GW_TYPE_GAMEPAD_STATE, GW_KIND_STRUCT, GW_NATIVE_POINTER, "gamepad-state"},
};

static_assert(sizeof(REGISTRATIONS) / sizeof(REGISTRATIONS[0]) == GW_TYPE_COUNT, "every semantic type needs a registration");

static std::vector<STypeDescriptor> buildDescriptors() {
    std::vector<STypeDescriptor> result;
    result.reserve(GW_TYPE_COUNT);

    for (const auto& r : REGISTRATIONS) {
        RASSERT(sc<size_t>(r.type) == result.size(), "type registry out of order at {}", r.name);

        const auto FFITYPE = FFI::ffiTypeFrom(r.primitive);
        RASSERT(FFITYPE, "type {} has no native layout", r.name);

        result.emplace_back(STypeDescriptor{
            .type      = r.type,
            .kind      = r.kind,
            .primitive = r.primitive,
            .name      = r.name,
            .size      = FFI::nativeSizeOf(r.primitive),
            .align     = r.primitive == GW_NATIVE_VOID ? 0 : FFITYPE->alignment,
            .ffi       = FFITYPE,
        });
    }

    return result;
}

const std::vector<STypeDescriptor>& Glfwire::TypeRegistry::all() {
    static const std::vector<STypeDescriptor> DESCRIPTORS = buildDescriptors();
    return DESCRIPTORS;
}

const STypeDescriptor& Glfwire::TypeRegistry::describe(eSemanticType type) {
    const auto& DESCRIPTORS = all();
    RASSERT(sc<size_t>(type) < DESCRIPTORS.size(), "semantic type {} is not registered", sc<int>(type));
    return DESCRIPTORS[type];
}
