#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <glfwire/core/types/NativeType.hpp>
#include <glfwire/core/types/Codecs.hpp>
#include <glfwire/core/types/Types.hpp>

#include "../../helpers/Memory.hpp"

/*
    Compile-time descriptors. Each one names the host type, the native type,
    the registry id and the conversions in both directions. Callback
    signatures, out-args and wrappers are all built from these.
*/
namespace Glfwire::Types {

    template <typename H, typename N, eSemanticType T>
    struct SPassthrough {
        using Host                          = H;
        using Native                        = N;
        static constexpr eSemanticType TYPE = T;

        static Native                  serialize(Host value) {
            return sc<Native>(value);
        }

        static Host deserialize(Native value) {
            return sc<Host>(value);
        }
    };

    using Int    = SPassthrough<int32_t, int32_t, GW_TYPE_INT>;
    using UInt   = SPassthrough<uint32_t, uint32_t, GW_TYPE_UINT>;
    using Int64  = SPassthrough<int64_t, int64_t, GW_TYPE_INT64>;
    using UInt64 = SPassthrough<uint64_t, uint64_t, GW_TYPE_UINT64>;
    using Short  = SPassthrough<uint16_t, uint16_t, GW_TYPE_SHORT>;
    using Byte   = SPassthrough<uint8_t, uint8_t, GW_TYPE_BYTE>;
    using Float  = SPassthrough<float, float, GW_TYPE_FLOAT>;
    using Double = SPassthrough<double, double, GW_TYPE_DOUBLE>;

    struct Pointer {
        using Host                          = void*;
        using Native                        = void*;
        static constexpr eSemanticType TYPE = GW_TYPE_POINTER;

        static Native                  serialize(Host value) {
            return value;
        }

        static Host deserialize(Native value) {
            return value;
        }
    };

    struct Void {
        using Host                          = void;
        using Native                        = void;
        static constexpr eSemanticType TYPE = GW_TYPE_VOID;
    };

    struct Bool {
        using Host                          = bool;
        using Native                        = int32_t;
        static constexpr eSemanticType TYPE = GW_TYPE_BOOL;

        static Native                  serialize(Host value) {
            return value ? 1 : 0;
        }

        static Host deserialize(Native value) {
            return value != 0;
        }
    };

    struct CString {
        using Host                          = std::optional<std::string>;
        using Native                        = const char*;
        static constexpr eSemanticType TYPE = GW_TYPE_CSTRING;

        // the returned pointer borrows from value
        static Native serialize(const std::string& value) {
            return value.c_str();
        }

        static Host deserialize(Native value) {
            if (!value)
                return std::nullopt;
            return std::string{value};
        }
    };

    /*
        Text the native library never reports as null. A null still reads as empty.
    */
    struct String {
        using Host                          = std::string;
        using Native                        = const char*;
        static constexpr eSemanticType TYPE = GW_TYPE_CSTRING;

        static Native                  serialize(const std::string& value) {
            return value.c_str();
        }

        static Host deserialize(Native value) {
            return value ? std::string{value} : std::string{};
        }
    };

    /*
        A unicode codepoint, hosted as the UTF-8 encoding of that one character.
    */
    struct Codepoint {
        using Host                          = std::string;
        using Native                        = uint32_t;
        static constexpr eSemanticType TYPE = GW_TYPE_CODEPOINT;

        // throws std::invalid_argument unless value holds exactly one UTF-8 character
        static Native serialize(std::string_view value);
        static Host   deserialize(Native value);
    };

    template <typename H, eSemanticType T>
    struct SHandle {
        using Host                          = H*;
        using Native                        = H*;
        static constexpr eSemanticType TYPE = T;

        static Native                  serialize(Host value) {
            return value;
        }

        static Host deserialize(Native value) {
            return value;
        }
    };

    using Window  = SHandle<SWindow, GW_TYPE_WINDOW>;
    using Monitor = SHandle<SMonitor, GW_TYPE_MONITOR>;
    using Cursor  = SHandle<SCursor, GW_TYPE_CURSOR>;

    /*
        Native integers outside the codec's domain deserialize to std::nullopt.
    */
    template <typename E, eSemanticType T, const CEnumCodec<E>& (*CODEC)()>
    struct SEnum {
        using Enum                          = E;
        using Host                          = std::optional<E>;
        using Native                        = int32_t;
        static constexpr eSemanticType TYPE = T;

        static Native                  serialize(E value) {
            return CODEC().encode(value);
        }

        static Host deserialize(Native value) {
            return CODEC().decode(value);
        }
    };

    template <typename E, typename N, eSemanticType T, const CBitflagCodec<E>& (*CODEC)()>
    struct SBitflag {
        using Flag                          = E;
        using Host                          = std::set<E>;
        using Native                        = N;
        static constexpr eSemanticType TYPE = T;

        static Native                  serialize(const Host& value) {
            return sc<Native>(CODEC().encode(value));
        }

        static Host deserialize(Native value) {
            return CODEC().decode(sc<int32_t>(value));
        }
    };

    using ErrorCode       = SEnum<eErrorCode, GW_TYPE_ERROR_CODE, Codecs::errorCodes>;
    using InitHint        = SEnum<eInitHint, GW_TYPE_INIT_HINT, Codecs::initHints>;
    using WindowHint      = SEnum<eWindowHint, GW_TYPE_WINDOW_HINT, Codecs::windowHints>;
    using InputMode       = SEnum<eInputMode, GW_TYPE_INPUT_MODE, Codecs::inputModes>;
    using Key             = SEnum<eKey, GW_TYPE_KEY, Codecs::keys>;
    using KeyAction       = SEnum<eKeyAction, GW_TYPE_KEY_ACTION, Codecs::keyActions>;
    using MouseButton     = SEnum<eMouseButton, GW_TYPE_MOUSE_BUTTON, Codecs::mouseButtons>;
    using ConnectionEvent = SEnum<eConnectionEvent, GW_TYPE_CONNECTION_EVENT, Codecs::connectionEvents>;
    using StandardCursor  = SEnum<eStandardCursor, GW_TYPE_STANDARD_CURSOR, Codecs::standardCursors>;

    using Mods = SBitflag<eModifier, int32_t, GW_TYPE_MODS, Codecs::modifiers>;
    using Hat  = SBitflag<eHat, uint8_t, GW_TYPE_HAT, Codecs::hats>;

    /*
        Attaches the value a trampoline returns when its callback throws.
    */
    template <typename D, typename D::Host DEFAULT>
    struct SWithDefault : D {
        static constexpr typename D::Host FALLBACK = DEFAULT;
    };

    template <typename D>
    concept HasFallback = requires {
        { D::FALLBACK } -> std::convertible_to<typename D::Host>;
    };
};
