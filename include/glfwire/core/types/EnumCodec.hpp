#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Glfwire {

    template <typename E>
    struct SEnumEntry {
        E                value;
        std::string_view name;
    };

    struct SEnumAlias {
        std::string_view alias;
        std::string_view canonical;
    };

    /*
        Maps one domain of native integer constants to host enumerators and
        kebab-case names.

        encode() of anything not registered in the domain is a caller error and
        throws std::invalid_argument. decode() of an integer the domain does not
        know returns std::nullopt, as newer native libraries may add constants.

        Aliases are only accepted by name and resolve to their canonical entry
        before encoding. Names are never reported as an alias.
    */
    template <typename E>
    class CEnumCodec {
      public:
        CEnumCodec(std::string_view domain, std::vector<SEnumEntry<E>>&& entries, std::vector<SEnumAlias>&& aliases = {}) :
            m_domain(domain), m_entries(std::move(entries)), m_aliases(std::move(aliases)) {
            ;
        }

        int32_t encode(E value) const {
            if (!contains(value))
                throw std::invalid_argument(std::format("{}: {} is not a member of this domain", m_domain, static_cast<int32_t>(value)));

            return static_cast<int32_t>(value);
        }

        int32_t encode(std::string_view name) const {
            const auto VALUE = fromName(name);
            if (!VALUE)
                throw std::invalid_argument(std::format("{}: unknown name \"{}\"", m_domain, name));

            return static_cast<int32_t>(*VALUE);
        }

        std::optional<E> decode(int32_t native) const {
            for (const auto& e : m_entries) {
                if (static_cast<int32_t>(e.value) == native)
                    return e.value;
            }

            return std::nullopt;
        }

        std::optional<E> fromName(std::string_view name) const {
            for (const auto& a : m_aliases) {
                if (a.alias == name) {
                    name = a.canonical;
                    break;
                }
            }

            for (const auto& e : m_entries) {
                if (e.name == name)
                    return e.value;
            }

            return std::nullopt;
        }

        std::string_view name(E value) const {
            for (const auto& e : m_entries) {
                if (e.value == value)
                    return e.name;
            }

            throw std::invalid_argument(std::format("{}: {} is not a member of this domain", m_domain, static_cast<int32_t>(value)));
        }

        bool contains(E value) const {
            for (const auto& e : m_entries) {
                if (e.value == value)
                    return true;
            }

            return false;
        }

        std::string_view domain() const {
            return m_domain;
        }

        const std::vector<SEnumEntry<E>>& entries() const {
            return m_entries;
        }

        const std::vector<SEnumAlias>& aliases() const {
            return m_aliases;
        }

      private:
        std::string_view           m_domain;
        std::vector<SEnumEntry<E>> m_entries;
        std::vector<SEnumAlias>    m_aliases;
    };

    /*
        A domain of single-bit flags combined with bitwise OR.

        Bits with no registered flag are dropped when decoding.
    */
    template <typename E>
    class CBitflagCodec {
      public:
        CBitflagCodec(std::string_view domain, std::vector<SEnumEntry<E>>&& entries) : m_flags(domain, std::move(entries)) {
            ;
        }

        int32_t encode(const std::set<E>& flags) const {
            int32_t result = 0;
            for (const auto& f : flags) {
                result |= m_flags.encode(f);
            }
            return result;
        }

        int32_t encode(const std::vector<std::string_view>& names) const {
            int32_t result = 0;
            for (const auto& n : names) {
                result |= m_flags.encode(n);
            }
            return result;
        }

        std::set<E> decode(int32_t native) const {
            std::set<E> result;
            for (const auto& e : m_flags.entries()) {
                if (native & static_cast<int32_t>(e.value))
                    result.emplace(e.value);
            }
            return result;
        }

        std::vector<std::string_view> names(const std::set<E>& flags) const {
            std::vector<std::string_view> result;
            for (const auto& f : flags) {
                result.emplace_back(m_flags.name(f));
            }
            return result;
        }

        std::string_view domain() const {
            return m_flags.domain();
        }

        const std::vector<SEnumEntry<E>>& entries() const {
            return m_flags.entries();
        }

      private:
        CEnumCodec<E> m_flags;
    };
};
