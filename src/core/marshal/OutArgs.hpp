#pragma once

#include <tuple>
#include <utility>

#include "Arena.hpp"

namespace Glfwire::Marshal {

    /*
        Allocates one scratch native per descriptor, calls fn with their
        addresses and returns the deserialized values in declared order.

        The scratch region is gone by the time this returns.
    */
    template <typename... Ds, typename Fn>
    std::tuple<typename Ds::Host...> withOutArgs(Fn&& fn) {
        CArena                              arena;
        std::tuple<typename Ds::Native*...> slots{arena.allocate<typename Ds::Native>()...};

        std::apply(std::forward<Fn>(fn), slots);

        return [&]<size_t... I>(std::index_sequence<I...>) {
            return std::tuple<typename Ds::Host...>{Ds::deserialize(*std::get<I>(slots))...};
        }(std::index_sequence_for<Ds...>{});
    }
};
