#pragma once

/**
 * @file overloaded.h
 * @brief Builds a std::visit visitor from a set of lambdas
 */

namespace slippy_map {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace slippy_map
