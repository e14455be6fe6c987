#ifndef OBJCHAIN_CORE_OPERATIONS_HPP
#define OBJCHAIN_CORE_OPERATIONS_HPP

/// \file operations.hpp
/// \brief Free-function forms of the chain element operations.
///
/// These forward to the member functions and only participate in overload
/// resolution for `terminal` and `link` arguments, so generic code can write
/// `objchain::len(c)` for any chain element without naming its shape.

#include <cstddef>
#include <type_traits>
#include <utility>

#include <objchain/core/chain_traits.hpp>
#include <objchain/core/link.hpp>
#include <objchain/core/macros.hpp>
#include <objchain/core/terminal.hpp>

namespace objchain {

namespace detail {

    template<typename C>
    using enable_if_chain_t = std::enable_if_t<is_chain_element_v<std::remove_reference_t<C>>, int>;

}// namespace detail

#if OBJCHAIN_HAS_CONCEPTS

template<chain_element C> [[nodiscard]] constexpr auto len(const C &chain) noexcept -> std::size_t {
    return chain.len();
}

template<chain_element C> [[nodiscard]] constexpr auto get(const C &chain) noexcept -> const auto & {
    return chain.get();
}

template<chain_element C> [[nodiscard]] constexpr auto get_mut(C &chain) noexcept -> auto & {
    return chain.get_mut();
}

/// \brief `std::forward<C>(chain).append(item)`: moves from rvalue chains, copies lvalue chains.
template<chain_element C, typename T>
[[nodiscard]] constexpr auto append(C &&chain, T &&item) -> link<std::decay_t<T>, std::remove_cvref_t<C>> {
    return std::forward<C>(chain).append(std::forward<T>(item));
}

#else

template<typename C, detail::enable_if_chain_t<C> = 0>
[[nodiscard]] constexpr auto len(const C &chain) noexcept -> std::size_t {
    return chain.len();
}

template<typename C, detail::enable_if_chain_t<C> = 0>
[[nodiscard]] constexpr auto get(const C &chain) noexcept -> const auto & {
    return chain.get();
}

template<typename C, detail::enable_if_chain_t<C> = 0>
[[nodiscard]] constexpr auto get_mut(C &chain) noexcept -> auto & {
    return chain.get_mut();
}

/// \brief `std::forward<C>(chain).append(item)`: moves from rvalue chains, copies lvalue chains.
template<typename C, typename T, detail::enable_if_chain_t<C> = 0>
[[nodiscard]] constexpr auto append(C &&chain, T &&item)
  -> link<std::decay_t<T>, std::remove_cv_t<std::remove_reference_t<C>>> {
    return std::forward<C>(chain).append(std::forward<T>(item));
}

#endif// OBJCHAIN_HAS_CONCEPTS

}// namespace objchain

#endif// OBJCHAIN_CORE_OPERATIONS_HPP
