#ifndef OBJCHAIN_CORE_MAKE_CHAIN_HPP
#define OBJCHAIN_CORE_MAKE_CHAIN_HPP

/// \file make_chain.hpp
/// \brief Builds nested chain types from flat type lists, and chains from values.
///
/// Spelling a chain type by hand means writing the payload types inside out:
///
/// \code
///   using abc = objchain::link<C, objchain::link<B, objchain::terminal<A>>>;
/// \endcode
///
/// `chain_t` accepts the types in the order they are appended instead:
///
/// \code
///   using abc = objchain::chain_t<A, B, C>;
/// \endcode
///
/// The expansion first reverses the list, then folds it: the last entry of the
/// reversed list becomes the innermost `terminal` and every earlier entry wraps
/// the accumulated type in a `link`. `chain_types_t` runs the same steps
/// backwards and recovers the flat list from a chain type.

#include <type_traits>
#include <utility>

#include <objchain/core/chain_traits.hpp>
#include <objchain/core/link.hpp>
#include <objchain/core/terminal.hpp>

namespace objchain {

namespace detail {

    // Reverses a type_list by moving its head onto the front of an accumulator.
    template<typename Pending, typename Reversed> struct reverse_impl;

    template<typename... Reversed> struct reverse_impl<type_list<>, type_list<Reversed...>> {
        using type = type_list<Reversed...>;
    };

    template<typename Head, typename... Tail, typename... Reversed>
    struct reverse_impl<type_list<Head, Tail...>, type_list<Reversed...>>
      : reverse_impl<type_list<Tail...>, type_list<Head, Reversed...>> {};

    template<typename List> using reverse_t = typename reverse_impl<List, type_list<>>::type;

    // Folds a reversed (outermost-first) type_list into the nested chain type.
    template<typename Reversed> struct fold_chain;

    // chain_of rejects the empty list with its own static_assert; void keeps that the only diagnostic.
    template<> struct fold_chain<type_list<>> {
        using type = void;
    };

    template<typename Last> struct fold_chain<type_list<Last>> {
        using type = terminal<Last>;
    };

    template<typename Outer, typename Next, typename... Rest> struct fold_chain<type_list<Outer, Next, Rest...>> {
        using type = link<Outer, typename fold_chain<type_list<Next, Rest...>>::type>;
    };

    // Inverse of fold_chain: flattens a chain type into append order.
    template<typename Chain, typename Collected> struct unfold_chain;

    template<typename V, typename... Collected> struct unfold_chain<terminal<V>, type_list<Collected...>> {
        using type = type_list<V, Collected...>;
    };

    template<typename V, typename C, typename... Collected>
    struct unfold_chain<link<V, C>, type_list<Collected...>> : unfold_chain<C, type_list<V, Collected...>> {};

    template<typename Chain> constexpr auto append_all(Chain &&chain) -> std::decay_t<Chain> {
        return std::forward<Chain>(chain);
    }

    template<typename Chain, typename T, typename... Rest>
    constexpr auto append_all(Chain &&chain, T &&item, Rest &&...rest) {
        return append_all(std::forward<Chain>(chain).append(std::forward<T>(item)), std::forward<Rest>(rest)...);
    }

}// namespace detail

/// \brief Computes the chain type for payload types listed in append order.
///
/// `chain_of<A>::type` is `terminal<A>`; `chain_of<A, B, C>::type` is
/// `link<C, link<B, terminal<A>>>`.
template<typename... Ts> struct chain_of {
    static_assert(sizeof...(Ts) > 0, "objchain::chain_t requires at least one payload type");

    using type = typename detail::fold_chain<detail::reverse_t<type_list<Ts...>>>::type;
};

template<typename... Ts> using chain_t = typename chain_of<Ts...>::type;

/// \brief `chain_t` applied to the contents of a `type_list`.
template<typename List> struct apply_chain;

template<typename... Ts> struct apply_chain<type_list<Ts...>> : chain_of<Ts...> {};

template<typename List> using apply_chain_t = typename apply_chain<List>::type;

/// \brief Payload types of the chain `C` in append order, as a `type_list`.
///
/// `apply_chain_t<chain_types_t<C>>` is `C` for every chain type `C`.
template<typename C> struct chain_types {
    static_assert(is_chain_element_v<C>, "objchain::chain_types requires a terminal or a link");

    using type = typename detail::unfold_chain<std::remove_cv_t<C>, type_list<>>::type;
};

template<typename C> using chain_types_t = typename chain_types<C>::type;

/// \brief Builds a chain from values given in append order.
///
/// Equivalent to `terminal{ first }.append(rest)...`. Each payload is stored as
/// `std::decay_t` of its argument, so the result is
/// `chain_t<std::decay_t<First>, std::decay_t<Rest>...>`.
///
/// \code
///   auto sensors = objchain::make_chain(imu{}, barometer{}, gps{});
///   static_assert(std::is_same_v<decltype(sensors), objchain::chain_t<imu, barometer, gps>>);
/// \endcode
template<typename First, typename... Rest>
[[nodiscard]] constexpr auto make_chain(First &&first, Rest &&...rest)
  -> chain_t<std::decay_t<First>, std::decay_t<Rest>...> {
    return detail::append_all(
      terminal<std::decay_t<First>>(std::forward<First>(first)), std::forward<Rest>(rest)...);
}

}// namespace objchain

#endif// OBJCHAIN_CORE_MAKE_CHAIN_HPP
