#ifndef OBJCHAIN_CORE_CHAIN_TRAITS_HPP
#define OBJCHAIN_CORE_CHAIN_TRAITS_HPP

/// \file chain_traits.hpp
/// \brief Compile-time description of the closed chain element family.
///
/// A chain is built from exactly two shapes:
/// - `terminal<V>`: the innermost element, holding one payload.
/// - `link<V, C>`: one payload plus an owned parent chain element `C`.
///
/// This header forward-declares both shapes and provides the traits that
/// generic code uses to reason about them without knowing the concrete
/// nesting: `is_chain_element`, `chain_traits`, `inner_t`, `parent_t` and
/// `chain_length_v`. The traits are specialized for the two shapes only, so
/// no third shape can ever satisfy them.

#include <cstddef>
#include <type_traits>

#include <objchain/core/macros.hpp>

namespace objchain {

template<typename V> class terminal;
template<typename V, typename C> class link;

/// \brief Ordered list of types, used as the input and output of the chain generator.
template<typename... Ts> struct type_list {
    static constexpr std::size_t size = sizeof...(Ts);
};

/// \brief Per-shape compile-time properties of a chain element.
///
/// Members of every specialization:
/// - `inner_type`: the payload type owned directly by the element.
/// - `length`: number of payloads reachable from the element, itself included.
/// - `is_terminal`: `true` for `terminal<V>`, `false` for `link<V, C>`.
///
/// `link<V, C>` additionally exposes `parent_type`.
///
/// The primary template is intentionally left undefined: naming
/// `chain_traits<T>` for a non-chain `T` is a compile-time error.
template<typename C> struct chain_traits;

template<typename V> struct chain_traits<terminal<V>> {
    using inner_type = V;
    static constexpr std::size_t length = 1;
    static constexpr bool is_terminal = true;
};

template<typename V, typename C> struct chain_traits<link<V, C>> {
    using inner_type = V;
    using parent_type = C;
    static constexpr std::size_t length = chain_traits<C>::length + 1;
    static constexpr bool is_terminal = false;
};

namespace detail {

    template<typename T> struct is_chain_element_impl : std::false_type {};

    template<typename V> struct is_chain_element_impl<terminal<V>> : std::true_type {};

    template<typename V, typename C> struct is_chain_element_impl<link<V, C>> : std::true_type {};

}// namespace detail

/// \brief `true` when `T` (ignoring cv-qualifiers) is a `terminal` or a `link`.
template<typename T> struct is_chain_element : detail::is_chain_element_impl<std::remove_cv_t<T>> {};

template<typename T> inline constexpr bool is_chain_element_v = is_chain_element<T>::value;

#if OBJCHAIN_HAS_CONCEPTS
/// \brief Constraint for code generic over "any chain element".
///
/// \code
///   template<objchain::chain_element C> void report(const C &chain) { log(chain.len()); }
/// \endcode
template<typename T>
concept chain_element = is_chain_element_v<std::remove_reference_t<T>>;
#endif

/// \brief Payload type owned directly by the chain element `C`.
template<typename C> using inner_t = typename chain_traits<std::remove_cv_t<C>>::inner_type;

/// \brief Parent chain type of the link `C`. Ill-formed for a terminal.
template<typename C> using parent_t = typename chain_traits<std::remove_cv_t<C>>::parent_type;

/// \brief Number of payloads in the chain type `C`, known at compile time.
///
/// Always equal to `c.len()` for any value `c` of type `C`.
template<typename C> inline constexpr std::size_t chain_length_v = chain_traits<std::remove_cv_t<C>>::length;

/// \brief Function form of `chain_length_v`, guaranteed to fold at compile time in C++20.
template<typename C> [[nodiscard]] OBJCHAIN_CPP20_CONSTEVAL auto chain_length() noexcept -> std::size_t {
    static_assert(is_chain_element_v<C>, "objchain::chain_length requires a terminal or a link");
    if constexpr (is_chain_element_v<C>) {
        return chain_length_v<C>;
    } else {
        return 0;
    }
}

}// namespace objchain

#endif// OBJCHAIN_CORE_CHAIN_TRAITS_HPP
