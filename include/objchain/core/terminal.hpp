#ifndef OBJCHAIN_CORE_TERMINAL_HPP
#define OBJCHAIN_CORE_TERMINAL_HPP

/// \file terminal.hpp
/// \brief The base chain shape: a single wrapped payload.

#include <cstddef>
#include <utility>

#include <objchain/core/element_base.hpp>
#include <objchain/core/link.hpp>
#include <objchain/core/macros.hpp>

namespace objchain {

/// \brief Innermost element of every chain, wrapping exactly one payload.
///
/// A terminal never gains a parent. Growing it produces a new `link` that owns
/// the terminal:
///
/// \code
///   constexpr auto chain = objchain::terminal{ 0 }.append(1U).append(2.0);
///   static_assert(chain.len() == 3);
/// \endcode
///
/// Deduction always wraps: `terminal{ other_terminal }` is a
/// `terminal<terminal<V>>` holding a copy of `other_terminal`. Copies are
/// spelled with the type, `terminal<V> copy = other_terminal;`.
///
/// \tparam V Payload type. Any type is accepted, including lvalue references.
template<typename V> class terminal : public element_base<terminal<V>> {
  public:
    using inner_type = V;

    /// The wrapped payload.
    V object;

    /// \brief Wraps `value` as a chain of length one.
    constexpr explicit terminal(V value) : object(std::forward<V>(value)) {}

    /// \brief Always `1`.
    [[nodiscard]] OBJCHAIN_FORCEINLINE constexpr auto len() const noexcept -> std::size_t { return 1; }
};

template<typename V> terminal(V) -> terminal<V>;

// Preferred over the implicit copy deduction candidate, so a terminal payload is wrapped too.
template<typename V> terminal(terminal<V>) -> terminal<terminal<V>>;

}// namespace objchain

#endif// OBJCHAIN_CORE_TERMINAL_HPP
