#ifndef OBJCHAIN_CORE_ELEMENT_BASE_HPP
#define OBJCHAIN_CORE_ELEMENT_BASE_HPP

/// \file element_base.hpp
/// \brief Sealed base shared by the two chain shapes.
///
/// `element_base<Derived>` carries the operations whose behaviour is the same
/// for `terminal` and `link`: growing the chain with `append` and reaching the
/// directly owned payload with `get` / `get_mut`. `len()` differs per shape
/// and is defined by each of them.
///
/// The base can only be constructed by `terminal` and `link`; any other class
/// deriving from it fails to compile as soon as it is constructed.

#include <type_traits>
#include <utility>

#include <objchain/core/chain_traits.hpp>
#include <objchain/core/macros.hpp>

namespace objchain {

template<typename Derived> class element_base {
  public:
    /// \brief Consumes this chain element and returns a one-longer chain.
    ///
    /// The receiver is moved into the `parent` of the returned link and `item`
    /// becomes its payload. Call on an rvalue: `std::move(c).append(x)`.
    ///
    /// \param item Payload of the new outermost element, stored by value.
    /// \return `link<std::decay_t<T>, Derived>` whose `len()` is `len() + 1`.
    template<typename T>
    [[nodiscard]] constexpr auto append(T &&item) && -> link<std::decay_t<T>, Derived> {
        return link<std::decay_t<T>, Derived>(std::forward<T>(item), std::move(self()));
    }

    /// \brief Copying variant of `append` for lvalue chains of copyable payloads.
    ///
    /// The receiver is left untouched; the returned link owns a copy of it.
    template<typename T>
    [[nodiscard]] constexpr auto append(T &&item) const & -> link<std::decay_t<T>, Derived> {
        static_assert(std::is_copy_constructible_v<Derived>,
          "objchain::append on an lvalue copies the chain; use std::move(chain).append(item) for move-only payloads");
        return link<std::decay_t<T>, Derived>(std::forward<T>(item), self());
    }

    /// \brief Read-only access to the payload owned directly by this element.
    [[nodiscard]] OBJCHAIN_FORCEINLINE constexpr auto get() const noexcept -> const auto & { return self().object; }

    /// \brief Mutable access to the payload owned directly by this element.
    [[nodiscard]] OBJCHAIN_FORCEINLINE constexpr auto get_mut() noexcept -> auto & { return self().object; }

  private:
    // User-provided so that element_base is never an aggregate.
    constexpr element_base() noexcept {}

    template<typename> friend class terminal;
    template<typename, typename> friend class link;

    constexpr auto self() noexcept -> Derived & { return static_cast<Derived &>(*this); }
    constexpr auto self() const noexcept -> const Derived & { return static_cast<const Derived &>(*this); }
};

}// namespace objchain

#endif// OBJCHAIN_CORE_ELEMENT_BASE_HPP
