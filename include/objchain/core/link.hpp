#ifndef OBJCHAIN_CORE_LINK_HPP
#define OBJCHAIN_CORE_LINK_HPP

/// \file link.hpp
/// \brief The recursive chain shape: one payload plus an owned parent chain.

#include <cstddef>
#include <type_traits>
#include <utility>

#include <objchain/core/chain_traits.hpp>
#include <objchain/core/element_base.hpp>
#include <objchain/core/macros.hpp>

namespace objchain {

/// \brief Chain element holding the most recently appended payload.
///
/// `link<V, C>` owns its parent chain `C` by value, so the whole chain is a
/// single nested object with no indirection. Links are produced only by
/// `append`; there is no way to assemble one from a payload and an arbitrary
/// parent value.
///
/// `get()` / `get_mut()` (inherited) reach this element's own `object`. Earlier
/// payloads are reached through `parent`, one level per step:
///
/// \code
///   auto c = objchain::terminal{ std::uint8_t{ 1 } }.append(std::uint16_t{ 2 }).append(3.0F);
///   c.get();               // 3.0F
///   c.parent.get();        // 2
///   c.parent.parent.get(); // 1
/// \endcode
///
/// \tparam V Payload type.
/// \tparam C Parent chain type, either a `terminal` or another `link`.
template<typename V, typename C> class link : public element_base<link<V, C>> {
    static_assert(is_chain_element_v<C>, "objchain::link requires its parent to be a terminal or another link");
    static_assert(!std::is_const_v<C>, "objchain::link owns its parent by value; the parent type must not be const");

  public:
    using inner_type = V;
    using parent_type = C;

    /// The rest of the chain.
    C parent;

    /// The payload appended last.
    V object;

    /// \brief Number of payloads in this chain, this link included.
    [[nodiscard]] OBJCHAIN_FORCEINLINE constexpr auto len() const noexcept -> std::size_t { return parent.len() + 1; }

  private:
    template<typename> friend class element_base;

    template<typename U, typename P>
    constexpr link(U &&item, P &&prev) : parent(std::forward<P>(prev)), object(std::forward<U>(item)) {}
};

}// namespace objchain

#endif// OBJCHAIN_CORE_LINK_HPP
