#ifndef OBJCHAIN_CORE_MACROS_HPP
#define OBJCHAIN_CORE_MACROS_HPP

/// \file macros.hpp
/// \brief Compiler-specific macros and language-level feature switches.
///
/// This header provides portable macros for:
/// - Forced inlining of the trivial chain accessors
/// - Detection of C++20 concepts
/// - `consteval` with a C++17 fallback
///
/// Supports: GCC, Clang, MSVC, and other C++17-compliant compilers.

// ============================================================================
// OBJCHAIN_FORCEINLINE: Force function inlining across compilers
// ============================================================================
/// \def OBJCHAIN_FORCEINLINE
/// \brief Forces the compiler to inline a function regardless of heuristics.
///
/// Every chain accessor is a single member access, and `len()` on a link is a
/// recursion whose depth is the nesting depth of the type. Debug builds and
/// some optimisers refuse to inline deep recursions on their own; forcing the
/// inline lets `len()` collapse to a constant and `get()` to a plain load even
/// at `-O1`.
///
/// Example:
/// ```cpp
/// OBJCHAIN_FORCEINLINE constexpr auto len() const noexcept -> std::size_t {
///     return parent.len() + 1;
/// }
/// ```

#ifdef _MSC_VER
    // MSVC: __forceinline
    #define OBJCHAIN_FORCEINLINE __forceinline

#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang: __attribute__((always_inline)) inline
    #define OBJCHAIN_FORCEINLINE inline __attribute__((always_inline))

#else
    // Fallback: standard inline (compiler may still ignore it)
    #define OBJCHAIN_FORCEINLINE inline

#endif

// ============================================================================
// OBJCHAIN_HAS_CONCEPTS: C++20 concepts detection
// ============================================================================
/// \def OBJCHAIN_HAS_CONCEPTS
/// \brief `1` when the translation unit can declare and use concepts.
///
/// When set, `<objchain/core/chain_traits.hpp>` additionally declares the
/// `objchain::chain_element` concept and the free functions are constrained
/// with it instead of `std::enable_if_t`. The observable behaviour is the same
/// in both modes; only diagnostics differ.
///
/// Define `OBJCHAIN_DISABLE_CONCEPTS` before including any objchain header to
/// force the C++17 path in a C++20 build.

#if !defined(OBJCHAIN_DISABLE_CONCEPTS) && defined(__cpp_concepts) && __cpp_concepts >= 201907L
    #define OBJCHAIN_HAS_CONCEPTS 1
#else
    #define OBJCHAIN_HAS_CONCEPTS 0
#endif

// ============================================================================
// OBJCHAIN_CPP20_CONSTEVAL: consteval with a C++17 fallback
// ============================================================================
/// \def OBJCHAIN_CPP20_CONSTEVAL
/// \brief Use `consteval` for C++20, fallback to `constexpr` for C++17.
///
/// Used for queries whose answer is a property of the chain *type*
/// (`objchain::chain_length<C>()`), so a call can never be deferred to
/// runtime in C++20 builds.
///
/// Example:
/// ```cpp
/// OBJCHAIN_CPP20_CONSTEVAL auto depth() noexcept -> std::size_t { return 3; }
///
/// constexpr auto d = depth();  // OK in both modes
/// ```

#if __cplusplus >= 202002L
    #define OBJCHAIN_CPP20_CONSTEVAL consteval
#else
    #define OBJCHAIN_CPP20_CONSTEVAL constexpr
#endif

#endif// OBJCHAIN_CORE_MACROS_HPP
