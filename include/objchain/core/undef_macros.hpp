#ifndef OBJCHAIN_UNDEF_MACROS_HPP
#define OBJCHAIN_UNDEF_MACROS_HPP

/// \file undef_macros.hpp
/// \brief Undefines all objchain macros to prevent namespace pollution.
///
/// Include this header AFTER <objchain/objchain.hpp> to keep the chain types
/// while removing objchain's helper macros from the preprocessor namespace:
/// - OBJCHAIN_FORCEINLINE: Forces function inlining
/// - OBJCHAIN_HAS_CONCEPTS: C++20 concepts detection
/// - OBJCHAIN_CPP20_CONSTEVAL: consteval with a C++17 fallback
///
/// **Usage Pattern:**
///
/// ```cpp
/// #include <objchain/objchain.hpp>
///
/// using sensors = objchain::chain_t<imu, barometer, gps>;
///
/// #include <objchain/core/undef_macros.hpp>
///
/// #include <other_library.hpp>
/// ```
///
/// The include guard of <objchain/core/macros.hpp> is reset as well, so a later
/// objchain include in the same translation unit defines the macros again.
/// The `objchain::chain_element` concept, once declared, stays available.

// ============================================================================
// Undefine OBJCHAIN_FORCEINLINE
// ============================================================================
#ifdef OBJCHAIN_FORCEINLINE
    #undef OBJCHAIN_FORCEINLINE
#endif

// ============================================================================
// Undefine OBJCHAIN_HAS_CONCEPTS
// ============================================================================
#ifdef OBJCHAIN_HAS_CONCEPTS
    #undef OBJCHAIN_HAS_CONCEPTS
#endif

// ============================================================================
// Undefine OBJCHAIN_CPP20_CONSTEVAL
// ============================================================================
#ifdef OBJCHAIN_CPP20_CONSTEVAL
    #undef OBJCHAIN_CPP20_CONSTEVAL
#endif

#ifdef OBJCHAIN_CORE_MACROS_HPP
    #undef OBJCHAIN_CORE_MACROS_HPP
#endif

#undef OBJCHAIN_UNDEF_MACROS_HPP

#endif// OBJCHAIN_UNDEF_MACROS_HPP
