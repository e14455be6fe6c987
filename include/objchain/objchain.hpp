#pragma once

/// \file objchain.hpp
/// \brief Umbrella header aggregating the public objchain API surface.
///
/// Downstream projects can include <objchain/objchain.hpp> to get both chain
/// shapes, the traits, the free-function operations and the `chain_t`
/// generator. Include <objchain/core/undef_macros.hpp> afterwards to drop the
/// helper macros.
///
/// This umbrella does not include undef_macros.hpp itself:
/// `OBJCHAIN_HAS_CONCEPTS` stays visible so user code can select between the
/// `objchain::chain_element` concept and `is_chain_element_v`.

// clang-format off
// IMPORTANT: Include order matters! macros.hpp must come first
// NOLINTBEGIN(llvm-include-order)
#include <objchain/core/macros.hpp>
#include <objchain/core/chain_traits.hpp>
#include <objchain/core/element_base.hpp>
#include <objchain/core/link.hpp>
#include <objchain/core/terminal.hpp>
#include <objchain/core/operations.hpp>
#include <objchain/core/make_chain.hpp>
// NOLINTEND(llvm-include-order)
// clang-format on
