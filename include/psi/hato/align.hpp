////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <bit>
#include <cstdint>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

#ifdef _MSC_VER
#pragma warning( push )
#pragma warning( disable : 5030 ) // unknown attribute
#endif

[[ using gnu: const, always_inline ]] constexpr bool is_power_of_2( auto const value ) noexcept { return std::has_single_bit( value ); }

#ifdef __clang__
[[ using gnu: const, always_inline ]] constexpr bool is_aligned( auto const value, auto const alignment ) noexcept { return __builtin_is_aligned( value, alignment ); }
#else
[[ using gnu: const, always_inline ]] constexpr bool is_aligned( auto   const value, auto const alignment ) noexcept { return value % alignment == 0; }
[[ using gnu: const, always_inline ]] constexpr bool is_aligned( auto * const ptr  , auto const alignment ) noexcept { return is_aligned( std::bit_cast<std::uintptr_t>( ptr ), alignment ); }
#endif

#ifdef _MSC_VER
#pragma warning( pop )
#endif

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
