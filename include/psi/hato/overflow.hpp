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
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

// Capacity exhaustion (more shape buffers than the handle index type can
// address or a shape buffer outgrowing the handle offset type) is a resource
// planning error: the (compile time) overflow handler decides how the process
// learns about it.

namespace detail
{
    [[ noreturn, gnu::cold ]] void abort_on_overflow ( char const * reason ) noexcept;
    [[ noreturn, gnu::cold ]] void throw_on_overflow ( char const * reason );
} // namespace detail

struct abort_on_overflow { // prints the reason to stderr and aborts
    [[ noreturn ]] void operator()( char const * const reason ) const noexcept { detail::abort_on_overflow( reason ); }
}; // abort_on_overflow
struct throw_on_overflow { // std::length_error
    [[ noreturn ]] void operator()( char const * const reason ) const { detail::throw_on_overflow( reason ); }
}; // throw_on_overflow

namespace overflow_reason
{
    inline constexpr char const too_many_shapes[]{ "too many shape buffers for the handle index type" };
    inline constexpr char const buffer_too_large[]{ "shape buffer byte length exceeds the handle offset type" };
} // namespace overflow_reason

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
