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
#include <psi/hato/byte_buffer.hpp>
#include <psi/hato/overflow.hpp>

#include <cstdio> // for fputs
#include <cstdlib>
#include <new>
#include <stdexcept>
#include <string>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_bad_alloc() { throw std::bad_alloc(); }

    [[ noreturn, gnu::cold ]] void abort_on_overflow( char const * const reason ) noexcept
    {
        std::fputs( "psi::hato: ", stderr );
        std::fputs( reason       , stderr );
        std::fputs( "\n"         , stderr );
        std::fflush( stderr );
        std::abort();
    }

    [[ noreturn, gnu::cold ]] void throw_on_overflow( char const * const reason )
    {
        throw std::length_error( std::string( "psi::hato: " ) + reason );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
