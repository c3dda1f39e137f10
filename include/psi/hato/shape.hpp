////////////////////////////////////////////////////////////////////////////////
/// Shapes and the polymorphic reference resolver
///
/// A shape is the pairing of a concrete type T with the 'dispatch table' it
/// uses to satisfy a common Interface. Since the vptr of a stored object
/// belongs to T (and the Interface subobject need not live at offset 0) the
/// dispatch table kept alongside a shape buffer is a small, static,
/// per-(Interface, T) descriptor: the layout of T plus a thunk that turns raw
/// storage holding a T into an Interface reference. Its address is the shape
/// identity (one inline variable per instantiation, i.e. unique within the
/// process).
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

#include <psi/hato/align.hpp>
#include <psi/hato/relocatable.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/config_ex.hpp>

#include <cstdint>
#include <new>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

template <typename Interface>
struct shape
{
    using upcaster = Interface * ( * )( void * object ) noexcept;

    upcaster      upcast;
    std::uint32_t size;
    std::uint32_t alignment;
}; // struct shape

namespace detail
{
    template <typename Interface, typename T>
    Interface * upcast( void * const object ) noexcept
    {
        // derived-to-base conversion: applies the Interface subobject offset
        return std::launder( static_cast<T *>( object ) );
    }
} // namespace detail

template <typename Interface, storable<Interface> T>
inline constexpr shape<Interface> shape_of
{
    .upcast    = &detail::upcast<Interface, T>,
    .size      = sizeof ( T ),
    .alignment = alignof( T ),
}; // shape_of

//! <b>Requires</b>: the bytes at data hold a complete, initialized object of
//!   exactly the type the shape was created for (unchecked).
//!
//! <b>Effects</b>: Reconstructs an Interface reference from a raw location
//!   and a separately stored shape (the 'fat pointer' pair).
template <typename Interface>
[[ nodiscard, gnu::pure ]] BOOST_FORCEINLINE
Interface & resolve( void * const data, shape<Interface> const & table ) noexcept
{
    BOOST_ASSUME( data );
    BOOST_ASSERT_MSG( is_aligned( data, table.alignment ), "Misaligned object storage" );
    return *table.upcast( data );
}

template <typename Interface>
[[ nodiscard, gnu::pure ]] BOOST_FORCEINLINE
Interface const & resolve( void const * const data, shape<Interface> const & table ) noexcept
{
    return resolve( const_cast<void *>( data ), table );
}

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
