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

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <tuple>

#ifdef __linux__
#include <malloc.h>
#elif defined( __APPLE__ )
#include <malloc/malloc.h>
#endif
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

namespace detail
{
    std::size_t crt_aligned_alloc_size( void const * const address, [[ maybe_unused ]] std::size_t const alignment ) noexcept
    {
        if ( !address )
            return 0;
        // https://lemire.me/blog/2017/09/15/how-fast-are-malloc_size-and-malloc_usable_size-in-c
#   if defined( _MSC_VER )
        if ( alignment > guaranteed_alignment )
            return ::_aligned_msize( const_cast<void *>( address ), alignment, 0 );
        return ::_msize( const_cast<void *>( address ) );
#   elif defined( __linux__ )
        return ::malloc_usable_size( const_cast<void *>( address ) ); // fast
#   elif defined( __APPLE__ )
        return ::malloc_size( address ); // not so fast
#   else
        static_assert( false, "no malloc size implementation" );
#   endif
    }

    void * crt_aligned_realloc( void * const existing_allocation_address, std::size_t const existing_allocation_size, std::size_t const new_size, std::size_t const alignment )
    {
        BOOST_ASSUME( is_power_of_2( alignment ) );
        BOOST_ASSUME( new_size != 0 );
        void * new_allocation{ nullptr };
        if ( alignment <= guaranteed_alignment )
        {
            std::ignore    = existing_allocation_size;
            new_allocation = std::realloc( existing_allocation_address, new_size );
        }
        else
        {
#       if defined( _MSC_VER )
            std::ignore    = existing_allocation_size;
            new_allocation = ::_aligned_realloc( existing_allocation_address, new_size, alignment );
#       else
            // the existing block is released only after its contents got
            // copied to its successor
            if ( ::posix_memalign( &new_allocation, alignment, new_size ) != 0 ) [[ unlikely ]]
                throw_bad_alloc(); // the existing allocation is left intact
            if ( existing_allocation_address )
            {
                std::memcpy( new_allocation, existing_allocation_address, std::min( existing_allocation_size, new_size ) );
                std::free( existing_allocation_address );
            }
            else
            {
                BOOST_ASSUME( !existing_allocation_size );
            }
#       endif
        }
        if ( !new_allocation ) [[ unlikely ]]
            throw_bad_alloc();
        BOOST_ASSUME( is_aligned( new_allocation, alignment ) );
        return new_allocation;
    } // crt_aligned_realloc()

    void crt_aligned_free( void * const allocation, [[ maybe_unused ]] std::size_t const alignment ) noexcept
    {
#   if defined( _MSC_VER )
        if ( alignment > guaranteed_alignment )
            return ::_aligned_free( allocation );
#   endif
        std::free( allocation );
    }
} // namespace detail

byte_buffer::byte_buffer( byte_buffer const & other )
    : byte_buffer( other.alignment() )
{
    if ( other.empty() )
        return;
    reallocate( other.size() );
    std::memcpy( p_bytes_, other.p_bytes_, other.size() );
    size_ = other.size();
}

void byte_buffer::reserve( size_type const new_capacity )
{
    if ( new_capacity > capacity() )
        reallocate( new_capacity );
}

void byte_buffer::do_grow( size_type const target_size )
{
    // basic (1.5x) geometric growth
    auto const current_capacity{ capacity() };
    BOOST_ASSUME( target_size > current_capacity );
    reallocate( std::max( target_size, current_capacity * 3U / 2U ) );
}

void byte_buffer::reallocate( size_type const new_capacity )
{
    BOOST_ASSUME( new_capacity > capacity_ );
    p_bytes_  = static_cast<std::byte *>( detail::crt_aligned_realloc( p_bytes_, size_, new_capacity, alignment_ ) );
    capacity_ = detail::crt_aligned_alloc_size( p_bytes_, alignment_ );
    BOOST_ASSUME( capacity_ >= new_capacity );
}

void byte_buffer::storage_free() noexcept
{
    detail::crt_aligned_free( p_bytes_, alignment_ );
    p_bytes_  = nullptr;
    size_     = 0;
    capacity_ = 0;
}

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
