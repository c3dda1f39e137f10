////////////////////////////////////////////////////////////////////////////////
/// Heterogeneous arena of typed objects
///
/// Stores values of many different concrete types behind a single (typically
/// abstract) Interface while keeping the values of each type ('shape') packed
/// in a contiguous, dedicated shape buffer - i.e. no per-value heap
/// allocation, cache friendly iteration and cheap bulk copying.
///
/// Like with bump allocators, destructors are never invoked: neither on
/// remove() nor on destruction of the hato itself (hence the
/// is_plain_relocatable requirement on stored types).
///
/// Handles are not versioned: using the handle of a removed value is not
/// detected - it keeps resolving to the old (inert) value until the slot is
/// reused by a later push of the same shape after which it silently resolves
/// to the new value (the ABA problem):
/// \code
///   hato<printable> arena;
///   auto const x{ arena.push( boxed<std::uint8_t>{ 5 } ) };
///   arena.remove( x );
///   arena.get( x ); // still 5
///   arena.push( boxed<std::uint8_t>{ 9 } );
///   arena.get( x ); // 9
/// \endcode
///
/// References returned by get() are invalidated by any subsequent push() (the
/// storage of a shape buffer may get relocated); handles are not.
/// Not thread safe.
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

#include <psi/hato/handle.hpp>
#include <psi/hato/overflow.hpp>
#include <psi/hato/relocatable.hpp>
#include <psi/hato/shape.hpp>
#include <psi/hato/shape_buffer.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>
#include <boost/container/vector.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ranges>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

template
<
    typename                Interface,
    std::unsigned_integral  Index            = std::uint32_t,
    std::unsigned_integral  Offset           = std::uint32_t,
    auto                    overflow_handler = abort_on_overflow{}
>
class hato
{
public:
    using interface_type = Interface;
    using index_type     = Index;
    using offset_type    = Offset;
    using handle         = basic_handle<Index, Offset>;
    using buffer_type    = shape_buffer<Interface, Offset, overflow_handler>;
    using size_type      = std::size_t;

    static_assert( sizeof( index_type ) <= sizeof( size_type ) );

    // the last shape buffer index representable by index_type
    static size_type constexpr max_index{ std::numeric_limits<index_type>::max() };

    hato() noexcept = default;
    // deep copy: every shape buffer with its bytes and free slot list
    hato( hato const &  ) = default;
    hato( hato       && ) noexcept = default;

    hato & operator=( hato const &  ) = default;
    hato & operator=( hato       && ) noexcept = default;

    //! <b>Effects</b>: Moves value into the first shape buffer of its shape
    //!   that is not full, creating a new buffer if there is none.
    //!
    //! <b>Returns</b>: The handle through which the value can be accessed.
    //!
    //! <b>Throws</b>: std::bad_alloc. Invokes the overflow handler if a new
    //!   shape buffer is required but index_type cannot address it (the hato
    //!   is left unchanged if the handler returns by throwing). Types larger
    //!   than the offset_type range are rejected at compile time.
    //!
    //! <b>Note</b>: Invalidates all references obtained through get().
    template <storable<Interface> T>
    requires ( sizeof( T ) <= buffer_type::max_size )
    handle push( T value )
    {
        // values of type T are identified at runtime by their dispatch table
        auto const index { buffer_for( shape_of<Interface, T> ) };
        auto const offset{ buffers_[ index ].push( std::move( value ) ) };
        return { static_cast<index_type>( index ), offset };
    }

    //! <b>Requires</b>: h was returned by push() on this hato (or a hato it
    //!   was copied from).
    //!
    //! <b>Returns</b>: The value identified by h as an Interface.
    [[ nodiscard ]] Interface const & get( handle const h ) const noexcept { return buffer( h ).get( h.offset() ); }
    [[ nodiscard ]] Interface       & get( handle const h )       noexcept { return buffer( h ).get( h.offset() ); }
    [[ nodiscard ]] Interface       & get_mut( handle const h )   noexcept { return get( h ); }

    [[ nodiscard ]] Interface const & operator[]( handle const h ) const noexcept { return get( h ); }
    [[ nodiscard ]] Interface       & operator[]( handle const h )       noexcept { return get( h ); }

    //! <b>Effects</b>: Marks the slot of h as reusable. The value is not
    //!   destroyed and its bytes stay intact until the slot is reused.
    //!
    //! <b>Note</b>: Removing the same handle twice is undefined behaviour.
    void remove( handle const h ) { buffer( h ).remove( h.offset() ); }

    // Invokes f( get( h ) ) for every h in handles, in the given order (see
    // sort_for_locality()).
    template <std::ranges::input_range Handles, typename F>
    requires std::invocable<F &, Interface const &>
    void for_each( Handles const & handles, F && f ) const
    {
        for ( handle const h : handles )
            f( get( h ) );
    }
    template <std::ranges::input_range Handles, typename F>
    requires std::invocable<F &, Interface &>
    void for_each( Handles const & handles, F && f )
    {
        for ( handle const h : handles )
            f( get( h ) );
    }

    [[ nodiscard, gnu::pure ]] size_type shape_count() const noexcept { return buffers_.size(); }
    [[ nodiscard, gnu::pure ]] bool      empty      () const noexcept { return buffers_.empty(); }

    [[ nodiscard ]] buffer_type const & shape_buffer_at( index_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < buffers_.size(), "Shape buffer index out of range" );
        return buffers_[ index ];
    }

    void swap( hato & other ) noexcept { buffers_.swap( other.buffers_ ); }
    friend void swap( hato & left, hato & right ) noexcept { left.swap( right ); }

private:
    [[ nodiscard ]] buffer_type       & buffer( handle const h )       noexcept { return const_cast<buffer_type &>( std::as_const( *this ).buffer( h ) ); }
    [[ nodiscard ]] buffer_type const & buffer( handle const h ) const noexcept
    {
        BOOST_ASSERT_MSG( h.index() < buffers_.size(), "Handle from a different hato" );
        return buffers_[ h.index() ];
    }

    [[ nodiscard ]] size_type buffer_for( shape<Interface> const & table )
    {
        auto const existing
        {
            std::ranges::find_if
            (
                buffers_,
                [ &table ]( buffer_type const & candidate ) noexcept
                {
                    return ( &candidate.dispatch_table() == &table ) && !candidate.is_full();
                }
            )
        };
        if ( existing != buffers_.end() ) [[ likely ]]
            return static_cast<size_type>( existing - buffers_.begin() );
        return add_buffer( table );
    }

    [[ gnu::cold, gnu::noinline ]]
    size_type add_buffer( shape<Interface> const & table )
    {
        auto const index{ buffers_.size() };
        if ( index > max_index ) [[ unlikely ]]
            overflow_handler( overflow_reason::too_many_shapes );
        buffers_.emplace_back( table );
        return index;
    }

private:
    boost::container::vector<buffer_type> buffers_;
}; // class hato

template <typename Interface> using thin_hato = hato<Interface, std::uint32_t, std::uint32_t>; // 8 byte handles
template <typename Interface> using wide_hato = hato<Interface, std::uint64_t, std::uint64_t>; // 16 byte handles

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
