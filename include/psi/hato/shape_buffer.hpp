////////////////////////////////////////////////////////////////////////////////
/// Shape buffer
///
/// Densely packed storage for the values of exactly one shape: an aligned
/// byte buffer, the shape's dispatch table and a LIFO list of recycled slots.
/// Values are addressed by byte offsets (which, unlike pointers, survive
/// reallocations of the underlying storage).
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

#include <psi/hato/byte_buffer.hpp>
#include <psi/hato/overflow.hpp>
#include <psi/hato/relocatable.hpp>
#include <psi/hato/shape.hpp>

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>
#include <boost/container/vector.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

template <typename Interface, std::unsigned_integral Offset = std::uint32_t, auto overflow_handler = abort_on_overflow{}>
class shape_buffer
{
public:
    using interface_type = Interface;
    using offset_type    = Offset;
    using size_type      = std::size_t;
    using shape_type     = shape<Interface>;

    static_assert( sizeof( offset_type ) <= sizeof( size_type ) );

    // the byte length of the buffer (and thus every offset) has to fit into
    // an offset_type
    static size_type constexpr max_size{ std::numeric_limits<offset_type>::max() };

    explicit shape_buffer( shape_type const & dispatch_table ) noexcept
        : shape_{ &dispatch_table }, bytes_{ dispatch_table.alignment }
    {}

    template <storable<Interface> T>
    [[ nodiscard ]] static shape_buffer for_type() noexcept { return shape_buffer{ shape_of<Interface, T> }; }

    //! <b>Requires</b>: the buffer was created for T.
    //!
    //! <b>Effects</b>: Moves value into the most recently freed slot or, if
    //!   there is none, into newly appended space at the end of the buffer.
    //!   The buffer becomes the sole owner of the value: it is never
    //!   destroyed (is_plain_relocatable guarantees there is nothing to
    //!   destroy).
    //!
    //! <b>Returns</b>: The byte offset of the stored value.
    //!
    //! <b>Throws</b>: std::bad_alloc. Invokes the overflow handler if the
    //!   byte length would not fit offset_type (types that could not fit even
    //!   into an empty buffer are rejected at compile time).
    //!
    //! <b>Note</b>: Invalidates references obtained through get() (the
    //!   storage may get relocated).
    template <storable<Interface> T>
    requires ( sizeof( T ) <= max_size )
    offset_type push( T value )
    {
        BOOST_ASSERT_MSG( ( shape_ == &shape_of<Interface, T> ), "Value pushed into a buffer of a different shape" );
        BOOST_ASSUME( shape_->size == sizeof( T ) );

        offset_type offset;
        std::byte * slot;
        if ( !free_slots_.empty() )
        {
            offset = free_slots_.back();
            free_slots_.pop_back();
            slot = bytes_.data() + offset;
        }
        else
        {
            auto const current_size{ bytes_.size() };
            if ( !fits( current_size, sizeof( T ) ) ) [[ unlikely ]]
                overflow_handler( overflow_reason::buffer_too_large );
            slot   = bytes_.grow_by( sizeof( T ) );
            offset = static_cast<offset_type>( current_size );
        }

        BOOST_ASSUME( is_aligned( slot, alignof( T ) ) );
        // overwrites whatever inert bytes a removed value left behind
        std::construct_at( reinterpret_cast<T *>( slot ), std::move( value ) );
        return offset;
    }

    [[ nodiscard ]] Interface       & get( offset_type const offset )       noexcept { verify_offset( offset ); return resolve( bytes_.data() + offset, *shape_ ); }
    [[ nodiscard ]] Interface const & get( offset_type const offset ) const noexcept { verify_offset( offset ); return resolve( bytes_.data() + offset, *shape_ ); }

    // The bytes are left untouched (the value remains observable until the
    // slot gets reused). Removing the same offset twice corrupts the free
    // list.
    void remove( offset_type const offset )
    {
        verify_offset( offset );
        free_slots_.push_back( offset );
    }

    // True if the buffer can accept no further values of its shape: no
    // recycled slots and no room for another value under max_size.
    [[ nodiscard, gnu::pure ]] bool is_full() const noexcept
    {
        return free_slots_.empty() && !fits( bytes_.size(), shape_->size );
    }

    [[ nodiscard, gnu::pure ]] shape_type const & dispatch_table() const noexcept { return *shape_; }

    [[ nodiscard, gnu::pure ]] size_type size      () const noexcept { return bytes_.size(); }
    [[ nodiscard, gnu::pure ]] size_type free_slots() const noexcept { return free_slots_.size(); }

    friend void swap( shape_buffer & left, shape_buffer & right ) noexcept
    {
        std::swap( left.shape_, right.shape_ );
        swap( left.bytes_, right.bytes_ );
        left.free_slots_.swap( right.free_slots_ );
    }

private:
    [[ gnu::const ]] static constexpr bool fits( size_type const current_size, size_type const value_size ) noexcept
    {
        return ( current_size <= max_size ) && ( value_size <= max_size - current_size );
    }

    void verify_offset( [[ maybe_unused ]] offset_type const offset ) const noexcept
    {
        BOOST_ASSERT_MSG( static_cast<size_type>( offset ) + shape_->size <= bytes_.size(), "Offset beyond the end of the shape buffer" );
        BOOST_ASSERT_MSG( offset % shape_->size == 0                                      , "Offset does not point to a slot"           );
    }

private:
    shape_type const *                      shape_;
    byte_buffer                             bytes_;
    boost::container::vector<offset_type>   free_slots_;
}; // class shape_buffer

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
