////////////////////////////////////////////////////////////////////////////////
/// Aligned byte buffer
///
/// The raw storage behind a shape buffer: a growable, contiguous array of bytes
/// whose base address is aligned to a (runtime, power of 2) alignment chosen
/// at construction - and kept aligned across every reallocation. Built
/// directly on the CRT allocation APIs (realloc fast path with a
/// posix_memalign fallback for over-aligned storage) in the manner of
/// tr_vector, minus everything a blob of bytes does not need (element
/// construction, destruction, iterators).
/// Never shrinks.
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

#include <boost/assert.hpp>
#include <boost/config_ex.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_bad_alloc();

    // https://www.gnu.org/software/libc/manual/html_node/Aligned-Memory-Blocks.html
    inline std::uint8_t constexpr guaranteed_alignment{ 16 }; // all known x64 and arm64 platforms

    [[ gnu::pure ]] std::size_t crt_aligned_alloc_size( void const * address, std::size_t alignment ) noexcept;

    // From GCC docs: realloc-like functions have this property (malloc/restrict) as long as the old pointer is never referred to (including comparing it to the new pointer) after the function returns a non-NULL value.
    [[ using gnu: cold, malloc ]]
    void * crt_aligned_realloc( void * existing_allocation_address, std::size_t existing_allocation_size, std::size_t new_size, std::size_t alignment );

    void crt_aligned_free( void * allocation, std::size_t alignment ) noexcept;
} // namespace detail


class [[ nodiscard, clang::trivial_abi ]] byte_buffer
{
public:
    using size_type  = std::size_t;
    using value_type = std::byte;

    // realloc/memcpy based, see is_trivially_moveable
    static bool constexpr is_trivially_moveable{ true };

    constexpr byte_buffer() noexcept : byte_buffer( 1 ) {}
    constexpr explicit byte_buffer( size_type const alignment ) noexcept
        : p_bytes_{ nullptr }, size_{ 0 }, capacity_{ 0 }, alignment_{ alignment }
    {
        BOOST_ASSUME( is_power_of_2( alignment ) );
    }
    byte_buffer( byte_buffer const & other );
    constexpr byte_buffer( byte_buffer && other ) noexcept
        :
        p_bytes_  { std::exchange( other.p_bytes_ , nullptr ) },
        size_     { std::exchange( other.size_    , 0       ) },
        capacity_ { std::exchange( other.capacity_, 0       ) },
        alignment_{ other.alignment_ }
    {}

    byte_buffer & operator=( byte_buffer const & other ) { return ( *this = byte_buffer( other ) ); }
    byte_buffer & operator=( byte_buffer && other ) noexcept
    {
        // swap: other's destructor frees our old allocation
        swap( other );
        return *this;
    }

    ~byte_buffer() noexcept { storage_free(); }

    [[ nodiscard, gnu::pure ]] size_type size     () const noexcept { return size_; }
    [[ nodiscard, gnu::pure ]] size_type capacity () const noexcept { BOOST_ASSUME( capacity_ >= size_ ); return capacity_; }
    [[ nodiscard, gnu::pure ]] size_type alignment() const noexcept { return alignment_; }
    [[ nodiscard, gnu::pure ]] bool      empty    () const noexcept { return size_ == 0; }

    [[ nodiscard, gnu::pure ]] std::byte       * data()       noexcept { return p_bytes_; }
    [[ nodiscard, gnu::pure ]] std::byte const * data() const noexcept { return p_bytes_; }

    [[ nodiscard, gnu::pure ]] std::span<std::byte const> span() const noexcept { return { data(), size() }; }

    //! <b>Effects</b>: Appends delta uninitialized bytes.
    //!
    //! <b>Returns</b>: A pointer to the first appended byte.
    //!
    //! <b>Throws</b>: std::bad_alloc (in which case the buffer is unchanged).
    //!
    //! <b>Note</b>: Invalidates all pointers into the buffer if a reallocation
    //!   was necessary (offsets remain valid).
    std::byte * grow_by( size_type const delta )
    {
        auto const current_size{ size_ };
        auto const target_size { current_size + delta };
        BOOST_ASSERT_MSG( target_size >= current_size, "Byte buffer size overflow" );
        if ( target_size > capacity() ) [[ unlikely ]]
            do_grow( target_size );
        size_ = target_size;
        BOOST_ASSUME( is_aligned( p_bytes_, alignment_ ) );
        return p_bytes_ + current_size;
    }

    void reserve( size_type new_capacity );

    void swap( byte_buffer & other ) noexcept
    {
        std::swap( p_bytes_  , other.p_bytes_   );
        std::swap( size_     , other.size_      );
        std::swap( capacity_ , other.capacity_  );
        std::swap( alignment_, other.alignment_ );
    }
    friend void swap( byte_buffer & left, byte_buffer & right ) noexcept { left.swap( right ); }

private:
    [[ gnu::cold, gnu::noinline ]] void do_grow( size_type target_size );

    void reallocate( size_type new_capacity );

    void storage_free() noexcept;

private:
    std::byte * __restrict p_bytes_;
    size_type              size_;
    size_type              capacity_; // cached crt_aligned_alloc_size (slow on some platforms)
    size_type              alignment_;
}; // class byte_buffer

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
