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

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <ranges>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

template <typename Interface, std::unsigned_integral Index, std::unsigned_integral Offset, auto overflow_handler>
class hato;

////////////////////////////////////////////////////////////////////////////////
// An opaque (shape buffer index, byte offset) pair identifying a value stored
// in a hato. Plain data: no versioning, i.e. after a remove() the handle may
// (and, once the slot gets reused, will) resolve to a different value - see
// the ABA note for hato.
// Ordering is lexicographic over (index, offset) so that sorting a batch of
// handles groups them by shape and memory address.
////////////////////////////////////////////////////////////////////////////////

template <std::unsigned_integral Index = std::uint32_t, std::unsigned_integral Offset = std::uint32_t>
class basic_handle
{
public:
    using index_type  = Index;
    using offset_type = Offset;

    constexpr basic_handle() noexcept = default;

    [[ nodiscard, gnu::pure ]] constexpr index_type  index () const noexcept { return index_;  }
    [[ nodiscard, gnu::pure ]] constexpr offset_type offset() const noexcept { return offset_; }

    constexpr auto operator<=>( basic_handle const & ) const noexcept = default;
    constexpr bool operator== ( basic_handle const & ) const noexcept = default;

private:
    template <typename Interface, std::unsigned_integral, std::unsigned_integral, auto>
    friend class hato;

    constexpr basic_handle( index_type const index, offset_type const offset ) noexcept : index_{ index }, offset_{ offset } {}

    // order matters: defines the lexicographic comparison
    index_type  index_ { 0 };
    offset_type offset_{ 0 };
}; // class basic_handle

using handle      = basic_handle<>;
using thin_handle = basic_handle<std::uint32_t, std::uint32_t>;
using wide_handle = basic_handle<std::uint64_t, std::uint64_t>;

// Visiting handles in (index, offset) order touches each shape buffer in one
// go, front to back (friendlier to the branch predictor and the prefetcher).
template <std::ranges::random_access_range Handles>
requires std::sortable<std::ranges::iterator_t<Handles>>
void sort_for_locality( Handles && handles ) noexcept
{
    std::ranges::sort( handles );
}

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
