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

#include <array>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

// template <typename T>
// bool is_trivially_moveable;
//
// A type is 'trivially moveable' if an object can be 'paused', picked up from
// its current location as a plain sequence of bytes, dropped at a different
// location and 'resumed' without violating any of its invariants (IOW its
// this pointer may change under its feet). Shape buffers rely on this when
// they grow (realloc) and when a hato gets copied (memcpy of whole buffers).
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p1144r12.html std::is_trivially_relocatable
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p2786r11.html Trivial Relocatability
// https://quuxplusone.github.io/blog/2019/02/20/p1144-what-types-are-relocatable

// allowed/expected to be user-specialized for custom types
template <typename T>
bool constexpr is_trivially_moveable
{
#ifdef __clang__
    __is_trivially_relocatable( T ) ||
#endif
#if defined( __cpp_lib_trivially_relocatable /*P1144*/ ) || defined( __cpp_trivial_relocatability /*P2786*/ )
    std::is_trivially_relocatable_v<T> ||
#endif
    std::is_trivially_copyable_v<T> || // implies trivial destructibility https://eel.is/c++draft/class.prop#1
    std::is_trivially_move_constructible_v<T>
}; // is_trivially_moveable

template <typename T>
requires requires{ T::is_trivially_moveable; }
bool constexpr is_trivially_moveable<T>{ T::is_trivially_moveable };

template <typename T1, typename T2>
bool constexpr is_trivially_moveable<std::pair<T1, T2>>{ is_trivially_moveable<T1> && is_trivially_moveable<T2> };
template <typename T, std::size_t size>
bool constexpr is_trivially_moveable<std::array<T, size>>{ is_trivially_moveable<T> };


// template <typename T>
// bool is_plain_relocatable;
//
// Stricter than is_trivially_moveable: a hato takes ownership of a value by
// burying its bytes in a shape buffer and never runs its destructor (not on
// remove(), not on slot reuse, not when the hato itself dies) - so the type
// must additionally have nothing to finalize.
// Polymorphic types are accepted even though their copy constructors are not
// trivial: the only 'non trivial' part is the vptr which points to static,
// process-wide data and therefore survives being copied around as bytes
// (types that store pointers into themselves have to opt out explicitly).
template <typename T>
bool constexpr is_plain_relocatable
{
    std::is_trivially_destructible_v<T> &&
    ( is_trivially_moveable<T> || std::is_polymorphic_v<T> )
}; // is_plain_relocatable

template <typename T>
requires requires{ T::is_plain_relocatable; }
bool constexpr is_plain_relocatable<T>{ T::is_plain_relocatable };

// The capability required from values pushed into a hato<Interface>.
template <typename T, typename Interface>
concept storable =
    std::is_object_v<T>                         &&
    !std::is_const_v<T> && !std::is_volatile_v<T> &&
    !std::is_array_v<T>                         &&
    std::is_nothrow_move_constructible_v<T>     &&
    std::derived_from<T, Interface>             &&
    is_plain_relocatable<T>;

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
