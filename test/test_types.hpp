#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::hato::test
{
//------------------------------------------------------------------------------

struct printable
{
    virtual std::string print() const = 0;
    virtual void        bump ()       = 0;

protected:
    // non-virtual: keeps implementations trivially destructible
    ~printable() = default;
}; // struct printable

template <typename T>
struct boxed final : printable
{
    constexpr boxed( T const v ) noexcept : value{ v } {}

    std::string print() const override { return std::to_string( value ); }
    void        bump ()       override { ++value; }

    T value;
}; // struct boxed

// just large enough for two of them to fit into a shape buffer with 8 bit
// offsets
struct fat final : printable
{
    constexpr fat( std::int64_t const v ) noexcept : value{ v }, padding{} {}

    std::string print() const override { return std::to_string( value ); }
    void        bump ()       override { ++value; }

    std::int64_t                 value;
    std::array<std::int64_t, 10> padding;
}; // struct fat
static_assert( 2 * sizeof( fat ) <= 255 );
static_assert( 3 * sizeof( fat ) >  255 );

// too large for even a single value in a shape buffer with 8 bit offsets
struct huge final : printable
{
    constexpr huge( std::int64_t const v ) noexcept : value{ v }, padding{} {}

    std::string print() const override { return std::to_string( value ); }
    void        bump ()       override { ++value; }

    std::int64_t                 value;
    std::array<std::int64_t, 40> padding;
}; // struct huge
static_assert( sizeof( huge ) > 255 );

// whether container.push( value ) is well-formed
template <typename Container, typename T>
concept pushable = requires( Container & container, T value ) { container.push( std::move( value ) ); };

struct alignas( 64 ) overaligned final : printable
{
    constexpr overaligned( std::uint32_t const v ) noexcept : value{ v } {}

    std::string print() const override { return std::to_string( value ); }
    void        bump ()       override { ++value; }

    std::uint32_t value;
}; // struct overaligned

// places the printable subobject at a non-zero offset
struct named
{
    virtual char const * name() const noexcept { return "named"; }

    std::uint64_t id{ 0xABCD };

protected:
    ~named() = default;
}; // struct named

struct labelled final : named, printable
{
    constexpr labelled( std::int16_t const v ) noexcept : value{ v } {}

    char const * name () const noexcept override { return "labelled"; }
    std::string  print() const          override { return std::to_string( value ) + '@' + name(); }
    void         bump ()                override { ++value; }

    std::int16_t value;
}; // struct labelled

//------------------------------------------------------------------------------
} // namespace psi::hato::test
//------------------------------------------------------------------------------
