#include <psi/hato/hato.hpp>

#include "test_types.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::hato
{
//------------------------------------------------------------------------------

using namespace test;

namespace
{
    struct as_i64
    {
        virtual std::int64_t value() const noexcept = 0;
    protected:
        ~as_i64() = default;
    }; // struct as_i64

    template <typename T>
    struct integer final : as_i64
    {
        constexpr integer( T const v ) noexcept : v_{ v } {}
        std::int64_t value() const noexcept override { return v_; }
        T v_;
    }; // struct integer

    template <typename Arena>
    void thin_and_wide()
    {
        Arena arena;
        auto const x{ arena.push( integer<std::int32_t >{ 9 } ) };
        auto const y{ arena.push( integer<std::uint16_t>{ 5 } ) };
        EXPECT_EQ( arena.get_mut( x ).value(), 9 );
        EXPECT_EQ( arena.get_mut( y ).value(), 5 );
    }
} // anonymous namespace

TEST( hato, default_is_empty )
{
    hato<printable> const arena;
    EXPECT_TRUE( arena.empty() );
    EXPECT_EQ  ( arena.shape_count(), 0U );
}

TEST( hato, mixed_integers_print_back )
{
    {
        hato<printable> arena;
        auto const x{ arena.push( boxed<std::int32_t >{ 9 } ) };
        auto const y{ arena.push( boxed<std::uint16_t>{ 5 } ) };
        EXPECT_EQ( arena.get( x ).print(), "9" );
        EXPECT_EQ( arena.get( y ).print(), "5" );
        EXPECT_EQ( arena.shape_count(), 2U );
    }
    {
        hato<printable> arena;
        auto const y{ arena.push( boxed<std::uint16_t>{ 5 } ) };
        auto const x{ arena.push( boxed<std::int32_t >{ 9 } ) };
        EXPECT_EQ( arena.get( x ).print(), "9" );
        EXPECT_EQ( arena.get( y ).print(), "5" );
    }
}

TEST( hato, thin_handles ) { thin_and_wide<thin_hato<as_i64>>(); }
TEST( hato, wide_handles ) { thin_and_wide<wide_hato<as_i64>>(); }

TEST( hato, get_mut_and_const_get )
{
    hato<printable> arena;
    auto const h{ arena.push( boxed<std::int64_t>{ 41 } ) };
    arena.get_mut( h ).bump();
    EXPECT_EQ( std::as_const( arena ).get( h ).print(), "42" );
    arena[ h ].bump();
    EXPECT_EQ( std::as_const( arena )[ h ].print(), "43" );
}

TEST( hato, same_shape_shares_a_buffer )
{
    hato<printable> arena;
    auto const a{ arena.push( boxed<std::int32_t>{ 1 } ) };
    auto const b{ arena.push( boxed<std::int16_t>{ 2 } ) };
    auto const c{ arena.push( boxed<std::int32_t>{ 3 } ) };
    EXPECT_EQ( a.index(), c.index() );
    EXPECT_NE( a.index(), b.index() );
    EXPECT_EQ( c.offset(), sizeof( boxed<std::int32_t> ) );
    EXPECT_EQ( arena.shape_count(), 2U );
    EXPECT_EQ( arena.shape_buffer_at( a.index() ).size(), 2 * sizeof( boxed<std::int32_t> ) );
}

TEST( hato, shapes_are_isolated )
{
    hato<printable> arena;
    std::vector<std::pair<hato<printable>::handle, std::string>> expected;
    std::mt19937 rng{ 42 };
    for ( std::int32_t i{ 0 }; i < 2000; ++i )
    {
        switch ( rng() % 4 )
        {
            case 0 : expected.emplace_back( arena.push( boxed<std::uint8_t>{ static_cast<std::uint8_t>( i ) } ), std::to_string( static_cast<std::uint8_t>( i ) ) ); break;
            case 1 : expected.emplace_back( arena.push( boxed<std::int64_t>{ -i } ), std::to_string( -i ) ); break;
            case 2 : expected.emplace_back( arena.push( labelled{ static_cast<std::int16_t>( i ) } ), std::to_string( i ) + "@labelled" ); break;
            default: expected.emplace_back( arena.push( overaligned{ static_cast<std::uint32_t>( i ) } ), std::to_string( i ) ); break;
        }
    }
    EXPECT_EQ( arena.shape_count(), 4U );
    for ( auto const & [ h, text ] : expected )
        ASSERT_EQ( arena.get( h ).print(), text );
}

TEST( hato, removed_values_stay_readable_until_reused )
{
    hato<printable> arena;
    auto const x{ arena.push( boxed<std::uint8_t>{ 5 } ) };
    arena.remove( x );
    EXPECT_EQ( arena.get( x ).print(), "5" );

    auto const y{ arena.push( boxed<std::uint8_t>{ 9 } ) };
    EXPECT_EQ( y, x ); // the slot got recycled...
    EXPECT_EQ( arena.get( x ).print(), "9" ); // ...and the stale handle sees the new value
}

TEST( hato, slot_reuse_aliases_the_new_value )
{
    hato<printable> arena;
    auto const other{ arena.push( boxed<std::int32_t>{ 100 } ) };
    auto const v1   { arena.push( boxed<std::int64_t>{ 1 } ) };
    std::ignore =     arena.push( boxed<std::int64_t>{ 2 } );
    arena.remove( v1 );

    // a different shape does not touch the freed slot
    std::ignore = arena.push( boxed<std::int32_t>{ 200 } );
    EXPECT_EQ( arena.get( v1 ).print(), "1" );

    auto const v2{ arena.push( boxed<std::int64_t>{ 2222 } ) };
    EXPECT_EQ( v2, v1 );
    EXPECT_EQ( arena.get( v1 ).print(), "2222" );
    EXPECT_EQ( arena.get( other ).print(), "100" );
}

TEST( hato, handles_survive_growth )
{
    hato<printable> arena;
    std::vector<hato<printable>::handle> handles;
    handles.push_back( arena.push( boxed<std::uint32_t>{ 0 } ) );
    for ( std::uint32_t i{ 1 }; i < 100000; ++i )
    {
        handles.push_back( arena.push( boxed<std::uint32_t>{ i } ) );
        if ( i % 7 == 0 )
            std::ignore = arena.push( overaligned{ i } );
    }
    EXPECT_EQ( arena.shape_count(), 2U );

    for ( std::uint32_t i{ 0 }; i < handles.size(); ++i )
        ASSERT_EQ( arena.get( handles[ i ] ).print(), std::to_string( i ) );
}

TEST( hato, copy_is_deep )
{
    hato<printable> original;
    auto const a{ original.push( boxed<std::int32_t>{ 1 } ) };
    auto const b{ original.push( labelled{ 2 } ) };
    auto const c{ original.push( boxed<std::int32_t>{ 3 } ) };

    hato<printable> const copy{ original };
    EXPECT_EQ( copy.shape_count(), original.shape_count() );

    original.get( a ).bump();
    original.remove( c );
    std::ignore = original.push( boxed<std::int32_t>{ 30 } ); // reuses c's slot
    std::ignore = original.push( boxed<std::uint64_t>{ 4 } ); // a new shape buffer
    EXPECT_EQ( original.get( c ).print(), "30" );

    EXPECT_EQ( copy.shape_count(), 2U );
    EXPECT_EQ( copy.get( a ).print(), "1" );
    EXPECT_EQ( copy.get( b ).print(), "2@labelled" );
    EXPECT_EQ( copy.get( c ).print(), "3" );

    hato<printable> assigned;
    assigned = copy;
    EXPECT_EQ( assigned.get( c ).print(), "3" );
}

TEST( hato, move_and_swap )
{
    hato<printable> source;
    auto const h{ source.push( boxed<std::int32_t>{ 7 } ) };

    hato<printable> target{ std::move( source ) };
    EXPECT_EQ( target.get( h ).print(), "7" );

    hato<printable> other;
    swap( target, other );
    EXPECT_TRUE( target.empty() );
    EXPECT_EQ( other.get( h ).print(), "7" );
}

TEST( hato, for_each_mutates_in_order )
{
    hato<printable> arena;
    std::vector<hato<printable>::handle> handles
    {
        arena.push( boxed<std::int32_t>{ 1 } ),
        arena.push( boxed<std::int8_t >{ 2 } ),
        arena.push( boxed<std::int32_t>{ 3 } ),
    };
    arena.for_each( handles, []( printable & value ) { value.bump(); } );

    std::string visited;
    std::as_const( arena ).for_each( handles, [ & ]( printable const & value ) { visited += value.print(); } );
    EXPECT_EQ( visited, "234" );
}

////////////////////////////////////////////////////////////////////////////////
// Capacity exhaustion: 8 bit offsets fit only two 'fat' values per buffer and
// 8 bit indices allow only 256 buffers
////////////////////////////////////////////////////////////////////////////////

using tiny_hato = hato<printable, std::uint8_t, std::uint8_t>;

TEST( hato, full_buffer_opens_a_new_one )
{
    tiny_hato arena;
    auto const a{ arena.push( fat{ 1 } ) };
    auto const b{ arena.push( fat{ 2 } ) };
    auto const c{ arena.push( fat{ 3 } ) };
    EXPECT_EQ( a.index(), b.index() );
    EXPECT_NE( a.index(), c.index() );
    EXPECT_EQ( c.offset(), 0U );
    EXPECT_EQ( arena.shape_count(), 2U );
    EXPECT_EQ( arena.get( a ).print(), "1" );
    EXPECT_EQ( arena.get( b ).print(), "2" );
    EXPECT_EQ( arena.get( c ).print(), "3" );

    // freed slots in the full buffer get reused before the second buffer grows
    arena.remove( a );
    auto const d{ arena.push( fat{ 4 } ) };
    EXPECT_EQ( d, a );
    auto const e{ arena.push( fat{ 5 } ) };
    EXPECT_EQ( e.index(), c.index() );
    EXPECT_EQ( arena.shape_count(), 2U );
}

TEST( hato, values_wider_than_the_offset_range_are_rejected )
{
    // would otherwise open a new (and immediately overflowing) shape buffer
    // for every attempt
    static_assert( !pushable<hato<printable, std::uint32_t, std::uint8_t, throw_on_overflow{}>, huge> );
    static_assert( !pushable<tiny_hato, huge> );
    static_assert(  pushable<tiny_hato, fat > );

    hato<printable, std::uint8_t, std::uint16_t, throw_on_overflow{}> arena;
    auto const h{ arena.push( huge{ 7 } ) };
    EXPECT_EQ( arena.shape_count(), 1U );
    EXPECT_EQ( arena.get( h ).print(), "7" );
}

TEST( hato, failed_push_leaves_the_hato_unchanged )
{
    hato<printable, std::uint8_t, std::uint8_t, throw_on_overflow{}> arena;
    auto const first{ arena.push( fat{ -1 } ) };
    for ( int i{ 1 }; i < 2 * 256; ++i )
        std::ignore = arena.push( fat{ i } );
    auto const last{ arena.shape_buffer_at( 255 ).size() };
    for ( int attempt{ 0 }; attempt < 3; ++attempt )
        EXPECT_THROW( std::ignore = arena.push( fat{ attempt } ), std::length_error );
    EXPECT_EQ( arena.shape_count(), 256U );
    EXPECT_EQ( arena.shape_buffer_at( 255 ).size(), last );

    // a freed slot is still usable after the failures
    arena.remove( first );
    EXPECT_EQ( arena.push( fat{ 42 } ), first );
    EXPECT_EQ( arena.get( first ).print(), "42" );
    EXPECT_EQ( arena.shape_count(), 256U );
}

TEST( hato, index_overflow_is_fatal )
{
    EXPECT_DEATH
    (
        {
            tiny_hato arena;
            for ( int i{ 0 }; i < 2 * 256 + 1; ++i )
                std::ignore = arena.push( fat{ i } );
        },
        "too many shape buffers for the handle index type"
    );
}

TEST( hato, index_overflow_can_throw )
{
    hato<printable, std::uint8_t, std::uint8_t, throw_on_overflow{}> arena;
    for ( int i{ 0 }; i < 2 * 256; ++i )
        std::ignore = arena.push( fat{ i } );
    EXPECT_EQ( arena.shape_count(), 256U );
    EXPECT_THROW( std::ignore = arena.push( fat{ -1 } ), std::length_error );
    EXPECT_EQ( arena.shape_count(), 256U );

    // other shapes are in the same boat
    EXPECT_THROW( std::ignore = arena.push( boxed<std::int8_t>{ 1 } ), std::length_error );
}

//------------------------------------------------------------------------------
} // namespace psi::hato
//------------------------------------------------------------------------------
