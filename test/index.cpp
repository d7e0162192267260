#include <psi/genarena/index.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

static_assert( sizeof( index ) == 2 * sizeof( std::uint32_t ) );
static_assert( std::is_trivially_copyable_v<index> );
static_assert( std::is_trivially_copyable_v<typed_index<std::string>> );

TEST( index, raw_parts )
{
    auto const idx{ index::from_raw_parts( 12, 34 ) };
    EXPECT_EQ( idx.slot(), 12U );
    EXPECT_EQ( idx.generation(), 34U );
    auto const [ slot, generation ]{ idx.into_raw_parts() };
    EXPECT_EQ( slot, 12U );
    EXPECT_EQ( generation, 34U );
    EXPECT_EQ( index::from_raw_parts( slot, generation ), idx );

    using small_index = basic_index<std::uint8_t, std::uint16_t>;
    auto const small{ small_index::from_raw_parts( 255, 65535 ) };
    EXPECT_EQ( small.into_raw_parts(), ( std::pair<std::uint8_t, std::uint16_t>{ 255, 65535 } ) );
}

TEST( index, ordering )
{
    std::set<index> const ordered
    {
        index::from_raw_parts( 2, 0 ),
        index::from_raw_parts( 1, 5 ),
        index::from_raw_parts( 1, 2 ),
        index::from_raw_parts( 0, 9 )
    };
    std::vector<index> const expected
    {
        index::from_raw_parts( 0, 9 ),
        index::from_raw_parts( 1, 2 ),
        index::from_raw_parts( 1, 5 ),
        index::from_raw_parts( 2, 0 )
    };
    EXPECT_TRUE( std::ranges::equal( ordered, expected ) );
    EXPECT_LT( index::from_raw_parts( 1, 9 ), index::from_raw_parts( 2, 0 ) );
    EXPECT_NE( index::from_raw_parts( 1, 0 ), index::from_raw_parts( 1, 1 ) );
}

TEST( index, hashing )
{
    std::unordered_set<index> set;
    for ( std::uint32_t slot{ 0 }; slot < 16; ++slot )
        for ( std::uint32_t generation{ 0 }; generation < 4; ++generation )
            EXPECT_TRUE( set.insert( index::from_raw_parts( slot, generation ) ).second );
    EXPECT_FALSE( set.insert( index::from_raw_parts( 3, 3 ) ).second );
    EXPECT_EQ( set.size(), 64U );

    EXPECT_EQ( std::hash<typed_index<int>>{}( typed_index<int>::from_raw_parts( 3, 1 ) ), std::hash<index>{}( index::from_raw_parts( 3, 1 ) ) );
    std::unordered_set<dyn_index<>> dyn_set;
    dyn_set.insert( typed_index<int  >::from_raw_parts( 3, 1 ) );
    dyn_set.insert( typed_index<float>::from_raw_parts( 3, 1 ) );
    dyn_set.insert( typed_index<int  >::from_raw_parts( 3, 1 ) );
    EXPECT_EQ( dyn_set.size(), 2U );
}

TEST( index, printing )
{
    std::ostringstream os;
    os << index::from_raw_parts( 3, 7 ) << ' ' << basic_index<std::uint8_t, std::uint8_t>::from_raw_parts( 65, 66 ) << ' ' << typed_index<int>::from_raw_parts( 1, 0 );
    EXPECT_EQ( os.str(), "{ slot: 3, generation: 7 } { slot: 65, generation: 66 } { slot: 1, generation: 0 }" );
}

TEST( index, typed )
{
    auto const untyped{ index::from_raw_parts( 5, 6 ) };
    typed_index<std::string> const typed{ untyped };
    EXPECT_EQ( typed.untyped(), untyped );
    EXPECT_EQ( typed.slot(), 5U );
    EXPECT_EQ( typed.generation(), 6U );
    EXPECT_EQ( typed, typed_index<std::string>::from_raw_parts( 5, 6 ) );
    EXPECT_LT( typed, typed_index<std::string>::from_raw_parts( 5, 7 ) );
    static_assert( !std::is_convertible_v<index, typed_index<std::string>> );
    static_assert( !std::is_convertible_v<typed_index<int>, typed_index<std::string>> );
}

TEST( index, dyn )
{
    dyn_index<> const dyn{ typed_index<double>::from_raw_parts( 4, 2 ) };
    EXPECT_TRUE ( dyn.holds<double>() );
    EXPECT_FALSE( dyn.holds<float >() );
    EXPECT_EQ( dyn.type(), typeid( double ) );
    EXPECT_STREQ( dyn.name(), typeid( double ).name() );
    EXPECT_EQ( dyn.untyped(), index::from_raw_parts( 4, 2 ) );
    EXPECT_EQ( dyn.as<double>(), typed_index<double>::from_raw_parts( 4, 2 ) );
    EXPECT_THROW( static_cast<void>( dyn.as<float>() ), std::bad_cast );

    EXPECT_EQ( dyn, dyn_index<>{ typed_index<double>::from_raw_parts( 4, 2 ) } );
    EXPECT_FALSE( dyn == dyn_index<>{ typed_index<float>::from_raw_parts( 4, 2 ) } );
}

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
