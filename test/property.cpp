#include <psi/genarena/arena.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

#ifdef NDEBUG // bench only release builds

namespace
{
    using timer    = std::chrono::high_resolution_clock;
    using duration = std::chrono::nanoseconds;
} // anonymous namespace

TEST( arena, benchmark )
{
    auto const   test_size{ 4321987 };
    auto const   seed{ std::random_device{}() };
    std::mt19937 rng{ seed };

    arena<std::uint64_t> a;
    std::vector<index> indices;
    indices.reserve( test_size );

    auto start{ timer::now() };
    for ( std::uint64_t i{ 0 }; i < test_size; ++i )
        indices.push_back( a.insert( i ) );
    auto const insertion{ std::chrono::duration_cast<duration>( timer::now() - start ) / test_size };

    std::ranges::shuffle( indices, rng );
    start = timer::now();
    std::uint64_t sum{ 0 };
    for ( auto const idx : indices )
        sum += a[ idx ];
    auto const lookup{ std::chrono::duration_cast<duration>( timer::now() - start ) / test_size };
    EXPECT_EQ( sum, std::uint64_t{ test_size } * ( test_size - 1 ) / 2 );

    start = timer::now();
    for ( auto const idx : indices )
        EXPECT_TRUE( a.remove( idx ).has_value() );
    auto const removal{ std::chrono::duration_cast<duration>( timer::now() - start ) / test_size };

    start = timer::now();
    for ( std::uint64_t i{ 0 }; i < test_size; ++i )
        static_cast<void>( a.insert( i ) );
    auto const reinsertion{ std::chrono::duration_cast<duration>( timer::now() - start ) / test_size };

    std::cout
        << "arena timing (per element): insertion " << insertion.count()
        << "ns, lookup " << lookup.count()
        << "ns, removal " << removal.count()
        << "ns, free list reinsertion " << reinsertion.count() << "ns\n";
}

#endif // NDEBUG

// Random sequences of operations checked against a map from every index ever
// issued to the value it should resolve to (or to nothing).
TEST( arena, random_operations_match_model )
{
#ifdef NDEBUG
    auto const operations{ 2000000 };
#else
    auto const operations{ 200000 };
#endif
    auto const seed{ std::random_device{}() };
    std::cout << "Seed " << seed << '\n';
    std::mt19937 rng{ seed };

    // small generation type to exercise slot retirement
    arena<int, std::uint32_t, std::uint8_t> a;
    using index_type = decltype( a )::index_type;

    std::map<index_type, int> live;
    std::vector<index_type>   issued;
    std::set<index_type>      ever_issued;

    std::uniform_int_distribution<int> operation{ 0, 99 };
    for ( int i{ 0 }; i < operations; ++i )
    {
        auto const op{ operation( rng ) };
        if ( op < 45 || issued.empty() )
        {
            auto const idx{ a.insert( i ) };
            ASSERT_FALSE( live.contains( idx ) ) << "issued a live index twice";
            // a previously issued index never resolves again
            ASSERT_TRUE( ever_issued.insert( idx ).second );
            live.emplace( idx, i );
            issued.push_back( idx );
        }
        else if ( op < 90 )
        {
            auto const idx{ issued[ std::uniform_int_distribution<std::size_t>{ 0, issued.size() - 1 }( rng ) ] };
            auto const removed{ a.remove( idx ) };
            auto const expected{ live.find( idx ) };
            if ( expected == live.end() )
            {
                ASSERT_FALSE( removed.has_value() );
            }
            else
            {
                ASSERT_TRUE( removed.has_value() );
                ASSERT_EQ( *removed, expected->second );
                live.erase( expected );
            }
        }
        else if ( op < 99 )
        {
            auto const idx{ issued[ std::uniform_int_distribution<std::size_t>{ 0, issued.size() - 1 }( rng ) ] };
            auto const element { a.get( idx ) };
            auto const expected{ live.find( idx ) };
            ASSERT_EQ( element != nullptr, expected != live.end() );
            if ( element )
                ASSERT_EQ( *element, expected->second );
        }
        else
        {
            a.retain( [ &rng ]( int ) { return rng() % 2 == 0; } );
            for ( auto it{ live.begin() }; it != live.end(); )
                it = a.contains( it->first ) ? std::next( it ) : live.erase( it );
        }
        ASSERT_EQ( a.size(), live.size() );
    }

    std::map<index_type, int> iterated;
    for ( auto const [ idx, value ] : a )
        iterated.emplace( idx, value );
    EXPECT_EQ( iterated, live );
}

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
