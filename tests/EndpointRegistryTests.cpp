#include "btsgate/Node/EndpointRegistry/EndpointRegistry.hpp"

#include "btsgate/Util/Utils.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <thread>
#include <vector>

using namespace Btsgate;
using namespace Btsgate::Node;

namespace
{

std::map< Chain, std::vector< std::string > > test_endpoints( )
{
    return
    {
        { Chain::bitshares, { "wss://x", "wss://y", "wss://z" } },
        { Chain::bitshares_testnet, { "wss://t1", "wss://t2" } }
    };
}

} // namespace

TEST_CASE( "Registry starts at the first configured endpoint", "[registry]" )
{
    EndpointRegistry registry( test_endpoints( ) );

    REQUIRE( registry.current_endpoint( Chain::bitshares ) == "wss://x" );
    REQUIRE( registry.current_endpoint( Chain::bitshares_testnet ) == "wss://t1" );
}

TEST_CASE( "Rotation moves the head to the back", "[registry]" )
{
    EndpointRegistry registry( test_endpoints( ) );

    REQUIRE( registry.rotate( Chain::bitshares ) == "wss://y" );
    REQUIRE( registry.snapshot( Chain::bitshares ) == std::vector< std::string >{ "wss://y", "wss://z", "wss://x" } );

    // Chains rotate independently.
    REQUIRE( registry.current_endpoint( Chain::bitshares_testnet ) == "wss://t1" );
}

TEST_CASE( "A full rotation cycle restores the original order", "[registry]" )
{
    EndpointRegistry registry( test_endpoints( ) );
    auto original = registry.snapshot( Chain::bitshares );

    for ( size_t i = 0; i < original.size( ); ++i )
    {
        registry.rotate( Chain::bitshares );
    }

    REQUIRE( registry.snapshot( Chain::bitshares ) == original );
}

TEST_CASE( "Rotate if current ignores stale failures", "[registry]" )
{
    EndpointRegistry registry( test_endpoints( ) );

    REQUIRE( registry.rotate_if_current( Chain::bitshares, "wss://x" ) == "wss://y" );
    // A second report against x arrives after the first already rotated.
    REQUIRE( registry.rotate_if_current( Chain::bitshares, "wss://x" ) == "wss://y" );
    REQUIRE( registry.snapshot( Chain::bitshares ) == std::vector< std::string >{ "wss://y", "wss://z", "wss://x" } );
}

TEST_CASE( "Concurrent rotation keeps a permutation", "[registry]" )
{
    std::vector< std::string > urls;
    for ( int i = 0; i < 7; ++i )
    {
        urls.push_back( "wss://node" + std::to_string( i ) );
    }
    EndpointRegistry registry( { { Chain::bitshares, urls }, { Chain::bitshares_testnet, { "wss://t1" } } } );

    constexpr size_t threadCount = 8;
    constexpr size_t rotationsPerThread = 1000;
    {
        std::vector< std::jthread > threads;
        for ( size_t t = 0; t < threadCount; ++t )
        {
            threads.emplace_back( [ &registry ]( )
            {
                for ( size_t i = 0; i < rotationsPerThread; ++i )
                {
                    registry.rotate( Chain::bitshares );
                }
            } );
        }
    }

    auto rotated = registry.snapshot( Chain::bitshares );
    REQUIRE( rotated.size( ) == urls.size( ) );
    std::sort( rotated.begin( ), rotated.end( ) );
    REQUIRE( rotated == urls );

    // 8000 rotations of 7 entries leaves the head at 8000 % 7.
    REQUIRE( registry.current_endpoint( Chain::bitshares ) == urls[ ( threadCount * rotationsPerThread ) % urls.size( ) ] );
}

TEST_CASE( "Concurrent failures against one endpoint rotate once", "[registry]" )
{
    EndpointRegistry registry( test_endpoints( ) );

    {
        std::vector< std::jthread > threads;
        for ( size_t t = 0; t < 16; ++t )
        {
            threads.emplace_back( [ &registry ]( ){ registry.rotate_if_current( Chain::bitshares, "wss://x" ); } );
        }
    }

    REQUIRE( registry.snapshot( Chain::bitshares ) == std::vector< std::string >{ "wss://y", "wss://z", "wss://x" } );
}

TEST_CASE( "An empty endpoint list is a configuration error", "[registry]" )
{
    std::map< Chain, std::vector< std::string > > endpoints{ { Chain::bitshares, { } } };
    REQUIRE_THROWS_AS( EndpointRegistry( endpoints ), ConfigurationError );
}
