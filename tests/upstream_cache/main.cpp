#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <dnstoys/upstream/cache.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace
{

using cache_t = dnstoys::upstream::upstream_cache_t< int, int >;

// Counter that can outlive a test case.
using counter_shptr_t = std::shared_ptr< std::atomic< int > >;

[[nodiscard]]
counter_shptr_t
make_counter()
{
	return std::make_shared< std::atomic< int > >( 0 );
}

[[nodiscard]]
cache_t::cached_value_t
expect_value( const cache_t::get_result_t & r )
{
	REQUIRE( std::holds_alternative< cache_t::cached_value_t >( r ) );
	return std::get< cache_t::cached_value_t >( r );
}

//
// fake_clock_t
//
// Time that is changed by a test.
struct fake_clock_t
{
	std::atomic< std::int64_t > m_offset_ms{ 0 };
	const cache_t::clock_t::time_point m_start{ cache_t::clock_t::now() };

	[[nodiscard]]
	cache_t::clock_t::time_point
	now() const
	{
		return m_start + std::chrono::milliseconds{ m_offset_ms.load() };
	}

	void
	advance( std::chrono::milliseconds d )
	{
		m_offset_ms += d.count();
	}
};

} /* namespace anonymous */

TEST_CASE("simple hit and miss") {
	auto fetches = make_counter();

	cache_t cache{
			cache_t::params_t{ 10u, 1h, 1s },
			[fetches]( const int & key ) {
				++(*fetches);
				return key * 10;
			}
		};

	{
		const auto & v = expect_value( cache.get( 1 ) );
		REQUIRE( 10 == *v.m_value );
		REQUIRE( v.m_remaining_ttl > 59min );
	}
	REQUIRE( 1 == fetches->load() );

	{
		const auto & v = expect_value( cache.get( 1 ) );
		REQUIRE( 10 == *v.m_value );
	}
	REQUIRE( 1 == fetches->load() );

	{
		const auto & v = expect_value( cache.get( 2 ) );
		REQUIRE( 20 == *v.m_value );
	}
	REQUIRE( 2 == fetches->load() );
	REQUIRE( 2u == cache.size() );
}

TEST_CASE("single flight") {
	auto fetches = make_counter();

	cache_t cache{
			cache_t::params_t{ 10u, 1h, 5s },
			[fetches]( const int & key ) {
				++(*fetches);
				std::this_thread::sleep_for( 200ms );
				return key + 1;
			}
		};

	constexpr std::size_t callers = 50u;

	std::vector< cache_t::get_result_t > results( callers );
	std::vector< std::thread > threads;
	threads.reserve( callers );

	for( std::size_t i = 0u; i != callers; ++i )
		threads.emplace_back( [&cache, &results, i] {
				results[ i ] = cache.get( 42 );
			} );

	for( auto & t : threads )
		t.join();

	REQUIRE( 1 == fetches->load() );

	const auto & first = expect_value( results.front() );
	REQUIRE( 43 == *first.m_value );
	for( const auto & r : results )
	{
		const auto & v = expect_value( r );
		// All callers get the very same object.
		REQUIRE( first.m_value.get() == v.m_value.get() );
	}
}

TEST_CASE("LRU eviction") {
	auto fetches = make_counter();

	cache_t cache{
			cache_t::params_t{ 3u, 1h, 1s },
			[fetches]( const int & key ) {
				++(*fetches);
				return key;
			}
		};

	(void)expect_value( cache.get( 1 ) );
	(void)expect_value( cache.get( 2 ) );
	(void)expect_value( cache.get( 3 ) );
	REQUIRE( 3 == fetches->load() );
	REQUIRE( 3u == cache.size() );

	// 1 becomes the most recently used, 2 is the least recently used.
	(void)expect_value( cache.get( 1 ) );
	REQUIRE( 3 == fetches->load() );

	(void)expect_value( cache.get( 4 ) );
	REQUIRE( 4 == fetches->load() );
	REQUIRE( 3u == cache.size() );

	// These are still in the cache.
	(void)expect_value( cache.get( 1 ) );
	(void)expect_value( cache.get( 3 ) );
	(void)expect_value( cache.get( 4 ) );
	REQUIRE( 4 == fetches->load() );

	// 2 was evicted, so it's a fresh miss.
	(void)expect_value( cache.get( 2 ) );
	REQUIRE( 5 == fetches->load() );
	REQUIRE( 3u == cache.size() );
}

TEST_CASE("failures are not cached") {
	auto fetches = make_counter();

	cache_t cache{
			cache_t::params_t{ 10u, 1h, 1s },
			[fetches]( const int & key ) {
				if( 1 == ++(*fetches) )
					throw std::runtime_error( "upstream is down" );
				return key;
			}
		};

	{
		const auto r = cache.get( 7 );
		REQUIRE( std::holds_alternative< dnstoys::upstream::failed_fetch_t >( r ) );
		REQUIRE( "upstream is down" ==
				std::get< dnstoys::upstream::failed_fetch_t >( r ).m_description );
	}
	REQUIRE( 0u == cache.size() );

	{
		const auto & v = expect_value( cache.get( 7 ) );
		REQUIRE( 7 == *v.m_value );
	}
	REQUIRE( 2 == fetches->load() );
	REQUIRE( 1u == cache.size() );
}

TEST_CASE("slow fetch is reported as a failure") {
	auto fetches = make_counter();

	cache_t cache{
			cache_t::params_t{ 10u, 1h, 50ms },
			[fetches]( const int & key ) {
				if( 1 == ++(*fetches) )
					// The first fetch is too slow.
					std::this_thread::sleep_for( 300ms );
				return key * 2;
			}
		};

	{
		const auto r = cache.get( 5 );
		REQUIRE( std::holds_alternative< dnstoys::upstream::failed_fetch_t >( r ) );
		REQUIRE( "fetch timed out" ==
				std::get< dnstoys::upstream::failed_fetch_t >( r ).m_description );
	}
	REQUIRE( 0u == cache.size() );

	// A new fetch is started.
	{
		const auto & v = expect_value( cache.get( 5 ) );
		REQUIRE( 10 == *v.m_value );
	}
	REQUIRE( 2 == fetches->load() );
	REQUIRE( 1u == cache.size() );
}

TEST_CASE("fetch timeout releases the slot") {
	auto fetches = make_counter();
	auto first_started = std::make_shared< std::promise< void > >();

	cache_t cache{
			cache_t::params_t{ 10u, 1h, 50ms },
			[fetches, first_started]( const int & key ) {
				if( 1 == ++(*fetches) )
				{
					first_started->set_value();
					// The first fetch is too slow.
					std::this_thread::sleep_for( 300ms );
					return key * 100;
				}
				return key * 2;
			}
		};

	cache_t::get_result_t leader_result;
	std::thread leader{ [&cache, &leader_result] {
			leader_result = cache.get( 5 );
		} };

	first_started->get_future().wait();

	// The waiter gives up after the timeout.
	{
		const auto r = cache.get( 5 );
		REQUIRE( std::holds_alternative< dnstoys::upstream::failed_fetch_t >( r ) );
	}

	// The slot is free, so a new fetch is started.
	{
		const auto & v = expect_value( cache.get( 5 ) );
		REQUIRE( 10 == *v.m_value );
	}
	REQUIRE( 2 == fetches->load() );

	leader.join();

	// The result of the abandoned fetch is discarded.
	REQUIRE( std::holds_alternative< dnstoys::upstream::failed_fetch_t >(
			leader_result ) );
	REQUIRE( 1u == cache.size() );
	{
		const auto & v = expect_value( cache.get( 5 ) );
		REQUIRE( 10 == *v.m_value );
	}
	REQUIRE( 2 == fetches->load() );
}

TEST_CASE("fetch is performed by the caller") {
	cache_t cache{
			cache_t::params_t{ 10u, 1h, 1s },
			[caller = std::this_thread::get_id()]( const int & key ) {
				if( caller != std::this_thread::get_id() )
					throw std::runtime_error( "fetch on a foreign thread" );
				return key;
			}
		};

	const auto & v = expect_value( cache.get( 3 ) );
	REQUIRE( 3 == *v.m_value );
}

TEST_CASE("expiration") {
	auto fetches = make_counter();
	auto clock = std::make_shared< fake_clock_t >();

	cache_t cache{
			cache_t::params_t{ 10u, 1min, 1s },
			[fetches]( const int & key ) {
				++(*fetches);
				return key;
			},
			[clock] { return clock->now(); }
		};

	{
		const auto & v = expect_value( cache.get( 1 ) );
		REQUIRE( 60s == v.m_remaining_ttl );
	}

	clock->advance( 30s );
	{
		const auto & v = expect_value( cache.get( 1 ) );
		REQUIRE( 30s == v.m_remaining_ttl );
	}
	REQUIRE( 1 == fetches->load() );

	clock->advance( 30s );
	{
		const auto & v = expect_value( cache.get( 1 ) );
		REQUIRE( 60s == v.m_remaining_ttl );
	}
	REQUIRE( 2 == fetches->load() );
}

TEST_CASE("expired values are purged on insertion") {
	auto clock = std::make_shared< fake_clock_t >();

	cache_t cache{
			cache_t::params_t{ 10u, 1min, 1s },
			[]( const int & key ) { return key; },
			[clock] { return clock->now(); }
		};

	(void)expect_value( cache.get( 1 ) );
	(void)expect_value( cache.get( 2 ) );
	REQUIRE( 2u == cache.size() );

	clock->advance( 2min );

	(void)expect_value( cache.get( 3 ) );
	REQUIRE( 1u == cache.size() );
}
