#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <dnstoys/services/fx.hpp>
#include <dnstoys/services/help.hpp>
#include <dnstoys/services/myip.hpp>
#include <dnstoys/services/time.hpp>
#include <dnstoys/services/weather.hpp>

#include <date/date.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace
{

[[nodiscard]]
dnstoys::query::query_t
make( std::string_view qname )
{
	return dnstoys::query::make_query(
			qname, asio::ip::make_address( "192.0.2.1" ) );
}

template< typename T >
[[nodiscard]]
T
expect( const dnstoys::services::outcome_t & v )
{
	REQUIRE( std::holds_alternative< T >( v ) );
	return std::get< T >( v );
}

[[nodiscard]]
std::vector< std::string >
txt_of( const dnstoys::services::answer_t & answer )
{
	REQUIRE( std::holds_alternative< dnstoys::services::txt_record_t >( answer ) );
	return std::get< dnstoys::services::txt_record_t >( answer ).m_strings;
}

// 2022-03-09 12:00:00 UTC.
[[nodiscard]]
std::chrono::system_clock::time_point
fixed_now()
{
	using namespace date::literals;
	return date::sys_days{ 2022_y/date::March/9 } + 12h;
}

[[nodiscard]]
dnstoys::geo::index_shptr_t
make_index()
{
	using dnstoys::geo::location_t;

	std::vector< location_t > locations;
	locations.push_back( location_t{ "Mumbai", { "Bombay" }, "IN",
			19.07283, 72.88261, "Asia/Kolkata", 12691836u } );
	locations.push_back( location_t{ "Delhi", {}, "IN",
			28.65195, 77.23149, "Asia/Kolkata", 10927986u } );
	locations.push_back( location_t{ "Berlin", {}, "DE",
			52.52437, 13.41053, "Europe/Berlin", 3426354u } );
	locations.push_back( location_t{ "Berlin", {}, "US",
			44.46867, -71.18508, "America/New_York", 19926u } );
	locations.push_back( location_t{ "Chicago", {}, "US",
			41.85003, -87.65005, "America/Chicago", 2720546u } );

	return std::make_shared< const dnstoys::geo::index_t >(
			std::move(locations) );
}

[[nodiscard]]
dnstoys::services::rates_holder_shptr_t
make_rates()
{
	auto table = std::make_shared< dnstoys::upstream::rates_table_t >();
	table->m_base = "USD";
	table->m_rates = { { "USD", 1.0 }, { "EUR", 0.9 }, { "INR", 75.0 } };
	table->m_timestamp = fixed_now();

	auto holder = std::make_shared< dnstoys::services::rates_holder_t >();
	holder->update( std::move(table) );
	return holder;
}

} /* namespace anonymous */

TEST_CASE("format_local_time") {
	using namespace dnstoys;

	const geo::location_t kolkata{ "Mumbai", {}, "IN", 0.0, 0.0,
			"Asia/Kolkata", 0u };
	REQUIRE( "Wed, 09 Mar 2022 17:30:00 +0530" ==
			services::format_local_time( kolkata, fixed_now() ) );

	const geo::location_t berlin{ "Berlin", {}, "DE", 0.0, 0.0,
			"Europe/Berlin", 0u };
	REQUIRE( "Wed, 09 Mar 2022 13:00:00 +0100" ==
			services::format_local_time( berlin, fixed_now() ) );
}

TEST_CASE("time for a place") {
	using namespace dnstoys;

	const services::time_handler_t handler{ make_index(), []{ return fixed_now(); } };

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "mumbai.time" ) ) );
		REQUIRE( services::dynamic_answer_ttl == r.m_ttl );
		REQUIRE( 1u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"Mumbai (Asia/Kolkata, IN)",
					"Wed, 09 Mar 2022 17:30:00 +0530"
				} == txt_of( r.m_answers.front() ) );
	}

	{
		// Alias is used for the lookup.
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "Bombay.TIME." ) ) );
		REQUIRE( "Mumbai (Asia/Kolkata, IN)" == txt_of( r.m_answers.front() )[ 0 ] );
	}

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "berlin.us.time" ) ) );
		REQUIRE( std::vector< std::string >{
					"Berlin (America/New_York, US)",
					"Wed, 09 Mar 2022 07:00:00 -0500"
				} == txt_of( r.m_answers.front() ) );
	}

	{
		// The most populated place is selected without a hint.
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "berlin.time" ) ) );
		REQUIRE( "Berlin (Europe/Berlin, DE)" == txt_of( r.m_answers.front() )[ 0 ] );
	}

	(void)expect< services::resolution_error_t >(
			handler.handle( make( "atlantis.time" ) ) );
	(void)expect< services::format_error_t >(
			handler.handle( make( "time" ) ) );
}

TEST_CASE("time for a country") {
	using namespace dnstoys;

	const services::time_handler_t handler{ make_index(), []{ return fixed_now(); } };

	{
		// Both places have the same timezone, so there is only one
		// answer for the most populated of them.
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "in.time" ) ) );
		REQUIRE( services::dynamic_answer_ttl == r.m_ttl );
		REQUIRE( 1u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"Mumbai (Asia/Kolkata, IN)",
					"Wed, 09 Mar 2022 17:30:00 +0530"
				} == txt_of( r.m_answers.front() ) );
	}

	{
		// One answer per timezone, the most populated place first.
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "US.time" ) ) );
		REQUIRE( 2u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"Chicago (America/Chicago, US)",
					"Wed, 09 Mar 2022 06:00:00 -0600"
				} == txt_of( r.m_answers[ 0 ] ) );
		REQUIRE( std::vector< std::string >{
					"Berlin (America/New_York, US)",
					"Wed, 09 Mar 2022 07:00:00 -0500"
				} == txt_of( r.m_answers[ 1 ] ) );
	}

	(void)expect< services::resolution_error_t >(
			handler.handle( make( "zz.time" ) ) );
}

TEST_CASE("convert_amount") {
	using namespace dnstoys;

	upstream::rates_table_t table;
	table.m_base = "USD";
	table.m_rates = { { "USD", 1.0 }, { "EUR", 0.9 }, { "JPY", 110.0 } };

	REQUIRE( services::convert_amount( table, 25.0, "USD", "EUR" ) );
	REQUIRE( doctest::Approx( 22.5 ) ==
			*services::convert_amount( table, 25.0, "USD", "EUR" ) );
	REQUIRE( doctest::Approx( 1.0 ) ==
			*services::convert_amount( table, 110.0, "JPY", "USD" ) );
	REQUIRE( doctest::Approx( 0.82 ) ==
			*services::convert_amount( table, 100.0, "JPY", "EUR" ) );

	REQUIRE( !services::convert_amount( table, 1.0, "USD", "XXX" ) );
	REQUIRE( !services::convert_amount( table, 1.0, "XXX", "USD" ) );
}

TEST_CASE("fx conversion") {
	using namespace dnstoys;

	const services::fx_handler_t handler{ make_rates() };

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "25USD-EUR.fx" ) ) );
		REQUIRE( services::dynamic_answer_ttl == r.m_ttl );
		REQUIRE( 1u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"25 USD = 22.50 EUR",
					"2022-03-09 12:00 UTC"
				} == txt_of( r.m_answers.front() ) );
	}

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "eur-inr.fx" ) ) );
		REQUIRE( "1 EUR = 83.33 INR" == txt_of( r.m_answers.front() )[ 0 ] );
	}

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "10usd-usd.fx" ) ) );
		REQUIRE( "10 USD = 10 USD" == txt_of( r.m_answers.front() )[ 0 ] );
	}

	(void)expect< services::format_error_t >(
			handler.handle( make( "25usd-xyz.fx" ) ) );
	(void)expect< services::format_error_t >(
			handler.handle( make( "25usd.fx" ) ) );
}

TEST_CASE("malformed fx queries leave the rates intact") {
	using namespace dnstoys;

	const auto rates = make_rates();
	const auto before = rates->current();
	REQUIRE( before );

	const services::fx_handler_t handler{ rates };

	for( const auto qname : {
			"25usd-xyz.fx", "abcusd-eur.fx", "25usd.fx", "fx",
			"1.usd-eur.fx", "25usd-eur.extra.fx" } )
	{
		INFO( "qname: " << qname );
		(void)expect< services::format_error_t >( handler.handle( make( qname ) ) );
	}

	// The very same table is still in use and it's not changed.
	REQUIRE( before.get() == rates->current().get() );
	REQUIRE( "USD" == before->m_base );
	REQUIRE( 3u == before->m_rates.size() );
	REQUIRE( doctest::Approx( 0.9 ) == before->m_rates.at( "EUR" ) );
	REQUIRE( doctest::Approx( 75.0 ) == before->m_rates.at( "INR" ) );

	const auto r = expect< services::successful_outcome_t >(
			handler.handle( make( "25USD-EUR.fx" ) ) );
	REQUIRE( "25 USD = 22.50 EUR" == txt_of( r.m_answers.front() )[ 0 ] );
}

TEST_CASE("fx without rates") {
	using namespace dnstoys;

	const services::fx_handler_t handler{
			std::make_shared< services::rates_holder_t >() };

	(void)expect< services::upstream_error_t >(
			handler.handle( make( "25USD-EUR.fx" ) ) );

	// Identity conversion doesn't need rates.
	const auto r = expect< services::successful_outcome_t >(
			handler.handle( make( "25eur-eur.fx" ) ) );
	REQUIRE( std::vector< std::string >{ "25 EUR = 25 EUR" } ==
			txt_of( r.m_answers.front() ) );
}

TEST_CASE("help entries") {
	using namespace dnstoys;

	{
		const auto entries = services::make_help_entries( {}, "dns.example.org" );
		REQUIRE( entries.empty() );
	}

	{
		const auto entries = services::make_help_entries(
				{ services::service_kind_t::weather, services::service_kind_t::time },
				"dns.example.org" );
		REQUIRE( 2u == entries.size() );
		REQUIRE( services::service_kind_t::time == entries[ 0 ].m_kind );
		REQUIRE( "dig mumbai.time @dns.example.org" == entries[ 0 ].m_example );
		REQUIRE( services::service_kind_t::weather == entries[ 1 ].m_kind );
		REQUIRE( "dig berlin.weather @dns.example.org" == entries[ 1 ].m_example );

		const services::help_handler_t handler{ entries };
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "help" ) ) );
		REQUIRE( services::static_answer_ttl == r.m_ttl );
		REQUIRE( 2u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"get time for a city or country code",
					"dig mumbai.time @dns.example.org"
				} == txt_of( r.m_answers[ 0 ] ) );
	}
}

TEST_CASE("help doesn't depend on the query") {
	using namespace dnstoys;

	const services::help_handler_t handler{
			services::make_help_entries(
					{ services::service_kind_t::time,
						services::service_kind_t::fx,
						services::service_kind_t::myip,
						services::service_kind_t::weather },
					"dns.example.org" ) };

	const auto texts_of = []( const services::successful_outcome_t & r ) {
		std::vector< std::vector< std::string > > result;
		for( const auto & a : r.m_answers )
			result.push_back( txt_of( a ) );
		return result;
	};

	const auto first = expect< services::successful_outcome_t >(
			handler.handle( make( "help" ) ) );
	REQUIRE( 4u == first.m_answers.size() );

	for( const auto qname : { "help", "HELP.", "foo.help", "a.b.c.help", "help" } )
	{
		INFO( "qname: " << qname );
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( qname ) ) );
		REQUIRE( first.m_ttl == r.m_ttl );
		REQUIRE( texts_of( first ) == texts_of( r ) );
	}
}

TEST_CASE("default handler") {
	using namespace dnstoys;

	const services::default_handler_t handler;
	(void)expect< services::no_such_zone_t >(
			handler.handle( make( "something.unknown" ) ) );
}

TEST_CASE("myip") {
	using namespace dnstoys;

	const services::myip_handler_t handler;

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "myip" ) ) );
		REQUIRE( 1u == r.m_answers.size() );
		REQUIRE( std::holds_alternative< asio::ip::address >( r.m_answers[ 0 ] ) );
		REQUIRE( asio::ip::make_address( "192.0.2.1" ) ==
				std::get< asio::ip::address >( r.m_answers[ 0 ] ) );
	}

	{
		// IPv4-mapped address is reported as IPv4.
		const auto q = query::make_query( "myip",
				asio::ip::make_address( "::ffff:198.51.100.7" ) );
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( q ) );
		const auto address = std::get< asio::ip::address >( r.m_answers[ 0 ] );
		REQUIRE( address.is_v4() );
		REQUIRE( asio::ip::make_address( "198.51.100.7" ) == address );
	}

	{
		const auto q = query::make_query( "myip",
				asio::ip::make_address( "2001:db8::1" ) );
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( q ) );
		const auto address = std::get< asio::ip::address >( r.m_answers[ 0 ] );
		REQUIRE( address.is_v6() );
		REQUIRE( asio::ip::make_address( "2001:db8::1" ) == address );
	}
}

TEST_CASE("weather") {
	using namespace dnstoys;

	std::vector< std::string > requested;
	auto cache = std::make_shared< services::forecast_cache_t >(
			services::forecast_cache_t::params_t{ 10u, 10min, 1s },
			[&requested]( const services::place_key_t & key ) {
				requested.push_back( key.m_name + "/" + key.m_country_code );
				if( "US" == key.m_country_code )
					throw std::runtime_error( "upstream is down" );

				upstream::weather_report_t report;
				report.m_entries.push_back( upstream::forecast_entry_t{
						fixed_now(), 10.0, 50.0, 3.5, "cloudy" } );
				return report;
			} );

	const services::weather_handler_t handler{ make_index(), cache };

	{
		const auto r = expect< services::successful_outcome_t >(
				handler.handle( make( "berlin.weather" ) ) );
		REQUIRE( r.m_ttl <= 600s );
		REQUIRE( r.m_ttl >= 590s );
		REQUIRE( 1u == r.m_answers.size() );
		REQUIRE( std::vector< std::string >{
					"Berlin (DE)",
					"10.00C (50.00F)",
					"50.00% hu.",
					"3.50 m/s wind",
					"cloudy",
					"13:00, Wed"
				} == txt_of( r.m_answers.front() ) );
	}

	// The second request is served from the cache.
	(void)expect< services::successful_outcome_t >(
			handler.handle( make( "berlin.de.weather" ) ) );
	REQUIRE( std::vector< std::string >{ "Berlin/DE" } == requested );

	(void)expect< services::upstream_error_t >(
			handler.handle( make( "berlin.us.weather" ) ) );
	(void)expect< services::resolution_error_t >(
			handler.handle( make( "atlantis.weather" ) ) );
	(void)expect< services::format_error_t >(
			handler.handle( make( "weather" ) ) );
}
