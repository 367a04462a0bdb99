#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <dnstoys/router/zone_router.hpp>

#include <dnstoys/services/help.hpp>

namespace
{

// Handler that returns the name of the zone it was registered for.
class marker_handler_t final : public dnstoys::services::service_handler_t
{
public:
	explicit marker_handler_t( std::string marker )
		:	m_marker{ std::move(marker) }
	{}

	[[nodiscard]]
	dnstoys::services::outcome_t
	handle( const dnstoys::query::query_t & ) const override
	{
		return dnstoys::services::successful_outcome_t{
				{ dnstoys::services::txt_record_t{ { m_marker } } },
				dnstoys::services::dynamic_answer_ttl
			};
	}

private:
	const std::string m_marker;
};

[[nodiscard]]
dnstoys::services::service_handler_shptr_t
make_marker( std::string marker )
{
	return std::make_shared< marker_handler_t >( std::move(marker) );
}

[[nodiscard]]
std::string
marker_of( const dnstoys::router::zone_router_t & router, std::string_view qname )
{
	const auto q = dnstoys::query::make_query(
			qname, asio::ip::make_address( "127.0.0.1" ) );
	const auto outcome = router.route( q ).handle( q );
	REQUIRE( std::holds_alternative< dnstoys::services::successful_outcome_t >(
			outcome ) );

	const auto & answers =
			std::get< dnstoys::services::successful_outcome_t >( outcome ).m_answers;
	REQUIRE( 1u == answers.size() );
	return std::get< dnstoys::services::txt_record_t >(
			answers.front() ).m_strings.front();
}

} /* namespace anonymous */

TEST_CASE("help zone is always present") {
	using namespace dnstoys;

	const router::zone_router_t router{ make_marker( "help" ) };

	REQUIRE( "help" == marker_of( router, "help" ) );
	REQUIRE( "help" == marker_of( router, "HELP." ) );
	REQUIRE( "help" == marker_of( router, "anything.help" ) );
}

TEST_CASE("routing by zone") {
	using namespace dnstoys;

	router::zone_router_t router{ make_marker( "help" ) };
	router.register_zone( "time", make_marker( "time" ) );
	router.register_zone( "FX", make_marker( "fx" ) );
	router.register_zone( "weather.", make_marker( "weather" ) );

	REQUIRE( "time" == marker_of( router, "mumbai.time" ) );
	REQUIRE( "time" == marker_of( router, "Mumbai.TIME." ) );
	REQUIRE( "fx" == marker_of( router, "25usd-eur.fx" ) );
	REQUIRE( "weather" == marker_of( router, "berlin.weather" ) );

	// Only the last label is used as the zone.
	REQUIRE( "fx" == marker_of( router, "time.fx" ) );
}

TEST_CASE("unknown zones") {
	using namespace dnstoys;

	router::zone_router_t router{ make_marker( "help" ) };
	router.register_zone( "time", make_marker( "time" ) );

	for( const auto qname : { "mumbai.weather", "myip", "time.example", "." } )
	{
		const auto q = query::make_query(
				qname, asio::ip::make_address( "127.0.0.1" ) );
		const auto outcome = router.route( q ).handle( q );
		REQUIRE( std::holds_alternative< services::no_such_zone_t >( outcome ) );
	}
}

TEST_CASE("invalid registrations") {
	using namespace dnstoys;

	router::zone_router_t router{ make_marker( "help" ) };
	router.register_zone( "time", make_marker( "time" ) );

	REQUIRE_THROWS_AS(
			router.register_zone( "time", make_marker( "another" ) ),
			router::zone_registration_error_t );
	REQUIRE_THROWS_AS(
			router.register_zone( "Time.", make_marker( "another" ) ),
			router::zone_registration_error_t );
	REQUIRE_THROWS_AS(
			router.register_zone( "help", make_marker( "another" ) ),
			router::zone_registration_error_t );
	REQUIRE_THROWS_AS(
			router.register_zone( "", make_marker( "another" ) ),
			router::zone_registration_error_t );
	REQUIRE_THROWS_AS(
			router.register_zone( "fx", nullptr ),
			router::zone_registration_error_t );

	REQUIRE_THROWS_AS(
			router::zone_router_t{ nullptr },
			router::zone_registration_error_t );

	// The first registration is kept.
	REQUIRE( "time" == marker_of( router, "mumbai.time" ) );
}
