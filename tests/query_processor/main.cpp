#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <dnstoys/query_processor/pub.hpp>

#include <dnstoys/services/help.hpp>

#include <so_5/all.hpp>

#include <future>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

namespace
{

namespace qp = dnstoys::query_processor;
namespace services = dnstoys::services;

//
// slow_upstream_t
//
// Imitation of an upstream service that doesn't respond until
// the test allows it.
struct slow_upstream_t
{
	std::promise< void > m_started;
	std::promise< void > m_release;
	std::shared_future< void > m_released{ m_release.get_future().share() };
};

class slow_upstream_handler_t final : public services::service_handler_t
{
public:
	explicit slow_upstream_handler_t( std::shared_ptr< slow_upstream_t > upstream )
		:	m_upstream{ std::move(upstream) }
	{}

	[[nodiscard]]
	services::outcome_t
	handle( const dnstoys::query::query_t & ) const override
	{
		m_upstream->m_started.set_value();

		if( std::future_status::ready != m_upstream->m_released.wait_for( 5s ) )
			return services::upstream_error_t{ "upstream is not responding" };

		return services::successful_outcome_t{
				{ services::txt_record_t{ { "sunny" } } },
				1s
			};
	}

private:
	const std::shared_ptr< slow_upstream_t > m_upstream;
};

[[nodiscard]]
dnstoys::dns::query_message_t
make_request( oess_2::ushort_t id, std::string_view qname )
{
	dnstoys::dns::query_message_t r;
	r.m_header.m_id = id;
	r.m_header.m_qdcount = 1u;
	r.m_question = dnstoys::dns::dns_question_t{
			qname,
			dnstoys::dns::qtype_values::TXT,
			dnstoys::dns::qclass_values::IN
		};

	return r;
}

[[nodiscard]]
unsigned int
response_id( const std::string & data )
{
	REQUIRE( data.size() >= dnstoys::dns::dns_header_t::wire_size );
	return (static_cast< unsigned int >(static_cast< unsigned char >(data[ 0 ])) << 8u)
			| static_cast< unsigned char >(data[ 1 ]);
}

void
start_processor(
	so_5::environment_t & env,
	so_5::coop_handle_t parent,
	const dnstoys::application_context_t & app_ctx,
	qp::params_t params )
{
	// Only one worker thread, so a blocked query blocks the whole agent.
	auto disp = so_5::disp::adv_thread_pool::make_dispatcher(
			env, params.m_name, 1u );

	qp::introduce_query_processor(
			env,
			std::move(parent),
			disp.binder( so_5::disp::adv_thread_pool::bind_params_t{} ),
			app_ctx,
			std::move(params) );
}

} /* namespace anonymous */

TEST_CASE("help is answered while a weather query waits for upstream") {
	using namespace dnstoys;

	auto upstream = std::make_shared< slow_upstream_t >();

	auto router = std::make_shared< router::zone_router_t >(
			std::make_shared< services::help_handler_t >(
					services::make_help_entries(
							{ services::service_kind_t::weather },
							"dns.example.org" ) ) );
	router->register_zone( "weather",
			std::make_shared< slow_upstream_handler_t >( upstream ) );

	auto assembler = std::make_shared< response::assembler_t >(
			"dns.example.org" );

	so_5::wrapped_env_t sobj;
	auto & env = sobj.environment();

	application_context_t app_ctx;
	app_ctx.m_logger = logging::make_null_logger();
	app_ctx.m_query_processor_mbox = env.create_mbox();
	app_ctx.m_upstream_query_mbox = env.create_mbox();

	auto parent = env.introduce_coop( []( so_5::coop_t & coop ) {
			coop.make_agent< so_5::agent_t >();
			return coop.handle();
		} );

	qp::params_t params{ router, assembler, "query_processor" };
	params.m_source = app_ctx.m_query_processor_mbox;
	params.m_redirected_zones.emplace( "weather" );
	params.m_redirect_to = app_ctx.m_upstream_query_mbox;
	start_processor( env, parent, app_ctx, std::move(params) );

	qp::params_t upstream_params{ router, assembler, "upstream_query_processor" };
	upstream_params.m_source = app_ctx.m_upstream_query_mbox;
	start_processor( env, parent, app_ctx, std::move(upstream_params) );

	auto replies = so_5::create_mchain( sobj );
	const asio::ip::udp::endpoint peer{ asio::ip::make_address( "192.0.2.1" ), 5353u };

	std::vector< unsigned int > ids;
	const auto receive_one = [&] {
		return so_5::receive(
				so_5::from( replies ).handle_n( 1u ).empty_timeout( 5s ),
				[&ids]( so_5::mhood_t< qp::outgoing_response_t > cmd ) {
					ids.push_back( response_id( cmd->m_data ) );
				} ).handled();
	};

	so_5::send< qp::incoming_query_t >(
			app_ctx.m_query_processor_mbox,
			make_request( 1u, "Berlin.WEATHER." ),
			peer,
			replies->as_mbox() );

	REQUIRE( std::future_status::ready ==
			upstream->m_started.get_future().wait_for( 5s ) );

	so_5::send< qp::incoming_query_t >(
			app_ctx.m_query_processor_mbox,
			make_request( 2u, "help." ),
			peer,
			replies->as_mbox() );

	REQUIRE( 1u == receive_one() );
	REQUIRE( std::vector< unsigned int >{ 2u } == ids );

	upstream->m_release.set_value();

	REQUIRE( 1u == receive_one() );
	REQUIRE( std::vector< unsigned int >{ 2u, 1u } == ids );
}

TEST_CASE("queries for other zones are not redirected") {
	using namespace dnstoys;

	auto router = std::make_shared< router::zone_router_t >(
			std::make_shared< services::help_handler_t >(
					services::make_help_entries( {}, "dns.example.org" ) ) );
	auto assembler = std::make_shared< response::assembler_t >(
			"dns.example.org" );

	so_5::wrapped_env_t sobj;
	auto & env = sobj.environment();

	application_context_t app_ctx;
	app_ctx.m_logger = logging::make_null_logger();
	app_ctx.m_query_processor_mbox = env.create_mbox();
	app_ctx.m_upstream_query_mbox = env.create_mbox();

	auto parent = env.introduce_coop( []( so_5::coop_t & coop ) {
			coop.make_agent< so_5::agent_t >();
			return coop.handle();
		} );

	// Nobody listens to the upstream mbox.
	qp::params_t params{ router, assembler, "query_processor" };
	params.m_source = app_ctx.m_query_processor_mbox;
	params.m_redirected_zones.emplace( "weather" );
	params.m_redirect_to = app_ctx.m_upstream_query_mbox;
	start_processor( env, parent, app_ctx, std::move(params) );

	auto replies = so_5::create_mchain( sobj );
	const asio::ip::udp::endpoint peer{ asio::ip::make_address( "192.0.2.1" ), 5353u };

	for( const auto & qname : { "help.", "berlin.time.", "weather-like.zone." } )
		so_5::send< qp::incoming_query_t >(
				app_ctx.m_query_processor_mbox,
				make_request( 7u, qname ),
				peer,
				replies->as_mbox() );

	const auto r = so_5::receive(
			so_5::from( replies ).handle_n( 3u ).empty_timeout( 5s ),
			[]( so_5::mhood_t< qp::outgoing_response_t > cmd ) {
				REQUIRE( 7u == response_id( cmd->m_data ) );
			} );
	REQUIRE( 3u == r.handled() );
}
