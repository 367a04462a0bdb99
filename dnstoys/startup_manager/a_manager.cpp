/*!
 * @file
 * @brief Agent that starts all main agents in the right sequence.
 */

#include <dnstoys/startup_manager/a_manager.hpp>

#include <dnstoys/fx_refresher/pub.hpp>
#include <dnstoys/query_processor/pub.hpp>

#include <dnstoys/services/help.hpp>
#include <dnstoys/services/myip.hpp>
#include <dnstoys/services/time.hpp>
#include <dnstoys/services/weather.hpp>

#include <dnstoys/upstream/met_no.hpp>
#include <dnstoys/upstream/openexchangerates.hpp>

#include <dnstoys/logging/wrap_logging.hpp>

#include <dnstoys/exception.hpp>
#include <dnstoys/version.hpp>

#include <string>
#include <utility>
#include <vector>

namespace dnstoys::startup_manager
{

namespace services = ::dnstoys::services;
namespace upstream = ::dnstoys::upstream;

//
// startup_manager_ex_t
//
//! Exception to be used by startup_manager.
struct startup_manager_ex_t : public exception_t
{
public:
	startup_manager_ex_t( const std::string & what )
		:	exception_t{ what }
	{}
};

//
// a_manager_t
//
a_manager_t::a_manager_t(
	context_t ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_params{ std::move(params) }
	,	m_app_ctx{ make_application_context( so_environment(), m_params ) }
{}

void
a_manager_t::so_define_agent()
{
	// NOTE: on_enter handlers can't throw exceptions.
	// But we don't care about this because the whole application
	// has to be terminated in the case of an error in on_enter handlers.
	st_wait_dns_server
		.on_enter( [this]{ on_enter_wait_dns_server(); } )
		.event( &a_manager_t::on_dns_server_started )
		.event( &a_manager_t::on_dns_server_startup_timeout );
}

void
a_manager_t::so_evt_start()
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::info,
			[&]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: startup procedure started" );
			} );

	auto router = make_zone_router();

	if( m_rates )
		launch_fx_refresher();

	launch_query_processor( std::move(router) );

	this >>= st_wait_dns_server;
}

application_context_t
a_manager_t::make_application_context(
	so_5::environment_t & env,
	const params_t & params )
{
	application_context_t result;

	result.m_logger = params.m_logger;
	result.m_query_processor_mbox = env.create_mbox();
	result.m_upstream_query_mbox = env.create_mbox();

	return result;
}

std::shared_ptr< const ::dnstoys::router::zone_router_t >
a_manager_t::make_zone_router()
{
	const auto & config = m_params.m_config;

	services::enabled_services_t enabled;
	std::vector< std::pair<
				services::service_kind_t,
				services::service_handler_shptr_t > > handlers;

	if( config.m_timezones.m_enabled )
	{
		handlers.emplace_back(
				services::service_kind_t::time,
				std::make_shared< services::time_handler_t >(
						m_params.m_geo_index,
						[]{ return std::chrono::system_clock::now(); } ) );
	}

	if( config.m_fx.m_enabled )
	{
		m_rates = std::make_shared< services::rates_holder_t >();
		handlers.emplace_back(
				services::service_kind_t::fx,
				std::make_shared< services::fx_handler_t >( m_rates ) );
	}

	if( config.m_myip.m_enabled )
	{
		handlers.emplace_back(
				services::service_kind_t::myip,
				std::make_shared< services::myip_handler_t >() );
	}

	if( config.m_weather.m_enabled )
	{
		auto cache = std::make_shared< services::forecast_cache_t >(
				services::forecast_cache_t::params_t{
						config.m_weather.m_max_entries,
						config.m_weather.m_cache_ttl,
						config.m_weather.m_fetch_timeout
				},
				[timeout = config.m_weather.m_fetch_timeout](
					const services::place_key_t & place )
				{
					return upstream::fetch_forecast(
							upstream::forecast_fetch_params_t{
									place.m_latitude,
									place.m_longitude,
									std::string{ ::dnstoys::user_agent },
									timeout
							} );
				} );

		handlers.emplace_back(
				services::service_kind_t::weather,
				std::make_shared< services::weather_handler_t >(
						m_params.m_geo_index,
						std::move(cache) ) );
	}

	for( const auto & h : handlers )
		enabled.insert( h.first );

	auto router = std::make_shared< ::dnstoys::router::zone_router_t >(
			std::make_shared< services::help_handler_t >(
					services::make_help_entries(
							enabled,
							config.m_server.m_domain ) ) );

	for( auto & h : handlers )
	{
		router->register_zone(
				services::zone_name( h.first ),
				std::move(h.second) );

		::dnstoys::logging::wrap_logging(
				*m_app_ctx.m_logger,
				spdlog::level::info,
				[&]( auto & logger, auto level )
				{
					logger.log( level, "startup_manager: zone '{}' enabled",
							services::zone_name( h.first ) );
				} );
	}

	return router;
}

void
a_manager_t::launch_fx_refresher()
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::debug,
			[]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: starting fx_refresher" );
			} );

	const auto & fx = m_params.m_config.m_fx;

	// fx_refresher will use own worker thread.
	namespace fr = ::dnstoys::fx_refresher;
	fr::introduce_fx_refresher(
			so_environment(),
			so_coop(),
			so_5::disp::one_thread::make_dispatcher(
					so_environment(),
					"fx_refresher" ).binder(),
			m_app_ctx,
			fr::params_t{
					m_rates,
					[fetch_params = upstream::rates_fetch_params_t{
							fx.m_api_key,
							std::string{ ::dnstoys::user_agent },
							fx.m_fetch_timeout
						}]
					{
						return upstream::fetch_rates( fetch_params );
					},
					fx.m_refresh_interval,
					"fx_refresher"
			} );
}

void
a_manager_t::launch_query_processor(
	std::shared_ptr< const ::dnstoys::router::zone_router_t > router )
{
	const auto & config = m_params.m_config;

	auto assembler = std::make_shared< ::dnstoys::response::assembler_t >(
			config.m_server.m_domain );

	namespace qp = ::dnstoys::query_processor;

	qp::params_t params{
			std::move(router),
			std::move(assembler),
			"query_processor"
	};
	params.m_source = m_app_ctx.m_query_processor_mbox;

	// Queries that wait for upstream services are handled on own threads,
	// so they can't stall queries to other zones.
	if( config.m_weather.m_enabled )
	{
		params.m_redirected_zones.emplace(
				services::zone_name( services::service_kind_t::weather ) );
		params.m_redirect_to = m_app_ctx.m_upstream_query_mbox;

		qp::params_t upstream_params{
				params.m_router,
				params.m_assembler,
				"upstream_query_processor"
		};
		upstream_params.m_source = m_app_ctx.m_upstream_query_mbox;

		start_query_processor(
				"upstream_query_processor",
				config.m_upstream_query_processor_threads,
				std::move(upstream_params) );
	}

	start_query_processor(
			"query_processor",
			config.m_query_processor_threads,
			std::move(params) );
}

void
a_manager_t::start_query_processor(
	std::string_view dispatcher_name,
	std::size_t threads,
	::dnstoys::query_processor::params_t params )
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::debug,
			[&]( auto & logger, auto level )
			{
				logger.log( level,
						"startup_manager: starting {}, threads: {}",
						params.m_name,
						threads );
			} );

	// Queries are processed in parallel on several threads.
	namespace qp = ::dnstoys::query_processor;
	qp::introduce_query_processor(
			so_environment(),
			so_coop(),
			so_5::disp::adv_thread_pool::make_dispatcher(
					so_environment(),
					std::string{ dispatcher_name },
					threads ).binder(
							so_5::disp::adv_thread_pool::bind_params_t{} ),
			m_app_ctx,
			std::move(params) );
}

void
a_manager_t::on_enter_wait_dns_server()
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::debug,
			[]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: starting dns_server" );
			} );

	// dns_server works on own thread with own io_context.
	m_io_disp = so_5::extra::disp::asio_one_thread::make_dispatcher(
			so_environment(),
			"dns_server_io",
			so_5::extra::disp::asio_one_thread::disp_params_t{}
					.use_own_io_context() );

	const auto & server = m_params.m_config.m_server;

	namespace ds = ::dnstoys::dns_server;
	ds::introduce_dns_server(
			so_environment(),
			so_coop(),
			m_io_disp.binder(),
			m_app_ctx,
			ds::params_t{
					m_io_disp.io_context(),
					asio::ip::udp::endpoint{ server.m_ip, server.m_port },
					so_direct_mbox(),
					"dns_server"
			} );

	// Limit the time of dns_server startup.
	so_5::send_delayed< dns_server_startup_timeout >(
			*this,
			m_params.m_max_stage_startup_time );
}

void
a_manager_t::on_dns_server_started(
	mhood_t< ::dnstoys::dns_server::started_t > )
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::info,
			[]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: dns_server started" );
			} );

	this >>= st_normal;
}

[[noreturn]] void
a_manager_t::on_dns_server_startup_timeout(
	mhood_t< dns_server_startup_timeout > )
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::critical,
			[]( auto & logger, auto level )
			{
				logger.log( level, "startup_manager: dns_server startup timed-out" );
			} );

	// This exception will kill the whole application.
	throw startup_manager_ex_t{ "dns_server startup timed-out" };
}

//
// introduce_startup_manager
//
void
introduce_startup_manager(
	so_5::environment_t & env,
	params_t params )
{
	env.register_agent_as_coop(
			env.make_agent< a_manager_t >( std::move(params) ) );
}

} /* namespace dnstoys::startup_manager */
