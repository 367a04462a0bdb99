/*!
 * @file
 * @brief Agent for processing of DNS queries.
 */

#include <dnstoys/query_processor/a_processor.hpp>

#include <dnstoys/query/query.hpp>

#include <dnstoys/logging/wrap_logging.hpp>

#include <dnstoys/utils/string_algo.hpp>

namespace dnstoys::query_processor
{

namespace dns = ::dnstoys::dns;
namespace services = ::dnstoys::services;

//
// process_query
//
dns::encoded_response_t
process_query(
	spdlog::logger & logger,
	const ::dnstoys::router::zone_router_t & router,
	const ::dnstoys::response::assembler_t & assembler,
	const dns::query_message_t & request,
	const asio::ip::address & requester )
{
	const auto q = ::dnstoys::query::make_query(
			request.m_question.m_qname.to_dotted(),
			requester );

	services::outcome_t outcome;
	try
	{
		outcome = router.route( q ).handle( q );
	}
	catch( const std::exception & x )
	{
		outcome = services::internal_error_t{ x.what() };
	}

	std::visit( ::dnstoys::utils::overloaded{
			[&]( const services::upstream_error_t & e ) {
				::dnstoys::logging::wrap_logging( logger, spdlog::level::warn,
						[&]( auto & l, auto level ) {
							l.log( level, "upstream failure for '{}': {}",
									q.m_qname, e.m_description );
						} );
			},
			[&]( const services::internal_error_t & e ) {
				::dnstoys::logging::wrap_logging( logger, spdlog::level::err,
						[&]( auto & l, auto level ) {
							l.log( level, "unable to handle '{}': {}",
									q.m_qname, e.m_description );
						} );
			},
			[]( const auto & ) {}
		},
		outcome );

	dns::response_message_t response;
	try
	{
		response = assembler.make_response( request, q, outcome );
	}
	catch( const std::exception & x )
	{
		::dnstoys::logging::wrap_logging( logger, spdlog::level::err,
				[&]( auto & l, auto level ) {
					l.log( level, "unable to make response for '{}': {}",
							q.m_qname, x.what() );
				} );

		response = ::dnstoys::response::assembler_t::make_server_failure(
				request );
	}

	return dns::encode_response( response );
}

//
// a_processor_t
//
a_processor_t::a_processor_t(
	context_t ctx,
	application_context_t app_ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_app_ctx{ std::move(app_ctx) }
	,	m_params{ std::move(params) }
{}

void
a_processor_t::so_define_agent()
{
	so_subscribe( m_params.m_source )
		.event( &a_processor_t::on_incoming_query, so_5::thread_safe );
}

void
a_processor_t::so_evt_start()
{
	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::info,
			[this]( auto & logger, auto level )
			{
				logger.log( level, "{}: started", m_params.m_name );
			} );
}

void
a_processor_t::on_incoming_query( mhood_t< incoming_query_t > cmd )
{
	if( should_be_redirected( *cmd ) )
	{
		so_5::send( m_params.m_redirect_to, cmd );
		return;
	}

	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::debug,
			[&]( auto & logger, auto level )
			{
				logger.log( level, "{}: query from {}:{}, id={}, qname={}, qtype={}",
						m_params.m_name,
						cmd->m_peer.address().to_string(),
						cmd->m_peer.port(),
						cmd->m_request.m_header.m_id,
						cmd->m_request.m_question.m_qname.to_dotted(),
						cmd->m_request.m_question.m_qtype );
			} );

	auto encoded = process_query(
			*m_app_ctx.m_logger,
			*m_params.m_router,
			*m_params.m_assembler,
			cmd->m_request,
			cmd->m_peer.address() );

	if( encoded.m_truncated )
		::dnstoys::logging::wrap_logging(
				*m_app_ctx.m_logger,
				spdlog::level::debug,
				[&]( auto & logger, auto level )
				{
					logger.log( level, "{}: response for id={} is truncated",
							m_params.m_name,
							cmd->m_request.m_header.m_id );
				} );

	so_5::send< outgoing_response_t >(
			cmd->m_reply_to,
			std::move(encoded.m_data),
			cmd->m_peer );
}

bool
a_processor_t::should_be_redirected( const incoming_query_t & cmd ) const
{
	if( m_params.m_redirected_zones.empty() )
		return false;

	const auto q = ::dnstoys::query::make_query(
			cmd.m_request.m_question.m_qname.to_dotted(),
			cmd.m_peer.address() );

	return m_params.m_redirected_zones.end() !=
			m_params.m_redirected_zones.find( q.m_zone );
}

//
// introduce_query_processor
//
void
introduce_query_processor(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params )
{
	env.introduce_coop(
			parent_coop,
			std::move(disp_binder),
			[&]( so_5::coop_t & coop ) {
				coop.make_agent< a_processor_t >(
						std::move(app_ctx),
						std::move(params) );
			} );
}

} /* namespace dnstoys::query_processor */
