/*!
 * @file
 * @brief Agent that serves DNS clients via UDP.
 */

#include <dnstoys/dns_server/a_server.hpp>

#include <dnstoys/dns/message.hpp>
#include <dnstoys/response/assembler.hpp>

#include <dnstoys/logging/wrap_logging.hpp>
#include <dnstoys/nothrow_block/macros.hpp>

#include <dnstoys/utils/string_algo.hpp>

#include <noexcept_ctcheck/pub.hpp>

#include <asio/buffer.hpp>

#include <memory>

namespace dnstoys::dns_server
{

namespace dns = ::dnstoys::dns;

//
// a_server_t
//
a_server_t::a_server_t(
	context_t ctx,
	application_context_t app_ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_app_ctx{ std::move(app_ctx) }
	,	m_params{ std::move(params) }
	,	m_socket{ m_params.m_io_ctx }
{}

void
a_server_t::so_define_agent()
{
	so_subscribe_self().event( &a_server_t::on_outgoing_response );
}

void
a_server_t::so_evt_start()
{
	// An exception here kills the whole application. It's expected
	// because the server can't work without the socket.
	m_socket.open( m_params.m_endpoint.protocol() );
	m_socket.set_option( asio::ip::udp::socket::reuse_address{ true } );
	m_socket.bind( m_params.m_endpoint );

	initiate_next_async_read();

	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::info,
			[&]( auto & logger, auto level )
			{
				logger.log(
						level,
						"{}: listening on {}:{}",
						m_params.m_name,
						m_params.m_endpoint.address().to_string(),
						m_params.m_endpoint.port() );
			} );

	so_5::send< started_t >( m_params.m_startup_notify_mbox );
}

void
a_server_t::so_evt_finish()
{
	m_is_finished = true;

	asio::error_code ec;
	m_socket.close( ec );
	if( ec )
		::dnstoys::logging::wrap_logging(
				*m_app_ctx.m_logger,
				spdlog::level::warn,
				[&]( auto & logger, auto level )
				{
					logger.log( level, "{}: unable to close socket: {}",
							m_params.m_name, ec.message() );
				} );
}

void
a_server_t::on_outgoing_response(
	mhood_t< ::dnstoys::query_processor::outgoing_response_t > cmd )
{
	if( m_is_finished )
		return;

	send_datagram( std::move(cmd->m_data), cmd->m_peer );
}

void
a_server_t::initiate_next_async_read()
{
	m_socket.async_receive_from(
			asio::buffer( m_incoming_pkg ),
			m_incoming_pkg_endpoint,
			[self = so_5::make_agent_ref(this)]
			( const asio::error_code & ec, std::size_t bytes_transferred ) {
				NOEXCEPT_CTCHECK_ENSURE_NOEXCEPT_STATEMENT(
					self->handle_async_receive_result( ec, bytes_transferred )
				);
			} );
}

void
a_server_t::handle_async_receive_result(
	const asio::error_code & ec,
	std::size_t bytes_transferred ) noexcept
{
	if( asio::error::operation_aborted == ec || m_is_finished )
		return;

	if( !ec )
	{
		// Just log exceptions and ignore them.
		DNSTOYS_NOTHROW_BLOCK_BEGIN()
			DNSTOYS_NOTHROW_BLOCK_STAGE(handle_incoming_pkg)

			try_handle_incoming_pkg( bytes_transferred );
		DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_app_ctx.m_logger)
	}
	else
	{
		DNSTOYS_NOTHROW_BLOCK_BEGIN()
			DNSTOYS_NOTHROW_BLOCK_STAGE(log_async_receive_from_failure)

			::dnstoys::logging::wrap_logging(
					*m_app_ctx.m_logger,
					spdlog::level::warn,
					[&]( auto & logger, auto level )
					{
						logger.log(
								level,
								"{}: async_receive_from failed: {}",
								m_params.m_name,
								ec.message() );
					} );
		DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_app_ctx.m_logger)
	}

	// If we can't start a new operation then it's better to abort.
	initiate_next_async_read();
}

void
a_server_t::try_handle_incoming_pkg(
	std::size_t bytes_transferred )
{
	const std::string_view datagram{ m_incoming_pkg.data(), bytes_transferred };

	auto decoded = dns::decode_query( datagram );
	std::visit( ::dnstoys::utils::overloaded{
			[this]( dns::query_message_t & request ) {
				so_5::send< ::dnstoys::query_processor::incoming_query_t >(
						m_app_ctx.m_query_processor_mbox,
						std::move(request),
						m_incoming_pkg_endpoint,
						so_direct_mbox() );
			},
			[this]( dns::decoding_failure_t & failure ) {
				::dnstoys::logging::wrap_logging(
						*m_app_ctx.m_logger,
						spdlog::level::debug,
						[&]( auto & logger, auto level )
						{
							logger.log(
									level,
									"{}: malformed datagram from {}:{}: {}",
									m_params.m_name,
									m_incoming_pkg_endpoint.address().to_string(),
									m_incoming_pkg_endpoint.port(),
									failure.m_description );
						} );

				// Without the header there is no ID for the response.
				if( failure.m_header )
				{
					auto encoded = dns::encode_response(
							::dnstoys::response::assembler_t::make_format_error(
									*failure.m_header ) );
					send_datagram(
							std::move(encoded.m_data),
							m_incoming_pkg_endpoint );
				}
			}
		},
		decoded );
}

void
a_server_t::send_datagram(
	std::string data,
	const asio::ip::udp::endpoint & peer )
{
	// The data should live until the completion of the operation.
	auto buffer = std::make_shared< std::string >( std::move(data) );

	m_socket.async_send_to(
			asio::buffer( *buffer ),
			peer,
			[self = so_5::make_agent_ref(this), buffer, peer]
			( const asio::error_code & ec, std::size_t /*bytes_transferred*/ ) {
				if( !ec || asio::error::operation_aborted == ec )
					return;

				DNSTOYS_NOTHROW_BLOCK_BEGIN()
					DNSTOYS_NOTHROW_BLOCK_STAGE(log_async_send_to_failure)

					::dnstoys::logging::wrap_logging(
							*(self->m_app_ctx.m_logger),
							spdlog::level::warn,
							[&]( auto & logger, auto level )
							{
								logger.log(
										level,
										"{}: unable to send response to {}:{}: {}",
										self->m_params.m_name,
										peer.address().to_string(),
										peer.port(),
										ec.message() );
							} );
				DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *(self->m_app_ctx.m_logger))
			} );
}

//
// introduce_dns_server
//
void
introduce_dns_server(
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
				coop.make_agent< a_server_t >(
						std::move(app_ctx),
						std::move(params) );
			} );
}

} /* namespace dnstoys::dns_server */
