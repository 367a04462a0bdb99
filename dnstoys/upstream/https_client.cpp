/*!
 * @file
 * @brief Simple HTTPS client for requests to upstream services.
 */

#include <dnstoys/upstream/https_client.hpp>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/write.hpp>

#include <http_parser.h>

#include <fmt/format.h>

#include <array>
#include <optional>

namespace dnstoys::upstream
{

namespace
{

//
// get_operation_t
//
/*!
 * @brief The state of a single GET request.
 *
 * All callbacks are called on the thread that runs the io_context,
 * so there is no need in synchronization.
 */
class get_operation_t
{
public:
	get_operation_t(
		asio::io_context & io_ctx,
		asio::ssl::context & ssl_ctx,
		const https_request_t & request )
		:	m_resolver{ io_ctx }
		,	m_stream{ io_ctx, ssl_ctx }
		,	m_request{ request }
	{
		http_parser_init( &m_parser, HTTP_RESPONSE );
		m_parser.data = this;

		http_parser_settings_init( &m_settings );
		m_settings.on_body =
			[]( http_parser * p, const char * data, std::size_t size ) -> int {
				auto * self = reinterpret_cast< get_operation_t * >( p->data );
				self->m_body.append( data, size );
				return 0;
			};
		m_settings.on_message_complete =
			[]( http_parser * p ) -> int {
				auto * self = reinterpret_cast< get_operation_t * >( p->data );
				self->m_message_completed = true;
				return 0;
			};
	}

	void
	start()
	{
		// SNI is necessary for most of modern servers.
		if( !SSL_set_tlsext_host_name(
				m_stream.native_handle(), m_request.m_host.c_str() ) )
			throw https_error_t{
					fmt::format( "unable to set SNI for '{}'", m_request.m_host )
				};

		m_stream.set_verify_mode( asio::ssl::verify_peer );
		m_stream.set_verify_callback(
				asio::ssl::host_name_verification( m_request.m_host ) );

		m_resolver.async_resolve(
				m_request.m_host,
				"443",
				[this]( const asio::error_code & ec,
					asio::ip::tcp::resolver::results_type results )
				{
					if( ec )
						return fail( "resolve", ec );
					on_resolved( results );
				} );
	}

	//! Is the operation finished (successfully or not)?
	[[nodiscard]]
	bool
	finished() const noexcept
	{
		return m_message_completed || m_error.has_value();
	}

	[[nodiscard]]
	const std::optional< std::string > &
	error() const noexcept { return m_error; }

	[[nodiscard]]
	unsigned int
	status_code() const noexcept { return m_parser.status_code; }

	[[nodiscard]]
	std::string
	take_body() noexcept { return std::move(m_body); }

private:
	asio::ip::tcp::resolver m_resolver;
	asio::ssl::stream< asio::ip::tcp::socket > m_stream;

	const https_request_t & m_request;

	std::string m_outgoing;
	std::array< char, 4096 > m_incoming;

	http_parser m_parser;
	http_parser_settings m_settings;

	std::string m_body;
	bool m_message_completed{ false };
	std::optional< std::string > m_error;

	void
	fail( std::string_view stage, const asio::error_code & ec )
	{
		m_error = fmt::format( "{}: {}", stage, ec.message() );
	}

	void
	on_resolved( const asio::ip::tcp::resolver::results_type & results )
	{
		asio::async_connect(
				m_stream.lowest_layer(),
				results,
				[this]( const asio::error_code & ec,
					const asio::ip::tcp::endpoint & )
				{
					if( ec )
						return fail( "connect", ec );
					on_connected();
				} );
	}

	void
	on_connected()
	{
		m_stream.async_handshake(
				asio::ssl::stream_base::client,
				[this]( const asio::error_code & ec )
				{
					if( ec )
						return fail( "handshake", ec );
					on_handshake_completed();
				} );
	}

	void
	on_handshake_completed()
	{
		m_outgoing = fmt::format(
				"GET {} HTTP/1.1\r\n"
				"Host: {}\r\n"
				"User-Agent: {}\r\n"
				"Accept: application/json\r\n"
				"Connection: close\r\n"
				"\r\n",
				m_request.m_target,
				m_request.m_host,
				m_request.m_user_agent );

		asio::async_write(
				m_stream,
				asio::buffer( m_outgoing ),
				[this]( const asio::error_code & ec, std::size_t )
				{
					if( ec )
						return fail( "write", ec );
					initiate_next_read();
				} );
	}

	void
	initiate_next_read()
	{
		m_stream.async_read_some(
				asio::buffer( m_incoming ),
				[this]( const asio::error_code & ec, std::size_t bytes_transferred )
				{
					on_read( ec, bytes_transferred );
				} );
	}

	void
	on_read( const asio::error_code & ec, std::size_t bytes_transferred )
	{
		if( ec )
		{
			if( asio::error::eof == ec || asio::ssl::error::stream_truncated == ec )
			{
				// Responses without Content-Length end at EOF.
				http_parser_execute( &m_parser, &m_settings, nullptr, 0u );
				if( !m_message_completed )
					m_error = std::string{ "connection closed before the end "
							"of the response" };
			}
			else
				fail( "read", ec );

			return;
		}

		const auto parsed = http_parser_execute(
				&m_parser, &m_settings, m_incoming.data(), bytes_transferred );
		const auto err = HTTP_PARSER_ERRNO( &m_parser );
		if( HPE_OK != err || parsed != bytes_transferred )
		{
			m_error = fmt::format( "unable to parse response: {}",
					http_errno_description( err ) );
			return;
		}

		if( !m_message_completed )
			initiate_next_read();
	}
};

} /* namespace anonymous */

std::string
https_get( const https_request_t & request )
{
	asio::io_context io_ctx;

	asio::ssl::context ssl_ctx{ asio::ssl::context::tls_client };
	ssl_ctx.set_default_verify_paths();

	get_operation_t operation{ io_ctx, ssl_ctx, request };
	operation.start();

	io_ctx.run_for( request.m_timeout );

	if( !operation.finished() )
		throw https_error_t{
				fmt::format( "request to {} timed out", request.m_host )
			};

	if( const auto & error = operation.error() )
		throw https_error_t{
				fmt::format( "request to {} failed: {}", request.m_host, *error )
			};

	const auto status = operation.status_code();
	if( status < 200u || status > 299u )
		throw https_error_t{
				fmt::format( "request to {} failed: status {}",
						request.m_host, status )
			};

	return operation.take_body();
}

} /* namespace dnstoys::upstream */
