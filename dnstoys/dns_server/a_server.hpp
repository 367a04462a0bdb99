/*!
 * @file
 * @brief Agent that serves DNS clients via UDP.
 */

#pragma once

#include <dnstoys/dns_server/pub.hpp>

#include <dnstoys/query_processor/pub.hpp>

#include <dnstoys/dns/dns_types.hpp>

#include <array>

namespace dnstoys::dns_server
{

//
// a_server_t
//
/*!
 * @brief Agent that owns UDP socket.
 *
 * The agent works on asio_one_thread dispatcher, so its event
 * handlers and completion handlers for socket operations are
 * called on the same thread.
 *
 * Incoming datagrams are decoded and sent to query_processor.
 * Processed responses are received as outgoing_response_t messages.
 * The agent doesn't wait for anything, all socket operations
 * are asynchronous.
 */
class a_server_t final : public so_5::agent_t
{
public:
	a_server_t(
		context_t ctx,
		application_context_t app_ctx,
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

	void
	so_evt_finish() override;

private:
	const application_context_t m_app_ctx;

	const params_t m_params;

	asio::ip::udp::socket m_socket;

	//! Receiver of endpoint of last incoming datagram.
	asio::ip::udp::endpoint m_incoming_pkg_endpoint;

	//! Buffer for incoming datagrams.
	std::array< char, ::dnstoys::dns::max_udp_message_size >
			m_incoming_pkg;

	//! Flag that tells that the agent is finishing its work.
	bool m_is_finished{ false };

	void
	on_outgoing_response(
		mhood_t< ::dnstoys::query_processor::outgoing_response_t > cmd );

	void
	initiate_next_async_read();

	void
	handle_async_receive_result(
		const asio::error_code & ec,
		std::size_t bytes_transferred ) noexcept;

	void
	try_handle_incoming_pkg( std::size_t bytes_transferred );

	void
	send_datagram(
		std::string data,
		const asio::ip::udp::endpoint & peer );
};

} /* namespace dnstoys::dns_server */
