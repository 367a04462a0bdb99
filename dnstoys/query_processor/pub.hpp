/*!
 * @file
 * @brief The public part of query_processor-agent's interface.
 */

#pragma once

#include <dnstoys/application_context.hpp>

#include <dnstoys/dns/message.hpp>
#include <dnstoys/response/assembler.hpp>
#include <dnstoys/router/zone_router.hpp>

#include <asio/ip/udp.hpp>

#include <memory>
#include <set>
#include <string>

namespace dnstoys::query_processor
{

//
// params_t
//
/*!
 * @brief Initial parameters for query_processor-agent.
 */
struct params_t
{
	//! Table of zones.
	/*!
	 * It isn't modified after the start, so it's shared between
	 * all worker threads without any locks.
	 */
	std::shared_ptr< const ::dnstoys::router::zone_router_t > m_router;

	//! Maker of responses.
	std::shared_ptr< const ::dnstoys::response::assembler_t > m_assembler;

	//! Name of the agent for logging.
	std::string m_name;

	//! mbox from that incoming_query_t messages are received.
	so_5::mbox_t m_source;

	//! Zones those queries are passed to @a m_redirect_to.
	/*!
	 * Empty if the agent handles all received queries itself.
	 */
	std::set< std::string, std::less<> > m_redirected_zones;

	//! The destination for queries from @a m_redirected_zones.
	so_5::mbox_t m_redirect_to;
};

//
// incoming_query_t
//
/*!
 * @brief A decoded query to be processed.
 */
struct incoming_query_t final : public so_5::message_t
{
	//! The query itself.
	::dnstoys::dns::query_message_t m_request;

	//! The address of the client.
	asio::ip::udp::endpoint m_peer;

	//! mbox for outgoing_response_t.
	so_5::mbox_t m_reply_to;

	incoming_query_t(
		::dnstoys::dns::query_message_t request,
		asio::ip::udp::endpoint peer,
		so_5::mbox_t reply_to )
		:	m_request{ std::move(request) }
		,	m_peer{ std::move(peer) }
		,	m_reply_to{ std::move(reply_to) }
	{}
};

//
// outgoing_response_t
//
/*!
 * @brief Encoded response to be sent to a client.
 */
struct outgoing_response_t final : public so_5::message_t
{
	//! Binary representation of the response.
	std::string m_data;

	//! The address of the client.
	asio::ip::udp::endpoint m_peer;

	outgoing_response_t(
		std::string data,
		asio::ip::udp::endpoint peer )
		:	m_data{ std::move(data) }
		,	m_peer{ std::move(peer) }
	{}
};

//
// process_query
//
/*!
 * @brief Perform the processing of a query.
 *
 * Routes the query, calls the handler and assembles the response.
 * Exceptions from the handler are logged and converted into
 * SERVFAIL responses.
 *
 * @return encoded response.
 */
[[nodiscard]]
::dnstoys::dns::encoded_response_t
process_query(
	spdlog::logger & logger,
	const ::dnstoys::router::zone_router_t & router,
	const ::dnstoys::response::assembler_t & assembler,
	const ::dnstoys::dns::query_message_t & request,
	const asio::ip::address & requester );

//
// introduce_query_processor
//
/*!
 * @brief A factory for the creation of a new query_processor-agent.
 *
 * The agent subscribes to params.m_source and handles
 * incoming_query_t messages in thread-safe mode. So it's expected
 * that @a disp_binder refers to adv_thread_pool dispatcher.
 *
 * Queries for zones from params.m_redirected_zones are not handled
 * but resent to params.m_redirect_to as is. It allows to handle
 * queries that wait for upstream services on a separate set of
 * worker threads.
 */
void
introduce_query_processor(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params );

} /* namespace dnstoys::query_processor */
