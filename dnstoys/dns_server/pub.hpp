/*!
 * @file
 * @brief The public part of dns_server-agent's interface.
 */

#pragma once

#include <dnstoys/application_context.hpp>

#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>

#include <string>

namespace dnstoys::dns_server
{

//
// params_t
//
/*!
 * @brief Initial parameters for dns_server-agent.
 */
struct params_t
{
	//! Asio's io_context to be used by dns_server.
	/*!
	 * @note
	 * This reference is expected to be valid for the whole lifetime
	 * of dns_server-agent.
	 */
	asio::io_context & m_io_ctx;

	//! Address to listen on.
	asio::ip::udp::endpoint m_endpoint;

	//! mbox for started_t notification.
	so_5::mbox_t m_startup_notify_mbox;

	//! Unique name of that agent.
	/*!
	 * Intended to be used for logging.
	 */
	std::string m_name;
};

//
// started_t
//
/*!
 * @brief Notification about the successful start.
 *
 * It's sent when the socket is bound and the first read is initiated.
 */
struct started_t final : public so_5::signal_t {};

//
// introduce_dns_server
//
/*!
 * @brief A factory for the creation of a new dns_server-agent.
 *
 * @attention
 * @a disp_binder has to be a binder of asio_one_thread dispatcher
 * that serves params.m_io_ctx.
 */
void
introduce_dns_server(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params );

} /* namespace dnstoys::dns_server */
