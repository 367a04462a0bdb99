/*!
 * @file
 * @brief Agent that starts all main agents in the right sequence.
 */

#pragma once

#include <dnstoys/startup_manager/pub.hpp>

#include <dnstoys/application_context.hpp>

#include <dnstoys/dns_server/pub.hpp>
#include <dnstoys/query_processor/pub.hpp>
#include <dnstoys/response/assembler.hpp>
#include <dnstoys/router/zone_router.hpp>
#include <dnstoys/services/fx.hpp>

#include <so_5_extra/disp/asio_one_thread/pub.hpp>

#include <so_5/all.hpp>

#include <string_view>

namespace dnstoys::startup_manager
{

//
// a_manager_t
//
/*!
 * @brief Agent that starts all main agents in the right sequence.
 *
 * This agent creates an instance of application_context that will
 * be used by all other agents in the application. It also creates
 * handlers for all enabled services and the table of zones.
 *
 * The sequence of launching:
 * - fx_refresher (only if `fx` is enabled);
 * - query_processor (and upstream_query_processor if `weather`
 *   is enabled);
 * - dns_server. The startup is completed when dns_server
 *   reports about bound socket.
 */
class a_manager_t final : public so_5::agent_t
{
public:
	//! Initializing constructor.
	a_manager_t(
		//! SObjectizer-related parameters for the agent.
		context_t ctx,
		//! Initial params for the agent.
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

private:
	//! Notification about too long time of dns_server's startup.
	struct dns_server_startup_timeout final : public so_5::signal_t {};

	//! Initial parameters for the agent.
	const params_t m_params;

	//! The context of the whole application.
	const application_context_t m_app_ctx;

	//! Storage for currency rates.
	/*!
	 * It's nullptr if `fx` is disabled.
	 */
	::dnstoys::services::rates_holder_shptr_t m_rates;

	//! Dispatcher for dns_server.
	so_5::extra::disp::asio_one_thread::dispatcher_handle_t m_io_disp;

	//! State for waiting start of dns_server agent.
	state_t st_wait_dns_server{ this, "wait_dns_server" };
	//! The normal state when all components are started.
	state_t st_normal{ this, "normal" };

	//! Create an instance of application_context for the whole application.
	[[nodiscard]]
	static application_context_t
	make_application_context(
		so_5::environment_t & env,
		const params_t & params );

	//! Create handlers for enabled services and the table of zones.
	[[nodiscard]]
	std::shared_ptr< const ::dnstoys::router::zone_router_t >
	make_zone_router();

	void
	launch_fx_refresher();

	//! Start query_processor agents.
	/*!
	 * If `weather` is enabled then there will be two agents with
	 * own dispatchers. The second one handles only queries that wait
	 * for upstream services.
	 */
	void
	launch_query_processor(
		std::shared_ptr< const ::dnstoys::router::zone_router_t > router );

	void
	start_query_processor(
		std::string_view dispatcher_name,
		std::size_t threads,
		::dnstoys::query_processor::params_t params );

	//! on_enter-handler for wait_dns_server state.
	/*!
	 * Creates a dns_server agent.
	 */
	void
	on_enter_wait_dns_server();

	//! Handler of the start of dns_server agent.
	void
	on_dns_server_started(
		mhood_t< ::dnstoys::dns_server::started_t > );

	//! Handler for the timeout of dns_server startup.
	[[noreturn]] void
	on_dns_server_startup_timeout(
		mhood_t< dns_server_startup_timeout > );
};

} /* namespace dnstoys::startup_manager */
