/*!
 * @file
 * @brief Agent for processing of DNS queries.
 */

#pragma once

#include <dnstoys/query_processor/pub.hpp>

namespace dnstoys::query_processor
{

//
// a_processor_t
//
/*!
 * @brief Agent that performs the actual processing of queries.
 *
 * The agent doesn't have any mutable state, so its event handler
 * is marked as thread-safe and can be called on several threads
 * of adv_thread_pool dispatcher at the same time.
 */
class a_processor_t final : public so_5::agent_t
{
public:
	a_processor_t(
		context_t ctx,
		application_context_t app_ctx,
		params_t params );

	void
	so_define_agent() override;

	void
	so_evt_start() override;

private:
	const application_context_t m_app_ctx;

	const params_t m_params;

	void
	on_incoming_query( mhood_t< incoming_query_t > cmd );

	[[nodiscard]]
	bool
	should_be_redirected( const incoming_query_t & cmd ) const;
};

} /* namespace dnstoys::query_processor */
