/*!
 * @file
 * @brief Agent for periodic updates of currency rates.
 */

#pragma once

#include <dnstoys/fx_refresher/pub.hpp>

namespace dnstoys::fx_refresher
{

//
// a_refresher_t
//
class a_refresher_t final : public so_5::agent_t
{
public:
	a_refresher_t(
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
	//! Signal for the next attempt to load rates.
	struct refresh_t final : public so_5::signal_t {};

	const application_context_t m_app_ctx;

	const params_t m_params;

	//! Timer for refresh_t signals.
	so_5::timer_id_t m_refresh_timer;

	void
	on_refresh( mhood_t< refresh_t > );
};

} /* namespace dnstoys::fx_refresher */
