/*!
 * @file
 * @brief The public part of fx_refresher-agent's interface.
 */

#pragma once

#include <dnstoys/application_context.hpp>

#include <dnstoys/services/fx.hpp>
#include <dnstoys/upstream/openexchangerates.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace dnstoys::fx_refresher
{

//! Type of function that loads a new table of rates.
/*!
 * It should throw in the case of a failure.
 */
using rates_loader_t = std::function< ::dnstoys::upstream::rates_table_t() >;

//
// params_t
//
/*!
 * @brief Initial parameters for fx_refresher-agent.
 */
struct params_t
{
	//! Storage for the actual table.
	::dnstoys::services::rates_holder_shptr_t m_rates;

	//! Loader of new tables.
	rates_loader_t m_loader;

	//! Period of updates.
	std::chrono::milliseconds m_refresh_interval;

	//! Unique name of that agent.
	std::string m_name;
};

//
// introduce_fx_refresher
//
/*!
 * @brief A factory for the creation of a new fx_refresher-agent.
 *
 * The agent makes the first attempt to load rates right after
 * the start and then repeats it every params.m_refresh_interval.
 * Failed attempts are logged, the previous table is kept in that case.
 *
 * @note
 * Loading is a blocking operation, so the agent should have
 * its own worker thread.
 */
void
introduce_fx_refresher(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params );

} /* namespace dnstoys::fx_refresher */
