/*!
 * @file
 * @brief The public interface of startup_manager-agent.
 */

#pragma once

#include <dnstoys/config.hpp>

#include <dnstoys/geo/index.hpp>
#include <dnstoys/logging/wrap_logging.hpp>

#include <so_5/all.hpp>

#include <chrono>

namespace dnstoys::startup_manager
{

//
// params_t
//
/*!
 * @brief Initial parameters for startup_manager-agent.
 */
struct params_t
{
	//! The loaded configuration.
	config_t m_config;

	//! Index of places.
	/*!
	 * It's nullptr if neither `time` nor `weather` is enabled.
	 */
	::dnstoys::geo::index_shptr_t m_geo_index;

	//! Logger for the whole application.
	logging::logger_shptr_t m_logger;

	//! Max waiting time for startup of one agent.
	/*!
	 * If an agent doesn't start within that time then the
	 * whole application will be terminated.
	 */
	std::chrono::seconds m_max_stage_startup_time;
};

//
// introduce_startup_manager
//
/*!
 * @brief A factory for creation and launching a new startup_manager-agent.
 */
void
introduce_startup_manager(
	so_5::environment_t & env,
	params_t params );

} /* namespace dnstoys::startup_manager */
