/*!
 * @file
 * @brief Definition of context in that dnstoys's agents will work.
 */

#pragma once

#include <dnstoys/logging/wrap_logging.hpp>

#include <so_5/all.hpp>

namespace dnstoys
{

//
// application_context_t
//
/*!
 * @brief A struct for holding info necessary for interaction
 * between dnstoys's agents.
 */
struct application_context_t
{
	//! Logger to be used by all agents.
	logging::logger_shptr_t m_logger;

	//! mbox for queries to be processed.
	/*!
	 * It's MPMC mbox, query_processor agents are subscribed to it.
	 */
	so_5::mbox_t m_query_processor_mbox;

	//! mbox for queries to zones that wait for upstream services.
	/*!
	 * Queries are resent to it from m_query_processor_mbox.
	 */
	so_5::mbox_t m_upstream_query_mbox;
};

} /* namespace dnstoys */
