/*!
 * @file
 * @brief Macros for nothrow blocks.
 */

#pragma once

#include <dnstoys/logging/wrap_logging.hpp>

/*!
 * Starts a new block for catching and logging all exceptions.
 *
 * Usage example:
 * @code
 * DNSTOYS_NOTHROW_BLOCK_BEGIN()
 * 	... // Some code inside.
 * DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_logger)
 * @endcode
 */
#define DNSTOYS_NOTHROW_BLOCK_BEGIN() \
{ \
	const char * dnstoys_nothrow_block_stage__ = nullptr; \
	(void)dnstoys_nothrow_block_stage__; \
	try \
	{

/*!
 * Sets an internal variable. That value will be used later for logging.
 *
 * Usage example:
 * @code
 * DNSTOYS_NOTHROW_BLOCK_BEGIN()
 * 	DNSTOYS_NOTHROW_BLOCK_STAGE(first_stage)
 * 	... // Some code
 *
 * 	DNSTOYS_NOTHROW_BLOCK_STAGE(second_stage)
 * 	... // Some code
 * DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_logger)
 * @endcode
 */
#define DNSTOYS_NOTHROW_BLOCK_STAGE(stage_name) \
	dnstoys_nothrow_block_stage__ = #stage_name;

// NOTE: an exception from the logger itself can't be reported anywhere,
// so it is the only one that is silently dropped.
#define DNSTOYS_NOTHROW_BLOCK_END_STATEMENT_LOG_THEN_IGNORE(logger_ref) \
} \
catch( const std::exception & x ) \
{ \
	const auto line__ = __LINE__; \
	const auto file__ = __FILE__; \
	const auto function__ = __PRETTY_FUNCTION__; \
	try \
	{ \
		if( !dnstoys_nothrow_block_stage__ ) dnstoys_nothrow_block_stage__ = "unspecified"; \
		::dnstoys::logging::wrap_logging( (logger_ref), spdlog::level::err, \
				[dnstoys_nothrow_block_stage__, &x, &line__, &file__, &function__] \
				( auto & logger, auto level ) { \
					logger.log( level, "{}:{} [{}] unexpected exception at stage '{}' => {}", \
							file__, line__, function__, dnstoys_nothrow_block_stage__, x.what() ); \
				} ); \
	} \
	catch( ... ) {} \
} \
catch( ... ) \
{ \
	const auto line__ = __LINE__; \
	const auto file__ = __FILE__; \
	const auto function__ = __PRETTY_FUNCTION__; \
	try \
	{ \
		if( !dnstoys_nothrow_block_stage__ ) dnstoys_nothrow_block_stage__ = "unspecified"; \
		::dnstoys::logging::wrap_logging( (logger_ref), spdlog::level::err, \
				[dnstoys_nothrow_block_stage__, &line__, &file__, &function__] \
				( auto & logger, auto level ) { \
					logger.log( level, "{}:{} [{}] unexpected exception at stage '{}', description not available", \
							file__, line__, function__, dnstoys_nothrow_block_stage__ ); \
				} ); \
	} \
	catch( ... ) {} \
}

/*!
 * Finishes block started by DNSTOYS_NOTHROW_BLOCK_BEGIN.
 *
 * @a action can only be LOG_THEN_IGNORE now.
 * @a logger_ref is a reference to spdlog::logger to be used.
 */
#define DNSTOYS_NOTHROW_BLOCK_END(action, logger_ref) \
	DNSTOYS_NOTHROW_BLOCK_END_STATEMENT_##action(logger_ref) \
}
