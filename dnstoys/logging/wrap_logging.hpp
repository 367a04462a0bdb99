/*!
 * @file
 * @brief Helpers for logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

namespace dnstoys
{

namespace logging
{

//! Type of shared pointer to a logger.
/*!
 * The logger is created by main() and is passed to every component
 * via its params. There is no global logger in dnstoys.
 */
using logger_shptr_t = std::shared_ptr< spdlog::logger >;

/*!
 * @brief A special wrapper around logging-level that tells that
 * logging is performed from wrap_logging helper.
 */
class processed_log_level_t
{
	spdlog::level::level_enum m_level;

public:
	explicit processed_log_level_t(
		spdlog::level::level_enum level )
		:	m_level{ level }
	{}

	[[nodiscard]]
	auto
	value() const noexcept { return m_level; }

	[[nodiscard]]
	operator spdlog::level::level_enum() const noexcept { return value(); }
};

/*!
 * @brief Perform logging via the specified logger.
 *
 * The functor @a action is called only if @a level is enabled
 * for logging. So the formatting of a message isn't performed
 * for disabled levels at all.
 *
 * The functor @a action should have the following format:
 * @code
 * void(spdlog::logger &, processed_log_level_t);
 * @endcode
 *
 * Usage example:
 * @code
 * ::dnstoys::logging::wrap_logging(
 * 		*m_logger,
 * 		spdlog::level::debug,
 * 		[&]( auto & logger, auto level ) {
 * 			logger.log( level, "{}: query received, id={}", m_name, id );
 * 		} );
 * @endcode
 */
template< typename Logging_Action >
void
wrap_logging(
	spdlog::logger & logger,
	spdlog::level::level_enum level,
	Logging_Action && action )
{
	if( logger.should_log( level ) )
	{
		action( logger, processed_log_level_t{ level } );
	}
}

/*!
 * @brief Conversion of a level name into spdlog's level.
 *
 * Names "trace", "debug", "info", "warn", "error", "crit" and "off"
 * are supported.
 *
 * @return empty value if @a name is unknown.
 */
[[nodiscard]]
std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( spdlog::string_view_t name ) noexcept;

/*!
 * @brief Make a logger that discards everything.
 *
 * Intended to be used in tests and tools where the output
 * isn't interesting.
 */
[[nodiscard]]
logger_shptr_t
make_null_logger();

} /* namespace logging */

} /* namespace dnstoys */
