/*!
 * @file
 * @brief Helpers for logging.
 */

#include <dnstoys/logging/wrap_logging.hpp>

#include <spdlog/sinks/null_sink.h>

namespace dnstoys::logging
{

std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( spdlog::string_view_t name ) noexcept
{
	if( "trace" == name )
		return spdlog::level::trace;
	else if( "debug" == name )
		return spdlog::level::debug;
	else if( "info" == name )
		return spdlog::level::info;
	else if( "warn" == name )
		return spdlog::level::warn;
	else if( "error" == name )
		return spdlog::level::err;
	else if( "crit" == name )
		return spdlog::level::critical;
	else if( "off" == name )
		return spdlog::level::off;
	else
		return std::nullopt;
}

logger_shptr_t
make_null_logger()
{
	auto logger = std::make_shared< spdlog::logger >(
			"null",
			std::make_shared< spdlog::sinks::null_sink_mt >() );
	logger->set_level( spdlog::level::off );

	return logger;
}

} /* namespace dnstoys::logging */
