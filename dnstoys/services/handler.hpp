/*!
 * @file
 * @brief Interface of a service.
 */

#pragma once

#include <dnstoys/services/outcome.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace dnstoys::services
{

//
// service_kind_t
//
//! All services supported by dnstoys.
enum class service_kind_t
{
	time,
	fx,
	myip,
	weather
};

//! Zone name for a service.
[[nodiscard]]
inline constexpr std::string_view
zone_name( service_kind_t kind ) noexcept
{
	switch( kind )
	{
	case service_kind_t::time: return "time";
	case service_kind_t::fx: return "fx";
	case service_kind_t::myip: return "myip";
	case service_kind_t::weather: return "weather";
	}

	return "unknown";
}

//! Type of function for getting the current time.
/*!
 * Services receive it as a parameter, so tests can use a fixed time.
 */
using now_provider_t = std::function< std::chrono::system_clock::time_point() >;

//
// service_handler_t
//
/*!
 * @brief Interface of a query handler.
 *
 * Handlers are called from several worker threads at the same time,
 * so implementations must be thread safe.
 */
class service_handler_t
{
public:
	virtual ~service_handler_t() = default;

	//! Handle the query.
	/*!
	 * @note
	 * All expected problems should be reported via outcome_t.
	 * Exceptions are treated as internal errors.
	 */
	[[nodiscard]]
	virtual outcome_t
	handle( const ::dnstoys::query::query_t & q ) const = 0;
};

using service_handler_shptr_t = std::shared_ptr< const service_handler_t >;

} /* namespace dnstoys::services */
