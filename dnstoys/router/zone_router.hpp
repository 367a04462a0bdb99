/*!
 * @file
 * @brief Selection of a service by the zone of a query.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

#include <dnstoys/exception.hpp>

#include <map>
#include <string>
#include <string_view>

namespace dnstoys::router
{

//
// zone_registration_error_t
//
//! Exception to be thrown on an attempt to register a zone twice.
class zone_registration_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

//! The name of the zone with the help.
inline constexpr std::string_view help_zone{ "help" };

//
// zone_router_t
//
/*!
 * @brief Table of zones and their handlers.
 *
 * The table is filled at the startup and then is used from several
 * threads without modification.
 *
 * The zone `help` is always present. All unknown zones are routed to
 * services::default_handler_t.
 */
class zone_router_t
{
public:
	explicit zone_router_t(
		::dnstoys::services::service_handler_shptr_t help_handler );

	/*!
	 * @throw zone_registration_error_t if the zone is already registered.
	 */
	void
	register_zone(
		std::string_view zone,
		::dnstoys::services::service_handler_shptr_t handler );

	//! Find a handler for the query.
	/*!
	 * The matching is case-insensitive.
	 */
	[[nodiscard]]
	const ::dnstoys::services::service_handler_t &
	route( const ::dnstoys::query::query_t & q ) const;

private:
	std::map<
				std::string,
				::dnstoys::services::service_handler_shptr_t,
				std::less<> >
		m_zones;

	const ::dnstoys::services::service_handler_shptr_t m_default_handler;
};

} /* namespace dnstoys::router */
