/*!
 * @file
 * @brief Selection of a service by the zone of a query.
 */

#include <dnstoys/router/zone_router.hpp>

#include <dnstoys/services/help.hpp>
#include <dnstoys/utils/string_algo.hpp>

#include <fmt/format.h>

namespace dnstoys::router
{

zone_router_t::zone_router_t(
	::dnstoys::services::service_handler_shptr_t help_handler )
	:	m_default_handler{
			std::make_shared< ::dnstoys::services::default_handler_t >() }
{
	register_zone( help_zone, std::move(help_handler) );
}

void
zone_router_t::register_zone(
	std::string_view zone,
	::dnstoys::services::service_handler_shptr_t handler )
{
	auto key = ::dnstoys::utils::to_lower_copy( zone );
	if( !key.empty() && '.' == key.back() )
		key.pop_back();

	if( key.empty() )
		throw zone_registration_error_t{ "empty zone name" };

	if( !handler )
		throw zone_registration_error_t{
				fmt::format( "no handler for zone '{}'", key )
			};

	const auto [ it, inserted ] = m_zones.emplace( key, std::move(handler) );
	(void)it;
	if( !inserted )
		throw zone_registration_error_t{
				fmt::format( "zone '{}' is already registered", key )
			};
}

const ::dnstoys::services::service_handler_t &
zone_router_t::route( const ::dnstoys::query::query_t & q ) const
{
	// Zone in the query is already normalized.
	const auto it = m_zones.find( q.m_zone );
	if( it != m_zones.end() )
		return *(it->second);

	return *m_default_handler;
}

} /* namespace dnstoys::router */
