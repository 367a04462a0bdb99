/*!
 * @file
 * @brief Help and default services.
 */

#include <dnstoys/services/help.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace dnstoys::services
{

namespace
{

[[nodiscard]]
help_entry_t
make_entry( service_kind_t kind, std::string_view domain )
{
	switch( kind )
	{
	case service_kind_t::time:
		return { kind,
				"get time for a city or country code",
				fmt::format( "dig mumbai.time @{}", domain ) };

	case service_kind_t::fx:
		return { kind,
				"convert currency rates (25USD-EUR.fx, 99.5JPY-INR.fx)",
				fmt::format( "dig 25USD-EUR.fx @{}", domain ) };

	case service_kind_t::myip:
		return { kind,
				"get your host's requesting IP.",
				fmt::format( "dig myip @{}", domain ) };

	case service_kind_t::weather:
		return { kind,
				"get weather forecast for a city.",
				fmt::format( "dig berlin.weather @{}", domain ) };
	}

	throw std::invalid_argument{ "unknown service kind" };
}

[[nodiscard]]
successful_outcome_t
make_answer( const std::vector< help_entry_t > & entries )
{
	successful_outcome_t result{ {}, static_answer_ttl };
	result.m_answers.reserve( entries.size() );

	for( const auto & e : entries )
		result.m_answers.emplace_back(
				txt_record_t{ { e.m_description, e.m_example } } );

	return result;
}

} /* namespace anonymous */

std::vector< help_entry_t >
make_help_entries(
	const enabled_services_t & enabled,
	std::string_view domain )
{
	std::vector< help_entry_t > result;
	result.reserve( enabled.size() );

	// std::set keeps the order of service_kind_t values.
	for( const auto kind : enabled )
		result.push_back( make_entry( kind, domain ) );

	return result;
}

help_handler_t::help_handler_t( const std::vector< help_entry_t > & entries )
	:	m_answer{ make_answer( entries ) }
{}

outcome_t
help_handler_t::handle( const ::dnstoys::query::query_t & ) const
{
	return m_answer;
}

outcome_t
default_handler_t::handle( const ::dnstoys::query::query_t & ) const
{
	return no_such_zone_t{};
}

} /* namespace dnstoys::services */
