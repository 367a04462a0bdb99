/*!
 * @file
 * @brief Service for getting the current time in a place.
 */

#include <dnstoys/services/time.hpp>

#include <dnstoys/utils/string_algo.hpp>

#include <date/tz.h>

#include <fmt/format.h>

namespace dnstoys::services
{

namespace
{

[[nodiscard]]
txt_record_t
make_record(
	const ::dnstoys::geo::location_t & location,
	std::chrono::system_clock::time_point now )
{
	return txt_record_t{ {
			fmt::format( "{} ({}, {})",
					location.m_name,
					location.m_timezone,
					location.m_country_code ),
			format_local_time( location, now )
		} };
}

} /* namespace anonymous */

std::string
format_local_time(
	const ::dnstoys::geo::location_t & location,
	std::chrono::system_clock::time_point when )
{
	const auto zoned = date::make_zoned(
			location.m_timezone,
			date::floor< std::chrono::seconds >( when ) );

	return date::format( "%a, %d %b %Y %H:%M:%S %z", zoned );
}

time_handler_t::time_handler_t(
	::dnstoys::geo::index_shptr_t index,
	now_provider_t now_provider )
	:	m_index{ std::move(index) }
	,	m_now_provider{ std::move(now_provider) }
{}

outcome_t
time_handler_t::handle( const ::dnstoys::query::query_t & q ) const
{
	auto parse_result = ::dnstoys::query::parse_time_query( q );
	if( auto * err = std::get_if< format_error_t >( &parse_result ) )
		return std::move(*err);

	const auto now = m_now_provider();

	return std::visit( ::dnstoys::utils::overloaded{
			[&]( const ::dnstoys::query::place_query_t & p ) {
				return handle_place( p, now );
			},
			[&]( const ::dnstoys::query::country_query_t & c ) {
				return handle_country( c, now );
			}
		},
		std::get< ::dnstoys::query::time_params_t >( parse_result ) );
}

outcome_t
time_handler_t::handle_place(
	const ::dnstoys::query::place_query_t & params,
	std::chrono::system_clock::time_point now ) const
{
	const auto r = m_index->resolve( params.m_place, params.m_country_hint );
	if( !r )
		return resolution_error_t{
				fmt::format( "time: unknown place '{}'", params.m_place )
			};

	return successful_outcome_t{
			{ make_record( *(r->m_location), now ) },
			dynamic_answer_ttl
		};
}

outcome_t
time_handler_t::handle_country(
	const ::dnstoys::query::country_query_t & params,
	std::chrono::system_clock::time_point now ) const
{
	const auto locations = m_index->by_country( params.m_country_code );
	if( locations.empty() )
		return resolution_error_t{
				fmt::format( "time: unknown country '{}'", params.m_country_code )
			};

	successful_outcome_t result{ {}, dynamic_answer_ttl };
	result.m_answers.reserve( locations.size() );
	for( const auto * loc : locations )
		result.m_answers.emplace_back( make_record( *loc, now ) );

	return result;
}

} /* namespace dnstoys::services */
