/*!
 * @file
 * @brief Weather forecast service.
 */

#include <dnstoys/services/weather.hpp>

#include <date/tz.h>

#include <fmt/format.h>

#include <algorithm>

namespace dnstoys::services
{

namespace
{

[[nodiscard]]
txt_record_t
make_record(
	const ::dnstoys::geo::location_t & location,
	const ::dnstoys::upstream::forecast_entry_t & entry )
{
	const auto zoned = date::make_zoned(
			location.m_timezone,
			date::floor< std::chrono::minutes >( entry.m_time ) );

	return txt_record_t{ {
			fmt::format( "{} ({})", location.m_name, location.m_country_code ),
			fmt::format( "{:.2f}C ({:.2f}F)",
					entry.m_temperature,
					entry.m_temperature * 9.0 / 5.0 + 32.0 ),
			fmt::format( "{:.2f}% hu.", entry.m_humidity ),
			fmt::format( "{:.2f} m/s wind", entry.m_wind_speed ),
			entry.m_symbol,
			date::format( "%H:%M, %a", zoned )
		} };
}

} /* namespace anonymous */

weather_handler_t::weather_handler_t(
	::dnstoys::geo::index_shptr_t index,
	forecast_cache_shptr_t cache )
	:	m_index{ std::move(index) }
	,	m_cache{ std::move(cache) }
{}

outcome_t
weather_handler_t::handle( const ::dnstoys::query::query_t & q ) const
{
	auto parse_result = ::dnstoys::query::parse_weather_query( q );
	if( auto * err = std::get_if< format_error_t >( &parse_result ) )
		return std::move(*err);

	const auto & params =
			std::get< ::dnstoys::query::place_query_t >( parse_result );

	const auto r = m_index->resolve( params.m_place, params.m_country_hint );
	if( !r )
		return resolution_error_t{
				fmt::format( "weather: unknown place '{}'", params.m_place )
			};

	const auto & location = *(r->m_location);
	const auto cache_result = m_cache->get( place_key_t{
			location.m_name,
			location.m_country_code,
			location.m_latitude,
			location.m_longitude
		} );

	if( const auto * failed =
			std::get_if< ::dnstoys::upstream::failed_fetch_t >( &cache_result ) )
		return upstream_error_t{
				fmt::format( "weather: unable to get forecast for {} ({}): {}",
						location.m_name,
						location.m_country_code,
						failed->m_description )
			};

	const auto & cached = std::get< forecast_cache_t::cached_value_t >(
			cache_result );

	// TTL can't be less than one second.
	successful_outcome_t result{
			{},
			std::max(
				std::chrono::duration_cast< std::chrono::seconds >(
						cached.m_remaining_ttl ),
				dynamic_answer_ttl )
		};
	for( const auto & entry : cached.m_value->m_entries )
		result.m_answers.emplace_back( make_record( location, entry ) );

	return result;
}

} /* namespace dnstoys::services */
