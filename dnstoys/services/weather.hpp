/*!
 * @file
 * @brief Weather forecast service.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

#include <dnstoys/geo/index.hpp>
#include <dnstoys/upstream/cache.hpp>
#include <dnstoys/upstream/met_no.hpp>

#include <tuple>

namespace dnstoys::services
{

//
// place_key_t
//
/*!
 * @brief Key for the cache of forecasts.
 *
 * Places are identified by name and country code only, coordinates
 * are carried for the fetcher.
 */
struct place_key_t
{
	std::string m_name;
	std::string m_country_code;
	double m_latitude;
	double m_longitude;
};

[[nodiscard]]
inline bool
operator<( const place_key_t & a, const place_key_t & b ) noexcept
{
	return std::tie( a.m_name, a.m_country_code ) <
			std::tie( b.m_name, b.m_country_code );
}

using forecast_cache_t = ::dnstoys::upstream::upstream_cache_t<
		place_key_t,
		::dnstoys::upstream::weather_report_t >;

using forecast_cache_shptr_t = std::shared_ptr< forecast_cache_t >;

//
// weather_handler_t
//
/*!
 * @brief Handler for `weather` zone.
 *
 * The answer is a TXT record for every forecast entry, like:
 * @code
 * "Berlin (DE)" "8.40C (47.12F)" "89.40% hu." "cloudy" "14:00, Sat"
 * @endcode
 * The time is shown in the timezone of the place.
 */
class weather_handler_t final : public service_handler_t
{
public:
	weather_handler_t(
		::dnstoys::geo::index_shptr_t index,
		forecast_cache_shptr_t cache );

	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;

private:
	const ::dnstoys::geo::index_shptr_t m_index;
	const forecast_cache_shptr_t m_cache;
};

} /* namespace dnstoys::services */
