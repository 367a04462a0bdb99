/*!
 * @file
 * @brief Source of weather forecasts (api.met.no locationforecast 2.0).
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace dnstoys::upstream
{

//
// forecast_entry_t
//
struct forecast_entry_t
{
	std::chrono::system_clock::time_point m_time;

	//! Air temperature in Celsius.
	double m_temperature;

	//! Relative humidity in percents.
	double m_humidity;

	//! Wind speed in m/s.
	double m_wind_speed;

	//! Weather symbol code, like "clearsky_day".
	std::string m_symbol;
};

//
// weather_report_t
//
struct weather_report_t
{
	std::vector< forecast_entry_t > m_entries;
};

//! Max count of entries in a report.
inline constexpr std::size_t max_forecast_entries = 3u;

//! Min distance in time between two entries in a report.
inline constexpr std::chrono::hours min_forecast_spacing{ 3 };

/*!
 * @brief Parse the body of locationforecast `compact` response.
 *
 * Only entries with a weather symbol are used. No more than
 * max_forecast_entries entries are taken, the distance between two
 * consequent entries is at least min_forecast_spacing.
 *
 * @throw payload_error_t if the body can't be parsed or contains
 * no usable entries.
 */
[[nodiscard]]
weather_report_t
parse_forecast_json( std::string_view body );

//
// forecast_fetch_params_t
//
struct forecast_fetch_params_t
{
	double m_latitude;
	double m_longitude;
	std::string m_user_agent;
	std::chrono::milliseconds m_timeout;
};

/*!
 * @brief Get a forecast for a point from api.met.no.
 *
 * @throw https_error_t or payload_error_t in the case of a failure.
 */
[[nodiscard]]
weather_report_t
fetch_forecast( const forecast_fetch_params_t & params );

} /* namespace dnstoys::upstream */
