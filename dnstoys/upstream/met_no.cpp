/*!
 * @file
 * @brief Source of weather forecasts (api.met.no locationforecast 2.0).
 */

#include <dnstoys/upstream/met_no.hpp>

#include <dnstoys/upstream/https_client.hpp>

#include <nlohmann/json.hpp>

#include <date/date.h>

#include <fmt/format.h>

#include <sstream>

namespace dnstoys::upstream
{

namespace
{

[[nodiscard]]
std::chrono::system_clock::time_point
parse_time( const std::string & value )
{
	std::istringstream from{ value };
	date::sys_seconds result;
	from >> date::parse( "%FT%TZ", result );
	if( from.fail() )
		throw payload_error_t{
				fmt::format( "unable to parse time: '{}'", value )
			};

	return result;
}

//! Find the nearest summary with a symbol.
/*!
 * @return empty string if there is no symbol in the entry.
 */
[[nodiscard]]
std::string
find_symbol( const nlohmann::json & data )
{
	for( const char * period : { "next_1_hours", "next_6_hours", "next_12_hours" } )
	{
		const auto it = data.find( period );
		if( it != data.end() )
		{
			const auto & summary = it->at( "summary" );
			if( const auto s = summary.find( "symbol_code" ); s != summary.end() )
				return s->get< std::string >();
		}
	}

	return {};
}

} /* namespace anonymous */

weather_report_t
parse_forecast_json( std::string_view body )
{
	weather_report_t result;

	try
	{
		const auto json = nlohmann::json::parse( body.begin(), body.end() );

		for( const auto & item : json.at( "properties" ).at( "timeseries" ) )
		{
			if( result.m_entries.size() >= max_forecast_entries )
				break;

			const auto time = parse_time( item.at( "time" ).get< std::string >() );
			if( !result.m_entries.empty() &&
					time < result.m_entries.back().m_time + min_forecast_spacing )
				continue;

			const auto & data = item.at( "data" );
			auto symbol = find_symbol( data );
			if( symbol.empty() )
				continue;

			const auto & details = data.at( "instant" ).at( "details" );
			result.m_entries.push_back( forecast_entry_t{
					time,
					details.at( "air_temperature" ).get< double >(),
					details.at( "relative_humidity" ).get< double >(),
					details.value( "wind_speed", 0.0 ),
					std::move(symbol)
				} );
		}
	}
	catch( const nlohmann::json::exception & x )
	{
		throw payload_error_t{
				fmt::format( "unable to parse forecast: {}", x.what() )
			};
	}

	if( result.m_entries.empty() )
		throw payload_error_t{ "no forecast entries in the response" };

	return result;
}

weather_report_t
fetch_forecast( const forecast_fetch_params_t & params )
{
	// api.met.no requires no more than 4 decimals in coordinates.
	const auto body = https_get( https_request_t{
			"api.met.no",
			fmt::format( "/weatherapi/locationforecast/2.0/compact"
					"?lat={:.4f}&lon={:.4f}",
					params.m_latitude, params.m_longitude ),
			params.m_user_agent,
			params.m_timeout
		} );

	return parse_forecast_json( body );
}

} /* namespace dnstoys::upstream */
