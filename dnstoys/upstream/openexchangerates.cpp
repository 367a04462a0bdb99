/*!
 * @file
 * @brief Source of currency exchange rates (openexchangerates.org).
 */

#include <dnstoys/upstream/openexchangerates.hpp>

#include <dnstoys/upstream/https_client.hpp>
#include <dnstoys/utils/string_algo.hpp>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

namespace dnstoys::upstream
{

rates_table_t
parse_rates_json( std::string_view body )
{
	rates_table_t result;

	try
	{
		const auto json = nlohmann::json::parse( body.begin(), body.end() );

		result.m_base = ::dnstoys::utils::to_upper_copy(
				json.at( "base" ).get< std::string >() );
		result.m_timestamp = std::chrono::system_clock::time_point{
				std::chrono::seconds{ json.at( "timestamp" ).get< std::int64_t >() }
			};

		for( const auto & [ code, rate ] : json.at( "rates" ).items() )
		{
			const auto value = rate.get< double >();
			// Zero or negative rates make conversion impossible.
			if( value > 0.0 )
				result.m_rates.emplace(
						::dnstoys::utils::to_upper_copy( code ), value );
		}
	}
	catch( const nlohmann::json::exception & x )
	{
		throw payload_error_t{
				fmt::format( "unable to parse exchange rates: {}", x.what() )
			};
	}

	if( result.m_rates.empty() )
		throw payload_error_t{ "no exchange rates in the response" };

	// The base currency is always present.
	result.m_rates.emplace( result.m_base, 1.0 );

	return result;
}

rates_table_t
fetch_rates( const rates_fetch_params_t & params )
{
	const auto body = https_get( https_request_t{
			"openexchangerates.org",
			fmt::format( "/api/latest.json?app_id={}", params.m_api_key ),
			params.m_user_agent,
			params.m_timeout
		} );

	return parse_rates_json( body );
}

} /* namespace dnstoys::upstream */
