/*!
 * @file
 * @brief Source of currency exchange rates (openexchangerates.org).
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace dnstoys::upstream
{

//
// rates_table_t
//
/*!
 * @brief Snapshot of exchange rates.
 *
 * A new instance is created on every refresh and is never modified
 * after the creation.
 */
struct rates_table_t
{
	//! The base currency (the rate for it is 1).
	std::string m_base;

	//! Currency code in upper case to its rate against the base.
	std::map< std::string, double, std::less<> > m_rates;

	//! When the rates were published by the source.
	std::chrono::system_clock::time_point m_timestamp;
};

using rates_table_shptr_t = std::shared_ptr< const rates_table_t >;

/*!
 * @brief Parse the body of openexchangerates.org `latest.json` response.
 *
 * @throw payload_error_t if the body can't be parsed or contains no rates.
 */
[[nodiscard]]
rates_table_t
parse_rates_json( std::string_view body );

//
// rates_fetch_params_t
//
struct rates_fetch_params_t
{
	std::string m_api_key;
	std::string m_user_agent;
	std::chrono::milliseconds m_timeout;
};

/*!
 * @brief Get the actual rates from openexchangerates.org.
 *
 * @throw https_error_t or payload_error_t in the case of a failure.
 */
[[nodiscard]]
rates_table_t
fetch_rates( const rates_fetch_params_t & params );

} /* namespace dnstoys::upstream */
