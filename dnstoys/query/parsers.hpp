/*!
 * @file
 * @brief Grammars of queries for every service.
 */

#pragma once

#include <dnstoys/query/query.hpp>

#include <optional>
#include <string>
#include <variant>

namespace dnstoys::query
{

//
// format_error_t
//
//! The query doesn't match the grammar of the service.
struct format_error_t
{
	std::string m_description;
};

//
// place_query_t
//
//! Query for a place with an optional country hint.
/*!
 * Like `paris.fr.time` or `berlin.weather`.
 */
struct place_query_t
{
	//! Name of the place as it is in the query.
	std::string m_place;

	//! Country code in upper case.
	std::optional< std::string > m_country_hint;
};

//
// country_query_t
//
//! Query for a whole country, like `in.time`.
struct country_query_t
{
	//! Country code in upper case.
	std::string m_country_code;
};

using time_params_t = std::variant< place_query_t, country_query_t >;

/*!
 * @brief Parser for `time` zone.
 *
 * Grammar:
 * @code
 * <place>[.<cc>].time
 * <cc>.time
 * @endcode
 * A single two-letter label is treated as a country code.
 */
[[nodiscard]]
std::variant< time_params_t, format_error_t >
parse_time_query( const query_t & q );

/*!
 * @brief Parser for `weather` zone.
 *
 * Grammar:
 * @code
 * <place>[.<cc>].weather
 * @endcode
 */
[[nodiscard]]
std::variant< place_query_t, format_error_t >
parse_weather_query( const query_t & q );

//
// fx_params_t
//
struct fx_params_t
{
	//! Amount as it was specified in the query ("1" if it was omitted).
	std::string m_amount_text;

	double m_amount;

	//! Currency codes in upper case.
	std::string m_from;
	std::string m_to;
};

/*!
 * @brief Parser for `fx` zone.
 *
 * Grammar:
 * @code
 * [<amount>]<FROM>-<TO>.fx
 * @endcode
 * where amount is a decimal number like `25` or `99.5`, FROM and TO are
 * three-letter currency codes.
 */
[[nodiscard]]
std::variant< fx_params_t, format_error_t >
parse_fx_query( const query_t & q );

//
// myip_params_t
//
//! There are no params for myip, just the address of the requester.
struct myip_params_t
{
	asio::ip::address m_requester;
};

/*!
 * @brief Parser for `myip` zone.
 *
 * There should be no labels before the zone.
 */
[[nodiscard]]
std::variant< myip_params_t, format_error_t >
parse_myip_query( const query_t & q );

} /* namespace dnstoys::query */
