/*!
 * @file
 * @brief Description of a single place known to dnstoys.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dnstoys::geo
{

//
// location_t
//
/*!
 * @brief A place loaded from geonames dataset.
 *
 * Names aren't unique. Only the pair (name, country code) is unique
 * inside the index.
 */
struct location_t
{
	//! Canonical name of the place (as it is in the dataset).
	std::string m_name;

	//! Alternative names of the place.
	std::vector< std::string > m_aliases;

	//! ISO-3166 two-letter country code in upper case.
	std::string m_country_code;

	double m_latitude{};
	double m_longitude{};

	//! IANA timezone name, like "Asia/Kolkata".
	std::string m_timezone;

	//! Weight for selection between places with the same name.
	/*!
	 * It's the population of the place.
	 */
	std::uint64_t m_priority{};
};

} /* namespace dnstoys::geo */
