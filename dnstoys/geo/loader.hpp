/*!
 * @file
 * @brief Loading of places from geonames dataset.
 */

#pragma once

#include <dnstoys/geo/index.hpp>

#include <dnstoys/logging/wrap_logging.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace dnstoys::geo
{

//
// parsing_result_t
//
struct parsing_result_t
{
	std::vector< location_t > m_locations;

	//! Count of lines that were skipped because of errors.
	std::size_t m_skipped_lines{};
};

/*!
 * @brief Parse content of geonames "cities" dump.
 *
 * It is a tab-separated file with 19 columns. Only name, asciiname,
 * alternatenames, latitude, longitude, country code, population and
 * timezone are used. Only ASCII alternatenames are used as aliases.
 *
 * Lines that can't be parsed are skipped.
 */
[[nodiscard]]
parsing_result_t
parse_geonames( std::string_view content );

/*!
 * @brief Load geonames file and create the index.
 *
 * @throw config_error_t if the file can't be read or there are no
 * places in it.
 */
[[nodiscard]]
index_shptr_t
load_index(
	const std::filesystem::path & file_name,
	spdlog::logger & logger );

} /* namespace dnstoys::geo */
