/*!
 * @file
 * @brief Index for resolution of place names.
 */

#pragma once

#include <dnstoys/geo/location.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dnstoys::geo
{

//
// resolve_result_t
//
struct resolve_result_t
{
	//! The place found.
	const location_t * m_location;

	//! The name (canonical or one of aliases) that has matched.
	std::string m_matched_name;

	//! Was it an exact match?
	bool m_exact;
};

//
// index_t
//
/*!
 * @brief Read-only index of places.
 *
 * The index is created once and then is used from many threads
 * without any synchronization.
 *
 * Resolution policy:
 * - exact case-insensitive match on canonical name or alias is tried
 *   first. Hyphens and underscores are treated as spaces;
 * - if there is no exact match and the name is at least
 *   min_fuzzy_name_length long then all names with normalized Levenshtein
 *   distance not greater than fuzzy_threshold are taken as candidates;
 * - the best candidate is selected by: the country code hint, then the
 *   highest priority, then the lexicographically smallest name, then the
 *   lexicographically smallest country code.
 */
class index_t
{
public:
	//! Max allowed value of edit distance divided by the longer length.
	static constexpr double fuzzy_threshold = 0.25;

	//! Fuzzy search isn't performed for shorter names.
	static constexpr std::size_t min_fuzzy_name_length = 4u;

	/*!
	 * @note
	 * If there are several locations with the same (name, country code)
	 * pair then only the location with the highest priority is kept.
	 */
	explicit index_t( std::vector< location_t > locations );

	index_t( const index_t & ) = delete;
	index_t & operator=( const index_t & ) = delete;

	//! Find a place by name.
	/*!
	 * @param name the name to be found. Case-insensitive.
	 * @param country_hint optional two-letter country code. Case-insensitive.
	 */
	[[nodiscard]]
	std::optional< resolve_result_t >
	resolve(
		std::string_view name,
		std::optional< std::string_view > country_hint = std::nullopt ) const;

	//! Count of places in the index.
	[[nodiscard]]
	std::size_t
	count() const noexcept { return m_locations.size(); }

	//! Get the most important places of a country.
	/*!
	 * One location (with the highest priority) is returned for every
	 * distinct timezone of the country. The result is ordered by
	 * descending priority. The result is empty for unknown countries.
	 */
	[[nodiscard]]
	std::vector< const location_t * >
	by_country( std::string_view country_code ) const;

private:
	//! A reference to a location via one of its names.
	struct name_ref_t
	{
		std::size_t m_location_index;
		//! Pointer to the name inside the location.
		const std::string * m_name;
	};

	std::vector< location_t > m_locations;

	using names_map_t =
			std::unordered_map< std::string, std::vector< name_ref_t > >;

	//! Normalized name to all locations with that name.
	names_map_t m_names;

	//! Items of m_names grouped by the length of the name.
	/*!
	 * Fuzzy search checks only lengths those can pass fuzzy_threshold.
	 */
	std::map< std::size_t, std::vector< const names_map_t::value_type * > >
		m_names_by_length;

	//! Country code to the locations ordered for by_country().
	std::map< std::string, std::vector< std::size_t >, std::less<> > m_countries;

	void
	fill_names();

	void
	fill_countries();

	[[nodiscard]]
	std::optional< resolve_result_t >
	select_best(
		const std::vector< name_ref_t > & candidates,
		const std::optional< std::string > & country_hint,
		bool exact ) const;
};

//
// index_shptr_t
//
using index_shptr_t = std::shared_ptr< const index_t >;

/*!
 * @brief Normalization of a place name for comparison.
 *
 * ASCII letters are converted to lower case, '-' and '_' are
 * replaced by spaces.
 */
[[nodiscard]]
std::string
normalize_name( std::string_view name );

/*!
 * @brief Levenshtein distance between two byte strings.
 */
[[nodiscard]]
std::size_t
edit_distance( std::string_view a, std::string_view b );

} /* namespace dnstoys::geo */
