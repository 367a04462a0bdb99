/*!
 * @file
 * @brief Index for resolution of place names.
 */

#include <dnstoys/geo/index.hpp>

#include <dnstoys/utils/string_algo.hpp>

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

namespace dnstoys::geo
{

std::string
normalize_name( std::string_view name )
{
	std::string result;
	result.reserve( name.size() );

	for( const char ch : name )
	{
		if( '-' == ch || '_' == ch )
			result += ' ';
		else
			result += ::dnstoys::utils::ascii_to_lower( ch );
	}

	return result;
}

std::size_t
edit_distance( std::string_view a, std::string_view b )
{
	if( a.size() < b.size() )
		std::swap( a, b );

	// Only two rows of the matrix are necessary.
	std::vector< std::size_t > prev( b.size() + 1u );
	std::vector< std::size_t > current( b.size() + 1u );

	for( std::size_t j{}; j <= b.size(); ++j )
		prev[ j ] = j;

	for( std::size_t i = 1u; i <= a.size(); ++i )
	{
		current[ 0 ] = i;
		for( std::size_t j = 1u; j <= b.size(); ++j )
		{
			const std::size_t substitution_cost =
					a[ i - 1u ] == b[ j - 1u ] ? 0u : 1u;

			current[ j ] = std::min( {
					prev[ j ] + 1u,
					current[ j - 1u ] + 1u,
					prev[ j - 1u ] + substitution_cost
				} );
		}
		prev.swap( current );
	}

	return prev[ b.size() ];
}

index_t::index_t( std::vector< location_t > locations )
{
	// Only one location for every (name, country code) pair.
	std::map< std::pair< std::string, std::string >, std::size_t > unique;

	for( auto & loc : locations )
	{
		loc.m_country_code = ::dnstoys::utils::to_upper_copy( loc.m_country_code );

		auto key = std::make_pair(
				normalize_name( loc.m_name ), loc.m_country_code );
		const auto it = unique.find( key );
		if( it == unique.end() )
		{
			unique.emplace( std::move(key), m_locations.size() );
			m_locations.push_back( std::move(loc) );
		}
		else if( m_locations[ it->second ].m_priority < loc.m_priority )
		{
			m_locations[ it->second ] = std::move(loc);
		}
	}

	m_locations.shrink_to_fit();

	// NOTE: m_locations isn't modified since that point, so pointers
	// to names inside locations remain valid.
	fill_names();
	fill_countries();
}

std::optional< resolve_result_t >
index_t::resolve(
	std::string_view name,
	std::optional< std::string_view > country_hint ) const
{
	const auto key = normalize_name( name );
	if( key.empty() )
		return std::nullopt;

	std::optional< std::string > hint;
	if( country_hint )
		hint = ::dnstoys::utils::to_upper_copy( *country_hint );

	if( const auto it = m_names.find( key ); it != m_names.end() )
		return select_best( it->second, hint, true );

	if( key.size() < min_fuzzy_name_length )
		return std::nullopt;

	// Names with lengths outside this range can't be close enough.
	const auto min_length = static_cast< std::size_t >(
			static_cast< double >( key.size() ) * ( 1.0 - fuzzy_threshold ) );
	const auto max_length = static_cast< std::size_t >(
			static_cast< double >( key.size() ) / ( 1.0 - fuzzy_threshold ) ) + 1u;

	std::vector< name_ref_t > candidates;
	for( auto bucket = m_names_by_length.lower_bound( min_length );
			bucket != m_names_by_length.end() && bucket->first <= max_length;
			++bucket )
	{
		for( const auto * item : bucket->second )
		{
			const auto & [ candidate_name, refs ] = *item;

			const auto longer = std::max( key.size(), candidate_name.size() );
			const auto shorter = std::min( key.size(), candidate_name.size() );

			// The distance can't be less than the difference in lengths.
			if( static_cast< double >( longer - shorter ) / longer > fuzzy_threshold )
				continue;

			const auto distance = edit_distance( key, candidate_name );
			if( static_cast< double >( distance ) / longer <= fuzzy_threshold )
				candidates.insert( candidates.end(), refs.begin(), refs.end() );
		}
	}

	return select_best( candidates, hint, false );
}

std::vector< const location_t * >
index_t::by_country( std::string_view country_code ) const
{
	std::vector< const location_t * > result;

	const auto it = m_countries.find(
			::dnstoys::utils::to_upper_copy( country_code ) );
	if( it != m_countries.end() )
	{
		result.reserve( it->second.size() );
		for( const auto i : it->second )
			result.push_back( &m_locations[ i ] );
	}

	return result;
}

void
index_t::fill_names()
{
	const auto add_name = [this]( std::size_t index, const std::string & name ) {
		auto key = normalize_name( name );
		if( key.empty() )
			return;

		auto & refs = m_names[ std::move(key) ];
		// The same location can have an alias equal to its canonical name.
		const bool already_present = std::any_of( refs.begin(), refs.end(),
				[index]( const name_ref_t & r ) {
					return r.m_location_index == index;
				} );
		if( !already_present )
			refs.push_back( name_ref_t{ index, &name } );
	};

	for( std::size_t i{}; i < m_locations.size(); ++i )
	{
		const auto & loc = m_locations[ i ];
		add_name( i, loc.m_name );
		for( const auto & alias : loc.m_aliases )
			add_name( i, alias );
	}

	// NOTE: pointers to items of unordered_map remain valid on rehashing.
	for( const auto & item : m_names )
		m_names_by_length[ item.first.size() ].push_back( &item );
}

void
index_t::fill_countries()
{
	// Country -> timezone -> the best location for that timezone.
	std::map< std::string, std::map< std::string, std::size_t > > best;

	for( std::size_t i{}; i < m_locations.size(); ++i )
	{
		const auto & loc = m_locations[ i ];
		auto & zones = best[ loc.m_country_code ];
		const auto it = zones.find( loc.m_timezone );
		if( it == zones.end() )
			zones.emplace( loc.m_timezone, i );
		else if( m_locations[ it->second ].m_priority < loc.m_priority )
			it->second = i;
	}

	for( const auto & [ country, zones ] : best )
	{
		std::vector< std::size_t > indexes;
		indexes.reserve( zones.size() );
		for( const auto & z : zones )
			indexes.push_back( z.second );

		std::sort( indexes.begin(), indexes.end(),
				[this]( std::size_t a, std::size_t b ) {
					const auto & la = m_locations[ a ];
					const auto & lb = m_locations[ b ];
					return std::tie( lb.m_priority, la.m_name ) <
							std::tie( la.m_priority, lb.m_name );
				} );

		m_countries.emplace( country, std::move(indexes) );
	}
}

std::optional< resolve_result_t >
index_t::select_best(
	const std::vector< name_ref_t > & candidates,
	const std::optional< std::string > & country_hint,
	bool exact ) const
{
	const auto less = [&]( const name_ref_t & a, const name_ref_t & b ) {
		const auto & la = m_locations[ a.m_location_index ];
		const auto & lb = m_locations[ b.m_location_index ];

		// Locations matching the hint go first.
		const bool a_hinted = country_hint && *country_hint == la.m_country_code;
		const bool b_hinted = country_hint && *country_hint == lb.m_country_code;
		if( a_hinted != b_hinted )
			return a_hinted;

		// Then locations with higher priority.
		if( la.m_priority != lb.m_priority )
			return la.m_priority > lb.m_priority;

		return std::tie( la.m_name, la.m_country_code ) <
				std::tie( lb.m_name, lb.m_country_code );
	};

	const auto it = std::min_element(
			candidates.begin(), candidates.end(), less );
	if( it == candidates.end() )
		return std::nullopt;

	return resolve_result_t{
			&m_locations[ it->m_location_index ],
			*(it->m_name),
			exact
	};
}

} /* namespace dnstoys::geo */
