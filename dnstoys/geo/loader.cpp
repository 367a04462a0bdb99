/*!
 * @file
 * @brief Loading of places from geonames dataset.
 */

#include <dnstoys/geo/loader.hpp>

#include <dnstoys/exception.hpp>
#include <dnstoys/utils/line_reader.hpp>
#include <dnstoys/utils/load_file_into_memory.hpp>
#include <dnstoys/utils/string_algo.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <optional>

namespace dnstoys::geo
{

namespace
{

// Indexes of columns in geonames dump.
// See http://download.geonames.org/export/dump/readme.txt
namespace columns
{

inline constexpr std::size_t name = 1u;
inline constexpr std::size_t asciiname = 2u;
inline constexpr std::size_t alternatenames = 3u;
inline constexpr std::size_t latitude = 4u;
inline constexpr std::size_t longitude = 5u;
inline constexpr std::size_t country_code = 8u;
inline constexpr std::size_t population = 14u;
inline constexpr std::size_t timezone = 17u;

inline constexpr std::size_t total = 19u;

} /* namespace columns */

[[nodiscard]]
std::optional< double >
parse_coordinate( std::string_view value, double limit )
{
	if( value.empty() )
		return std::nullopt;

	// std::stod requires a null-terminated string.
	const std::string tmp{ value };
	std::size_t processed{};
	double result{};
	try
	{
		result = std::stod( tmp, &processed );
	}
	catch( const std::logic_error & )
	{
		return std::nullopt;
	}

	if( processed != tmp.size() || result < -limit || result > limit )
		return std::nullopt;

	return result;
}

[[nodiscard]]
std::optional< std::uint64_t >
parse_population( std::string_view value )
{
	// An empty value is treated as 0.
	if( value.empty() )
		return std::uint64_t{};

	std::uint64_t result{};
	const auto r = std::from_chars(
			value.data(), value.data() + value.size(), result );
	if( r.ec != std::errc{} || r.ptr != value.data() + value.size() )
		return std::nullopt;

	return result;
}

[[nodiscard]]
bool
is_printable_ascii( std::string_view v ) noexcept
{
	return std::all_of( v.begin(), v.end(),
			[]( char ch ) { return ch >= 0x20 && ch < 0x7f; } );
}

[[nodiscard]]
std::optional< location_t >
try_parse_line( std::string_view line )
{
	// Trailing '\r' is already removed by line_reader_t.
	const auto fields = ::dnstoys::utils::split( line, '\t' );
	if( columns::total != fields.size() )
		return std::nullopt;

	location_t loc;
	loc.m_name = std::string{ fields[ columns::name ] };
	loc.m_country_code = ::dnstoys::utils::to_upper_copy(
			fields[ columns::country_code ] );
	loc.m_timezone = std::string{ fields[ columns::timezone ] };

	if( loc.m_name.empty() || loc.m_timezone.empty() ||
			2u != loc.m_country_code.size() ||
			!::dnstoys::utils::is_ascii_alpha( loc.m_country_code ) )
		return std::nullopt;

	const auto lat = parse_coordinate( fields[ columns::latitude ], 90.0 );
	const auto lon = parse_coordinate( fields[ columns::longitude ], 180.0 );
	const auto population = parse_population( fields[ columns::population ] );
	if( !lat || !lon || !population )
		return std::nullopt;

	loc.m_latitude = *lat;
	loc.m_longitude = *lon;
	loc.m_priority = *population;

	if( const auto ascii = fields[ columns::asciiname ];
			!ascii.empty() && ascii != loc.m_name )
		loc.m_aliases.emplace_back( ascii );

	for( const auto alt : ::dnstoys::utils::split(
			fields[ columns::alternatenames ], ',' ) )
	{
		if( !alt.empty() && is_printable_ascii( alt ) && alt != loc.m_name )
			loc.m_aliases.emplace_back( alt );
	}

	return loc;
}

} /* namespace anonymous */

parsing_result_t
parse_geonames( std::string_view content )
{
	parsing_result_t result;

	using line_reader_t = ::dnstoys::utils::line_reader_t;

	line_reader_t reader{ content, line_reader_t::comments_t::disabled };
	reader.for_each_line( [&result]( const line_reader_t::line_t & line ) {
			auto loc = try_parse_line( line.content() );
			if( loc )
				result.m_locations.push_back( std::move(*loc) );
			else
				++result.m_skipped_lines;
		} );

	return result;
}

index_shptr_t
load_index(
	const std::filesystem::path & file_name,
	spdlog::logger & logger )
{
	const auto content = ::dnstoys::utils::load_file_into_memory( file_name );

	auto parsing_result = parse_geonames(
			std::string_view{ content.data(), content.size() } );

	if( parsing_result.m_locations.empty() )
		throw config_error_t{
				fmt::format( "no places loaded from '{}', lines skipped: {}",
						file_name.string(),
						parsing_result.m_skipped_lines )
			};

	::dnstoys::logging::wrap_logging(
			logger,
			parsing_result.m_skipped_lines ? spdlog::level::warn
					: spdlog::level::info,
			[&]( auto & l, auto level ) {
				l.log( level, "geo: {} place(s) loaded from '{}', "
						"{} line(s) skipped",
						parsing_result.m_locations.size(),
						file_name.string(),
						parsing_result.m_skipped_lines );
			} );

	return std::make_shared< index_t >(
			std::move(parsing_result.m_locations) );
}

} /* namespace dnstoys::geo */
