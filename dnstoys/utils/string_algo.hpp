/*!
 * @file
 * @brief Small helpers for strings and variants.
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dnstoys::utils
{

//
// overloaded
//
// Source: https://en.cppreference.com/w/cpp/utility/variant/visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

//
// ascii_to_lower
//
[[nodiscard]]
inline constexpr char
ascii_to_lower( char ch ) noexcept
{
	return ( ch >= 'A' && ch <= 'Z' ) ? static_cast<char>( ch - 'A' + 'a' ) : ch;
}

//
// ascii_to_upper
//
[[nodiscard]]
inline constexpr char
ascii_to_upper( char ch ) noexcept
{
	return ( ch >= 'a' && ch <= 'z' ) ? static_cast<char>( ch - 'a' + 'A' ) : ch;
}

//
// to_lower_copy
//
/*!
 * @brief Make a lower-case copy of a string.
 *
 * Only ASCII letters are converted, all other bytes (including parts
 * of UTF-8 sequences) are copied as is.
 */
[[nodiscard]]
inline std::string
to_lower_copy( std::string_view what )
{
	std::string result;
	result.reserve( what.size() );
	std::transform( what.begin(), what.end(), std::back_inserter(result),
			[]( char ch ) { return ascii_to_lower( ch ); } );

	return result;
}

//
// to_upper_copy
//
[[nodiscard]]
inline std::string
to_upper_copy( std::string_view what )
{
	std::string result;
	result.reserve( what.size() );
	std::transform( what.begin(), what.end(), std::back_inserter(result),
			[]( char ch ) { return ascii_to_upper( ch ); } );

	return result;
}

//
// is_ascii_alpha
//
[[nodiscard]]
inline bool
is_ascii_alpha( std::string_view what ) noexcept
{
	return std::all_of( what.begin(), what.end(),
			[]( char ch ) {
				return ( ch >= 'a' && ch <= 'z' ) || ( ch >= 'A' && ch <= 'Z' );
			} );
}

//
// split
//
/*!
 * @brief Split a string into pieces by a single delimiter.
 *
 * Empty pieces are kept. The returned views point into @a what.
 */
[[nodiscard]]
inline std::vector< std::string_view >
split( std::string_view what, char delimiter )
{
	std::vector< std::string_view > result;

	for(;;)
	{
		const auto pos = what.find( delimiter );
		result.push_back( what.substr( 0u, pos ) );
		if( std::string_view::npos == pos )
			break;
		what.remove_prefix( pos + 1u );
	}

	return result;
}

} /* namespace dnstoys::utils */
