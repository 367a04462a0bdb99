/*!
 * @file
 * @brief Grammars of queries for every service.
 */

#include <dnstoys/query/parsers.hpp>

#include <dnstoys/utils/string_algo.hpp>

#include <restinio/helpers/easy_parser.hpp>

#include <fmt/format.h>

#include <cmath>

namespace dnstoys::query
{

namespace
{

[[nodiscard]]
bool
is_country_code( std::string_view label ) noexcept
{
	return 2u == label.size() && ::dnstoys::utils::is_ascii_alpha( label );
}

/*!
 * @brief Common part of the grammars for time and weather.
 *
 * Expects one or two labels. The second label must be a country code.
 */
[[nodiscard]]
std::variant< place_query_t, format_error_t >
parse_place( std::string_view zone, const query_t & q )
{
	const auto & labels = q.m_labels;
	if( labels.empty() )
		return format_error_t{
				fmt::format( "{}: a place name is expected", zone )
			};
	if( labels.size() > 2u )
		return format_error_t{
				fmt::format( "{}: too many labels, {}", zone, labels.size() )
			};

	place_query_t result{ labels.front(), std::nullopt };
	if( 2u == labels.size() )
	{
		if( !is_country_code( labels.back() ) )
			return format_error_t{
					fmt::format( "{}: invalid country code: '{}'",
							zone, labels.back() )
				};

		result.m_country_hint = ::dnstoys::utils::to_upper_copy( labels.back() );
	}

	return result;
}

//
// raw_fx_t
//
struct raw_fx_t
{
	std::string m_amount;
	std::string m_from;
	std::string m_to;
};

[[nodiscard]]
auto
make_fx_label_parser()
{
	using namespace restinio::easy_parser;

	return produce< raw_fx_t >(
			maybe(
				produce< std::string >(
					repeat( 1u, N, digit_p() >> to_container() ),
					maybe(
						symbol_p( '.' ) >> to_container(),
						repeat( 1u, N, digit_p() >> to_container() )
					)
				) >> &raw_fx_t::m_amount
			),
			produce< std::string >(
				repeat( 3u, 3u, alpha_symbol_p() >> to_container() )
			) >> &raw_fx_t::m_from,
			symbol( '-' ),
			produce< std::string >(
				repeat( 3u, 3u, alpha_symbol_p() >> to_container() )
			) >> &raw_fx_t::m_to
		);
}

} /* namespace anonymous */

std::variant< time_params_t, format_error_t >
parse_time_query( const query_t & q )
{
	if( 1u == q.m_labels.size() && is_country_code( q.m_labels.front() ) )
		return time_params_t{
				country_query_t{
					::dnstoys::utils::to_upper_copy( q.m_labels.front() )
				}
			};

	auto r = parse_place( "time", q );
	if( auto * err = std::get_if< format_error_t >( &r ) )
		return std::move(*err);

	return time_params_t{ std::get< place_query_t >( std::move(r) ) };
}

std::variant< place_query_t, format_error_t >
parse_weather_query( const query_t & q )
{
	return parse_place( "weather", q );
}

std::variant< fx_params_t, format_error_t >
parse_fx_query( const query_t & q )
{
	if( 1u != q.m_labels.size() )
		return format_error_t{
				fmt::format( "fx: exactly one label expected, got {}",
						q.m_labels.size() )
			};

	const std::string_view label = q.m_labels.front();
	const auto parse_result = restinio::easy_parser::try_parse(
			label, make_fx_label_parser() );
	if( !parse_result )
		return format_error_t{
				fmt::format( "fx: unable to parse '{}': {}",
						label,
						restinio::easy_parser::make_error_description(
								parse_result.error(), label ) )
			};

	fx_params_t result;
	result.m_amount_text = parse_result->m_amount.empty() ?
			std::string{ "1" } : parse_result->m_amount;
	result.m_from = ::dnstoys::utils::to_upper_copy( parse_result->m_from );
	result.m_to = ::dnstoys::utils::to_upper_copy( parse_result->m_to );

	try
	{
		result.m_amount = std::stod( result.m_amount_text );
	}
	catch( const std::out_of_range & )
	{
		return format_error_t{
				fmt::format( "fx: amount is too big: {}", result.m_amount_text )
			};
	}

	if( !std::isfinite( result.m_amount ) )
		return format_error_t{
				fmt::format( "fx: invalid amount: {}", result.m_amount_text )
			};

	return result;
}

std::variant< myip_params_t, format_error_t >
parse_myip_query( const query_t & q )
{
	if( !q.m_labels.empty() )
		return format_error_t{ "myip: no parameters expected" };

	return myip_params_t{ q.m_requester };
}

} /* namespace dnstoys::query */
