/*!
 * @file
 * @brief Currency exchange service.
 */

#include <dnstoys/services/fx.hpp>

#include <date/date.h>

#include <fmt/format.h>

#include <cmath>

namespace dnstoys::services
{

namespace
{

[[nodiscard]]
std::string
format_rates_time( std::chrono::system_clock::time_point when )
{
	return date::format( "%Y-%m-%d %H:%M UTC",
			date::floor< std::chrono::minutes >( when ) );
}

} /* namespace anonymous */

//
// rates_holder_t
//
void
rates_holder_t::update( ::dnstoys::upstream::rates_table_shptr_t rates )
{
	std::lock_guard< std::mutex > lock{ m_lock };
	m_rates = std::move(rates);
}

::dnstoys::upstream::rates_table_shptr_t
rates_holder_t::current() const
{
	std::lock_guard< std::mutex > lock{ m_lock };
	return m_rates;
}

std::optional< double >
convert_amount(
	const ::dnstoys::upstream::rates_table_t & rates,
	double amount,
	std::string_view from,
	std::string_view to )
{
	const auto from_it = rates.m_rates.find( from );
	const auto to_it = rates.m_rates.find( to );
	if( from_it == rates.m_rates.end() || to_it == rates.m_rates.end() )
		return std::nullopt;

	const double converted = amount * to_it->second / from_it->second;

	// std::nearbyint uses the current rounding mode, the default one
	// is rounding half to even.
	return std::nearbyint( converted * 100.0 ) / 100.0;
}

//
// fx_handler_t
//
fx_handler_t::fx_handler_t( rates_holder_shptr_t rates )
	:	m_rates{ std::move(rates) }
{}

outcome_t
fx_handler_t::handle( const ::dnstoys::query::query_t & q ) const
{
	auto parse_result = ::dnstoys::query::parse_fx_query( q );
	if( auto * err = std::get_if< format_error_t >( &parse_result ) )
		return std::move(*err);

	const auto & params =
			std::get< ::dnstoys::query::fx_params_t >( parse_result );

	const auto rates = m_rates->current();

	if( params.m_from == params.m_to )
	{
		txt_record_t record{ {
				fmt::format( "{} {} = {} {}",
						params.m_amount_text, params.m_from,
						params.m_amount_text, params.m_to )
			} };
		if( rates )
			record.m_strings.push_back( format_rates_time( rates->m_timestamp ) );

		return successful_outcome_t{ { std::move(record) }, dynamic_answer_ttl };
	}

	if( !rates )
		return upstream_error_t{ "fx: exchange rates are not loaded yet" };

	const auto converted = convert_amount(
			*rates, params.m_amount, params.m_from, params.m_to );
	if( !converted )
		return format_error_t{
				fmt::format( "fx: unknown currency in {}-{}",
						params.m_from, params.m_to )
			};

	return successful_outcome_t{
			{ txt_record_t{ {
				fmt::format( "{} {} = {:.2f} {}",
						params.m_amount_text, params.m_from,
						*converted, params.m_to ),
				format_rates_time( rates->m_timestamp )
			} } },
			dynamic_answer_ttl
		};
}

} /* namespace dnstoys::services */
