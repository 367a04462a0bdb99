/*!
 * @file
 * @brief Currency exchange service.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

#include <dnstoys/upstream/openexchangerates.hpp>

#include <mutex>
#include <optional>
#include <string_view>

namespace dnstoys::services
{

//
// rates_holder_t
//
/*!
 * @brief Holder of the actual snapshot of exchange rates.
 *
 * The snapshot is replaced as a whole by the refresher and is read
 * by the query handlers. The snapshot is empty until the first
 * successful refresh.
 */
class rates_holder_t
{
public:
	//! Replace the current snapshot.
	void
	update( ::dnstoys::upstream::rates_table_shptr_t rates );

	//! Get the current snapshot. It can be nullptr.
	[[nodiscard]]
	::dnstoys::upstream::rates_table_shptr_t
	current() const;

private:
	mutable std::mutex m_lock;

	::dnstoys::upstream::rates_table_shptr_t m_rates;
};

using rates_holder_shptr_t = std::shared_ptr< rates_holder_t >;

/*!
 * @brief Convert an amount from one currency to another.
 *
 * The result is rounded half to even to 2 decimal places.
 *
 * @return empty value if one of the currencies is unknown.
 */
[[nodiscard]]
std::optional< double >
convert_amount(
	const ::dnstoys::upstream::rates_table_t & rates,
	double amount,
	std::string_view from,
	std::string_view to );

//
// fx_handler_t
//
/*!
 * @brief Handler for `fx` zone.
 *
 * The answer is a TXT record like:
 * @code
 * "25 USD = 22.50 EUR" "2022-03-09 12:00 UTC"
 * @endcode
 * where the second string is the time of the rates.
 */
class fx_handler_t final : public service_handler_t
{
public:
	explicit fx_handler_t( rates_holder_shptr_t rates );

	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;

private:
	const rates_holder_shptr_t m_rates;
};

} /* namespace dnstoys::services */
