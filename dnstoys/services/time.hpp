/*!
 * @file
 * @brief Service for getting the current time in a place.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

#include <dnstoys/geo/index.hpp>

namespace dnstoys::services
{

/*!
 * @brief Format the time in the timezone of a place.
 *
 * The format is like "Wed, 09 Mar 2022 12:23:51 +0530".
 *
 * @throw std::runtime_error if the timezone of the place is unknown.
 */
[[nodiscard]]
std::string
format_local_time(
	const ::dnstoys::geo::location_t & location,
	std::chrono::system_clock::time_point when );

//
// time_handler_t
//
/*!
 * @brief Handler for `time` zone.
 *
 * The answer for a place is a TXT record like:
 * @code
 * "Mumbai (Asia/Kolkata, IN)" "Wed, 09 Mar 2022 12:23:51 +0530"
 * @endcode
 * For a country code there is one record for every timezone of
 * the country.
 */
class time_handler_t final : public service_handler_t
{
public:
	time_handler_t(
		::dnstoys::geo::index_shptr_t index,
		now_provider_t now_provider );

	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;

private:
	const ::dnstoys::geo::index_shptr_t m_index;
	const now_provider_t m_now_provider;

	[[nodiscard]]
	outcome_t
	handle_place(
		const ::dnstoys::query::place_query_t & params,
		std::chrono::system_clock::time_point now ) const;

	[[nodiscard]]
	outcome_t
	handle_country(
		const ::dnstoys::query::country_query_t & params,
		std::chrono::system_clock::time_point now ) const;
};

} /* namespace dnstoys::services */
