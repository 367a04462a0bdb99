/*!
 * @file
 * @brief Help and default services.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dnstoys::services
{

//
// help_entry_t
//
struct help_entry_t
{
	service_kind_t m_kind;
	std::string m_description;
	//! Example of usage with the domain of the server.
	std::string m_example;
};

using enabled_services_t = std::set< service_kind_t >;

/*!
 * @brief Make help entries for the enabled services.
 *
 * The result depends only on the set of services (and the domain),
 * it contains one entry per service in the order of service_kind_t.
 */
[[nodiscard]]
std::vector< help_entry_t >
make_help_entries(
	const enabled_services_t & enabled,
	std::string_view domain );

//
// help_handler_t
//
/*!
 * @brief Handler for `help` zone.
 *
 * The answer is prepared once in the constructor.
 */
class help_handler_t final : public service_handler_t
{
public:
	explicit help_handler_t( const std::vector< help_entry_t > & entries );

	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;

private:
	const successful_outcome_t m_answer;
};

//
// default_handler_t
//
//! Handler for all unknown zones.
class default_handler_t final : public service_handler_t
{
public:
	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;
};

} /* namespace dnstoys::services */
