/*!
 * @file
 * @brief Service that returns the address of the requester.
 */

#pragma once

#include <dnstoys/services/handler.hpp>

namespace dnstoys::services
{

//
// myip_handler_t
//
/*!
 * @brief Handler for `myip` zone.
 *
 * IPv4 addresses (including IPv4-mapped IPv6 addresses) are returned
 * as A records, IPv6 addresses as AAAA records.
 */
class myip_handler_t final : public service_handler_t
{
public:
	[[nodiscard]]
	outcome_t
	handle( const ::dnstoys::query::query_t & q ) const override;
};

} /* namespace dnstoys::services */
