/*!
 * @file
 * @brief Conversion of service outcomes into DNS responses.
 */

#pragma once

#include <dnstoys/dns/message.hpp>
#include <dnstoys/query/query.hpp>
#include <dnstoys/services/outcome.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace dnstoys::response
{

//! TTL for negative responses.
inline constexpr std::chrono::seconds error_ttl{ 1 };

//
// assembler_t
//
/*!
 * @brief Maker of DNS responses.
 *
 * Rules:
 * - successful outcomes become TXT, A or AAAA records regardless of
 *   the type of the question;
 * - format errors, resolution errors and unknown zones become NXDOMAIN
 *   with SOA record of the zone in the authority section;
 * - upstream and internal errors become SERVFAIL without records.
 */
class assembler_t
{
public:
	/*!
	 * @param domain the domain of the server. It is used as MNAME
	 * in SOA records.
	 */
	explicit assembler_t( std::string domain );

	//! Make a response for a processed query.
	[[nodiscard]]
	::dnstoys::dns::response_message_t
	make_response(
		const ::dnstoys::dns::query_message_t & request,
		const ::dnstoys::query::query_t & q,
		const ::dnstoys::services::outcome_t & outcome ) const;

	//! Make SERVFAIL response without records.
	/*!
	 * Intended to be used if something goes wrong in make_response().
	 */
	[[nodiscard]]
	static ::dnstoys::dns::response_message_t
	make_server_failure(
		const ::dnstoys::dns::query_message_t & request );

	//! Make FORMERR response for a datagram that can't be decoded.
	[[nodiscard]]
	static ::dnstoys::dns::response_message_t
	make_format_error(
		const ::dnstoys::dns::dns_header_t & request_header );

private:
	const std::string m_domain;
	//! RNAME for SOA records.
	const std::string m_hostmaster;

	[[nodiscard]]
	::dnstoys::dns::response_message_t
	make_name_error(
		const ::dnstoys::dns::query_message_t & request,
		const ::dnstoys::query::query_t & q ) const;
};

} /* namespace dnstoys::response */
