/*!
 * @file
 * @brief Representation of an incoming query.
 */

#pragma once

#include <asio/ip/address.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dnstoys::query
{

//
// query_t
//
/*!
 * @brief A question from a client in the normalized form.
 *
 * For the question `Mumbai.TIME.` it will be:
 * - m_qname: "mumbai.time";
 * - m_zone: "time";
 * - m_labels: {"mumbai"}.
 */
struct query_t
{
	//! The question name in lower case without the trailing dot.
	std::string m_qname;

	//! The top-level label. Empty for the root name.
	std::string m_zone;

	//! All labels before the zone in the original order.
	std::vector< std::string > m_labels;

	//! Address of the client.
	asio::ip::address m_requester;
};

/*!
 * @brief Make a query from the question name.
 *
 * The name is converted to lower case and the trailing dot is removed.
 */
[[nodiscard]]
query_t
make_query(
	std::string_view qname,
	asio::ip::address requester );

} /* namespace dnstoys::query */
