/*!
 * @file
 * @brief Decoding of DNS queries and encoding of DNS responses.
 */

#pragma once

#include <dnstoys/dns/dns_types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dnstoys::dns
{

//
// query_message_t
//
//! A successfully decoded query with exactly one question.
struct query_message_t
{
	dns_header_t m_header;
	dns_question_t m_question;
};

//
// decoding_failure_t
//
/*!
 * @brief Description of a datagram that can't be handled.
 *
 * If the header was read then it is present in @a m_header and
 * the datagram can be answered with FORMERR.
 */
struct decoding_failure_t
{
	std::string m_description;
	std::optional< dns_header_t > m_header;
};

using decoding_result_t = std::variant< query_message_t, decoding_failure_t >;

/*!
 * @brief Decode an incoming datagram.
 *
 * Only standard queries (QR=0, OPCODE=0) with exactly one question
 * are accepted.
 *
 * @note
 * This function doesn't throw on malformed input, all problems are
 * reported via decoding_failure_t.
 */
[[nodiscard]]
decoding_result_t
decode_query( std::string_view datagram );

//
// response_message_t
//
/*!
 * @brief All parts of a response to be encoded.
 *
 * ID, opcode and RD flag are copied from @a m_request_header.
 */
struct response_message_t
{
	dns_header_t m_request_header;

	//! The question to be copied. Can be absent for FORMERR responses.
	std::optional< dns_question_t > m_question;

	unsigned int m_rcode{ rcode_values::ok };

	std::vector< dns_resource_record_t > m_answers;
	std::vector< dns_resource_record_t > m_authority;
};

//
// encoded_response_t
//
struct encoded_response_t
{
	//! The binary form of the response.
	std::string m_data;

	//! Was the response truncated?
	bool m_truncated{ false };
};

/*!
 * @brief Encode a response into a form that fits into one UDP datagram.
 *
 * Records that don't fit into max_udp_message_size bytes are dropped
 * from the end and TC flag is set in that case. If not all answers fit
 * then the authority section is dropped too.
 */
[[nodiscard]]
encoded_response_t
encode_response( const response_message_t & response );

} /* namespace dnstoys::dns */
