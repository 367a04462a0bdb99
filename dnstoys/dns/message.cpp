/*!
 * @file
 * @brief Decoding of DNS queries and encoding of DNS responses.
 */

#include <dnstoys/dns/message.hpp>

#include <array>

namespace dnstoys::dns
{

namespace
{

[[nodiscard]]
decoding_result_t
decode_after_header(
	std::string_view datagram,
	oess_2::io::istream_t & bin_stream,
	const dns_header_t & header )
{
	if( dns_header_t::REQUEST != header.qr() )
		return decoding_failure_t{ "not a query", header };

	if( 0u != header.opcode() )
		return decoding_failure_t{
				fmt::format( "unsupported opcode {}", header.opcode() ),
				header
		};

	if( 1u != header.m_qdcount )
		return decoding_failure_t{
				fmt::format( "exactly one question expected, qdcount={}",
						header.m_qdcount ),
				header
		};

	query_message_t result{ header, dns_question_t{} };
	try
	{
		// Answer, authority and additional sections are ignored.
		bin_stream >> from_memory( datagram, result.m_question );
	}
	catch( const std::exception & x )
	{
		return decoding_failure_t{
				fmt::format( "unable to read question: {}", x.what() ),
				header
		};
	}

	return result;
}

} /* namespace anonymous */

decoding_result_t
decode_query( std::string_view datagram )
{
	if( datagram.size() < dns_header_t::wire_size )
		return decoding_failure_t{
				fmt::format( "datagram is too small: {} byte(s)", datagram.size() ),
				std::nullopt
		};

	oess_2::io::ifixed_mem_buf_t bin_stream{
			datagram.data(), datagram.size()
	};

	dns_header_t header;
	try
	{
		bin_stream >> header;
	}
	catch( const std::exception & x )
	{
		return decoding_failure_t{
				fmt::format( "unable to read header: {}", x.what() ),
				std::nullopt
		};
	}

	return decode_after_header( datagram, bin_stream, header );
}

encoded_response_t
encode_response( const response_message_t & response )
{
	std::array< char, max_udp_message_size > buffer;
	oess_2::io::ofixed_mem_buf_t bin_stream{ buffer.data(), buffer.size() };

	std::size_t total_size = dns_header_t::wire_size;
	if( response.m_question )
		total_size += response.m_question->wire_size();

	const auto fits = [&total_size]( const dns_resource_record_t & rr ) {
		if( total_size + rr.wire_size() <= max_udp_message_size )
		{
			total_size += rr.wire_size();
			return true;
		}
		return false;
	};

	// Detect how many records can be sent.
	std::size_t answers_to_send = 0u;
	bool truncated = false;
	for( const auto & rr : response.m_answers )
	{
		if( !fits( rr ) )
		{
			truncated = true;
			break;
		}
		++answers_to_send;
	}

	std::size_t authority_to_send = 0u;
	if( !truncated )
	{
		for( const auto & rr : response.m_authority )
		{
			if( !fits( rr ) )
			{
				truncated = true;
				break;
			}
			++authority_to_send;
		}
	}

	dns_header_t header;
	header.m_id = response.m_request_header.m_id;
	header.set_qr( dns_header_t::RESPONSE );
	header.set_opcode( response.m_request_header.opcode() );
	header.set_aa( true );
	header.set_tc( truncated );
	header.set_rd( response.m_request_header.rd() );
	header.set_rcode( response.m_rcode );
	header.m_qdcount = response.m_question ? 1u : 0u;
	header.m_ancount = static_cast< oess_2::ushort_t >( answers_to_send );
	header.m_nscount = static_cast< oess_2::ushort_t >( authority_to_send );

	bin_stream << header;
	if( response.m_question )
		bin_stream << *(response.m_question);

	for( std::size_t i{}; i < answers_to_send; ++i )
		bin_stream << response.m_answers[ i ];
	for( std::size_t i{}; i < authority_to_send; ++i )
		bin_stream << response.m_authority[ i ];

	return encoded_response_t{
			std::string( buffer.data(), bin_stream.size() ),
			truncated
	};
}

} /* namespace dnstoys::dns */
