/*!
 * @file
 * @brief Conversion of service outcomes into DNS responses.
 */

#include <dnstoys/response/assembler.hpp>

#include <dnstoys/utils/string_algo.hpp>

#include <fmt/format.h>

namespace dnstoys::response
{

namespace dns = ::dnstoys::dns;
namespace services = ::dnstoys::services;

namespace
{

[[nodiscard]]
dns::response_message_t
make_base_response(
	const dns::query_message_t & request,
	unsigned int rcode )
{
	dns::response_message_t result;
	result.m_request_header = request.m_header;
	result.m_question = request.m_question;
	result.m_rcode = rcode;

	return result;
}

[[nodiscard]]
dns::dns_resource_record_t
make_answer_record(
	const dns::dns_format_name_t & owner,
	oess_2::uint_t ttl,
	const services::answer_t & answer )
{
	using namespace dns::dns_resource_record_tools;

	dns::dns_resource_record_t rr;
	rr.m_name = owner;
	rr.m_ttl = ttl;

	std::visit( ::dnstoys::utils::overloaded{
			[&rr]( const services::txt_record_t & txt ) {
				rr.m_type = dns::qtype_values::TXT;
				rr.m_resource_data = make_txt_rdata( txt.m_strings );
			},
			[&rr]( const asio::ip::address & address ) {
				if( address.is_v4() )
				{
					rr.m_type = dns::qtype_values::A;
					rr.m_resource_data = make_a_rdata( address.to_v4() );
				}
				else
				{
					rr.m_type = dns::qtype_values::AAAA;
					rr.m_resource_data = make_aaaa_rdata( address.to_v6() );
				}
			}
		},
		answer );

	return rr;
}

} /* namespace anonymous */

assembler_t::assembler_t( std::string domain )
	:	m_domain{ std::move(domain) }
	,	m_hostmaster{ fmt::format( "hostmaster.{}", m_domain ) }
{}

dns::response_message_t
assembler_t::make_response(
	const dns::query_message_t & request,
	const ::dnstoys::query::query_t & q,
	const services::outcome_t & outcome ) const
{
	return std::visit( ::dnstoys::utils::overloaded{
			[&]( const services::successful_outcome_t & success ) {
				auto result = make_base_response( request, dns::rcode_values::ok );

				const auto ttl = static_cast< oess_2::uint_t >( success.m_ttl.count() );
				result.m_answers.reserve( success.m_answers.size() );
				for( const auto & answer : success.m_answers )
					result.m_answers.push_back( make_answer_record(
							request.m_question.m_qname, ttl, answer ) );

				return result;
			},
			[&]( const services::format_error_t & ) {
				return make_name_error( request, q );
			},
			[&]( const services::resolution_error_t & ) {
				return make_name_error( request, q );
			},
			[&]( const services::no_such_zone_t & ) {
				return make_name_error( request, q );
			},
			[&]( const services::upstream_error_t & ) {
				return make_server_failure( request );
			},
			[&]( const services::internal_error_t & ) {
				return make_server_failure( request );
			}
		},
		outcome );
}

dns::response_message_t
assembler_t::make_server_failure(
	const dns::query_message_t & request )
{
	return make_base_response( request, dns::rcode_values::server_failure );
}

dns::response_message_t
assembler_t::make_format_error(
	const dns::dns_header_t & request_header )
{
	dns::response_message_t result;
	result.m_request_header = request_header;
	result.m_rcode = dns::rcode_values::format_error;

	return result;
}

dns::response_message_t
assembler_t::make_name_error(
	const dns::query_message_t & request,
	const ::dnstoys::query::query_t & q ) const
{
	auto result = make_base_response( request, dns::rcode_values::name_error );

	const auto ttl = static_cast< oess_2::uint_t >( error_ttl.count() );

	dns::dns_resource_record_t soa;
	soa.m_name = dns::dns_format_name_t{ q.m_zone };
	soa.m_type = dns::qtype_values::SOA;
	soa.m_ttl = ttl;
	soa.m_resource_data = dns::dns_resource_record_tools::make_soa_rdata(
			dns::dns_resource_record_tools::soa_params_t{
				m_domain,
				m_hostmaster,
				1u,
				ttl,
				ttl,
				ttl,
				ttl
			} );

	result.m_authority.push_back( std::move(soa) );

	return result;
}

} /* namespace dnstoys::response */
