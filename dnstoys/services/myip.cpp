/*!
 * @file
 * @brief Service that returns the address of the requester.
 */

#include <dnstoys/services/myip.hpp>

namespace dnstoys::services
{

outcome_t
myip_handler_t::handle( const ::dnstoys::query::query_t & q ) const
{
	auto parse_result = ::dnstoys::query::parse_myip_query( q );
	if( auto * err = std::get_if< format_error_t >( &parse_result ) )
		return std::move(*err);

	auto address = std::get< ::dnstoys::query::myip_params_t >(
			parse_result ).m_requester;
	if( address.is_v6() && address.to_v6().is_v4_mapped() )
		address = asio::ip::make_address_v4(
				asio::ip::v4_mapped, address.to_v6() );

	return successful_outcome_t{ { answer_t{ address } }, dynamic_answer_ttl };
}

} /* namespace dnstoys::services */
