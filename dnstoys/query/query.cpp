/*!
 * @file
 * @brief Representation of an incoming query.
 */

#include <dnstoys/query/query.hpp>

#include <dnstoys/utils/string_algo.hpp>

namespace dnstoys::query
{

query_t
make_query(
	std::string_view qname,
	asio::ip::address requester )
{
	query_t result;
	result.m_requester = std::move(requester);

	if( !qname.empty() && '.' == qname.back() )
		qname.remove_suffix( 1u );

	result.m_qname = ::dnstoys::utils::to_lower_copy( qname );
	if( result.m_qname.empty() )
		return result;

	for( const auto label : ::dnstoys::utils::split( result.m_qname, '.' ) )
		result.m_labels.emplace_back( label );

	result.m_zone = std::move( result.m_labels.back() );
	result.m_labels.pop_back();

	return result;
}

} /* namespace dnstoys::query */
