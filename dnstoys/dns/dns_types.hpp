/*!
 * @file
 * @brief Various tools for working with DNS-related data.
 */
#pragma once

#include <dnstoys/utils/string_algo.hpp>

#include <oess_2/defs/h/types.hpp>
#include <oess_2/io/h/stream.hpp>
#include <oess_2/io/h/fixed_mem_buf.hpp>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dnstoys::dns {

//
// max_udp_message_size
//
// See https://tools.ietf.org/html/rfc1035 section 4.2.1.
inline constexpr std::size_t max_udp_message_size = 512u;

namespace rcode_values {

	inline constexpr unsigned int ok = 0;
	inline constexpr unsigned int format_error = 1;
	inline constexpr unsigned int server_failure = 2;
	inline constexpr unsigned int name_error = 3;
	inline constexpr unsigned int not_implemented = 4;
	inline constexpr unsigned int refused = 5;

} /* namespace rcode_values */

//
// dns_header_t
//

/*!
                                    1  1  1  1  1  1
      0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                      ID                       |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |QR|   Opcode  |AA|TC|RD|RA|   Z    |   RCODE   |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                    QDCOUNT                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                    ANCOUNT                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                    NSCOUNT                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                    ARCOUNT                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

*/
struct dns_header_t
{
	//! Size of the header in the binary form.
	static constexpr std::size_t wire_size = 12u;

	enum
	{
		REQUEST = 0,
		RESPONSE = 1
	};

	oess_2::ushort_t m_id{};
	oess_2::ushort_t m_flags{};
	oess_2::ushort_t m_qdcount{};
	oess_2::ushort_t m_ancount{};
	oess_2::ushort_t m_nscount{};
	oess_2::ushort_t m_arcount{};

	oess_2::io::istream_t &
	read_from( oess_2::io::istream_t & i )
	{
		i
			>> m_id
			>> m_flags
			>> m_qdcount
			>> m_ancount
			>> m_nscount
			>> m_arcount;

		return i;
	}

	oess_2::io::ostream_t &
	write_to( oess_2::io::ostream_t & o ) const
	{
		o
			<< m_id
			<< m_flags
			<< m_qdcount
			<< m_ancount
			<< m_nscount
			<< m_arcount;

		return o;
	}

	void
	set_qr( int qr ) noexcept
	{
		if( qr == RESPONSE )
			m_flags |= 0x8000;
		else
			m_flags &= ~(0x8000);
	}

	[[nodiscard]]
	int
	qr() const noexcept
	{
		return m_flags & 0x8000? RESPONSE: REQUEST;
	}

	//! Opcode as a number from 0 to 15.
	[[nodiscard]]
	unsigned int
	opcode() const noexcept
	{
		return (m_flags & 0x7800u) >> 11;
	}

	void
	set_opcode( unsigned int v ) noexcept
	{
		m_flags = static_cast< oess_2::ushort_t >(
				(m_flags & ~(0x7800u)) | ((v & 0xFu) << 11) );
	}

	void
	set_aa( bool val ) noexcept
	{
		val? m_flags |= 0x400: m_flags &= ~(0x400);
	}

	[[nodiscard]]
	bool
	aa() const noexcept
	{
		return m_flags & 0x400;
	}

	void
	set_tc( bool val ) noexcept
	{
		val? m_flags |= 0x200: m_flags &= ~(0x200);
	}

	[[nodiscard]]
	bool
	tc() const noexcept
	{
		return m_flags & 0x200;
	}

	void
	set_rd( bool val ) noexcept
	{
		val? m_flags |= 0x100: m_flags &= ~(0x100);
	}

	[[nodiscard]]
	bool
	rd() const noexcept
	{
		return m_flags & 0x100;
	}

	[[nodiscard]]
	bool
	ra() const noexcept
	{
		return m_flags & 0x80;
	}

	void
	set_rcode( unsigned int v ) noexcept
	{
		m_flags = static_cast< oess_2::ushort_t >(
				(m_flags & ~(0xFu)) | (v & 0xFu) );
	}

	[[nodiscard]]
	unsigned int
	rcode() const noexcept
	{
		return m_flags & 0xF;
	}
};

inline oess_2::io::istream_t &
operator >> ( oess_2::io::istream_t & i, dns_header_t & h )
{
	return h.read_from( i );
}

inline oess_2::io::ostream_t &
operator << ( oess_2::io::ostream_t & o, const dns_header_t & h )
{
	return h.write_to( o );
}

//! Helper class for converting resource name in human-readable
//! form like mumbai.time into internal representation like 6mumbai4time0.
class dns_format_name_t
{
public :
	// The maximum allowed length.
	// See: https://blogs.msdn.microsoft.com/oldnewthing/20120412-00/?p=7873
	static constexpr std::size_t max_length = 254u;
	static constexpr std::size_t max_label_length = 63;

	struct already_translated_value_t
	{
		std::string m_value;
	};

	dns_format_name_t()
		:	dns_format_name_t( std::string_view{} )
	{}

	dns_format_name_t( std::string_view value )
		:	m_value( translate( value ) )
	{}

	dns_format_name_t( already_translated_value_t v ) noexcept
		:	m_value( std::move(v.m_value) )
	{}

	[[nodiscard]]
	const std::string &
	raw_value() const noexcept
	{
		return m_value;
	}

	//! Size of the name in the binary form.
	[[nodiscard]]
	std::size_t
	wire_size() const noexcept
	{
		return m_value.size();
	}

	//! Make human-readable form of the name without the trailing dot.
	/*!
	 * The root name is represented as an empty string.
	 */
	[[nodiscard]]
	std::string
	to_dotted() const
	{
		std::string result;
		result.reserve( m_value.size() );

		std::size_t i{};
		while( i < m_value.size() )
		{
			const std::size_t label_size = static_cast<unsigned char>(m_value[i]);
			if( 0u == label_size )
				break;

			if( !result.empty() )
				result += '.';
			result.append( m_value, i + 1u, label_size );
			i += 1u + label_size;
		}

		return result;
	}

	[[nodiscard]]
	friend bool
	operator==(
		const dns_format_name_t & a,
		const dns_format_name_t & b ) noexcept
	{
		return a.raw_value() == b.raw_value();
	}

	[[nodiscard]]
	friend bool
	operator!=(
		const dns_format_name_t & a,
		const dns_format_name_t & b ) noexcept
	{
		return a.raw_value() != b.raw_value();
	}

	static void
	ensure_valid_length( std::string_view v )
	{
		if( v.size() > max_length )
			throw std::invalid_argument{ "dns_format_name_t: length too long" };
	}

private :
	std::string m_value;

	[[nodiscard]]
	static std::string
	translate( std::string_view src )
	{
		ensure_valid_length( src );

		// If src is empty then src_end_index will be 0.
		// If src is "time." then src_end_index will be 4 (skip the ending '.').
		const std::size_t src_end_index = src.empty() ? 0u :
			( '.' == *src.rbegin() ? src.size() - 1u : src.size() );

		std::string result;
		result.reserve( src_end_index + 2u );

		// Every dot found should open a non-empty label.
		bool expects_next_label = false;

		for( std::size_t i{}; i < src_end_index; )
		{
			// Position where the actual length should be stored.
			const auto label_size_index = result.size();
			std::size_t label_size = 0;
			result += '\0';

			bool dot_found = false;
			for(; i < src_end_index && !dot_found; ++i )
			{
				if( '.' == src[i] )
				{
					dot_found = true;
				}
				else
				{
					result += src[i];
					++label_size;
				}
			}

			if( 0 == label_size )
				throw std::invalid_argument{ "empty label is found" };
			if( max_label_length < label_size )
				throw std::invalid_argument{
						fmt::format( "too long label is found, length={}",
								label_size )
				};

			result[ label_size_index ] = static_cast< char >( label_size );

			expects_next_label = dot_found;
		}

		if( expects_next_label )
			throw std::invalid_argument{ "empty label is found" };

		result += '\0';

		return result;
	}
};

/*!
 * Helpers for loading DNS-names from binary PDU already loaded
 * into the memory.
 */
namespace dns_format_name_tools
{

struct name_terminator_t {};

struct name_length_t
{
	oess_2::uchar_t m_length;
};

struct reference_offset_t
{
	oess_2::ushort_t m_offset;
};

//! The result of extraction length byte.
using load_size_byte_result_t = std::variant<
		name_terminator_t,
		name_length_t,
		reference_offset_t
	>;

[[nodiscard]]
inline load_size_byte_result_t
load_size_byte( oess_2::io::istream_t & i )
{
	oess_2::uchar_t size_byte;
	i >> size_byte;

	// If two most significant bits are set then it is a reference
	// to the place where a name is located.
	if( size_byte & 0xC0 )
	{
		oess_2::uchar_t second_offset_byte;
		i >> second_offset_byte;

		return reference_offset_t{
				static_cast<oess_2::ushort_t>(
						((static_cast< oess_2::ushort_t >( size_byte ) & 0x3Fu) << 8)
						+second_offset_byte
				)
		};
	}
	else if( size_byte == '\0' )
		return name_terminator_t{};
	else
		return name_length_t{ size_byte };
}

inline void
load_next_label(
	oess_2::io::istream_t & from,
	std::size_t label_size,
	std::string & to )
{
	const auto old_size = to.size();
	to.resize( old_size + label_size + 1 /* the length byte */ );
	to[ old_size ] = static_cast<char>(label_size);
	from.read( &to[ old_size+1 ], label_size );
}

void
read_from_memory_buffer_impl(
	unsigned int references_recursion_deep,
	std::string_view all_buffer,
	oess_2::io::istream_t & stream,
	std::string & to );

inline void
read_reference_from_memory_buffer_impl(
	unsigned int references_recursion_deep,
	// This should be a buffer that starts with DNS-header.
	std::string_view all_buffer,
	std::size_t offset,
	std::string & to )
{
	if( offset >= all_buffer.size() )
		throw std::invalid_argument{
				fmt::format( "name reference points outside of the package, "
						"offset={}, package_size={}",
						offset, all_buffer.size() )
		};

	oess_2::io::ifixed_mem_buf_t ibuf( all_buffer.data(), all_buffer.size() );

	ibuf.shift_bytes( offset );

	read_from_memory_buffer_impl(
			references_recursion_deep + 1,
			all_buffer,
			ibuf,
			to );
}

/*!
 * @brief Implementation of loading of DNS-name from PDU located in memory.
 *
 * The deep of reference recursion is controlled. If that deep becomes
 * too big then an exception is thrown.
 */
inline void
read_from_memory_buffer_impl(
	unsigned int references_recursion_deep,
	std::string_view all_buffer,
	oess_2::io::istream_t & stream,
	std::string & to )
{
	// Because every reference adds at least two octets then the max
	// count of references can be 127 (254/2).
	if( references_recursion_deep > 127u )
		throw std::invalid_argument{
			"read_from_memory_buffer_impl: reference recursion too deep"
		};

	bool continue_loop = true;
	do
	{
		continue_loop = std::visit(
				::dnstoys::utils::overloaded{
					[&]( const reference_offset_t & res ) {
						read_reference_from_memory_buffer_impl(
								references_recursion_deep,
								all_buffer,
								res.m_offset,
								to );
						return false;
					},
					[&]( const name_length_t & res ) {
						load_next_label( stream, res.m_length, to );
						dns_format_name_t::ensure_valid_length( to );
						return true;
					},
					[&]( const name_terminator_t & ) {
						to += '\0';
						return false;
					}
				},
				load_size_byte( stream ) );
	} while( continue_loop );
}

inline oess_2::io::ostream_t &
write_to( oess_2::io::ostream_t & o, const dns_format_name_t & name )
{
	o.write( name.raw_value().data(), name.raw_value().size() );

	return o;
}

class from_memory_t
{
	std::string_view m_all_buffer;
	dns_format_name_t & m_what;

public :
	from_memory_t(
		std::string_view all_buffer,
		dns_format_name_t & what )
		:	m_all_buffer( all_buffer )
		,	m_what( what )
	{}

	friend inline oess_2::io::istream_t &
	operator>>( oess_2::io::istream_t & i, from_memory_t && n )
	{
		std::string value;
		read_from_memory_buffer_impl( 0u, n.m_all_buffer, i, value );
		n.m_what = dns_format_name_t{
				dns_format_name_t::already_translated_value_t{ std::move(value) }
		};

		return i;
	}
};

} /* namespace dns_format_name_tools */

[[nodiscard]]
inline dns_format_name_tools::from_memory_t
from_memory(
	std::string_view all_buffer,
	dns_format_name_t & name )
{
	return dns_format_name_tools::from_memory_t( all_buffer, name );
}

inline oess_2::io::ostream_t &
operator << ( oess_2::io::ostream_t & o, const dns_format_name_t & n )
{
	return dns_format_name_tools::write_to( o, n );
}

namespace qtype_values
{
	inline constexpr oess_2::ushort_t A = 1;
	inline constexpr oess_2::ushort_t NS = 2;
	inline constexpr oess_2::ushort_t SOA = 6;
	inline constexpr oess_2::ushort_t TXT = 16;
	inline constexpr oess_2::ushort_t AAAA = 28;
	inline constexpr oess_2::ushort_t ANY = 255;
}

namespace qclass_values
{
	inline constexpr oess_2::ushort_t IN = 1;
}

//
// dns_question_t
//

/*!
                                    1  1  1  1  1  1
      0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                                               |
    /                     QNAME                     /
    /                                               /
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                     QTYPE                     |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                     QCLASS                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
*/
struct dns_question_t
{
	dns_question_t()
	{}

	dns_question_t(
		std::string_view name,
		oess_2::ushort_t qtype,
		oess_2::ushort_t qclass )
		: m_qname{ name }
		, m_qtype{ qtype }
		, m_qclass{ qclass }
	{}

	dns_format_name_t m_qname;
	oess_2::ushort_t m_qtype{};
	oess_2::ushort_t m_qclass{};

	[[nodiscard]]
	std::size_t
	wire_size() const noexcept
	{
		return m_qname.wire_size() + 4u;
	}

	oess_2::io::ostream_t &
	write_to( oess_2::io::ostream_t & o ) const
	{
		o
			<< m_qname
			<< m_qtype
			<< m_qclass;

		return o;
	}

};

namespace dns_question_tools
{

class from_memory_t
{
	std::string_view m_all_buffer;
	dns_question_t & m_what;

public :
	from_memory_t(
		std::string_view all_buffer,
		dns_question_t & what )
		:	m_all_buffer( all_buffer )
		,	m_what( what )
	{}

	friend inline oess_2::io::istream_t &
	operator>>( oess_2::io::istream_t & i, from_memory_t && n )
	{
		i
			>> ::dnstoys::dns::from_memory( n.m_all_buffer, n.m_what.m_qname )
			>> n.m_what.m_qtype
			>> n.m_what.m_qclass;

		return i;
	}
};

} /* namespace dns_question_tools */

[[nodiscard]]
inline dns_question_tools::from_memory_t
from_memory(
	std::string_view all_buffer,
	dns_question_t & q )
{
	return dns_question_tools::from_memory_t( all_buffer, q );
}

inline oess_2::io::ostream_t &
operator << ( oess_2::io::ostream_t & o, const dns_question_t & q )
{
	return q.write_to( o );
}

//
// dns_resource_record_t
//

/*!
                                    1  1  1  1  1  1
      0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                                               |
    /                                               /
    /                      NAME                     /
    |                                               |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                      TYPE                     |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                     CLASS                     |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                      TTL                      |
    |                                               |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
    |                   RDLENGTH                    |
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--|
    /                     RDATA                     /
    /                                               /
    +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

The content of RDATA is already in the binary form.
*/
struct dns_resource_record_t
{
	dns_format_name_t m_name;
	oess_2::ushort_t m_type{};
	oess_2::ushort_t m_class{ qclass_values::IN };
	oess_2::uint_t m_ttl{};
	std::string m_resource_data;

	[[nodiscard]]
	std::size_t
	wire_size() const noexcept
	{
		return m_name.wire_size() + 10u + m_resource_data.size();
	}

	oess_2::io::ostream_t &
	write_to( oess_2::io::ostream_t & o ) const
	{
		o
			<< m_name
			<< m_type
			<< m_class
			<< m_ttl
			<< static_cast< oess_2::ushort_t >( m_resource_data.size() );
		o.write( m_resource_data.data(), m_resource_data.size() );

		return o;
	}

};

inline oess_2::io::ostream_t &
operator << ( oess_2::io::ostream_t & o, const dns_resource_record_t & rr )
{
	return rr.write_to( o );
}

/*!
 * Helpers for making RDATA of the record types produced by dnstoys.
 */
namespace dns_resource_record_tools
{

//! Max length of a single character-string inside TXT record.
inline constexpr std::size_t max_character_string_length = 255u;

inline void
append_ushort( std::string & to, oess_2::ushort_t v )
{
	to += static_cast< char >( (v >> 8) & 0xFFu );
	to += static_cast< char >( v & 0xFFu );
}

inline void
append_uint( std::string & to, oess_2::uint_t v )
{
	append_ushort( to, static_cast< oess_2::ushort_t >( (v >> 16) & 0xFFFFu ) );
	append_ushort( to, static_cast< oess_2::ushort_t >( v & 0xFFFFu ) );
}

/*!
 * @brief Make RDATA for TXT record.
 *
 * Every item becomes a separate character-string. Items longer than
 * 255 bytes are split into several character-strings.
 */
[[nodiscard]]
inline std::string
make_txt_rdata( const std::vector< std::string > & items )
{
	std::string result;

	for( std::string_view item : items )
	{
		do
		{
			const auto piece = item.substr( 0u, max_character_string_length );
			result += static_cast< char >( piece.size() );
			result.append( piece.data(), piece.size() );
			item.remove_prefix( piece.size() );
		}
		while( !item.empty() );
	}

	return result;
}

[[nodiscard]]
inline std::string
make_a_rdata( const asio::ip::address_v4 & address )
{
	const auto bytes = address.to_bytes();
	return std::string( bytes.begin(), bytes.end() );
}

[[nodiscard]]
inline std::string
make_aaaa_rdata( const asio::ip::address_v6 & address )
{
	const auto bytes = address.to_bytes();
	return std::string( bytes.begin(), bytes.end() );
}

//
// soa_params_t
//
struct soa_params_t
{
	std::string_view m_mname;
	std::string_view m_rname;
	oess_2::uint_t m_serial{ 1u };
	oess_2::uint_t m_refresh{};
	oess_2::uint_t m_retry{};
	oess_2::uint_t m_expire{};
	oess_2::uint_t m_minimum{};
};

[[nodiscard]]
inline std::string
make_soa_rdata( const soa_params_t & params )
{
	std::string result = dns_format_name_t{ params.m_mname }.raw_value();
	result += dns_format_name_t{ params.m_rname }.raw_value();

	append_uint( result, params.m_serial );
	append_uint( result, params.m_refresh );
	append_uint( result, params.m_retry );
	append_uint( result, params.m_expire );
	append_uint( result, params.m_minimum );

	return result;
}

} /* namespace dns_resource_record_tools */

} /* namespace dnstoys::dns */
