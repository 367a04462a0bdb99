/*!
 * @file
 * @brief Helper function that throws an exception if some
 * system call returns an error.
 */

#pragma once

#include <dnstoys/exception.hpp>

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace dnstoys::utils
{

inline void
ensure_successful_syscall( int ret_code, std::string_view what )
{
	if( -1 == ret_code )
	{
		const auto error_code = errno;
		std::string description{ what };
		description += ": failed -> ";
		description += std::system_category().message( error_code );

		throw exception_t{ description };
	}
}

} /* namespace dnstoys::utils */
