/*!
 * @file
 * @brief Exceptions for interaction with upstream services.
 */

#pragma once

#include <dnstoys/exception.hpp>

namespace dnstoys::upstream
{

//
// https_error_t
//
//! Exception to be thrown in the case of HTTPS request failure.
class https_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

//
// payload_error_t
//
//! Exception to be thrown if the response of a service can't be parsed.
class payload_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

} /* namespace dnstoys::upstream */
