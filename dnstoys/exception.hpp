/*!
 * @file
 * @brief The base classes for exceptions.
 */

#pragma once

#include <stdexcept>

namespace dnstoys
{

/*!
 * @brief The base class for all exceptions thrown by dnstoys's code.
 */
class exception_t : public std::runtime_error
{
public:
	// Inherit constructors from the base class.
	using std::runtime_error::runtime_error;
};

/*!
 * @brief An exception for fatal startup problems.
 *
 * Thrown when a required configuration parameter is missing or a
 * data source required by an enabled service can't be loaded.
 * The application can't start if such an exception is thrown.
 */
class config_error_t : public exception_t
{
public:
	using exception_t::exception_t;
};

} /* namespace dnstoys */
