/*!
 * @file
 * @brief Simple HTTPS client for requests to upstream services.
 */

#pragma once

#include <dnstoys/upstream/exceptions.hpp>

#include <chrono>
#include <string>

namespace dnstoys::upstream
{

//
// https_request_t
//
struct https_request_t
{
	//! Host name. It's also used for SNI and certificate verification.
	std::string m_host;

	//! Target of the request (path with the query string).
	std::string m_target;

	//! Value for User-Agent header.
	std::string m_user_agent;

	//! Max time for the whole request (including DNS lookup and TLS
	//! handshake).
	std::chrono::milliseconds m_timeout;
};

/*!
 * @brief Perform HTTPS GET request and return the body of the response.
 *
 * The request is performed synchronously on the caller's thread.
 * The server's certificate is verified against the system store.
 *
 * @throw https_error_t if the request fails, the timeout elapses or
 * the status of the response isn't 2xx.
 */
[[nodiscard]]
std::string
https_get( const https_request_t & request );

} /* namespace dnstoys::upstream */
