/*!
 * @file
 * @brief Results of query processing by services.
 */

#pragma once

#include <dnstoys/query/parsers.hpp>

#include <asio/ip/address.hpp>

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace dnstoys::services
{

//
// txt_record_t
//
//! Content for a TXT record. Every item is a separate character-string.
struct txt_record_t
{
	std::vector< std::string > m_strings;
};

//! A single answer: a text or an IP-address.
using answer_t = std::variant< txt_record_t, asio::ip::address >;

//
// successful_outcome_t
//
struct successful_outcome_t
{
	std::vector< answer_t > m_answers;

	//! TTL for all answers.
	std::chrono::seconds m_ttl;
};

//! The query doesn't match the grammar of the service.
using format_error_t = ::dnstoys::query::format_error_t;

//! A place name can't be resolved.
struct resolution_error_t
{
	std::string m_description;
};

//! An upstream service is unreachable or has failed.
struct upstream_error_t
{
	std::string m_description;
};

//! An unexpected failure during the processing.
struct internal_error_t
{
	std::string m_description;
};

//! There is no service for the zone.
struct no_such_zone_t {};

using outcome_t = std::variant<
		successful_outcome_t,
		format_error_t,
		resolution_error_t,
		upstream_error_t,
		internal_error_t,
		no_such_zone_t >;

//! TTL for answers those are computed for every query.
inline constexpr std::chrono::seconds dynamic_answer_ttl{ 1 };

//! TTL for static answers (help).
inline constexpr std::chrono::seconds static_answer_ttl{ 3600 };

} /* namespace dnstoys::services */
