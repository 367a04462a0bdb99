/*!
 * @file
 * @brief Version of dnstoys.
 */

#pragma once

#include <string_view>

namespace dnstoys
{

inline constexpr std::string_view version{ "0.3.1" };

//! Value of User-Agent header for requests to upstream services.
inline constexpr std::string_view user_agent{ "dnstoys/0.3.1" };

} /* namespace dnstoys */
