/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#pragma once

#include <dnstoys/exception.hpp>

#include <spdlog/spdlog.h>

#include <asio/ip/address.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace dnstoys
{

//
// server_config_t
//
/*!
 * @brief Parameters of the DNS server itself.
 */
struct server_config_t
{
	//! Type for UDP-port.
	using port_t = std::uint16_t;

	//! The domain name under which the server is known.
	/*!
	 * It is used in help messages and as User-Agent for requests
	 * to upstream services.
	 */
	std::string m_domain;

	//! IP-address for incoming UDP packages.
	asio::ip::address m_ip{ asio::ip::address_v4::any() };

	//! UDP-port for incoming UDP packages.
	port_t m_port{ 53u };
};

//
// timezones_config_t
//
struct timezones_config_t
{
	bool m_enabled{ false };

	//! Path to geonames dataset.
	/*!
	 * It is required if timezones or weather service is enabled.
	 */
	std::filesystem::path m_geo_filepath;
};

//
// fx_config_t
//
struct fx_config_t
{
	bool m_enabled{ false };

	//! Key for openexchangerates.org API.
	std::string m_api_key;

	//! Period of updates of exchange rates.
	std::chrono::milliseconds m_refresh_interval{ std::chrono::hours{6} };

	//! Max time for one attempt to get exchange rates.
	std::chrono::milliseconds m_fetch_timeout{ std::chrono::seconds{10} };
};

//
// myip_config_t
//
struct myip_config_t
{
	bool m_enabled{ false };
};

//
// weather_config_t
//
struct weather_config_t
{
	bool m_enabled{ false };

	//! Max count of places for those forecasts are cached.
	std::size_t m_max_entries{ 1000u };

	//! Lifetime of a cached forecast.
	std::chrono::milliseconds m_cache_ttl{ std::chrono::hours{1} };

	//! Max time for one request to the weather service.
	std::chrono::milliseconds m_fetch_timeout{ std::chrono::seconds{3} };
};

//
// config_t
//
/*!
 * @brief The whole configuration of dnstoys.
 *
 * An instance is created once at the startup and then parts of it
 * are passed to components via their parameters.
 */
struct config_t
{
	//! Logging level to be used.
	spdlog::level::level_enum m_log_level{ spdlog::level::info };

	server_config_t m_server;

	timezones_config_t m_timezones;

	fx_config_t m_fx;

	myip_config_t m_myip;

	weather_config_t m_weather;

	//! Count of worker threads for processing of incoming queries.
	std::size_t m_query_processor_threads{ 4u };

	//! Count of worker threads for queries to zones that use
	//! data from upstream services (like `weather`).
	std::size_t m_upstream_query_processor_threads{ 4u };

	//! Is the geonames dataset necessary for the enabled services?
	[[nodiscard]]
	bool
	needs_geo_index() const noexcept
	{
		return m_timezones.m_enabled || m_weather.m_enabled;
	}
};

// For logging purposes.
std::ostream &
operator<<( std::ostream & to, const config_t & cfg );

//
// config_parser_t
//
/*!
 * @brief Parser for the configuration file.
 *
 * The config is a set of lines in the form:
 * @code
 * <key> <value>
 * @endcode
 * Lines started with '#' are comments. Empty lines are ignored.
 *
 * For example:
 * @code
 * # Common settings.
 * server.domain dns.example.org
 * server.address :53
 *
 * timezones.enabled true
 * timezones.geo_filepath /var/lib/dnstoys/cities15000.txt
 *
 * weather.enabled true
 * weather.max_entries 1000
 * weather.cache_ttl 1h
 * @endcode
 *
 * The parser also checks that all values required by the enabled
 * services are present.
 */
class config_parser_t
{
public:
	//! Type of exception for parsing errors.
	class parser_exception_t : public config_error_t
	{
	public:
		parser_exception_t( const std::string & what );
	};

	config_parser_t();
	~config_parser_t();

	//! Parse the content of the config.
	/*!
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( std::string_view content );

	//! Parse several configs as one.
	/*!
	 * Contents are processed in the order, so a value from a later
	 * content overrides the same value from an earlier one.
	 * The presence of required values is checked at the end.
	 *
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( const std::vector< std::string_view > & contents );

private:
	struct impl_t;

	std::unique_ptr<impl_t> m_impl;
};

/*!
 * @brief Helper for loading and parsing a config file.
 *
 * @throw config_error_t if the file can't be loaded or parsed.
 */
[[nodiscard]]
config_t
load_config( const std::filesystem::path & file_name );

/*!
 * @brief Helper for loading and parsing several config files.
 *
 * Values from later files override values from earlier ones.
 *
 * @throw config_error_t if a file can't be loaded or parsed.
 */
[[nodiscard]]
config_t
load_config( const std::vector< std::filesystem::path > & file_names );

} /* namespace dnstoys */
