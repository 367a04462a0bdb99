#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN 
#include <doctest/doctest.h>

#include <dnstoys/config.hpp>

using namespace std::string_view_literals;
using namespace std::chrono_literals;

TEST_CASE("minimalistic config") {
	using namespace dnstoys;

	config_parser_t parser;

	{
		const auto what = 
R"(
# This is a comment
				
	# This is an another comment

server.domain dns.example.org
server.address :53
				)"sv;

		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( what ) );

		REQUIRE( spdlog::level::info == cfg.m_log_level );
		REQUIRE( "dns.example.org" == cfg.m_server.m_domain );
		REQUIRE( asio::ip::make_address( "0.0.0.0" ) == cfg.m_server.m_ip );
		REQUIRE( 53u == cfg.m_server.m_port );

		REQUIRE( !cfg.m_timezones.m_enabled );
		REQUIRE( !cfg.m_fx.m_enabled );
		REQUIRE( !cfg.m_myip.m_enabled );
		REQUIRE( !cfg.m_weather.m_enabled );
		REQUIRE( !cfg.needs_geo_index() );

		REQUIRE( 4u == cfg.m_query_processor_threads );
		REQUIRE( 4u == cfg.m_upstream_query_processor_threads );
	}
}

TEST_CASE("empty config") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto what = 
R"(
# Only comments here.
)"sv;

	REQUIRE_THROWS_AS( (void)parser.parse( what ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("log_level") {
	using namespace dnstoys;

	config_parser_t parser;

	{
		const auto what = 
R"(
log_level debug
server.domain dns.example.org
server.address :53
)"sv;

		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( what ) );

		REQUIRE( spdlog::level::debug == cfg.m_log_level );
	}

	{
		const auto what = 
R"(
log_level verbose
server.domain dns.example.org
server.address :53
)"sv;

		REQUIRE_THROWS_AS( (void)parser.parse( what ),
				config_parser_t::parser_exception_t );
	}
}

TEST_CASE("server.address") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto make_config = []( std::string_view address ) {
		return "server.domain dns.example.org\nserver.address " +
				std::string{ address } + "\n";
	};

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( make_config( "127.0.0.1:5354" ) ) );

		REQUIRE( asio::ip::make_address( "127.0.0.1" ) == cfg.m_server.m_ip );
		REQUIRE( 5354u == cfg.m_server.m_port );
	}

	{
		config_t cfg;
		REQUIRE_NOTHROW( cfg = parser.parse( make_config( "[::1]:53" ) ) );

		REQUIRE( asio::ip::make_address( "::1" ) == cfg.m_server.m_ip );
		REQUIRE( 53u == cfg.m_server.m_port );
	}

	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "127.0.0.1" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( ":0" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "127.0.0:53" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( ":70000" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("unknown command") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto what = 
R"(
server.domain dns.example.org
server.address :53
weather.cities 100
)"sv;

	REQUIRE_THROWS_WITH( (void)parser.parse( what ),
			"unknown command weather.cities at line 4" );
}

TEST_CASE("all services") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto what = 
R"(
server.domain dns.example.org
server.address :5353

timezones.enabled true
timezones.geo_filepath /var/lib/dnstoys/cities15000.txt

fx.enabled yes
fx.api_key 0123456789abcdef
fx.refresh_interval 30min
fx.fetch_timeout 2500ms

myip.enabled on

weather.enabled TRUE
weather.max_entries 200
weather.cache_ttl 2h
weather.fetch_timeout 5

query_processor.threads 8
upstream_query_processor.threads 2
)"sv;

	config_t cfg;
	REQUIRE_NOTHROW( cfg = parser.parse( what ) );

	REQUIRE( 5353u == cfg.m_server.m_port );

	REQUIRE( cfg.m_timezones.m_enabled );
	REQUIRE( "/var/lib/dnstoys/cities15000.txt" ==
			cfg.m_timezones.m_geo_filepath.string() );

	REQUIRE( cfg.m_fx.m_enabled );
	REQUIRE( "0123456789abcdef" == cfg.m_fx.m_api_key );
	REQUIRE( 30min == cfg.m_fx.m_refresh_interval );
	REQUIRE( 2500ms == cfg.m_fx.m_fetch_timeout );

	REQUIRE( cfg.m_myip.m_enabled );

	REQUIRE( cfg.m_weather.m_enabled );
	REQUIRE( 200u == cfg.m_weather.m_max_entries );
	REQUIRE( 2h == cfg.m_weather.m_cache_ttl );
	REQUIRE( 5s == cfg.m_weather.m_fetch_timeout );

	REQUIRE( 8u == cfg.m_query_processor_threads );
	REQUIRE( 2u == cfg.m_upstream_query_processor_threads );
	REQUIRE( cfg.needs_geo_index() );
}

TEST_CASE("defaults for fetch timeouts") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto what = 
R"(
server.domain dns.example.org
server.address :53
fx.enabled true
fx.api_key key
fx.refresh_interval 6h
)"sv;

	config_t cfg;
	REQUIRE_NOTHROW( cfg = parser.parse( what ) );

	REQUIRE( 6h == cfg.m_fx.m_refresh_interval );
	REQUIRE( 10s == cfg.m_fx.m_fetch_timeout );
	REQUIRE( 3s == cfg.m_weather.m_fetch_timeout );
}

TEST_CASE("required values") {
	using namespace dnstoys;

	config_parser_t parser;

	{
		const auto what = 
R"(
server.address :53
)"sv;

		REQUIRE_THROWS_WITH( (void)parser.parse( what ),
				"required value server.domain is not specified" );
	}

	{
		// geo_filepath is required for weather too.
		const auto what = 
R"(
server.domain dns.example.org
server.address :53
weather.enabled true
weather.max_entries 100
weather.cache_ttl 1h
)"sv;

		REQUIRE_THROWS_WITH( (void)parser.parse( what ),
				"required value timezones.geo_filepath is not specified" );
	}

	{
		const auto what = 
R"(
server.domain dns.example.org
server.address :53
fx.enabled true
fx.refresh_interval 6h
)"sv;

		REQUIRE_THROWS_WITH( (void)parser.parse( what ),
				"required value fx.api_key is not specified" );
	}

	{
		// Values for disabled services aren't required.
		const auto what = 
R"(
server.domain dns.example.org
server.address :53
fx.enabled false
weather.enabled off
)"sv;

		REQUIRE_NOTHROW( (void)parser.parse( what ) );
	}
}

TEST_CASE("invalid values") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto make_config = []( std::string_view line ) {
		return "server.domain dns.example.org\nserver.address :53\n" +
				std::string{ line } + "\n";
	};

	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "myip.enabled maybe" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "fx.refresh_interval 0" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "fx.refresh_interval 10m" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "weather.max_entries 0" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "weather.max_entries -1" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "query_processor.threads 0" ) ),
			config_parser_t::parser_exception_t );
	REQUIRE_THROWS_WITH(
			(void)parser.parse( make_config( "upstream_query_processor.threads 0" ) ),
			"unable to process command upstream_query_processor.threads at line 3: "
			"upstream_query_processor.threads can't be 0" );
	REQUIRE_THROWS_AS( (void)parser.parse( make_config( "fx.api_key" ) ),
			config_parser_t::parser_exception_t );
}

TEST_CASE("several configs") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto common = 
R"(
server.domain dns.example.org
server.address :53
log_level warn

timezones.geo_filepath /var/lib/dnstoys/cities15000.txt

weather.enabled true
weather.max_entries 100
weather.cache_ttl 2h
)"sv;

	const auto local = 
R"(
# Overrides for this host.
server.address 127.0.0.1:5353
weather.cache_ttl 30min
myip.enabled true
)"sv;

	config_t cfg;
	REQUIRE_NOTHROW( cfg = parser.parse(
			std::vector< std::string_view >{ common, local } ) );

	REQUIRE( "dns.example.org" == cfg.m_server.m_domain );
	REQUIRE( asio::ip::make_address( "127.0.0.1" ) == cfg.m_server.m_ip );
	REQUIRE( 5353u == cfg.m_server.m_port );
	REQUIRE( spdlog::level::warn == cfg.m_log_level );

	REQUIRE( cfg.m_weather.m_enabled );
	REQUIRE( 30min == cfg.m_weather.m_cache_ttl );
	REQUIRE( cfg.m_myip.m_enabled );

	// The order matters.
	REQUIRE_NOTHROW( cfg = parser.parse(
			std::vector< std::string_view >{ local, common } ) );
	REQUIRE( asio::ip::make_address( "0.0.0.0" ) == cfg.m_server.m_ip );
	REQUIRE( 53u == cfg.m_server.m_port );
	REQUIRE( 2h == cfg.m_weather.m_cache_ttl );
}

TEST_CASE("several configs: errors") {
	using namespace dnstoys;

	config_parser_t parser;

	const auto common = 
R"(
server.domain dns.example.org
server.address :53
)"sv;

	// Required values can be split between configs.
	REQUIRE_NOTHROW( (void)parser.parse( std::vector< std::string_view >{
			"server.domain dns.example.org\n"sv,
			"server.address :53\n"sv } ) );

	REQUIRE_THROWS_WITH(
			(void)parser.parse( std::vector< std::string_view >{
					common, "\nweather.cities 100\n"sv } ),
			"unknown command weather.cities at line 2 of config #2" );

	REQUIRE_THROWS_AS(
			(void)parser.parse( std::vector< std::string_view >{
					"# nothing\n"sv, "\n"sv } ),
			config_parser_t::parser_exception_t );

	REQUIRE_THROWS_AS(
			(void)parser.parse( std::vector< std::string_view >{
					"server.domain dns.example.org\n"sv,
					"timezones.enabled true\n"sv } ),
			config_parser_t::parser_exception_t );
}
