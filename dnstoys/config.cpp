/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#include <dnstoys/config.hpp>

#include <dnstoys/logging/wrap_logging.hpp>
#include <dnstoys/utils/line_reader.hpp>
#include <dnstoys/utils/load_file_into_memory.hpp>

#include <restinio/helpers/http_field_parsers/basics.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace dnstoys
{

namespace parse_config_impl
{

struct success_t {};

class failure_t
{
	std::string m_description;

public:
	failure_t( std::string description )
		:	m_description{ std::move(description) }
	{}

	[[nodiscard]]
	std::string_view
	description() const noexcept { return { m_description }; }
};

using command_handling_result_t = std::variant< success_t, failure_t >;

class command_handler_t
{
protected :
	template< typename Parser, typename Parsing_Result_Handler >
	[[nodiscard]]
	static command_handling_result_t
	perform_parsing(
		std::string_view content,
		Parser && parser,
		Parsing_Result_Handler && result_handler )
	{
		using namespace restinio::easy_parser;

		auto parse_result = try_parse(
				content,
				std::forward<Parser>(parser) );
		if( !parse_result )
			return failure_t{
					fmt::format( "unable to parse argument: {}",
							make_error_description( parse_result.error(), content ) )
			};
		else
			return result_handler( *parse_result );
	}

public:
	virtual ~command_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const = 0;
};

using command_handler_unique_ptr_t = std::unique_ptr< command_handler_t >;

namespace parsers
{

//
// duration_value_p
//
/*!
 * @brief A producer for easy_parser that extracts durations
 * with possible suffixes (ms, s, min, h).
 *
 * A value without a suffix is treated as seconds.
 */
[[nodiscard]]
static auto
duration_value_p()
{
	struct tmp_value_t
	{
		std::int_least64_t m_count{ 0 };
		std::int_least64_t m_multiplier{ 1000 };
	};

	using namespace restinio::http_field_parsers;

	return produce< std::chrono::milliseconds >(
			produce< tmp_value_t >(
				non_negative_decimal_number_p< std::int_least64_t >()
						>> &tmp_value_t::m_count,
				maybe(
					produce< std::int_least64_t >(
						alternatives(
							exact_p( "min" ) >> just_result( 60'000 ),
							exact_p( "ms" ) >> just_result( 1 ),
							exact_p( "s" ) >> just_result( 1'000 ),
							exact_p( "h" ) >> just_result( 3'600'000 )
						)
					) >> &tmp_value_t::m_multiplier
				)
			)
			>> convert( []( const auto tmp ) {
					std::chrono::milliseconds r{ tmp.m_count };
					return r * tmp.m_multiplier;
				} )
			>> as_result()
		);
}

//
// bool_value_p
//
[[nodiscard]]
static auto
bool_value_p()
{
	using namespace restinio::http_field_parsers;

	return produce< bool >(
			alternatives(
				caseless_exact_p( "true" ) >> just_result( true ),
				caseless_exact_p( "yes" ) >> just_result( true ),
				caseless_exact_p( "on" ) >> just_result( true ),
				caseless_exact_p( "false" ) >> just_result( false ),
				caseless_exact_p( "no" ) >> just_result( false ),
				caseless_exact_p( "off" ) >> just_result( false )
			)
		);
}

//
// raw_address_t
//
//! Textual form of server address before the conversion.
struct raw_address_t
{
	std::string m_ip;
	server_config_t::port_t m_port{};
};

//
// server_address_p
//
/*!
 * @brief A producer for easy_parser that extracts values like
 * `:53`, `127.0.0.1:5354` or `[::1]:53`.
 */
[[nodiscard]]
static auto
server_address_p()
{
	using namespace restinio::http_field_parsers;

	return produce< raw_address_t >(
			maybe(
				alternatives(
					sequence(
						symbol( '[' ),
						produce< std::string >(
							repeat( 1u, N,
								alternatives(
									hexdigit_p() >> to_container(),
									symbol_p( ':' ) >> to_container(),
									symbol_p( '.' ) >> to_container() ) )
						) >> &raw_address_t::m_ip,
						symbol( ']' )
					),
					produce< std::string >(
						repeat( 1u, N,
							alternatives(
								digit_p() >> to_container(),
								symbol_p( '.' ) >> to_container() ) )
					) >> &raw_address_t::m_ip
				)
			),
			symbol( ':' ),
			non_negative_decimal_number_p< server_config_t::port_t >()
					>> &raw_address_t::m_port
		);
}

} /* namespace parsers */

//
// log_level_handler_t
//
/*!
 * @brief Handler for `log_level` command.
 */
class log_level_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			token_p(),
			[&]( const std::string & level_name ) -> command_handling_result_t {
				const auto opt_level =
						::dnstoys::logging::name_to_spdlog_level_enum( level_name );
				if( !opt_level )
					return failure_t{
							fmt::format( "unsupported log-level: {}", level_name )
					};

				current_cfg.m_log_level = *opt_level;

				return success_t{};
			} );
	}
};

//
// server_address_handler_t
//
/*!
 * @brief Handler for `server.address` command.
 */
class server_address_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::server_address_p(),
			[&]( const parsers::raw_address_t & v ) -> command_handling_result_t {
				if( 0u == v.m_port )
					return failure_t{ "server.address: port can't be 0" };

				if( v.m_ip.empty() )
					current_cfg.m_server.m_ip = asio::ip::address_v4::any();
				else
				{
					asio::error_code ec;
					const auto ip = asio::ip::make_address( v.m_ip, ec );
					if( ec )
						return failure_t{
								fmt::format( "server.address: invalid IP-address "
										"'{}': {}", v.m_ip, ec.message() )
						};

					current_cfg.m_server.m_ip = ip;
				}

				current_cfg.m_server.m_port = v.m_port;

				return success_t{};
			} );
	}
};

//
// string_value_handler_t
//
/*!
 * @brief Handler for commands with a string value.
 *
 * The whole rest of the line (without trailing spaces) is taken as
 * the value. The value can't be empty.
 */
template< auto Section, auto Field >
class string_value_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		const auto last = content.find_last_not_of( " \t\x0b" );
		if( std::string_view::npos == last )
			return failure_t{ "value can't be empty" };

		(current_cfg.*Section).*Field = std::string{ content.substr( 0u, last + 1u ) };

		return success_t{};
	}
};

//
// bool_value_handler_t
//
template< auto Section, auto Field >
class bool_value_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::bool_value_p(),
			[&]( bool v ) -> command_handling_result_t {
				(current_cfg.*Section).*Field = v;

				return success_t{};
			} );
	}
};

//
// duration_value_handler_t
//
/*!
 * @brief Handler for commands like `fx.refresh_interval`,
 * `weather.cache_ttl` and so on.
 *
 * Zero durations are not allowed.
 */
template< auto Section, auto Field >
class duration_value_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::duration_value_p(),
			[&]( std::chrono::milliseconds v ) -> command_handling_result_t {
				if( std::chrono::milliseconds::zero() == v )
					return failure_t{ "duration can't be 0" };

				(current_cfg.*Section).*Field = v;

				return success_t{};
			} );
	}
};

//
// max_entries_handler_t
//
/*!
 * @brief Handler for `weather.max_entries` command.
 */
class max_entries_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			non_negative_decimal_number_p< std::size_t >(),
			[&]( std::size_t v ) -> command_handling_result_t {
				if( 0u == v )
					return failure_t{ "weather.max_entries can't be 0" };

				current_cfg.m_weather.m_max_entries = v;

				return success_t{};
			} );
	}
};

//
// threads_count_handler_t
//
/*!
 * @brief Handler for commands like `query_processor.threads`.
 */
template< auto Field >
class threads_count_handler_t : public command_handler_t
{
	const std::string_view m_command;

public:
	explicit threads_count_handler_t( std::string_view command )
		:	m_command{ command }
	{}

	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			non_negative_decimal_number_p< std::size_t >(),
			[&]( std::size_t v ) -> command_handling_result_t {
				if( 0u == v )
					return failure_t{
							fmt::format( "{} can't be 0", m_command ) };

				current_cfg.*Field = v;

				return success_t{};
			} );
	}
};

//
// spaces
//
//! Set of space symbols.
[[nodiscard]]
inline constexpr std::string_view
spaces() noexcept { return { " \t\x0b" }; }

using line_reader_t = ::dnstoys::utils::line_reader_t;

/*!
 * @brief Splits specified line into the command and optional part
 * with arguments.
 *
 * @attention
 * It's expected that @a line contains something other than spaces.
 *
 * @return A tuple where the first item is the command name, and the second
 * is the optional part with arguments (the second item can be empty).
 */
[[nodiscard]]
std::tuple< std::string_view, std::string_view >
split_line( std::string_view line )
{
	const auto command_start = line.find_first_not_of( spaces() );
	if( std::string_view::npos == command_start )
		throw config_parser_t::parser_exception_t(
				"split_line: only spaces in the input" );

	std::string_view args;

	const auto line_size = line.size();
	const auto command_end = std::min(
			line.find_first_of( spaces(), command_start ),
			line_size );
	if( line_size != command_end )
	{
		if( const auto spaces_end = std::min(
				line.find_first_not_of( spaces(), command_end ),
				line_size );
				line_size != spaces_end )
		{
			args = line.substr( spaces_end );
		}
	}

	std::string_view command = line.substr(
			command_start,
			command_end - command_start );

	return { command, args };
}

//
// required_value_t
//
//! Description of a command that must be present in the config.
struct required_value_t
{
	std::string_view m_command;
	bool (*m_is_required)( const config_t & ) noexcept;
};

//! Commands those must be present if the corresponding service is on.
const required_value_t required_values[] = {
	{ "server.domain", []( const config_t & ) noexcept { return true; } },
	{ "server.address", []( const config_t & ) noexcept { return true; } },
	{ "timezones.geo_filepath",
		[]( const config_t & c ) noexcept { return c.needs_geo_index(); } },
	{ "fx.api_key",
		[]( const config_t & c ) noexcept { return c.m_fx.m_enabled; } },
	{ "fx.refresh_interval",
		[]( const config_t & c ) noexcept { return c.m_fx.m_enabled; } },
	{ "weather.max_entries",
		[]( const config_t & c ) noexcept { return c.m_weather.m_enabled; } },
	{ "weather.cache_ttl",
		[]( const config_t & c ) noexcept { return c.m_weather.m_enabled; } }
};

} /* namespace parse_config_impl */

std::ostream &
operator<<( std::ostream & to, const config_t & cfg )
{
	const auto yes_no = []( bool v ) { return v ? "on" : "off"; };

	fmt::print( to, "(log_level {}) ",
			spdlog::level::to_string_view( cfg.m_log_level ) );
	fmt::print( to, "(server.domain {}) ", cfg.m_server.m_domain );
	fmt::print( to, "(server.address {}:{}) ",
			cfg.m_server.m_ip.to_string(), cfg.m_server.m_port );
	fmt::print( to, "(timezones {} geo_filepath='{}') ",
			yes_no( cfg.m_timezones.m_enabled ),
			cfg.m_timezones.m_geo_filepath.string() );
	fmt::print( to, "(fx {} refresh_interval={}ms fetch_timeout={}ms) ",
			yes_no( cfg.m_fx.m_enabled ),
			cfg.m_fx.m_refresh_interval.count(),
			cfg.m_fx.m_fetch_timeout.count() );
	fmt::print( to, "(myip {}) ", yes_no( cfg.m_myip.m_enabled ) );
	fmt::print( to, "(weather {} max_entries={} cache_ttl={}ms "
			"fetch_timeout={}ms) ",
			yes_no( cfg.m_weather.m_enabled ),
			cfg.m_weather.m_max_entries,
			cfg.m_weather.m_cache_ttl.count(),
			cfg.m_weather.m_fetch_timeout.count() );
	fmt::print( to, "(query_processor.threads {}) ",
			cfg.m_query_processor_threads );
	fmt::print( to, "(upstream_query_processor.threads {})",
			cfg.m_upstream_query_processor_threads );

	return to;
}

//
// config_parser_t::parser_exception_t
//
config_parser_t::parser_exception_t::parser_exception_t(
	const std::string & what )
	:	config_error_t{ "config_parser: " + what }
{}

//
// config_parser_t::impl_t
//
struct config_parser_t::impl_t
{
	using command_map_t = std::map<
			std::string,
			parse_config_impl::command_handler_unique_ptr_t,
			std::less<> >;

	command_map_t m_commands;

	/*!
	 * @return nullptr, if command handler isn't found.
	 */
	[[nodiscard]]
	const parse_config_impl::command_handler_t *
	find_command_handler( std::string_view name ) const noexcept
	{
		const auto it = m_commands.find( name );
		if( it != m_commands.end() )
			return it->second.get();
		else
			return nullptr;
	}
};

//
// config_parser_t
//
config_parser_t::config_parser_t()
	:	m_impl{ new impl_t{} }
{
	using namespace parse_config_impl;
	using namespace std::string_literals;
	using namespace std::string_view_literals;

	m_impl->m_commands.emplace(
			"log_level"s,
			std::make_unique< log_level_handler_t >() );

	m_impl->m_commands.emplace(
			"server.domain"s,
			std::make_unique<
					string_value_handler_t<
							&config_t::m_server, &server_config_t::m_domain >
			>() );
	m_impl->m_commands.emplace(
			"server.address"s,
			std::make_unique< server_address_handler_t >() );

	m_impl->m_commands.emplace(
			"timezones.enabled"s,
			std::make_unique<
					bool_value_handler_t<
							&config_t::m_timezones, &timezones_config_t::m_enabled >
			>() );
	m_impl->m_commands.emplace(
			"timezones.geo_filepath"s,
			std::make_unique<
					string_value_handler_t<
							&config_t::m_timezones,
							&timezones_config_t::m_geo_filepath >
			>() );

	m_impl->m_commands.emplace(
			"fx.enabled"s,
			std::make_unique<
					bool_value_handler_t< &config_t::m_fx, &fx_config_t::m_enabled >
			>() );
	m_impl->m_commands.emplace(
			"fx.api_key"s,
			std::make_unique<
					string_value_handler_t< &config_t::m_fx, &fx_config_t::m_api_key >
			>() );
	m_impl->m_commands.emplace(
			"fx.refresh_interval"s,
			std::make_unique<
					duration_value_handler_t<
							&config_t::m_fx, &fx_config_t::m_refresh_interval >
			>() );
	m_impl->m_commands.emplace(
			"fx.fetch_timeout"s,
			std::make_unique<
					duration_value_handler_t<
							&config_t::m_fx, &fx_config_t::m_fetch_timeout >
			>() );

	m_impl->m_commands.emplace(
			"myip.enabled"s,
			std::make_unique<
					bool_value_handler_t< &config_t::m_myip, &myip_config_t::m_enabled >
			>() );

	m_impl->m_commands.emplace(
			"weather.enabled"s,
			std::make_unique<
					bool_value_handler_t<
							&config_t::m_weather, &weather_config_t::m_enabled >
			>() );
	m_impl->m_commands.emplace(
			"weather.max_entries"s,
			std::make_unique< max_entries_handler_t >() );
	m_impl->m_commands.emplace(
			"weather.cache_ttl"s,
			std::make_unique<
					duration_value_handler_t<
							&config_t::m_weather, &weather_config_t::m_cache_ttl >
			>() );
	m_impl->m_commands.emplace(
			"weather.fetch_timeout"s,
			std::make_unique<
					duration_value_handler_t<
							&config_t::m_weather, &weather_config_t::m_fetch_timeout >
			>() );

	m_impl->m_commands.emplace(
			"query_processor.threads"s,
			std::make_unique<
					threads_count_handler_t< &config_t::m_query_processor_threads >
			>( "query_processor.threads"sv ) );
	m_impl->m_commands.emplace(
			"upstream_query_processor.threads"s,
			std::make_unique<
					threads_count_handler_t<
							&config_t::m_upstream_query_processor_threads >
			>( "upstream_query_processor.threads"sv ) );
}

config_parser_t::~config_parser_t()
{}

config_t
config_parser_t::parse( std::string_view content )
{
	return parse( std::vector< std::string_view >{ content } );
}

config_t
config_parser_t::parse( const std::vector< std::string_view > & contents )
{
	config_t result;

	// Names of all processed commands.
	// It's necessary for checking the presence of required values.
	std::set< std::string, std::less<> > processed_commands;

	using namespace parse_config_impl;

	for( std::size_t i = 0u; i != contents.size(); ++i )
	{
		// The number of the config is shown only if there are several.
		const auto location = [&]( const line_reader_t::line_t & line ) {
			if( 1u == contents.size() )
				return fmt::format( "line {}", line.number() );
			else
				return fmt::format( "line {} of config #{}", line.number(), i + 1u );
		};

		line_reader_t line_reader{ contents[ i ] };
		line_reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
				auto [command, rest] = split_line( line.content() );
				const auto handler = m_impl->find_command_handler( command );
				if( handler )
				{
					const auto handling_result = handler->try_handle( rest, result );
					if( const auto failure = std::get_if<failure_t>(&handling_result) )
					{
						throw parser_exception_t{
								fmt::format( "unable to process command {} at {}: {}",
										command,
										location( line ),
										failure->description() )
							};
					}

					processed_commands.emplace( command );
				}
				else
					throw parser_exception_t{
							fmt::format( "unknown command {} at {}",
									command, location( line ) )
						};
			} );
	}

	if( processed_commands.empty() )
		throw parser_exception_t{ "Empty config" };

	for( const auto & rv : required_values )
	{
		if( rv.m_is_required( result ) &&
				processed_commands.end() == processed_commands.find( rv.m_command ) )
		{
			throw parser_exception_t{
					fmt::format( "required value {} is not specified",
							rv.m_command )
				};
		}
	}

	return result;
}

//
// load_config
//
config_t
load_config( const std::filesystem::path & file_name )
{
	const auto content = ::dnstoys::utils::load_file_into_memory( file_name );

	config_parser_t parser;
	return parser.parse( std::string_view{ content.data(), content.size() } );
}

config_t
load_config( const std::vector< std::filesystem::path > & file_names )
{
	std::vector< std::vector< char > > contents;
	contents.reserve( file_names.size() );
	for( const auto & n : file_names )
		contents.push_back( ::dnstoys::utils::load_file_into_memory( n ) );

	std::vector< std::string_view > views;
	views.reserve( contents.size() );
	for( const auto & c : contents )
		views.emplace_back( c.data(), c.size() );

	config_parser_t parser;
	return parser.parse( views );
}

} /* namespace dnstoys */
