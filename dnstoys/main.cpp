#include <dnstoys/utils/ensure_successful_syscall.hpp>

#include <dnstoys/startup_manager/pub.hpp>

#include <dnstoys/config.hpp>
#include <dnstoys/geo/loader.hpp>
#include <dnstoys/version.hpp>

#include <dnstoys/logging/wrap_logging.hpp>

#include <dnstoys/nothrow_block/macros.hpp>

#include <signal.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <memory>
#include <array>
#include <cerrno>
#include <system_error>
#include <vector>
#include <filesystem>

#include <args/args.hxx>

#include <optional>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <fmt/ostream.h>
#include <fmt/chrono.h>

#include <so_5/all.hpp>

namespace {

//
// to_string
//

[[nodiscard]]
std::string
to_string( const spdlog::string_view_t what )
{
	return std::string( what.data(), what.size() );
}

//
// detect_log_level
//

[[nodiscard]]
spdlog::level::level_enum
detect_log_level( const std::string & name )
{
	const auto r = dnstoys::logging::name_to_spdlog_level_enum( name );

	if( !r )
	{
		throw std::runtime_error( "Unsupported log-level: " + name );
	}

	return *r;
}

// Available values for command-line arguments related to logging to console.
const std::string stdout_log_target = "stdout";
const std::string stderr_log_target = "stderr";

//
// log_params_t
//

//! Logging parameters.
struct log_params_t
{
	void
	set_target( const std::string & target )
	{
		if( stdout_log_target == target ||
			stderr_log_target == target )
		{
			set_console_target( target );
		}
		else if( '@' == target[0] )
		{
			if( target.length() < 2u )
				throw std::runtime_error("invalid log-target name: " +
						target);

			set_syslog_target( target.substr(1u) );
		}
		else
			set_file_target( target );
	}

	std::optional< std::string > m_console_target;
	std::optional< std::string > m_syslog_target;
	std::optional< std::string > m_file_target;

	//! Logging level from the command line.
	/*!
	 * If it's empty then the level from the config is used.
	 */
	std::optional< spdlog::level::level_enum > m_log_level;
	spdlog::level::level_enum m_log_flush_level{ spdlog::level::err };
	std::size_t m_log_file_size{ 10ull*1024u*1024u };
	std::size_t m_log_file_count{ 3u };

private:
	static void
	set_unique_target(
		std::optional< std::string > & to,
		const char * kind,
		const std::string & target )
	{
		if( !to )
		{
			to = target;
		}
		else
			throw std::runtime_error(
				fmt::format( "{} target is present: {}, additional target: {}",
						kind, *to, target ) );
	}

	void
	set_console_target( const std::string & target )
	{
		set_unique_target( m_console_target, "console", target );
	}

	void
	set_syslog_target( const std::string & target )
	{
		set_unique_target( m_syslog_target, "syslog", target );
	}

	void
	set_file_target( const std::string & target )
	{
		set_unique_target( m_file_target, "file", target );
	}
};

std::ostream &
operator<<( std::ostream & o, const log_params_t & params )
{
	if(params.m_console_target)
		fmt::print( o, "(console_target {}) ", *(params.m_console_target) );

	if(params.m_syslog_target)
		fmt::print( o, "(syslog_target {}) ", *(params.m_syslog_target) );

	if(params.m_file_target)
		fmt::print( o, "(file_target {}) ", *(params.m_file_target) );

	if(params.m_log_level)
		fmt::print( o, "(log_level {}) ",
			to_string( spdlog::level::to_string_view(*(params.m_log_level)) ) );
	fmt::print( o, "(log_flush_level {}) ",
		to_string( spdlog::level::to_string_view(params.m_log_flush_level) ) );

	fmt::print( o, "(log_file_size {}) ", params.m_log_file_size );
	fmt::print( o, "(log_file_count {}) ", params.m_log_file_count );

	return o;
}

//
// cmd_line_args_t
//

//! Command-line arguments.
struct cmd_line_args_t
{
	log_params_t m_log_params;

	//! Paths to the config files.
	/*!
	 * Files are processed in this order, values from the later files
	 * override values from the earlier ones.
	 */
	std::vector< std::filesystem::path > m_config_paths;

	//! Max time for the completion of one initialization stage.
	std::chrono::seconds m_max_stage_startup_time{ 5 };
};

std::ostream &
operator<<( std::ostream & o, const cmd_line_args_t & args )
{
	o << "(log_params " << args.m_log_params << ") ";

	for( const auto & p : args.m_config_paths )
		fmt::print( o, "(config {}) ", p.string() );

	fmt::print( o, "(max_stage_startup_time {}) ",
			args.m_max_stage_startup_time );

	return o;
}

//
// finish_app_ex_t
//

//! An exception for errors related to command-line args parsing.
/*!
 * If such an exception is throw then the application has to be finished.
 */
class finish_app_ex_t : public std::runtime_error {

	int m_exit_code;

public:
	finish_app_ex_t(
		const char * what_arg,
		int exit_code )
	:	std::runtime_error{ what_arg }
	,	m_exit_code{ exit_code }
	{
	}

	int
	exit_code() const noexcept { return m_exit_code; }
};

//
// parse_cmd_line
//

/*!
 * Returns values of command-line args or throws finish_app_ex_t
 * in the case of an error.
 */
[[nodiscard]]
cmd_line_args_t
parse_cmd_line( int argc, char ** argv )
{
	cmd_line_args_t result;

	args::ArgumentParser parser( "dnstoys", "\n" );

	// Common parameters.

	args::HelpFlag help( parser, "help", "Display this help text",
			{ 'h', "help" } );

	args::Flag version(parser, "version", "Show version number",
			{ 'v', "version" } );

	args::ValueFlagList< std::string > config_path( parser,
			"path", "Set path to the config file. Can be repeated, "
			"later files override values from earlier ones."
			" [required parameter]",
			{ 'c', "config" } );

	// Parameters for logging.

	args::ValueFlagList< std::string > log_target( parser,
		"name", "Set log destination. "
		"Value 'stdout' means the standard output stream. "
		"Value 'stderr' means the standard error stream. "
		"Value '@something' means syslog as 'something'. "
		"Other values mean a file name. "
		" (default: " + stdout_log_target + ")",
		{ "log-target" } );

	args::ValueFlag< std::string > log_level( parser,
			"level", "Set logging level. Value 'off' turns logging off "
			" (default: the value of log_level from the config)",
			{ 'l', "log-level" } );

	args::ValueFlag< std::string > log_flush_level( parser,
			"level", "Set flush level. Value 'off' turns flushing off "
			" (default: " +
			to_string(
				spdlog::level::to_string_view(
					result.m_log_params.m_log_flush_level) ) + ")",
			{ 'f', "log-flush-level" } );

	args::ValueFlag< unsigned int > log_file_size( parser,
			"bytes", "Set maximum size of log file"
			" (default: " + std::to_string(
				result.m_log_params.m_log_file_size ) + ")",
			{ "log-file-size" } );

	args::ValueFlag< unsigned int > log_file_count( parser,
			"non-zero-value", "Set maximum count of log files in rotation. "
			"This value should be at least 2 "
			" (default: " + std::to_string(
				result.m_log_params.m_log_file_count ) + ")",
			{ "log-file-count" } );

	// Parameters for SObjectizer.

	args::ValueFlag<unsigned int> max_stage_startup_time( parser,
			"uint",
			fmt::format( "Max time for one startup stage in seconds "
					"(default: {})",
					result.m_max_stage_startup_time.count() ),
			{"max-stage-startup-time"});

	try
	{
		parser.ParseCLI( argc, argv );
	}
	catch( const args::Completion & e )
	{
		std::cout << e.what();
		throw finish_app_ex_t("bash-completion", 0);
	}
	catch( const args::Help & /*e*/ )
	{
		std::cout << parser;
		throw finish_app_ex_t( "cmd-line-help", 1 );
	}
	catch( const args::ParseError & e )
	{
		std::cerr << e.what() << std::endl;
		throw finish_app_ex_t( "cmd-line-parse-error", 2 );
	}

	if( version )
	{
		std::cout << "dnstoys v." << dnstoys::version << std::endl;
		throw finish_app_ex_t( "show-version-only", 0 );
	}

	if( config_path )
	{
		for( const auto & p : args::get( config_path ) )
			result.m_config_paths.emplace_back( p );
	}
	else
		throw std::runtime_error( "param --config is absent" );

	if( log_target )
	{
		for ( const auto & nm: args::get( log_target ) )
		{
			result.m_log_params.set_target(nm);
		}
	}
	if( log_level )
		result.m_log_params.m_log_level = detect_log_level( args::get( log_level ) );
	if( log_flush_level )
		result.m_log_params.m_log_flush_level = detect_log_level(
			args::get( log_flush_level ) );
	if( log_file_size )
	{
		result.m_log_params.m_log_file_size = args::get( log_file_size );
		if(0u == result.m_log_params.m_log_file_size)
			throw std::runtime_error("zero can't be used as log-file-size");
	}
	if( log_file_count )
	{
		result.m_log_params.m_log_file_count = args::get( log_file_count );
		if( 2u > result.m_log_params.m_log_file_count )
			throw std::runtime_error( "log-file-count should be at least 2" );
	}

	if( max_stage_startup_time )
	{
		if( const auto v = args::get( max_stage_startup_time );
				0u != v )
		{
			result.m_max_stage_startup_time =
					std::chrono::seconds{ static_cast<int>(v) };
		}
		else
			throw std::runtime_error( "param --max-stage-startup-time can't "
					"be zero" );
	}

	return result;
}

const std::array<int, 5> SIGNALS_TO_HANDLE{
	SIGINT, SIGHUP, SIGQUIT, SIGTERM, SIGPIPE
};

template<typename Container>
void
fill_sigset(sigset_t & what, const Container & signals)
{
	sigemptyset(&what);
	for(auto s : signals)
	{
		::dnstoys::utils::ensure_successful_syscall(
				sigaddset(&what, s),
				"fill_sigset.sigaddset()");
	}
}

void
block_signals_for_current_process()
{
	sigset_t sigset;
	fill_sigset(sigset, SIGNALS_TO_HANDLE);

	::dnstoys::utils::ensure_successful_syscall(
			sigprocmask(SIG_BLOCK, &sigset, nullptr),
			"block_signals_for_current_process.sigprocmask()");
}

void
run_loop( spdlog::logger & logger )
{
	sigset_t sigset;
	fill_sigset(sigset, SIGNALS_TO_HANDLE);

	for(;;) {
		int signal;
		int rc = sigwait(&sigset, &signal);

		if(0 != rc)
			throw std::runtime_error("sigwait failed -> " +
					std::system_category().message(rc));

		const char * name = nullptr;
		switch(signal) {
			case SIGINT: name = "SIGINT"; break;
			case SIGHUP: name = "SIGHUP"; break;
			case SIGQUIT: name = "SIGQUIT"; break;
			case SIGTERM: name = "SIGTERM"; break;
			case SIGPIPE: break;
		}

		if( name )
		{
			::dnstoys::logging::wrap_logging(
					logger,
					spdlog::level::info,
					[name]( auto & l, auto level )
					{
						l.log( level, "*** {}, shutting down...", name );
					} );
			return;
		}
	}
}

//
// sink_list_t
//

using sink_list_t = std::vector<spdlog::sink_ptr>;

[[nodiscard]]
sink_list_t
make_sinks( const log_params_t & log_params )
{
	sink_list_t result;

	if( log_params.m_console_target )
	{
		spdlog::sink_ptr console_sink;

		if( stdout_log_target == *(log_params.m_console_target) )
			console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		else //if( stderr_log_target == *(log_params.m_console_target) )
			console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

		result.push_back(console_sink);
	}

	if( log_params.m_syslog_target )
	{
		int syslog_option = 0;
		int syslog_facility = 1; // user-level messages
		bool enable_formatting = true;

		result.push_back(
			std::make_shared<spdlog::sinks::syslog_sink_mt>(
				*(log_params.m_syslog_target),
				syslog_option, syslog_facility,
				enable_formatting) );
	}

	if( log_params.m_file_target )
	{
		result.push_back(
			std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
				*(log_params.m_file_target),
				log_params.m_log_file_size,
				log_params.m_log_file_count) );
	}

	if( result.empty() )
	{
		result.push_back(
			std::make_shared<spdlog::sinks::stdout_color_sink_mt>() );
	}

	return result;
}

[[nodiscard]]
dnstoys::logging::logger_shptr_t
make_logger(
	std::string logger_name,
	const sink_list_t & sinks,
	const log_params_t & log_params,
	spdlog::level::level_enum config_log_level )
{
	auto logger = std::make_shared< spdlog::logger >(
		std::move(logger_name), sinks.begin(), sinks.end() );

	logger->set_level( log_params.m_log_level.value_or( config_log_level ) );
	logger->flush_on( log_params.m_log_flush_level );

	return logger;
}

// Helper function for tuning of SObjectizer parameters.
[[nodiscard]]
so_5::environment_params_t
make_sobjectizer_params(
	dnstoys::logging::logger_shptr_t app_logger )
{
	// Special logger that redirects all error messages to
	// the application logger.
	class so5_error_logger_t : public so_5::error_logger_t
	{
		const dnstoys::logging::logger_shptr_t m_logger;

	public:
		so5_error_logger_t( dnstoys::logging::logger_shptr_t logger )
			:	m_logger{ std::move(logger) }
		{}

		void
		log(
			const char * file_name,
			unsigned int line,
			const std::string & message ) override
		{
			DNSTOYS_NOTHROW_BLOCK_BEGIN()
				DNSTOYS_NOTHROW_BLOCK_STAGE(log_error_msg)

				::dnstoys::logging::wrap_logging(
						*m_logger,
						spdlog::level::err,
						[&]( auto & logger, auto level )
						{
							logger.log(
									level,
									"an error detected by SObjectizer: {} (at {}:{})",
									message, file_name, line );
						} );
			DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_logger)
		}
	};

	// Special logger that logs exceptions thrown from event-handlers.
	class so5_event_exception_logger_t : public so_5::event_exception_logger_t
	{
		const dnstoys::logging::logger_shptr_t m_logger;

	public:
		so5_event_exception_logger_t( dnstoys::logging::logger_shptr_t logger )
			:	m_logger{ std::move(logger) }
		{}

		void
		log_exception(
			const std::exception & event_exception,
			const so_5::coop_handle_t & coop ) noexcept override
		{
			// This method can't throw. So catch all exceptions.
			DNSTOYS_NOTHROW_BLOCK_BEGIN()
				DNSTOYS_NOTHROW_BLOCK_STAGE(log_exception)

				::dnstoys::logging::wrap_logging(
						*m_logger,
						spdlog::level::critical,
						[&]( auto & logger, auto level )
						{
							logger.log(
									level,
									"an exception from SObjectizer's agent event: \"{}\", "
									"agent's coop ID: {}",
									event_exception.what(),
									coop.id() );
						} );
			DNSTOYS_NOTHROW_BLOCK_END(LOG_THEN_IGNORE, *m_logger)
		}
	};

	so_5::environment_params_t params;

	params.error_logger( std::make_shared< so5_error_logger_t >( app_logger ) );
	params.event_exception_logger(
			std::make_unique< so5_event_exception_logger_t >( app_logger ) );

	return params;
}

} /* anonymous namespace */

int
main(int argc, char ** argv)
{
	try
	{
		const auto cmd_line_args = parse_cmd_line( argc, argv );

		// All problems with the config are detected before the start
		// of SObjectizer.
		auto config = dnstoys::load_config( cmd_line_args.m_config_paths );

		auto sinks = make_sinks( cmd_line_args.m_log_params );
		auto logger = make_logger(
				"dnstoys", sinks, cmd_line_args.m_log_params, config.m_log_level );

		std::cout << cmd_line_args << std::endl;

		::dnstoys::logging::wrap_logging(
				*logger,
				spdlog::level::info,
				[&config]( auto & l, auto level )
				{
					std::ostringstream config_dump;
					config_dump << config;

					l.log( level, "dnstoys v.{} starting, config: {}",
							dnstoys::version,
							config_dump.str() );
				} );

		dnstoys::geo::index_shptr_t geo_index;
		if( config.needs_geo_index() )
			geo_index = dnstoys::geo::load_index(
					config.m_timezones.m_geo_filepath, *logger );

		block_signals_for_current_process();

		so_5::wrapped_env_t sobj{
			[&]( so_5::environment_t & env ) {
				dnstoys::startup_manager::introduce_startup_manager(
						env,
						dnstoys::startup_manager::params_t{
								config,
								geo_index,
								logger,
								cmd_line_args.m_max_stage_startup_time
						} );
			},
			[&logger]( so_5::environment_params_t & params ) {
				params = make_sobjectizer_params( logger );
			}
		};

		run_loop( *logger );
	}
	catch(const finish_app_ex_t & need_finish) {
		return need_finish.exit_code();
	}
	catch(const std::exception & ex)
	{
		std::cerr << "*** Exception caught: " << ex.what() << std::endl;
		return 2;
	}

	return 0;
}
