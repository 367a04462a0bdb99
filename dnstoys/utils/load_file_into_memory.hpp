/*!
 * @file
 * @brief Helper function for loading the whole file content into memory.
 */

#pragma once

#include <dnstoys/exception.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace dnstoys::utils
{

/*!
 * @brief Load the whole content of a file.
 *
 * @throw config_error_t in the case of the absence of the file or
 * if the file can't be read. Config files and datasets are loaded only
 * during the startup, so any failure here prevents the start of
 * the application.
 */
[[nodiscard]]
inline std::vector< char >
load_file_into_memory(
	const std::filesystem::path & file_name )
{
	std::vector< char > buffer;

	std::error_code ec;
	const auto file_size = std::filesystem::file_size( file_name, ec );
	if( ec )
		throw config_error_t{
				fmt::format( "unable to get size of file '{}': {}",
						file_name.string(), ec.message() )
			};

	if( file_size )
	{
		std::ifstream file;
		file.open( file_name, std::ios_base::in | std::ios_base::binary );
		if( !file )
			throw config_error_t{
					fmt::format( "unable to open file '{}': {}",
							file_name.string(),
							std::system_category().message( errno ) )
				};

		buffer.resize( file_size );
		file.read( buffer.data(), static_cast<std::streamsize>(file_size) );

		if( file.gcount() != static_cast<std::streamsize>(file_size) )
			throw config_error_t{
					fmt::format( "number of bytes loaded from '{}' mismatches "
							"the size of the file: bytes_loaded={}, file_size={}",
							file_name.string(),
							file.gcount(),
							file_size )
				};
	}

	return buffer;
}

} /* namespace dnstoys::utils */
