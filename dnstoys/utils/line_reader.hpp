/*!
 * @file
 * @brief Helpers for line-by-line processing of a char array.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dnstoys::utils
{

//
// line_extractor_t
//
/*!
 * @brief A helper class for line-by-line extraction of the content
 * of previously loaded file.
 *
 * This class counts line numbers. All empty lines are ignored.
 *
 * If comments are enabled then lines started with '#' are skipped
 * and leading spaces in extracted lines are removed. If comments are
 * disabled the lines are returned as is (it's necessary for
 * tab-separated data where a leading tab is a significant empty field).
 */
class line_extractor_t
{
public:
	//! Type for holding line numbers.
	using line_number_t = std::uint_fast32_t;

	//! Should lines started with '#' be treated as comments?
	enum class comments_t { enabled, disabled };

private:
	[[nodiscard]]
	static constexpr std::string_view
	crlf() noexcept { return { "\r\n" }; }

	[[nodiscard]]
	static constexpr std::string_view
	spaces() noexcept { return { " \t\x0b" }; }

	std::string_view m_content;

	const comments_t m_comments;

	line_number_t m_line_number{ 1u };

	void
	skip_till_eol() noexcept
	{
		m_content.remove_prefix(
				std::min( m_content.find_first_of( crlf() ), m_content.size() ) );
	}

	void
	handle_eol( char front_ch ) noexcept
	{
		++m_line_number;
		std::string_view::size_type chars_to_remove{ 1u };

		// The case of \r\n, two symbols have to be removed.
		if( '\r' == front_ch && m_content.length() >= 2u &&
				'\n' == m_content[ 1u ] )
		{
			chars_to_remove = 2u;
		}

		m_content.remove_prefix( chars_to_remove );
	}

	[[nodiscard]]
	std::string_view
	take_till_eol() noexcept
	{
		const auto chars_to_extract = std::min(
				m_content.find_first_of( crlf() ),
				m_content.size() );

		const auto result = m_content.substr( 0u, chars_to_extract );
		m_content.remove_prefix( chars_to_extract );

		return result;
	}

public:
	line_extractor_t(
		std::string_view content,
		comments_t comments ) noexcept
		:	m_content{ content }
		,	m_comments{ comments }
	{}

	[[nodiscard]]
	auto
	line_number() const noexcept { return m_line_number; }

	[[nodiscard]]
	std::optional< std::string_view >
	get_next() noexcept
	{
		std::optional< std::string_view > result{ std::nullopt };

		while( !result && !m_content.empty() )
		{
			if( comments_t::enabled == m_comments )
			{
				const auto non_space_pos = m_content.find_first_not_of( spaces() );
				if( std::string_view::npos == non_space_pos )
				{
					// There are only space symbols.
					m_content.remove_prefix( m_content.size() );
					break;
				}
				m_content.remove_prefix( non_space_pos );
			}

			// m_content is not empty at that point.
			const auto front_ch = m_content.front();
			if( '\r' == front_ch || '\n' == front_ch )
				handle_eol( front_ch );
			else if( '#' == front_ch && comments_t::enabled == m_comments )
				skip_till_eol();
			else
				result = take_till_eol();
		}

		return result;
	}
};

//
// line_reader_t
//
/*!
 * @brief A helper class for line-by-line processing of a char array.
 *
 * The main scenario of the usage:
 * - create an instance of line_reader_t. Pass a string_view with a
 *   content of char array to the constructor;
 * - call line_reader_t::for_each_line method and pass a lambda function
 *   to it. This lambda will be called for every non-empty line
 *   from the char array.
 */
class line_reader_t
{
public:
	using comments_t = line_extractor_t::comments_t;

	class line_t
	{
	private:
		friend class line_reader_t;

		std::string_view m_content;
		line_extractor_t::line_number_t m_number;

		line_t(
			std::string_view content,
			line_extractor_t::line_number_t number )
			:	m_content{ content }
			,	m_number{ number }
		{}

	public:
		[[nodiscard]]
		std::string_view
		content() const noexcept { return m_content; }

		[[nodiscard]]
		auto
		number() const noexcept { return m_number; }
	};

	line_reader_t(
		std::string_view content,
		comments_t comments = comments_t::enabled )
		:	m_content{ content }
		,	m_comments{ comments }
	{}

	// A single argument will be passed to lambda-function: an instance
	// of line_t object that will be created for every non-empty line.
	template< typename Handler >
	void
	for_each_line( Handler && handler ) const
	{
		line_extractor_t extractor{ m_content, m_comments };

		for(;;)
		{
			const auto r = extractor.get_next();
			if( r )
				handler( line_t{ *r, extractor.line_number() } );
			else
				break;
		}
	}

private:
	const std::string_view m_content;
	const comments_t m_comments;
};

} /* namespace dnstoys::utils */
