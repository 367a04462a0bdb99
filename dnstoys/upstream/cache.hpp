/*!
 * @file
 * @brief Bounded cache for values received from upstream services.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace dnstoys::upstream
{

//
// failed_fetch_t
//
//! Description of a failed attempt to get a value.
struct failed_fetch_t
{
	std::string m_description;
};

//
// upstream_cache_t
//
/*!
 * @brief Bounded TTL-based cache with single-flight fetching.
 *
 * Behaviour of get():
 * - if there is an unexpired value for the key it is returned
 *   immediately and the key becomes the most recently used one;
 * - if there is a fetch in progress for the key then the caller waits
 *   for the result of that fetch;
 * - otherwise the caller becomes the leader and performs the fetch
 *   on its own thread. The result is shared with all waiters.
 *
 * The waiting is limited by the fetch timeout. If the timeout elapses
 * the in-flight slot is released (so the next caller starts a new fetch)
 * and the result of the abandoned fetch will be discarded. A leader
 * whose fetch lasted longer than the timeout gets a failure too.
 *
 * The fetcher is expected to limit its own duration (for example by
 * the same timeout), because the leader can't be interrupted.
 *
 * Failures are never stored in the cache.
 *
 * When a new value is stored all expired values are removed first.
 * If the count of values still exceeds the limit then the least
 * recently used value is removed.
 *
 * The internal lock is never held during the fetch.
 *
 * @tparam Key type of the key. Should be copyable and less-comparable.
 * @tparam Value type of the value.
 */
template< typename Key, typename Value >
class upstream_cache_t
{
public:
	using clock_t = std::chrono::steady_clock;

	//! Type of function that performs the actual fetch.
	/*!
	 * It should throw an exception derived from std::exception
	 * in the case of a failure.
	 */
	using fetcher_t = std::function< Value( const Key & ) >;

	//! Type of function for getting the current time.
	using now_provider_t = std::function< clock_t::time_point() >;

	//! Parameters of the cache.
	struct params_t
	{
		//! Max count of values in the cache.
		std::size_t m_max_entries;
		//! Lifetime of a value.
		std::chrono::milliseconds m_ttl;
		//! Max time to wait for the result of a fetch.
		std::chrono::milliseconds m_fetch_timeout;
	};

	//! Successful result of get().
	struct cached_value_t
	{
		std::shared_ptr< const Value > m_value;
		//! How long the value remains valid.
		std::chrono::milliseconds m_remaining_ttl;
	};

	using get_result_t = std::variant< failed_fetch_t, cached_value_t >;

	upstream_cache_t(
		params_t params,
		fetcher_t fetcher,
		now_provider_t now_provider = []{ return clock_t::now(); } )
		:	m_state{ std::make_unique< state_t >(
				params, std::move(fetcher), std::move(now_provider) ) }
	{}

	upstream_cache_t( const upstream_cache_t & ) = delete;
	upstream_cache_t & operator=( const upstream_cache_t & ) = delete;

	//! Get a value for the key.
	[[nodiscard]]
	get_result_t
	get( const Key & key )
	{
		std::shared_future< fetch_outcome_t > outcome;
		std::uint64_t generation{};
		std::shared_ptr< std::promise< fetch_outcome_t > > promise;

		{
			std::lock_guard< std::mutex > lock{ m_state->m_lock };

			const auto now = m_state->m_now_provider();
			if( auto it = m_state->m_entries.find( key );
					it != m_state->m_entries.end() )
			{
				if( now < it->second.m_expires_at )
				{
					m_state->m_lru.splice(
							m_state->m_lru.begin(),
							m_state->m_lru,
							it->second.m_lru_position );

					return cached_value_t{
							it->second.m_value,
							remaining_ttl( it->second.m_expires_at, now )
					};
				}
				else
					m_state->remove_entry( it );
			}

			if( auto it = m_state->m_in_flight.find( key );
					it != m_state->m_in_flight.end() )
			{
				outcome = it->second.m_outcome;
				generation = it->second.m_generation;
			}
			else
			{
				promise = std::make_shared< std::promise< fetch_outcome_t > >();
				outcome = promise->get_future().share();
				generation = ++(m_state->m_generation_counter);

				m_state->m_in_flight.emplace( key,
						in_flight_t{ outcome, generation } );
			}
		}

		if( promise )
			return perform_fetch( key, generation, *promise );

		return wait_outcome( key, generation, outcome );
	}

	//! Count of values in the cache (expired values included).
	[[nodiscard]]
	std::size_t
	size() const
	{
		std::lock_guard< std::mutex > lock{ m_state->m_lock };
		return m_state->m_entries.size();
	}

private:
	using lru_list_t = std::list< Key >;

	struct entry_t
	{
		std::shared_ptr< const Value > m_value;
		clock_t::time_point m_expires_at;
		typename lru_list_t::iterator m_lru_position;
	};

	struct fetched_t
	{
		std::shared_ptr< const Value > m_value;
		clock_t::time_point m_expires_at;
	};

	using fetch_outcome_t = std::variant< failed_fetch_t, fetched_t >;

	struct in_flight_t
	{
		std::shared_future< fetch_outcome_t > m_outcome;
		//! Unique number of the fetch.
		/*!
		 * It allows to detect the results of abandoned fetches.
		 */
		std::uint64_t m_generation;
	};

	using entries_map_t = std::map< Key, entry_t >;

	//! The state of the cache.
	struct state_t
	{
		const params_t m_params;
		const fetcher_t m_fetcher;
		const now_provider_t m_now_provider;

		std::mutex m_lock;

		entries_map_t m_entries;
		//! The most recently used key is at the front.
		lru_list_t m_lru;

		std::map< Key, in_flight_t > m_in_flight;
		std::uint64_t m_generation_counter{};

		state_t(
			params_t params,
			fetcher_t fetcher,
			now_provider_t now_provider )
			:	m_params{ params }
			,	m_fetcher{ std::move(fetcher) }
			,	m_now_provider{ std::move(now_provider) }
		{}

		void
		remove_entry( typename entries_map_t::iterator it )
		{
			m_lru.erase( it->second.m_lru_position );
			m_entries.erase( it );
		}

		// NOTE: should be called with m_lock held.
		void
		store( const Key & key, const fetched_t & fetched )
		{
			const auto now = m_now_provider();
			for( auto it = m_entries.begin(); it != m_entries.end(); )
			{
				if( !(now < it->second.m_expires_at) )
				{
					auto to_remove = it++;
					remove_entry( to_remove );
				}
				else
					++it;
			}

			if( auto it = m_entries.find( key ); it != m_entries.end() )
				remove_entry( it );

			while( !m_lru.empty() && m_entries.size() >= m_params.m_max_entries )
			{
				m_entries.erase( m_lru.back() );
				m_lru.pop_back();
			}

			m_lru.push_front( key );
			m_entries.emplace( key,
					entry_t{ fetched.m_value, fetched.m_expires_at, m_lru.begin() } );
		}

		//! Completion of a fetch.
		/*!
		 * The result is stored only if the in-flight slot still belongs
		 * to that fetch.
		 */
		void
		complete(
			const Key & key,
			std::uint64_t generation,
			const fetch_outcome_t & outcome )
		{
			std::lock_guard< std::mutex > lock{ m_lock };

			const auto it = m_in_flight.find( key );
			if( it == m_in_flight.end() || it->second.m_generation != generation )
				return;

			m_in_flight.erase( it );

			if( const auto * fetched = std::get_if< fetched_t >( &outcome ) )
				store( key, *fetched );
		}
	};

	std::unique_ptr< state_t > m_state;

	[[nodiscard]]
	static std::chrono::milliseconds
	remaining_ttl(
		clock_t::time_point expires_at,
		clock_t::time_point now ) noexcept
	{
		if( !(now < expires_at) )
			return std::chrono::milliseconds::zero();

		return std::chrono::duration_cast< std::chrono::milliseconds >(
				expires_at - now );
	}

	//! Fetch a value on the caller's thread and share it with waiters.
	[[nodiscard]]
	get_result_t
	perform_fetch(
		const Key & key,
		std::uint64_t generation,
		std::promise< fetch_outcome_t > & promise )
	{
		const auto started_at = clock_t::now();

		fetch_outcome_t outcome{ failed_fetch_t{} };
		try
		{
			auto value = std::make_shared< const Value >(
					m_state->m_fetcher( key ) );
			outcome = fetched_t{
					std::move(value),
					m_state->m_now_provider() + m_state->m_params.m_ttl
			};
		}
		catch( const std::exception & x )
		{
			outcome = failed_fetch_t{ x.what() };
		}

		if( m_state->m_params.m_fetch_timeout < clock_t::now() - started_at )
			outcome = failed_fetch_t{ "fetch timed out" };

		m_state->complete( key, generation, outcome );
		promise.set_value( outcome );

		return to_get_result( outcome );
	}

	[[nodiscard]]
	get_result_t
	wait_outcome(
		const Key & key,
		std::uint64_t generation,
		const std::shared_future< fetch_outcome_t > & outcome )
	{
		if( std::future_status::ready !=
				outcome.wait_for( m_state->m_params.m_fetch_timeout ) )
		{
			std::lock_guard< std::mutex > lock{ m_state->m_lock };

			const auto it = m_state->m_in_flight.find( key );
			if( it != m_state->m_in_flight.end() &&
					it->second.m_generation == generation )
			{
				m_state->m_in_flight.erase( it );
			}

			return failed_fetch_t{ "fetch timed out" };
		}

		return to_get_result( outcome.get() );
	}

	[[nodiscard]]
	get_result_t
	to_get_result( const fetch_outcome_t & outcome ) const
	{
		if( const auto * failed = std::get_if< failed_fetch_t >( &outcome ) )
			return *failed;

		const auto & fetched = std::get< fetched_t >( outcome );
		return cached_value_t{
				fetched.m_value,
				remaining_ttl( fetched.m_expires_at, m_state->m_now_provider() )
		};
	}
};

} /* namespace dnstoys::upstream */
