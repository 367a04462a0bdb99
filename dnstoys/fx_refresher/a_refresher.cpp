/*!
 * @file
 * @brief Agent for periodic updates of currency rates.
 */

#include <dnstoys/fx_refresher/a_refresher.hpp>

#include <dnstoys/logging/wrap_logging.hpp>

#include <fmt/chrono.h>

namespace dnstoys::fx_refresher
{

//
// a_refresher_t
//
a_refresher_t::a_refresher_t(
	context_t ctx,
	application_context_t app_ctx,
	params_t params )
	:	so_5::agent_t{ std::move(ctx) }
	,	m_app_ctx{ std::move(app_ctx) }
	,	m_params{ std::move(params) }
{}

void
a_refresher_t::so_define_agent()
{
	so_subscribe_self().event( &a_refresher_t::on_refresh );
}

void
a_refresher_t::so_evt_start()
{
	// The first attempt is made right now, then periodically.
	m_refresh_timer = so_5::send_periodic< refresh_t >(
			*this,
			std::chrono::milliseconds::zero(),
			m_params.m_refresh_interval );

	::dnstoys::logging::wrap_logging(
			*m_app_ctx.m_logger,
			spdlog::level::info,
			[this]( auto & logger, auto level )
			{
				logger.log( level, "{}: started, refresh interval: {}",
						m_params.m_name,
						m_params.m_refresh_interval );
			} );
}

void
a_refresher_t::so_evt_finish()
{
	m_refresh_timer.release();
}

void
a_refresher_t::on_refresh( mhood_t< refresh_t > )
{
	try
	{
		auto table = std::make_shared< const ::dnstoys::upstream::rates_table_t >(
				m_params.m_loader() );

		::dnstoys::logging::wrap_logging(
				*m_app_ctx.m_logger,
				spdlog::level::info,
				[&]( auto & logger, auto level )
				{
					logger.log( level, "{}: rates updated, base: {}, currencies: {}",
							m_params.m_name,
							table->m_base,
							table->m_rates.size() );
				} );

		m_params.m_rates->update( std::move(table) );
	}
	catch( const std::exception & x )
	{
		// The previous table (if any) remains in use.
		::dnstoys::logging::wrap_logging(
				*m_app_ctx.m_logger,
				spdlog::level::err,
				[&]( auto & logger, auto level )
				{
					logger.log( level, "{}: unable to update rates: {}",
							m_params.m_name,
							x.what() );
				} );
	}
}

//
// introduce_fx_refresher
//
void
introduce_fx_refresher(
	so_5::environment_t & env,
	so_5::coop_handle_t parent_coop,
	so_5::disp_binder_shptr_t disp_binder,
	application_context_t app_ctx,
	params_t params )
{
	env.introduce_coop(
			parent_coop,
			std::move(disp_binder),
			[&]( so_5::coop_t & coop ) {
				coop.make_agent< a_refresher_t >(
						std::move(app_ctx),
						std::move(params) );
			} );
}

} /* namespace dnstoys::fx_refresher */
