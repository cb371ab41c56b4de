#pragma once

#include "mpc_config.hpp"

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mpc
{
    /**
     * @brief Library logger, named "mpc". A logger already registered under that name is reused,
     * so applications can install their own sinks before the first encode/decode call.
     * @return std::shared_ptr< spdlog::logger >
     */
    inline std::shared_ptr< spdlog::logger > logger( )
    {
        static const std::shared_ptr< spdlog::logger > instance = [ ]
        {
            auto existing = spdlog::get( "mpc" );

            if ( existing )
                return existing;

            auto created = spdlog::stderr_color_mt( "mpc" );
            created->set_level( static_cast< spdlog::level::level_enum >( MPC_LOG_LEVEL ) );

            return created;
        }( );

        return instance;
    }

    inline void set_log_level( const spdlog::level::level_enum level )
    {
        logger( )->set_level( level );
    }
}

/*
 * Not routed through SPDLOG_LOGGER_* so that the run-time level alone decides, independent of SPDLOG_ACTIVE_LEVEL.
 */
#define MPC_TRACE( ... ) ( ::mpc::logger( )->trace( __VA_ARGS__ ) )
#define MPC_DEBUG( ... ) ( ::mpc::logger( )->debug( __VA_ARGS__ ) )
