#include "logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace sig0
{
    namespace logger
    {
        Level toLevel( const std::string &level )
        {
            if ( level == "trace" )
                return TRACE;
            if ( level == "debug" )
                return DEBUG;
            if ( level == "info" )
                return INFO;
            if ( level == "warning" )
                return WARNING;
            if ( level == "error" )
                return ERROR;
            if ( level == "fatal" )
                return FATAL;

            throw std::runtime_error( "unknown log level \"" + level + "\"" );
        }

        void initialize( Level level )
        {
            namespace expr = boost::log::expressions;

            boost::log::core::get()->set_logging_enabled( true );
            boost::log::core::get()->set_filter( boost::log::trivial::severity >= level );
            boost::log::add_common_attributes();
            boost::log::add_console_log( std::clog,
                                         boost::log::keywords::format =
                                             ( expr::stream << "[" << boost::log::trivial::severity << "] "
                                                            << expr::smessage ) );
        }

        void initialize( const std::string &level )
        {
            initialize( toLevel( level ) );
        }

        void disable()
        {
            boost::log::core::get()->set_logging_enabled( false );
        }
    }
}
