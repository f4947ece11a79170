#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/severity.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iomanip>
#include <iostream>
#include <string>

namespace Btsgate
{

using BtsgateLogger = boost::log::trivial::logger_type;

// Macro that includes severity, filename and line number.
#define BTSGATE_LOG( logger, sev ) \
    BOOST_LOG_STREAM_SEV( logger, sev ) \
            << boost::log::add_value( "Line", __LINE__ ) \
            << boost::log::add_value( "File", __FILE__ ) \
            << boost::log::add_value( "Function", __FUNCTION__ )

// Macros to log to local logger.
#define BTSGATE_LOG_TRACE( logger ) BTSGATE_LOG( logger, boost::log::trivial::severity_level::trace )
#define BTSGATE_LOG_DEBUG( logger ) BTSGATE_LOG( logger, boost::log::trivial::severity_level::debug )
#define BTSGATE_LOG_INFO( logger ) BTSGATE_LOG( logger, boost::log::trivial::severity_level::info )
#define BTSGATE_LOG_WARNING( logger ) BTSGATE_LOG( logger, boost::log::trivial::severity_level::warning )
#define BTSGATE_LOG_ERROR( logger ) BTSGATE_LOG( logger, boost::log::trivial::severity_level::error )

// Macros to log to global logger.
#define BTSGATE_LOG_DEBUG_GLOBAL( ) BTSGATE_LOG( boost::log::trivial::logger::get( ), boost::log::trivial::severity_level::debug )
#define BTSGATE_LOG_INFO_GLOBAL( ) BTSGATE_LOG( boost::log::trivial::logger::get( ), boost::log::trivial::severity_level::info )
#define BTSGATE_LOG_ERROR_GLOBAL( ) BTSGATE_LOG( boost::log::trivial::logger::get( ), boost::log::trivial::severity_level::error )

inline void init_logger( boost::log::trivial::severity_level logLevel )
{
    boost::log::add_console_log
    (
        std::cout,
        boost::log::keywords::format = boost::log::expressions::stream <<
        "["   << boost::log::expressions::format_date_time< boost::posix_time::ptime >( "TimeStamp", "%Y-%m-%d %H:%M:%S.%f" ) <<
        "] [" << std::left << std::setw( 7 ) << std::setfill(' ') << boost::log::trivial::severity <<
        "] "  << boost::log::expressions::smessage <<
        " ("  << boost::log::expressions::attr< std::string >( "File" ) <<
        ":"   << boost::log::expressions::attr< int >( "Line" ) <<
        ":"   << boost::log::expressions::attr< std::string >( "Function" ) <<
        ")",
        boost::log::keywords::filter = boost::log::trivial::severity >= logLevel
    );

    boost::log::add_common_attributes( );
}

} // namespace Btsgate
