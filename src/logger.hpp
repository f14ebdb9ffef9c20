#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <string>

namespace sig0
{
    namespace logger
    {
        typedef boost::log::trivial::severity_level Level;
        const Level TRACE   = boost::log::trivial::trace;
        const Level DEBUG   = boost::log::trivial::debug;
        const Level INFO    = boost::log::trivial::info;
        const Level WARNING = boost::log::trivial::warning;
        const Level ERROR   = boost::log::trivial::error;
        const Level FATAL   = boost::log::trivial::fatal;

        // "trace", "debug", "info", "warning", "error", "fatal"
        Level toLevel( const std::string &level );

        /*!
         * level以上のログをstderrに出力する
         * 初期化しない場合、Boost.Logの既定のsinkが使用される
         */
        void initialize( Level level = WARNING );
        void initialize( const std::string &level );

        // 出力を止める. テスト用
        void disable();
    }
}

#endif
