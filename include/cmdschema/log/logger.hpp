#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "cmdschema/log/log_config.hpp"

namespace cmdschema::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace cmdschema::log

#define CMDSCHEMA_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define CMDSCHEMA_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define CMDSCHEMA_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define CMDSCHEMA_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define CMDSCHEMA_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define CMDSCHEMA_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
