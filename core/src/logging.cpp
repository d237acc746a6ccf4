#include "lcfeat/logging.hpp"
#include "lcfeat/errors.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace lcfeat {

namespace {

boost::log::trivial::severity_level toSeverity(LogLevel level) {
    namespace trivial = boost::log::trivial;
    switch (level) {
        case LogLevel::TRACE: return trivial::trace;
        case LogLevel::DEBUG: return trivial::debug;
        case LogLevel::INFO: return trivial::info;
        case LogLevel::WARNING: return trivial::warning;
        case LogLevel::ERROR: return trivial::error;
        default: return trivial::fatal;
    }
}

} // namespace

void initLogging(LogLevel level) {
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= toSeverity(level));
}

LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    throw ConfigError("unknown log level '" + name + "'");
}

} // namespace lcfeat
