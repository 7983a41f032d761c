#ifndef FSTORE_LOGGER_HPP
#define FSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace fstore::logging {

// Shares the trivial logger's levels so BOOST_LOG_TRIVIAL records and the
// LOG_* macros go through the same filter
using severity_level = boost::log::trivial::severity_level;

using global_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, global_logger_type)

// Replaces all sinks with a text file sink
void init_logging(const std::string& log_file = "fstore.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Parses "trace" ... "fatal"; returns false on an unknown name
bool parse_severity(const std::string& name, severity_level& level);

} // namespace fstore::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::trace)
#define LOG_DEBUG BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::debug)
#define LOG_INFO BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::info)
#define LOG_WARN BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::warning)
#define LOG_ERROR BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::error)
#define LOG_FATAL BOOST_LOG_SEV(fstore::logging::global_logger::get(), fstore::logging::severity_level::fatal)

#endif // FSTORE_LOGGER_HPP
