#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_TRACE() and LOG_DEBUG() statements are compiled out. In order to enable them,
// configure with -DCONNECTZ_DEBUG_LOGGING=ON.
//
// Everything is written to stderr (and optionally to a file), never to stdout.

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "warn";
    bool append_mode = false;
    bool omit_timestamps = false;

    boost::program_options::options_description make_options_description();
  };

  // Throws util::CleanException if params.log_level is not a valid spdlog level name, or if the
  // log file cannot be opened.
  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
