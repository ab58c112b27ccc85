#include "util/LoggingUtil.hpp"

#include "util/Exception.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = spdlog::level::from_str(params.log_level);

  // from_str() maps unknown names to off, so only trust an "off" that was asked for
  if (level == spdlog::level::off && params.log_level != "off") {
    throw CleanException("Invalid log level: \"{}\"", params.log_level);
  }

  // Collect sinks
  std::vector<spdlog::sink_ptr> sinks;

  const char* format = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  // Console sink
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern(format);
  sinks.push_back(console_sink);

  // File sink, if needed
  if (!params.log_filename.empty()) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename,
                                                                      !params.append_mode);
    } catch (const spdlog::spdlog_ex& e) {
      throw CleanException("Unable to open log file \"{}\": {}", params.log_filename, e.what());
    }
    file_sink->set_pattern(format);
    sinks.push_back(file_sink);
  }

  // Create and set the default logger
  auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::debug);
  spdlog::set_level(level);
}

}  // namespace util
