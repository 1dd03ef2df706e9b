#pragma once

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <fmt/format.h>

#include <iostream>
#include <string>

#include "conf/challtestsrv_config.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

namespace challtestsrv {

inline logging::trivial::severity_level
severity_from_string(const std::string &level) {
  if (level == "trace") {
    return logging::trivial::trace;
  } else if (level == "debug") {
    return logging::trivial::debug;
  } else if (level == "warning") {
    return logging::trivial::warning;
  } else if (level == "error") {
    return logging::trivial::error;
  } else if (level == "fatal") {
    return logging::trivial::fatal;
  }
  return logging::trivial::info;
}

inline void init_my_log(const LoggingConfig &loggingConfig) {
  if (loggingConfig.log_dir.empty()) {
    logging::add_console_log(
        std::clog,
        logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%",
        logging::keywords::auto_flush = true);
  } else {
    std::string logfile = fmt::format("{}/{}_%N.log", loggingConfig.log_dir,
                                      loggingConfig.log_file);

    auto sink = logging::add_file_log(
        logging::keywords::file_name = logfile,
        logging::keywords::rotation_size = loggingConfig.rotation_size,
        logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%",
        logging::keywords::auto_flush = true,
        logging::keywords::open_mode = std::ios_base::app);
    sink->locked_backend()->set_file_collector(
        logging::sinks::file::make_collector(
            logging::keywords::target = loggingConfig.log_dir,
            logging::keywords::max_size = loggingConfig.rotation_size * 10,
            logging::keywords::max_files = 10));
    sink->locked_backend()->scan_for_files();
  }

  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   severity_from_string(loggingConfig.level));
}

} // namespace challtestsrv
