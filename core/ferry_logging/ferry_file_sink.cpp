// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>

namespace ferry {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

std::string timestamp_of(boost::log::record_view const& rec) {
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (!time_stamp) {
    return {};
  }
  return boost::posix_time::to_iso_extended_string(*time_stamp);
}

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;
  line["ts"] = timestamp_of(rec);

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  line["level"] = sev ? severity_name(*sev) : "";

  auto message = rec[expr::smessage];
  line["msg"] = message ? message.get() : std::string();

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    std::ostringstream oss;
    oss << *thread_id;
    line["thread_id"] = oss.str();
  }

  auto deployment = boost::log::extract<std::string>("DeploymentID", rec);
  if (deployment) {
    line["deployment_id"] = *deployment;
  }
  auto profile = boost::log::extract<std::string>("Profile", rec);
  if (profile) {
    line["profile"] = *profile;
  }

  // Invalid UTF-8 in a remote file name must not abort logging.
  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[" << timestamp_of(rec) << "] ";

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << "[" << *sev << "] ";
  }

  strm << rec[expr::smessage];

  auto deployment = boost::log::extract<std::string>("DeploymentID", rec);
  auto profile = boost::log::extract<std::string>("Profile", rec);
  if (deployment || profile) {
    strm << " |";
    if (profile) strm << " profile=" << *profile;
    if (deployment) strm << " deployment=" << *deployment;
  }
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  boost::filesystem::path log_directory(config.directory);

  if (!boost::filesystem::exists(log_directory)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(log_directory, ec);
    if (ec) {
      // Logging is not up yet, so report on stderr.
      log_directory = boost::filesystem::temp_directory_path();
      std::cerr << "[ferry_logging] Warning: cannot create log directory '" << config.directory
                << "': " << ec.message() << ". Using " << log_directory.string() << "\n";
    }
  }

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = (log_directory / config.file_pattern).string(),
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory.string(), keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

}  // namespace logging
}  // namespace ferry
