// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_FILE_SINK_HPP
#define FERRY_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * Rotating log file settings.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/ferry";
  std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = false;  // one JSON object per line when true
};

/**
 * Create the rotating file sink.
 *
 * Falls back to the system temp directory when the configured directory
 * cannot be created.
 *
 * @param config File sink settings
 * @param min_level Records below this level are filtered out
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_FILE_SINK_HPP
