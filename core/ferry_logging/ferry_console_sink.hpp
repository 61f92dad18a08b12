// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONSOLE_SINK_HPP
#define FERRY_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <ostream>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Async console sink. Records beyond the queue bound are dropped.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * ANSI color escape for a severity, empty for unknown levels.
 */
const char* get_color(severity_level level);

/**
 * Create the console sink.
 *
 * @param min_level Records below this level are filtered out
 * @param use_colors Wrap the severity tag in ANSI colors
 * @param stream Target stream, std::clog when null
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true,
  std::ostream* stream = nullptr
);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_CONSOLE_SINK_HPP
