// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/preprocessor/cat.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in ferry_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured messages.
 * Usage: FERRY_LOG_INFO("Uploaded" << kv("file", path) << kv("bytes", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace ferry

// Each translation unit defines FERRY_LOG_COMPONENT before including this header.
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

#define FERRY_LOG_AT_LEVEL_(level, msg)                                                    \
  do {                                                                                     \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::level) \
      << "[" << FERRY_LOG_COMPONENT << "] " << msg;                                        \
  } while (0)

#define FERRY_LOG_DEBUG(msg)            \
  do {                                  \
    if (FERRY_LOG_ENABLE_DEBUG) {       \
      FERRY_LOG_AT_LEVEL_(debug, msg);  \
    }                                   \
  } while (0)

#define FERRY_LOG_INFO(msg) FERRY_LOG_AT_LEVEL_(info, msg)
#define FERRY_LOG_WARN(msg) FERRY_LOG_AT_LEVEL_(warn, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_AT_LEVEL_(error, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_AT_LEVEL_(fatal, msg)

// Attaches DeploymentID and Profile attributes to every record logged by this
// thread until the enclosing scope exits.
#define FERRY_LOG_SCOPED_CONTEXT(deployment_id_val, profile_val)                      \
  ::boost::log::scoped_attribute BOOST_PP_CAT(_ferry_ctx_deployment_, __LINE__) =     \
    ::boost::log::add_scoped_thread_attribute(                                        \
      "DeploymentID", ::boost::log::attributes::constant<std::string>(deployment_id_val) \
    );                                                                                \
  ::boost::log::scoped_attribute BOOST_PP_CAT(_ferry_ctx_profile_, __LINE__) =        \
    ::boost::log::add_scoped_thread_attribute(                                        \
      "Profile", ::boost::log::attributes::constant<std::string>(profile_val)         \
    );                                                                                \
  (void)BOOST_PP_CAT(_ferry_ctx_deployment_, __LINE__);                               \
  (void)BOOST_PP_CAT(_ferry_ctx_profile_, __LINE__)

// At most one record per interval_sec from a given call site.
#define FERRY_LOG_THROTTLED_(level, interval_sec, msg)                                    \
  do {                                                                                    \
    static std::chrono::steady_clock::time_point _ferry_last_log_time{};                  \
    static std::mutex _ferry_throttle_mutex;                                              \
    auto _ferry_now = std::chrono::steady_clock::now();                                   \
    bool _ferry_should_log = false;                                                       \
    {                                                                                     \
      std::lock_guard<std::mutex> _ferry_lock(_ferry_throttle_mutex);                     \
      if (_ferry_now - _ferry_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _ferry_last_log_time = _ferry_now;                                                \
        _ferry_should_log = true;                                                         \
      }                                                                                   \
    }                                                                                     \
    if (_ferry_should_log) {                                                              \
      FERRY_LOG_AT_LEVEL_(level, msg);                                                    \
    }                                                                                     \
  } while (0)

#define FERRY_LOG_INFO_THROTTLE(interval_sec, msg) FERRY_LOG_THROTTLED_(info, interval_sec, msg)
#define FERRY_LOG_WARN_THROTTLE(interval_sec, msg) FERRY_LOG_THROTTLED_(warn, interval_sec, msg)

#endif  // FERRY_LOG_MACROS_HPP
