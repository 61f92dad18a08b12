// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_APP_OFFLINE_MANAGER_HPP
#define FERRY_APP_OFFLINE_MANAGER_HPP

#include <string>

namespace ferry {
namespace deploy {

/**
 * Produces the app_offline.htm marker that makes IIS stop the application
 * and serve a static page while files are replaced.
 */
class AppOfflineManager {
public:
  static constexpr const char* kFileName = "app_offline.htm";

  AppOfflineManager() = default;
  explicit AppOfflineManager(std::string custom_template);

  static const std::string& defaultContent();

  /**
   * Replace the maintenance page. A blank template restores the default.
   */
  void setCustomTemplate(const std::string& html);

  /**
   * Maintenance page, or the failure page with msg HTML-escaped into it when
   * is_error is set. An empty msg becomes "An unknown error occurred.".
   */
  std::string generateContent(bool is_error = false, const std::string& msg = "") const;

  /**
   * Write app_offline.htm into dir.
   *
   * @return full path of the written file
   * @throws std::invalid_argument if dir is blank
   * @throws std::runtime_error if dir does not exist or the write fails
   */
  std::string createFile(
    const std::string& dir, bool is_error = false, const std::string& msg = ""
  ) const;

  /**
   * True when path exists and looks like a usable HTML page.
   */
  static bool validateFile(const std::string& path);

  static std::string escapeHtml(const std::string& text);

private:
  std::string custom_template_;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_APP_OFFLINE_MANAGER_HPP
