// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "app_offline_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ferry {
namespace deploy {

namespace {

const char* const kMaintenanceTemplate = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>Application Offline</title>
    <style>
        body { font-family: Helvetica, Arial, sans-serif; background: #eef1f5; margin: 0; padding: 20px; }
        .panel { background: #fff; max-width: 600px; margin: 80px auto; padding: 40px; border-radius: 8px; text-align: center; }
        h1 { color: #2b3a4a; margin-top: 0; }
        p { color: #5a6570; line-height: 1.6; }
        .footer { margin-top: 30px; color: #9aa3ab; font-size: 0.9em; }
    </style>
</head>
<body>
    <div class="panel">
        <h1>Application Offline for Maintenance</h1>
        <p>A new version of this application is being deployed.</p>
        <p>The site will be back online shortly. Thank you for your patience.</p>
        <div class="footer">Deployed with ferry</div>
    </div>
</body>
</html>
)HTML";

const char* const kErrorTemplate = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>Deployment Failed</title>
    <style>
        body { font-family: Helvetica, Arial, sans-serif; background: #f7ecec; margin: 0; padding: 20px; }
        .panel { background: #fff; max-width: 600px; margin: 80px auto; padding: 40px; border-radius: 8px; text-align: center; }
        h1 { color: #c62828; margin-top: 0; }
        p { color: #5a6570; line-height: 1.6; }
        .error-message { background: #ffebee; border-left: 4px solid #c62828; padding: 15px; text-align: left; font-family: monospace; }
        .footer { margin-top: 30px; color: #9aa3ab; font-size: 0.9em; }
    </style>
</head>
<body>
    <div class="panel">
        <h1>Deployment Failed</h1>
        <p>An error occurred during the deployment process.</p>
        <div class="error-message">{ERROR_MESSAGE}</div>
        <p>Please contact your system administrator for assistance.</p>
        <div class="footer">Deployed with ferry</div>
    </div>
</body>
</html>
)HTML";

const char* const kPlaceholder = "{ERROR_MESSAGE}";

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

}  // namespace

AppOfflineManager::AppOfflineManager(std::string custom_template)
    : custom_template_(std::move(custom_template)) {}

const std::string& AppOfflineManager::defaultContent() {
  static const std::string content = kMaintenanceTemplate;
  return content;
}

void AppOfflineManager::setCustomTemplate(const std::string& html) {
  custom_template_ = html;
}

std::string AppOfflineManager::escapeHtml(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string AppOfflineManager::generateContent(bool is_error, const std::string& msg) const {
  if (!is_error) {
    return isBlank(custom_template_) ? defaultContent() : custom_template_;
  }

  std::string content = kErrorTemplate;
  const std::string escaped = escapeHtml(isBlank(msg) ? "An unknown error occurred." : msg);
  const auto pos = content.find(kPlaceholder);
  if (pos != std::string::npos) {
    content.replace(pos, std::char_traits<char>::length(kPlaceholder), escaped);
  }
  return content;
}

std::string AppOfflineManager::createFile(
  const std::string& dir, bool is_error, const std::string& msg
) const {
  if (isBlank(dir)) {
    throw std::invalid_argument("Directory path cannot be empty.");
  }
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw std::runtime_error("Directory not found: " + dir);
  }

  const fs::path path = fs::path(dir) / kFileName;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to create " + path.string());
  }
  out << generateContent(is_error, msg);
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write " + path.string());
  }
  return path.string();
}

bool AppOfflineManager::validateFile(const std::string& path) {
  if (isBlank(path)) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string content = buffer.str();
  if (content.size() < 100 || isBlank(content)) {
    return false;
  }

  std::transform(content.begin(), content.end(), content.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return content.find("<html") != std::string::npos;
}

}  // namespace deploy
}  // namespace ferry
