#pragma once
#include "CredentialInjector.h"
#include "ShellEvent.h"
#include "ShortcutInterceptor.h"
#include <chrono>
#include <string>
#include <vector>

struct StandardAppEntry
{
  std::string id;
  std::string url;
  std::string title;
  bool visible = true;
};

/**
 * Everything the view manager can be tuned with. Starts from built-in
 * defaults; LoadFromDirectory() and ApplyEnvironment() layer the optional
 * assets/*.json files and APPDOCK_* variables on top. Malformed input keeps
 * the defaults.
 */
struct ShellConfig
{
  int header_height = 48;
  int sidebar_width = 450;
  std::chrono::milliseconds resize_debounce{16};
  std::chrono::milliseconds startup_grace{15000};
  std::chrono::milliseconds poll_grace{2000};
  std::chrono::milliseconds poll_period{3000};

  std::vector<StandardAppEntry> standard_apps;
  std::vector<ShortcutBinding> shortcuts;
  std::vector<ServicePattern> credential_patterns;
  std::string credential_service = "appdock";

  // New-window requests matching one of these open in the system browser.
  std::vector<std::string> external_open_patterns;
  std::vector<std::string> notification_markers;
  std::string new_window_title = "AppDock";

  Severity log_level = Severity::Info;

  static ShellConfig Defaults();
  static std::vector<StandardAppEntry> DefaultStandardApps();

  // { "id": { "url": "...", "title": "...", "visible": true }, ... }
  static bool ParseStandardApps(const std::string &json, std::vector<StandardAppEntry> &out);
  // { "Ctrl+Shift+K": "action", ... } merged into bindings.
  static bool ParseShortcuts(const std::string &json, std::vector<ShortcutBinding> &bindings);
  // [ { "pattern": "...", "service": "..." }, ... ]
  static bool ParseServicePatterns(const std::string &json, std::vector<ServicePattern> &out);

  // Reads standard_apps.json, shortcuts.json and credential_services.json from dir.
  void LoadFromDirectory(const std::string &dir);
  void ApplyEnvironment();
};
