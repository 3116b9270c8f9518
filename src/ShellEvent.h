#pragma once
#include <functional>
#include <map>
#include <string>

enum class ShellEventType
{
  Loading,
  Loaded,
  Navigated,
  Error,
  Activated,
  NewWindowRequested,
  ExternalOpenRequested,
  ContextMenu,
  ShortcutForwarded,
  BadgeUpdate,
  DiagnosticLog
};

enum class Severity
{
  Debug,
  Info,
  Warn,
  Error
};

const char *ShellEventName(ShellEventType type);
const char *SeverityName(Severity level);
Severity ParseSeverity(const std::string &text, Severity fallback);

/**
 * One-way notification from the view manager to the host UI. Every event that
 * originates from a content view carries its id; only the members relevant to
 * the type are meaningful.
 */
struct ShellEvent
{
  ShellEventType type = ShellEventType::DiagnosticLog;
  std::string view_id; // empty means null for Activated
  bool flag = false;   // loading / hasNotification
  std::string url;
  std::string title;
  int error_code = 0;
  std::string description;
  std::string selection_text;
  int x = 0;
  int y = 0;
  std::string action;
  Severity level = Severity::Info;
  std::string log_type;
  std::string message;
  std::map<std::string, std::string> data;

  static ShellEvent Loading(const std::string &id, bool loading);
  static ShellEvent Loaded(const std::string &id, const std::string &url);
  static ShellEvent Navigated(const std::string &id, const std::string &url);
  static ShellEvent LoadError(const std::string &id, int code, const std::string &description, const std::string &url);
  static ShellEvent Activated(const std::string &id);
  static ShellEvent NewWindowRequested(const std::string &url, const std::string &title);
  static ShellEvent ExternalOpenRequested(const std::string &url);
  static ShellEvent ContextMenu(const std::string &id, const std::string &selection_text, int x, int y);
  static ShellEvent ShortcutForwarded(const std::string &action, const std::string &view_id);
  static ShellEvent BadgeUpdate(bool has_notification);
  static ShellEvent Diagnostic(Severity level, const std::string &type, const std::string &message,
                               const std::map<std::string, std::string> &data);

  // {"type":"...","payload":{...}}
  std::string ToJSON() const;
};

class ShellEventSink
{
public:
  virtual ~ShellEventSink() = default;

  // Returns false when the host UI could not be reached.
  virtual bool Deliver(const ShellEvent &event) = 0;
};

using ShellEventCallback = std::function<void(const ShellEvent &)>;
