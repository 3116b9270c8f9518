#include "ShellEvent.h"
#include "JsonText.h"
#include <algorithm>
#include <cctype>
#include <sstream>

const char *ShellEventName(ShellEventType type)
{
  switch (type)
  {
  case ShellEventType::Loading:
    return "loading";
  case ShellEventType::Loaded:
    return "loaded";
  case ShellEventType::Navigated:
    return "navigated";
  case ShellEventType::Error:
    return "error";
  case ShellEventType::Activated:
    return "activated";
  case ShellEventType::NewWindowRequested:
    return "new-window-requested";
  case ShellEventType::ExternalOpenRequested:
    return "external-open-requested";
  case ShellEventType::ContextMenu:
    return "context-menu";
  case ShellEventType::ShortcutForwarded:
    return "shortcut-forwarded";
  case ShellEventType::BadgeUpdate:
    return "badge-update";
  case ShellEventType::DiagnosticLog:
    return "diagnostic-log";
  }
  return "unknown";
}

const char *SeverityName(Severity level)
{
  switch (level)
  {
  case Severity::Debug:
    return "debug";
  case Severity::Info:
    return "info";
  case Severity::Warn:
    return "warn";
  case Severity::Error:
    return "error";
  }
  return "info";
}

Severity ParseSeverity(const std::string &text, Severity fallback)
{
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug")
    return Severity::Debug;
  if (lower == "info")
    return Severity::Info;
  if (lower == "warn" || lower == "warning")
    return Severity::Warn;
  if (lower == "error")
    return Severity::Error;
  return fallback;
}

ShellEvent ShellEvent::Loading(const std::string &id, bool loading)
{
  ShellEvent e;
  e.type = ShellEventType::Loading;
  e.view_id = id;
  e.flag = loading;
  return e;
}

ShellEvent ShellEvent::Loaded(const std::string &id, const std::string &url)
{
  ShellEvent e;
  e.type = ShellEventType::Loaded;
  e.view_id = id;
  e.url = url;
  return e;
}

ShellEvent ShellEvent::Navigated(const std::string &id, const std::string &url)
{
  ShellEvent e;
  e.type = ShellEventType::Navigated;
  e.view_id = id;
  e.url = url;
  return e;
}

ShellEvent ShellEvent::LoadError(const std::string &id, int code, const std::string &description,
                                 const std::string &url)
{
  ShellEvent e;
  e.type = ShellEventType::Error;
  e.view_id = id;
  e.error_code = code;
  e.description = description;
  e.url = url;
  return e;
}

ShellEvent ShellEvent::Activated(const std::string &id)
{
  ShellEvent e;
  e.type = ShellEventType::Activated;
  e.view_id = id;
  return e;
}

ShellEvent ShellEvent::NewWindowRequested(const std::string &url, const std::string &title)
{
  ShellEvent e;
  e.type = ShellEventType::NewWindowRequested;
  e.url = url;
  e.title = title;
  return e;
}

ShellEvent ShellEvent::ExternalOpenRequested(const std::string &url)
{
  ShellEvent e;
  e.type = ShellEventType::ExternalOpenRequested;
  e.url = url;
  return e;
}

ShellEvent ShellEvent::ContextMenu(const std::string &id, const std::string &selection_text, int x, int y)
{
  ShellEvent e;
  e.type = ShellEventType::ContextMenu;
  e.view_id = id;
  e.selection_text = selection_text;
  e.x = x;
  e.y = y;
  return e;
}

ShellEvent ShellEvent::ShortcutForwarded(const std::string &action, const std::string &view_id)
{
  ShellEvent e;
  e.type = ShellEventType::ShortcutForwarded;
  e.action = action;
  e.view_id = view_id;
  return e;
}

ShellEvent ShellEvent::BadgeUpdate(bool has_notification)
{
  ShellEvent e;
  e.type = ShellEventType::BadgeUpdate;
  e.flag = has_notification;
  return e;
}

ShellEvent ShellEvent::Diagnostic(Severity level, const std::string &type, const std::string &message,
                                  const std::map<std::string, std::string> &data)
{
  ShellEvent e;
  e.type = ShellEventType::DiagnosticLog;
  e.level = level;
  e.log_type = type;
  e.message = message;
  e.data = data;
  return e;
}

std::string ShellEvent::ToJSON() const
{
  std::ostringstream os;
  os << "{\"type\":" << QuoteJson(ShellEventName(type)) << ",\"payload\":{";
  switch (type)
  {
  case ShellEventType::Loading:
    os << "\"id\":" << QuoteJson(view_id) << ",\"loading\":" << (flag ? "true" : "false");
    break;
  case ShellEventType::Loaded:
  case ShellEventType::Navigated:
    os << "\"id\":" << QuoteJson(view_id) << ",\"url\":" << QuoteJson(url);
    break;
  case ShellEventType::Error:
    os << "\"id\":" << QuoteJson(view_id) << ",\"error\":{\"code\":" << error_code
       << ",\"description\":" << QuoteJson(description) << ",\"url\":" << QuoteJson(url) << "}";
    break;
  case ShellEventType::Activated:
    os << "\"id\":" << (view_id.empty() ? std::string("null") : QuoteJson(view_id));
    break;
  case ShellEventType::NewWindowRequested:
    os << "\"url\":" << QuoteJson(url) << ",\"title\":" << QuoteJson(title);
    break;
  case ShellEventType::ExternalOpenRequested:
    os << "\"url\":" << QuoteJson(url);
    break;
  case ShellEventType::ContextMenu:
    os << "\"id\":" << QuoteJson(view_id) << ",\"selectionText\":" << QuoteJson(selection_text)
       << ",\"x\":" << x << ",\"y\":" << y;
    break;
  case ShellEventType::ShortcutForwarded:
    os << "\"action\":" << QuoteJson(action) << ",\"viewId\":" << QuoteJson(view_id);
    break;
  case ShellEventType::BadgeUpdate:
    os << "\"hasNotification\":" << (flag ? "true" : "false");
    break;
  case ShellEventType::DiagnosticLog:
  {
    os << "\"type\":" << QuoteJson(log_type) << ",\"level\":" << QuoteJson(SeverityName(level))
       << ",\"message\":" << QuoteJson(message) << ",\"data\":{";
    bool first = true;
    for (const auto &entry : data)
    {
      if (!first)
        os << ",";
      first = false;
      os << QuoteJson(entry.first) << ":" << QuoteJson(entry.second);
    }
    os << "}";
    break;
  }
  }
  os << "}}";
  return os.str();
}
