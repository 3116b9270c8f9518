#include "ShellConfig.h"
#include "Env.h"
#include "JsonText.h"
#include <iostream>

ShellConfig ShellConfig::Defaults()
{
  ShellConfig config;
  config.standard_apps = DefaultStandardApps();
  config.shortcuts = ShortcutInterceptor::DefaultBindings();
  config.credential_patterns = CredentialInjector::DefaultPatterns();
  config.external_open_patterns = {"bbb.bbz-rd-eck.de/bigbluebutton/api/join?", "meet.stashcat.com"};
  config.notification_markers = {"badge", "unread", "notification"};
  return config;
}

std::vector<StandardAppEntry> ShellConfig::DefaultStandardApps()
{
  return {
      {"schulcloud", "https://app.schul.cloud", "schul.cloud", true},
      {"moodle", "https://portal.bbz-rd-eck.com", "Moodle", true},
      {"bbb", "https://bbb.bbz-rd-eck.de", "BigBlueButton", true},
      {"taskcards", "https://bbzrdeck.taskcards.app", "TaskCards", true},
      {"cryptpad", "https://cryptpad.fr/drive", "CryptPad", true},
      {"wiki", "https://wiki.bbz-rd-eck.com", "BBZ Wiki", true},
      {"handbook", "https://viflow.bbz-rd-eck.de/viflow", "BBZ Handbuch", true},
  };
}

bool ShellConfig::ParseStandardApps(const std::string &json, std::vector<StandardAppEntry> &out)
{
  std::vector<StandardAppEntry> parsed;
  bool ok = ForEachJsonMember(json, [&](const std::string &key, const std::string &object) {
    StandardAppEntry entry;
    entry.id = key;
    if (!ExtractJsonStringField(object, "url", entry.url) || entry.url.empty())
      return;
    if (!ExtractJsonStringField(object, "title", entry.title))
      entry.title = key;
    ExtractJsonBoolField(object, "visible", entry.visible);
    parsed.push_back(std::move(entry));
  });
  if (!ok || parsed.empty())
    return false;
  out = std::move(parsed);
  return true;
}

bool ShellConfig::ParseShortcuts(const std::string &json, std::vector<ShortcutBinding> &bindings)
{
  size_t merged = 0;
  bool ok = ForEachJsonMember(json, [&](const std::string &accelerator, const std::string &action) {
    ShortcutBinding binding;
    if (!ShortcutInterceptor::ParseAccelerator(accelerator, action, binding))
    {
      std::cerr << "[ShellConfig] warning: ignoring shortcut '" << accelerator << "'" << std::endl;
      return;
    }
    ShortcutInterceptor::MergeBinding(bindings, binding);
    ++merged;
  });
  return ok && merged > 0;
}

bool ShellConfig::ParseServicePatterns(const std::string &json, std::vector<ServicePattern> &out)
{
  std::vector<ServicePattern> parsed;
  bool ok = ForEachJsonArrayObject(json, [&](const std::string &object) {
    ServicePattern p;
    if (ExtractJsonStringField(object, "pattern", p.pattern) && ExtractJsonStringField(object, "service", p.service) &&
        !p.pattern.empty() && !p.service.empty())
      parsed.push_back(std::move(p));
  });
  if (!ok || parsed.empty())
    return false;
  out = std::move(parsed);
  return true;
}

void ShellConfig::LoadFromDirectory(const std::string &dir)
{
  std::string base = dir.empty() ? std::string() : dir + "/";
  std::string text;

  if (ReadTextFile(base + "standard_apps.json", text) && !ParseStandardApps(text, standard_apps))
    std::cerr << "[ShellConfig] warning: standard_apps.json unreadable, using defaults" << std::endl;

  if (ReadTextFile(base + "shortcuts.json", text) && !ParseShortcuts(text, shortcuts))
    std::cerr << "[ShellConfig] warning: shortcuts.json has no usable entries" << std::endl;

  if (ReadTextFile(base + "credential_services.json", text) && !ParseServicePatterns(text, credential_patterns))
    std::cerr << "[ShellConfig] warning: credential_services.json unreadable, using defaults" << std::endl;
}

void ShellConfig::ApplyEnvironment()
{
  std::string level = GetEnvVar("APPDOCK_LOG_LEVEL");
  if (!level.empty())
    log_level = ParseSeverity(level, log_level);

  long long value = 0;
  if (GetEnvInt("APPDOCK_STARTUP_GRACE_MS", value) && value >= 0)
    startup_grace = std::chrono::milliseconds(value);
  if (GetEnvInt("APPDOCK_POLL_INTERVAL_MS", value) && value > 0)
    poll_period = std::chrono::milliseconds(value);

  std::string service = GetEnvVar("APPDOCK_CREDENTIAL_SERVICE");
  if (!service.empty())
    credential_service = service;
}
