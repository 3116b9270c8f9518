#pragma once
#include "ShellEvent.h"
#include <map>
#include <string>

/**
 * Console logging in the "[Component] message" form, optionally mirrored to
 * the host UI as diagnostic-log events.
 *
 * Info and debug lines go to std::cout, warnings and errors to std::cerr.
 */
class Diagnostics
{
public:
  explicit Diagnostics(Severity threshold = Severity::Info);

  void set_sink(ShellEventSink *sink) { sink_ = sink; }
  void set_threshold(Severity level) { threshold_ = level; }
  Severity threshold() const { return threshold_; }

  // Console only.
  void Log(Severity level, const std::string &component, const std::string &message) const;

  // Console plus a diagnostic-log event of the given type.
  void Report(Severity level, const std::string &type, const std::string &component,
              const std::string &message, const std::map<std::string, std::string> &data = {});

private:
  Severity threshold_;
  ShellEventSink *sink_ = nullptr;
};
