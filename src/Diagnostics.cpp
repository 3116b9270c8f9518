#include "Diagnostics.h"
#include <iostream>

Diagnostics::Diagnostics(Severity threshold) : threshold_(threshold) {}

void Diagnostics::Log(Severity level, const std::string &component, const std::string &message) const
{
  if (static_cast<int>(level) < static_cast<int>(threshold_))
    return;

  std::ostream &out = (level == Severity::Warn || level == Severity::Error) ? std::cerr : std::cout;
  out << "[" << component << "] ";
  if (level == Severity::Warn)
    out << "warning: ";
  else if (level == Severity::Error)
    out << "error: ";
  out << message << std::endl;
}

void Diagnostics::Report(Severity level, const std::string &type, const std::string &component,
                         const std::string &message, const std::map<std::string, std::string> &data)
{
  Log(level, component, message);

  if (!sink_)
    return;
  if (!sink_->Deliver(ShellEvent::Diagnostic(level, type, message, data)))
    Log(Severity::Debug, "Diagnostics", "host unreachable, dropped " + type + " event");
}
