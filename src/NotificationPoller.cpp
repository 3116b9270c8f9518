#include "NotificationPoller.h"
#include <exception>
#include <utility>

const char *const NotificationPoller::kProbeScript =
    "(function() { var link = document.querySelector('link[rel=\"icon\"]'); return link ? link.href : null; })()";

NotificationPoller::NotificationPoller(ViewLookup lookup, TaskRunner &runner, ShellEventSink &sink,
                                       Diagnostics &diagnostics)
    : lookup_(std::move(lookup)), runner_(runner), sink_(sink), diagnostics_(diagnostics)
{
}

NotificationPoller::~NotificationPoller()
{
  StopAll();
}

bool NotificationPoller::IsEligible(const std::string &view_id, const std::string &url) const
{
  if (!eligible_id_.empty() && view_id == eligible_id_)
    return true;
  return !eligible_url_pattern_.empty() && url.find(eligible_url_pattern_) != std::string::npos;
}

bool NotificationPoller::HasNotification(const std::string &icon_href) const
{
  for (const auto &marker : markers_)
  {
    if (!marker.empty() && icon_href.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

void NotificationPoller::OnLoadFinished(const std::string &view_id, const std::string &url)
{
  if (IsEligible(view_id, url))
    Start(view_id);
}

void NotificationPoller::Start(const std::string &view_id)
{
  PollState &state = polls_[view_id];
  if (!state.timer)
    state.timer.reset(new RepeatingTimer(runner_));
  state.timer->Start(grace_, period_, [this, view_id]() { Tick(view_id); });
  diagnostics_.Log(Severity::Debug, "NotificationPoller", "polling '" + view_id + "'");
}

void NotificationPoller::Stop(const std::string &view_id)
{
  polls_.erase(view_id);
}

void NotificationPoller::StopAll()
{
  polls_.clear();
}

bool NotificationPoller::is_polling(const std::string &view_id) const
{
  auto it = polls_.find(view_id);
  return it != polls_.end() && it->second.timer && it->second.timer->is_running();
}

void NotificationPoller::Tick(const std::string &view_id)
{
  ContentView *view = lookup_ ? lookup_(view_id) : nullptr;
  if (!view)
  {
    Stop(view_id);
    return;
  }

  std::string href;
  std::string exception;
  try
  {
    if (!view->EvaluateScript(kProbeScript, &href, &exception))
    {
      diagnostics_.Log(Severity::Debug, "NotificationPoller", "probe of '" + view_id + "' failed: " + exception);
      return;
    }
  }
  catch (const std::exception &e)
  {
    diagnostics_.Log(Severity::Debug, "NotificationPoller", "probe of '" + view_id + "' threw: " + e.what());
    return;
  }

  if (href.empty() || href == "null" || href == "undefined")
    return;

  auto it = polls_.find(view_id);
  if (it == polls_.end())
    return;
  PollState &state = it->second;

  bool has_notification = HasNotification(href);
  if (state.has_result && state.last == has_notification)
    return;
  state.has_result = true;
  state.last = has_notification;

  if (!sink_.Deliver(ShellEvent::BadgeUpdate(has_notification)))
    diagnostics_.Log(Severity::Debug, "NotificationPoller", "host unreachable for badge update");
}
