#pragma once
#include "ContentView.h"
#include "Diagnostics.h"
#include "ShellEvent.h"
#include "TaskRunner.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * Watches the messenger view for unread messages by reading its favicon href
 * on a fixed period, and reports the badge state to the host.
 *
 * One repeating timer per view id. Stopping a poll destroys its timer, after
 * which no further probe of that view runs.
 */
class NotificationPoller
{
public:
  using ViewLookup = std::function<ContentView *(const std::string &)>;

  static const char *const kProbeScript;

  NotificationPoller(ViewLookup lookup, TaskRunner &runner, ShellEventSink &sink, Diagnostics &diagnostics);
  ~NotificationPoller();

  NotificationPoller(const NotificationPoller &) = delete;
  NotificationPoller &operator=(const NotificationPoller &) = delete;

  void set_timing(std::chrono::milliseconds grace, std::chrono::milliseconds period)
  {
    grace_ = grace;
    period_ = period;
  }
  std::chrono::milliseconds grace() const { return grace_; }
  std::chrono::milliseconds period() const { return period_; }

  void set_markers(std::vector<std::string> markers) { markers_ = std::move(markers); }
  void set_eligible(const std::string &view_id, const std::string &url_pattern)
  {
    eligible_id_ = view_id;
    eligible_url_pattern_ = url_pattern;
  }

  bool IsEligible(const std::string &view_id, const std::string &url) const;
  bool HasNotification(const std::string &icon_href) const;

  // (Re)starts polling when the view is eligible.
  void OnLoadFinished(const std::string &view_id, const std::string &url);

  void Start(const std::string &view_id);
  void Stop(const std::string &view_id);
  void StopAll();
  bool is_polling(const std::string &view_id) const;

private:
  struct PollState
  {
    std::unique_ptr<RepeatingTimer> timer;
    bool has_result = false;
    bool last = false;
  };

  void Tick(const std::string &view_id);

  ViewLookup lookup_;
  TaskRunner &runner_;
  ShellEventSink &sink_;
  Diagnostics &diagnostics_;

  std::chrono::milliseconds grace_{2000};
  std::chrono::milliseconds period_{3000};
  std::vector<std::string> markers_ = {"badge", "unread", "notification"};
  std::string eligible_id_ = "schulcloud";
  std::string eligible_url_pattern_ = "schul.cloud";
  std::map<std::string, PollState> polls_;
};
