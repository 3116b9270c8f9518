#pragma once
#include "BackgroundExecutor.h"
#include "Compositor.h"
#include "ContentView.h"
#include "CredentialInjector.h"
#include "CredentialStore.h"
#include "Diagnostics.h"
#include "HostWindow.h"
#include "NotificationPoller.h"
#include "ShellConfig.h"
#include "ShellEvent.h"
#include "ShortcutInterceptor.h"
#include "TaskRunner.h"
#include "ViewRegistry.h"
#include <set>
#include <string>
#include <vector>

struct ManagerStats
{
  size_t total_views = 0;
  size_t standard_app_count = 0;
  std::string active_view_id; // empty when nothing is shown
  bool initialized = false;
  std::vector<std::string> ids;

  std::string ToJSON() const;
};

/**
 * Entry point for the host UI. Owns the registry and the per-view helpers,
 * and turns content view signals into state changes and ShellEvents.
 *
 * Everything here runs on the UI thread.
 */
class ViewManager : public ContentViewListener
{
public:
  struct CreateResult
  {
    ViewError error = ViewError::None;
    bool created = false;
    std::string id;

    bool ok() const { return error == ViewError::None || error == ViewError::AlreadyExists; }
  };

  ViewManager(HostWindow &window, ContentViewFactory &factory, CredentialStore &store, BackgroundExecutor &executor,
              TaskRunner &runner, ShellEventSink &sink, const ShellConfig &config);
  ~ViewManager() override;

  ViewManager(const ViewManager &) = delete;
  ViewManager &operator=(const ViewManager &) = delete;

  // AlreadyExists is not a failure: the existing view is kept untouched.
  // Exceptions thrown by the content view factory propagate.
  CreateResult CreateView(const std::string &id, const std::string &url,
                          const ContentViewOptions &options = ContentViewOptions());
  bool ShowView(const std::string &id);
  void HideView();
  bool DestroyView(const std::string &id);

  bool NavigateView(const std::string &id, const std::string &url);
  bool ReloadView(const std::string &id);
  ScriptResult ExecuteScript(const std::string &id, const std::string &code);
  std::string GetViewURL(const std::string &id) const;

  void SetSidebarState(bool open);
  bool sidebar_open() const { return compositor_.sidebar_open(); }
  void SetOverlayState(bool open);
  bool overlay_open() const { return compositor_.overlay_open(); }

  // Creates every visible entry once. Returns the number of views created.
  size_t InitializeStandardApps(const std::vector<StandardAppEntry> &apps);
  bool initialized() const { return initialized_; }

  ManagerStats GetStats() const;

  bool TriggerCredentialInjection(const std::string &id, const std::string &service);
  void OnWindowResized();

  // Destroys every view and stops all background work. Safe to call twice.
  void Cleanup();

  ContentView *FindContentView(const std::string &id) { return registry_.content(id); }
  const ViewRecord *FindView(const std::string &id) const { return registry_.Find(id); }
  const std::string &active_view_id() const { return compositor_.active_view_id(); }
  Diagnostics &diagnostics() { return diagnostics_; }

  // ContentViewListener
  void OnBeginLoading(const std::string &view_id) override;
  void OnFinishLoading(const std::string &view_id, const std::string &url) override;
  void OnFailLoading(const std::string &view_id, const LoadFailure &failure) override;
  void OnNavigate(const std::string &view_id, const std::string &url) override;
  void OnNewWindowRequested(const std::string &view_id, const std::string &url) override;
  void OnContextMenu(const std::string &view_id, const std::string &selection_text, int x, int y) override;
  bool OnBeforeKeyEvent(const std::string &view_id, const KeyChord &chord) override;

private:
  void Emit(const ShellEvent &event);
  bool InStartupGrace() const;
  bool OpensExternally(const std::string &url) const;

  ShellConfig config_;
  TaskRunner &runner_;
  ShellEventSink &sink_;
  Diagnostics diagnostics_;

  ViewRegistry registry_;
  Compositor compositor_;
  ShortcutInterceptor shortcuts_;
  CredentialInjector injector_;
  NotificationPoller poller_;

  std::set<std::string> standard_apps_;
  bool initialized_ = false;
  TaskRunner::TimePoint startup_mark_;
};
