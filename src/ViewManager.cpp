#include "ViewManager.h"
#include "JsonText.h"
#include <exception>

namespace
{
long long ElapsedMs(TaskRunner::TimePoint from, TaskRunner::TimePoint to)
{
  return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}
} // namespace

std::string ManagerStats::ToJSON() const
{
  std::string out = "{";
  out += "\"totalViews\":" + std::to_string(total_views);
  out += ",\"standardAppCount\":" + std::to_string(standard_app_count);
  out += ",\"activeViewId\":" + (active_view_id.empty() ? std::string("null") : QuoteJson(active_view_id));
  out += std::string(",\"initialized\":") + (initialized ? "true" : "false");
  out += ",\"ids\":[";
  for (size_t i = 0; i < ids.size(); ++i)
  {
    if (i)
      out += ",";
    out += QuoteJson(ids[i]);
  }
  out += "]}";
  return out;
}

ViewManager::ViewManager(HostWindow &window, ContentViewFactory &factory, CredentialStore &store,
                         BackgroundExecutor &executor, TaskRunner &runner, ShellEventSink &sink,
                         const ShellConfig &config)
    : config_(config), runner_(runner), sink_(sink), diagnostics_(config.log_level), registry_(factory),
      compositor_(window, registry_, runner, diagnostics_, [this](const ShellEvent &e) { Emit(e); },
                  config.resize_debounce),
      shortcuts_([this](const std::string &id) { return registry_.content(id); }, sink, diagnostics_),
      injector_([this](const std::string &id) { return registry_.content(id); }, store, executor, runner,
                diagnostics_),
      poller_([this](const std::string &id) { return registry_.content(id); }, runner, sink, diagnostics_),
      startup_mark_(runner.now())
{
  diagnostics_.set_sink(&sink_);

  compositor_.set_header_height(config_.header_height);
  compositor_.set_sidebar_width(config_.sidebar_width);
  if (!config_.shortcuts.empty())
    shortcuts_.set_bindings(config_.shortcuts);
  if (!config_.credential_patterns.empty())
    injector_.set_patterns(config_.credential_patterns);
  injector_.set_store_service(config_.credential_service);
  poller_.set_timing(config_.poll_grace, config_.poll_period);
  if (!config_.notification_markers.empty())
    poller_.set_markers(config_.notification_markers);
}

ViewManager::~ViewManager()
{
  Cleanup();
}

void ViewManager::Emit(const ShellEvent &event)
{
  if (!sink_.Deliver(event))
    diagnostics_.Log(Severity::Debug, "ViewManager", std::string("host unreachable, dropped ") +
                                                         ShellEventName(event.type));
}

ViewManager::CreateResult ViewManager::CreateView(const std::string &id, const std::string &url,
                                                  const ContentViewOptions &options)
{
  CreateResult result;
  result.id = ViewRegistry::NormalizeId(id);
  if (result.id.empty() || url.empty())
  {
    diagnostics_.Log(Severity::Warn, "ViewManager::CreateView", "id and url are required");
    result.error = ViewError::LoadFailure;
    return result;
  }

  bool created = false;
  ViewRecord &record = registry_.Create(result.id, url, options, this, &created);
  if (!created)
  {
    diagnostics_.Log(Severity::Info, "ViewManager::CreateView", "'" + result.id + "' already exists");
    result.error = ViewError::AlreadyExists;
    return result;
  }

  shortcuts_.Attach(record.id);
  if (record.is_standard_app)
    standard_apps_.insert(record.id);

  diagnostics_.Log(Severity::Info, "ViewManager::CreateView", "created '" + record.id + "' for " + url);
  result.created = true;
  return result;
}

bool ViewManager::ShowView(const std::string &id)
{
  return compositor_.Show(id);
}

void ViewManager::HideView()
{
  compositor_.Hide();
}

bool ViewManager::DestroyView(const std::string &id)
{
  std::string key = ViewRegistry::NormalizeId(id);
  if (!registry_.Find(key))
  {
    diagnostics_.Log(Severity::Info, "ViewManager::DestroyView", "'" + key + "' not found");
    return false;
  }

  compositor_.DetachIfActive(key);
  poller_.Stop(key);
  injector_.Forget(key);
  shortcuts_.Detach(key);
  standard_apps_.erase(key);
  registry_.Destroy(key);

  diagnostics_.Log(Severity::Info, "ViewManager::DestroyView", "destroyed '" + key + "'");
  return true;
}

bool ViewManager::NavigateView(const std::string &id, const std::string &url)
{
  if (!registry_.Find(id))
  {
    diagnostics_.Log(Severity::Warn, "ViewManager::NavigateView", "'" + id + "' not found");
    return false;
  }
  return registry_.Navigate(id, url);
}

bool ViewManager::ReloadView(const std::string &id)
{
  if (!registry_.Find(id))
  {
    diagnostics_.Log(Severity::Warn, "ViewManager::ReloadView", "'" + id + "' not found");
    return false;
  }
  return registry_.Reload(id);
}

ScriptResult ViewManager::ExecuteScript(const std::string &id, const std::string &code)
{
  ScriptResult result = registry_.ExecuteScript(id, code);
  if (!result.ok())
    diagnostics_.Log(Severity::Warn, "ViewManager::ExecuteScript",
                     std::string(ViewErrorName(result.error)) + ": " + result.message);
  return result;
}

std::string ViewManager::GetViewURL(const std::string &id) const
{
  return registry_.url(id);
}

void ViewManager::SetSidebarState(bool open)
{
  compositor_.SetSidebarOpen(open);
}

void ViewManager::SetOverlayState(bool open)
{
  compositor_.SetOverlayOpen(open);
}

size_t ViewManager::InitializeStandardApps(const std::vector<StandardAppEntry> &apps)
{
  if (initialized_)
  {
    diagnostics_.Log(Severity::Info, "ViewManager::InitializeStandardApps", "already initialized");
    return 0;
  }
  initialized_ = true;
  startup_mark_ = runner_.now();

  // Every load is started here without waiting, so the apps come up in parallel
  size_t created = 0;
  for (const auto &app : apps)
  {
    if (!app.visible)
      continue;

    ContentViewOptions options;
    options.title = app.title;
    options.is_standard_app = true;
    try
    {
      if (CreateView(app.id, app.url, options).created)
        ++created;
    }
    catch (const std::exception &e)
    {
      diagnostics_.Report(Severity::Error, "standard-app-failure", "ViewManager::InitializeStandardApps",
                          "could not create '" + app.id + "': " + e.what(), {{"viewId", app.id}});
    }
  }

  diagnostics_.Log(Severity::Info, "ViewManager::InitializeStandardApps",
                   std::to_string(created) + " standard apps created");
  return created;
}

ManagerStats ViewManager::GetStats() const
{
  ManagerStats stats;
  stats.total_views = registry_.size();
  stats.standard_app_count = standard_apps_.size();
  stats.active_view_id = compositor_.active_view_id();
  stats.initialized = initialized_;
  stats.ids = registry_.ListIds();
  return stats;
}

bool ViewManager::TriggerCredentialInjection(const std::string &id, const std::string &service)
{
  return injector_.Trigger(ViewRegistry::NormalizeId(id), service);
}

void ViewManager::OnWindowResized()
{
  compositor_.ScheduleBoundsUpdate();
}

void ViewManager::Cleanup()
{
  poller_.StopAll();
  injector_.Clear();

  std::string active = compositor_.active_view_id();
  if (!active.empty())
    compositor_.DetachIfActive(active);
  compositor_.Reset();

  for (const auto &id : registry_.ListIds())
    shortcuts_.Detach(id);
  registry_.Clear();
  standard_apps_.clear();
  initialized_ = false;
}

bool ViewManager::InStartupGrace() const
{
  return runner_.now() - startup_mark_ < config_.startup_grace;
}

bool ViewManager::OpensExternally(const std::string &url) const
{
  for (const auto &pattern : config_.external_open_patterns)
  {
    if (!pattern.empty() && url.find(pattern) != std::string::npos)
      return true;
  }
  return false;
}

void ViewManager::OnBeginLoading(const std::string &view_id)
{
  ViewRecord *record = registry_.Find(view_id);
  if (!record)
    return;
  record->state.is_loaded = false;
  record->state.load_start = runner_.now();
  record->state.has_load_start = true;
  Emit(ShellEvent::Loading(record->id, true));
}

void ViewManager::OnFinishLoading(const std::string &view_id, const std::string &url)
{
  ViewRecord *record = registry_.Find(view_id);
  if (!record)
    return;
  std::string id = record->id;

  record->state.is_loaded = true;
  if (!url.empty())
    record->state.last_url = url;
  if (record->state.has_load_start)
    diagnostics_.Log(Severity::Debug, "ViewManager",
                     id + " finished loading (" + std::to_string(ElapsedMs(record->state.load_start, runner_.now())) +
                         "ms)");

  Emit(ShellEvent::Loading(id, false));
  Emit(ShellEvent::Loaded(id, record->state.last_url));

  injector_.OnLoadFinished(id, record->state.last_url);
  poller_.OnLoadFinished(id, record->state.last_url);
}

void ViewManager::OnFailLoading(const std::string &view_id, const LoadFailure &failure)
{
  ViewRecord *record = registry_.Find(view_id);
  if (!record)
    return;
  record->state.is_loaded = false;

  if (!failure.is_main_frame)
  {
    diagnostics_.Log(Severity::Debug, "ViewManager", record->id + " subframe failed: " + failure.description);
    return;
  }

  // No finish callback follows a failed main-frame load
  Emit(ShellEvent::Loading(record->id, false));

  if (InStartupGrace())
  {
    diagnostics_.Log(Severity::Warn, "ViewManager",
                     record->id + " failed to load during startup (" + std::to_string(failure.code) + " " +
                         failure.description + "), not reported");
    return;
  }

  diagnostics_.Log(Severity::Error, "ViewManager",
                   record->id + " failed to load: " + std::to_string(failure.code) + " " + failure.description);
  Emit(ShellEvent::LoadError(record->id, failure.code, failure.description, failure.url));
}

void ViewManager::OnNavigate(const std::string &view_id, const std::string &url)
{
  ViewRecord *record = registry_.Find(view_id);
  if (!record)
    return;
  record->state.last_url = url;
  injector_.OnNavigated(record->id, url);
  Emit(ShellEvent::Navigated(record->id, url));
}

void ViewManager::OnNewWindowRequested(const std::string &view_id, const std::string &url)
{
  if (!registry_.Find(view_id))
    return;
  diagnostics_.Log(Severity::Info, "ViewManager", view_id + " requested new window for " + url);
  if (OpensExternally(url))
    Emit(ShellEvent::ExternalOpenRequested(url));
  else
    Emit(ShellEvent::NewWindowRequested(url, config_.new_window_title));
}

void ViewManager::OnContextMenu(const std::string &view_id, const std::string &selection_text, int x, int y)
{
  if (selection_text.empty() || !registry_.Find(view_id))
    return;
  Emit(ShellEvent::ContextMenu(ViewRegistry::NormalizeId(view_id), selection_text, x, y));
}

bool ViewManager::OnBeforeKeyEvent(const std::string &view_id, const KeyChord &chord)
{
  return shortcuts_.HandleKeyEvent(ViewRegistry::NormalizeId(view_id), chord);
}
