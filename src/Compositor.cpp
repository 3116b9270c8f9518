#include "Compositor.h"
#include <exception>
#include <utility>

Compositor::Compositor(HostWindow &window, ViewRegistry &registry, TaskRunner &runner, Diagnostics &diagnostics,
                       ShellEventCallback emit, std::chrono::milliseconds resize_debounce)
    : window_(window), registry_(registry), runner_(runner), diagnostics_(diagnostics), emit_(std::move(emit)),
      resize_timer_(runner, resize_debounce)
{
}

Compositor::~Compositor()
{
  CancelFocus();
}

ViewBounds Compositor::TargetBounds() const
{
  return ComputeViewBounds(window_.content_bounds(), layout_);
}

bool Compositor::Show(const std::string &id)
{
  std::string key = ViewRegistry::NormalizeId(id);
  ViewRecord *next = registry_.Find(key);
  if (!next || !next->content)
  {
    diagnostics_.Log(Severity::Warn, "Compositor::Show", "view '" + key + "' not found");
    return false;
  }

  if (key == active_id_)
  {
    UpdateActiveBounds();
    try
    {
      next->content->Focus();
    }
    catch (const std::exception &e)
    {
      diagnostics_.Log(Severity::Warn, "Compositor::Show", "focus of '" + key + "' failed: " + e.what());
    }
    return true;
  }

  // Position the view while it is still detached, then attach it on top of
  // the current one.
  try
  {
    next->content->SetBounds(TargetBounds());
  }
  catch (const std::exception &e)
  {
    diagnostics_.Log(Severity::Warn, "Compositor::Show", "could not pre-set bounds of '" + key + "': " + e.what());
  }

  try
  {
    window_.AddChildView(*next->content);
  }
  catch (const std::exception &e)
  {
    diagnostics_.Report(Severity::Error, "attach-failure", "Compositor::Show",
                        "could not attach '" + key + "': " + e.what(), {{"viewId", key}});
    return false;
  }
  next->state.is_visible = true;

  if (!active_id_.empty())
  {
    ViewRecord *previous = registry_.Find(active_id_);
    if (previous)
      Detach(*previous, "Compositor::Show");
  }

  active_id_ = key;
  UpdateActiveBounds();
  ScheduleFocus(key);

  diagnostics_.Log(Severity::Info, "Compositor::Show", "switched to '" + key + "'");
  if (emit_)
    emit_(ShellEvent::Activated(key));
  return true;
}

void Compositor::Hide()
{
  if (active_id_.empty())
    return;

  ViewRecord *record = registry_.Find(active_id_);
  if (record)
    Detach(*record, "Compositor::Hide");

  active_id_.clear();
  CancelFocus();
  if (emit_)
    emit_(ShellEvent::Activated(std::string()));
}

void Compositor::DetachIfActive(const std::string &id)
{
  std::string key = ViewRegistry::NormalizeId(id);
  if (key.empty() || key != active_id_)
    return;

  ViewRecord *record = registry_.Find(key);
  if (record)
    Detach(*record, "Compositor::DetachIfActive");
  active_id_.clear();
  CancelFocus();
}

void Compositor::Detach(ViewRecord &record, const char *context)
{
  record.state.is_visible = false;
  if (!record.content)
    return;
  try
  {
    window_.RemoveChildView(*record.content);
  }
  catch (const std::exception &e)
  {
    diagnostics_.Report(Severity::Warn, "detach-failure", context,
                        "could not detach '" + record.id + "': " + e.what(), {{"viewId", record.id}});
  }
}

void Compositor::SetSidebarOpen(bool open)
{
  if (layout_.sidebar_open == open)
    return;
  layout_.sidebar_open = open;
  diagnostics_.Log(Severity::Info, "Compositor", std::string("sidebar ") + (open ? "open" : "closed"));
  UpdateActiveBounds();
}

void Compositor::SetOverlayOpen(bool open)
{
  if (layout_.overlay_open == open)
    return;
  layout_.overlay_open = open;
  UpdateActiveBounds();
}

void Compositor::ScheduleBoundsUpdate()
{
  resize_timer_.Schedule([this]() { UpdateActiveBounds(); });
}

void Compositor::UpdateActiveBounds()
{
  if (active_id_.empty())
    return;
  ContentView *view = registry_.content(active_id_);
  if (!view)
    return;

  try
  {
    view->SetBounds(TargetBounds());
  }
  catch (const std::exception &e)
  {
    diagnostics_.Log(Severity::Warn, "Compositor::UpdateActiveBounds", e.what());
  }
}

void Compositor::ScheduleFocus(const std::string &id)
{
  CancelFocus();
  focus_task_ = runner_.PostTask([this, id]() {
    focus_task_ = 0;
    if (id != active_id_)
      return;
    ContentView *view = registry_.content(id);
    if (!view)
      return;
    try
    {
      view->Focus();
    }
    catch (const std::exception &e)
    {
      diagnostics_.Log(Severity::Warn, "Compositor", "deferred focus of '" + id + "' failed: " + e.what());
    }
  });
}

void Compositor::CancelFocus()
{
  if (focus_task_ != 0)
  {
    runner_.Cancel(focus_task_);
    focus_task_ = 0;
  }
}

void Compositor::Reset()
{
  resize_timer_.Cancel();
  CancelFocus();
  active_id_.clear();
}
