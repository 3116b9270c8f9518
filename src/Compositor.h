#pragma once
#include "Diagnostics.h"
#include "Geometry.h"
#include "HostWindow.h"
#include "ShellEvent.h"
#include "TaskRunner.h"
#include "ViewRegistry.h"
#include <chrono>
#include <string>

/**
 * Decides which view is attached to the window and where it sits.
 *
 * A switch attaches the new view before the old one is detached, so the
 * window never shows an empty canvas between two views. At most one view is
 * attached at a time.
 */
class Compositor
{
public:
  Compositor(HostWindow &window, ViewRegistry &registry, TaskRunner &runner, Diagnostics &diagnostics,
             ShellEventCallback emit, std::chrono::milliseconds resize_debounce = std::chrono::milliseconds(16));
  ~Compositor();

  Compositor(const Compositor &) = delete;
  Compositor &operator=(const Compositor &) = delete;

  // False for unknown ids and attach failures; the active view is unchanged then.
  bool Show(const std::string &id);
  void Hide();

  // Detaches id without emitting an activation event. Used right before destroy.
  void DetachIfActive(const std::string &id);

  void SetSidebarOpen(bool open);
  void SetOverlayOpen(bool open);
  bool sidebar_open() const { return layout_.sidebar_open; }
  bool overlay_open() const { return layout_.overlay_open; }

  void set_header_height(int height) { layout_.header_height = height; }
  void set_sidebar_width(int width) { layout_.sidebar_width = width; }
  const LayoutState &layout() const { return layout_; }

  // Window resize path, coalesced to one recomputation per debounce interval.
  void ScheduleBoundsUpdate();
  void UpdateActiveBounds();

  ViewBounds TargetBounds() const;
  const std::string &active_view_id() const { return active_id_; }

  // Forgets the active view and all pending work without touching the window.
  void Reset();

private:
  void ScheduleFocus(const std::string &id);
  void CancelFocus();
  void Detach(ViewRecord &record, const char *context);

  HostWindow &window_;
  ViewRegistry &registry_;
  TaskRunner &runner_;
  Diagnostics &diagnostics_;
  ShellEventCallback emit_;

  LayoutState layout_;
  std::string active_id_;
  CoalescingTimer resize_timer_;
  TaskId focus_task_ = 0;
};
