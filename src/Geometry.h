#pragma once

// Rectangle in window pixels. x/y are relative to the window content area.
struct ViewBounds
{
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const ViewBounds &other) const
  {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
  bool operator!=(const ViewBounds &other) const { return !(*this == other); }
};

// Shell chrome that shrinks the canvas available to the active view.
struct LayoutState
{
  int header_height = 48;
  int sidebar_width = 450;
  bool sidebar_open = false;
  // Transient overlays (menus, dialogs) drawn by the host UI. Does not change
  // the rectangle yet but every toggle forces a recomputation.
  bool overlay_open = false;
};

ViewBounds ComputeViewBounds(const ViewBounds &window_content, const LayoutState &layout);
