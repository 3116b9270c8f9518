#include "Geometry.h"

ViewBounds ComputeViewBounds(const ViewBounds &window_content, const LayoutState &layout)
{
  ViewBounds bounds;
  bounds.x = 0;
  bounds.y = layout.header_height;
  bounds.width = layout.sidebar_open ? window_content.width - layout.sidebar_width : window_content.width;
  bounds.height = window_content.height - layout.header_height;

  // A window smaller than the chrome still gets a valid (empty) rectangle
  if (bounds.width < 0)
    bounds.width = 0;
  if (bounds.height < 0)
    bounds.height = 0;

  return bounds;
}
