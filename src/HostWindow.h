#pragma once
#include "Geometry.h"

class ContentView;

// The shell window as seen by the compositor. Add/Remove may throw.
class HostWindow
{
public:
  virtual ~HostWindow() = default;

  virtual ViewBounds content_bounds() const = 0;
  virtual void AddChildView(ContentView &view) = 0;
  virtual void RemoveChildView(ContentView &view) = 0;
};
