#pragma once
#include "Geometry.h"
#include "ViewTypes.h"
#include <memory>
#include <string>

/**
 * Lifecycle and input signals from one content view. Every callback is tagged
 * with the originating view id and arrives on the UI thread.
 */
class ContentViewListener
{
public:
  virtual ~ContentViewListener() = default;

  virtual void OnBeginLoading(const std::string &view_id) = 0;
  virtual void OnFinishLoading(const std::string &view_id, const std::string &url) = 0;
  virtual void OnFailLoading(const std::string &view_id, const LoadFailure &failure) = 0;
  virtual void OnNavigate(const std::string &view_id, const std::string &url) = 0;
  virtual void OnNewWindowRequested(const std::string &view_id, const std::string &url) = 0;
  virtual void OnContextMenu(const std::string &view_id, const std::string &selection_text, int x, int y) = 0;

  // Raw key-down before the page sees it. Return true to consume.
  virtual bool OnBeforeKeyEvent(const std::string &view_id, const KeyChord &chord) = 0;
};

/**
 * One embedded, independently navigable content surface. Implementations may
 * throw std::exception from any call; callers guard every use.
 */
class ContentView
{
public:
  virtual ~ContentView() = default;

  virtual const std::string &id() const = 0;

  virtual void LoadURL(const std::string &url) = 0;
  virtual void Reload() = 0;
  virtual bool CanGoBack() const = 0;
  virtual bool CanGoForward() const = 0;
  virtual void GoBack() = 0;
  virtual void GoForward() = 0;
  virtual std::string url() const = 0;

  virtual void SetBounds(const ViewBounds &bounds) = 0;
  virtual void Focus() = 0;

  // Evaluates script in the page. On a script exception returns false and
  // fills *exception.
  virtual bool EvaluateScript(const std::string &script, std::string *result, std::string *exception) = 0;

  // One-way message to scripts running in the page.
  virtual void PostMessage(const std::string &channel, const std::string &json_payload) = 0;
};

class ContentViewFactory
{
public:
  virtual ~ContentViewFactory() = default;

  virtual std::unique_ptr<ContentView> CreateContentView(const std::string &id, const ContentViewOptions &options,
                                                         ContentViewListener *listener) = 0;
};
