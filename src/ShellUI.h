#pragma once
#include <AppCore/AppCore.h>
#include "BackgroundExecutor.h"
#include "ContentView.h"
#include "CredentialStore.h"
#include "HostWindow.h"
#include "ShellConfig.h"
#include "ShellEvent.h"
#include "TaskRunner.h"
#include "UltralightContentView.h"
#include "ViewManager.h"
#include <memory>
#include <string>

using ultralight::JSArgs;
using ultralight::JSFunction;
using ultralight::JSObject;
using namespace ultralight;

/**
 * Shell chrome. A window-sized overlay renders assets/ui.html (header,
 * sidebar, dialogs); content views are stacked on top of it inside the area
 * the compositor computes.
 *
 * ui.html drives the ViewManager through the AppDock* globals bound on
 * DOMReady and receives every ShellEvent through window.onShellEvent(json).
 */
class ShellUI : public WindowListener,
                public LoadListener,
                public ViewListener,
                public HostWindow,
                public ShellEventSink,
                public ContentViewFactory
{
public:
  ShellUI(RefPtr<Window> window, TaskRunner &runner, CredentialStore &store, BackgroundExecutor &executor,
          const ShellConfig &config);
  ~ShellUI();

  RefPtr<Window> window() { return window_; }
  ViewManager &view_manager() { return *view_manager_; }

  // Inherited from WindowListener
  virtual bool OnKeyEvent(const ultralight::KeyEvent &evt) override;
  virtual void OnClose(ultralight::Window *window) override;
  virtual void OnResize(ultralight::Window *window, uint32_t width, uint32_t height) override;

  // Inherited from LoadListener
  virtual void OnDOMReady(View *caller, uint64_t frame_id, bool is_main_frame, const String &url) override;

  // Inherited from ViewListener
  virtual void OnChangeCursor(ultralight::View *caller, Cursor cursor) override { SetCursor(cursor); }

  // HostWindow
  ViewBounds content_bounds() const override;
  void AddChildView(ContentView &view) override;
  void RemoveChildView(ContentView &view) override;

  // ShellEventSink
  bool Deliver(const ShellEvent &event) override;

  // ContentViewFactory
  std::unique_ptr<ContentView> CreateContentView(const std::string &id, const ContentViewOptions &options,
                                                 ContentViewListener *listener) override;

  // Cursor changes from a content view; only the active one may set it
  void OnContentCursor(const std::string &view_id, Cursor cursor);

  // Called by UI JavaScript
  JSValue OnCreateView(const JSObject &obj, const JSArgs &args);
  JSValue OnShowView(const JSObject &obj, const JSArgs &args);
  void OnHideView(const JSObject &obj, const JSArgs &args);
  void OnDestroyView(const JSObject &obj, const JSArgs &args);
  JSValue OnNavigateView(const JSObject &obj, const JSArgs &args);
  JSValue OnReloadView(const JSObject &obj, const JSArgs &args);
  JSValue OnExecuteScript(const JSObject &obj, const JSArgs &args);
  JSValue OnGetViewURL(const JSObject &obj, const JSArgs &args);
  void OnSetSidebarState(const JSObject &obj, const JSArgs &args);
  void OnSetOverlayState(const JSObject &obj, const JSArgs &args);
  JSValue OnGetSidebarState(const JSObject &obj, const JSArgs &args);
  JSValue OnGetOverlayState(const JSObject &obj, const JSArgs &args);
  JSValue OnInitializeStandardApps(const JSObject &obj, const JSArgs &args);
  JSValue OnGetStats(const JSObject &obj, const JSArgs &args);
  JSValue OnTriggerCredentialInjection(const JSObject &obj, const JSArgs &args);

protected:
  RefPtr<View> view() { return overlay_->view(); }
  UltralightContentView *active_content();
  void SetCursor(Cursor cursor);

  RefPtr<Window> window_;
  RefPtr<Overlay> overlay_;
  RefPtr<Session> session_;
  TaskRunner &runner_;
  ShellConfig config_;
  std::unique_ptr<ViewManager> view_manager_;
  bool ui_ready_ = false;

  JSFunction onShellEvent;
};
