#pragma once
#include <AppCore/AppCore.h>
#include <Ultralight/Listener.h>
#include "ContentView.h"
#include <string>

class ShellUI;
using namespace ultralight;

/**
 * A content view backed by its own Ultralight overlay. Attaching shows the
 * overlay, detaching hides it; a hidden overlay keeps loading and running
 * scripts in the background.
 */
class UltralightContentView : public ContentView,
                              public ViewListener,
                              public LoadListener
{
public:
  UltralightContentView(ShellUI *ui, RefPtr<Session> session, const std::string &id,
                        const ContentViewOptions &options, ContentViewListener *listener);
  ~UltralightContentView();

  RefPtr<View> view() { return overlay_->view(); }

  void Attach();
  void Detach();
  bool attached() const { return !overlay_->is_hidden(); }
  bool has_focus() const { return overlay_->has_focus(); }

  // Key events from the window while this view has focus. Shortcuts are
  // offered to the listener before the page sees them.
  void DispatchKeyEvent(const ultralight::KeyEvent &evt);

  static KeyChord ToKeyChord(const ultralight::KeyEvent &evt);

  // ContentView
  const std::string &id() const override { return id_; }
  void LoadURL(const std::string &url) override;
  void Reload() override;
  bool CanGoBack() const override;
  bool CanGoForward() const override;
  void GoBack() override;
  void GoForward() override;
  std::string url() const override;
  void SetBounds(const ViewBounds &bounds) override;
  void Focus() override;
  bool EvaluateScript(const std::string &script, std::string *result, std::string *exception) override;
  void PostMessage(const std::string &channel, const std::string &json_payload) override;

  // Inherited from Listener::View
  virtual void OnChangeURL(ultralight::View *caller, const String &url) override;
  virtual void OnChangeCursor(ultralight::View *caller, Cursor cursor) override;
  virtual RefPtr<ultralight::View> OnCreateChildView(ultralight::View *caller, const String &opener_url,
                                                     const String &target_url, bool is_popup,
                                                     const IntRect &popup_rect) override;

  // Inherited from Listener::Load
  virtual void OnBeginLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                              const String &url) override;
  virtual void OnFinishLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                               const String &url) override;
  virtual void OnFailLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame, const String &url,
                             const String &description, const String &error_domain, int error_code) override;
  virtual void OnDOMReady(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                          const String &url) override;

  // JS callback from the page when text is right-clicked
  void OnOpenContextMenu(const JSObject &obj, const JSArgs &args);

protected:
  ShellUI *ui_;
  RefPtr<Overlay> overlay_;
  std::string id_;
  ContentViewOptions options_;
  ContentViewListener *listener_;
  // Set when a raw key-down was consumed, so its Char event is dropped too
  bool suppress_char_ = false;
};

// ultralight::String -> UTF-8
std::string ToStdString(const String &str);
