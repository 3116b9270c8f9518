#include "UltralightContentView.h"
#include "ShellUI.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

std::string ToStdString(const String &str)
{
  auto u8 = str.utf8();
  return u8.data() ? std::string(u8.data()) : std::string();
}

UltralightContentView::UltralightContentView(ShellUI *ui, RefPtr<Session> session, const std::string &id,
                                             const ContentViewOptions &options, ContentViewListener *listener)
    : ui_(ui), id_(id), options_(options), listener_(listener)
{
  RefPtr<Window> window = ui->window();

  ViewConfig config;
  config.is_accelerated = false;
  config.initial_device_scale = window->scale();
  config.enable_javascript = true;

  RefPtr<ultralight::View> page = App::instance()->renderer()->CreateView(1, 1, config, session);
  overlay_ = Overlay::Create(window, page, 0, 0);
  overlay_->Hide();

  view()->set_view_listener(this);
  view()->set_load_listener(this);
}

UltralightContentView::~UltralightContentView()
{
  view()->set_view_listener(nullptr);
  view()->set_load_listener(nullptr);
  overlay_->Hide();
}

void UltralightContentView::Attach()
{
  overlay_->Show();
}

void UltralightContentView::Detach()
{
  overlay_->Hide();
  overlay_->Unfocus();
}

KeyChord UltralightContentView::ToKeyChord(const ultralight::KeyEvent &evt)
{
  KeyChord chord;
  chord.ctrl = (evt.modifiers & KeyEvent::kMod_CtrlKey) != 0;
  chord.meta = (evt.modifiers & KeyEvent::kMod_MetaKey) != 0;
  chord.alt = (evt.modifiers & KeyEvent::kMod_AltKey) != 0;
  chord.shift = (evt.modifiers & KeyEvent::kMod_ShiftKey) != 0;

  int vk = evt.virtual_key_code;
  if (vk >= 0x70 && vk <= 0x7B) // F1..F12
    chord.key = "F" + std::to_string(vk - 0x6F);
  else if ((vk >= 0x30 && vk <= 0x39) || (vk >= 0x41 && vk <= 0x5A))
    chord.key = std::string(1, static_cast<char>(vk));
  else
  {
    switch (vk)
    {
    case 0x25 /*LEFT*/:
      chord.key = "ArrowLeft";
      break;
    case 0x26 /*UP*/:
      chord.key = "ArrowUp";
      break;
    case 0x27 /*RIGHT*/:
      chord.key = "ArrowRight";
      break;
    case 0x28 /*DOWN*/:
      chord.key = "ArrowDown";
      break;
    case 0x1B /*ESC*/:
      chord.key = "Escape";
      break;
    case 0xBB /*OEM_PLUS*/:
      chord.key = chord.shift ? "+" : "=";
      break;
    case 0x6B /*ADD*/:
      chord.key = "+";
      break;
    case 0xBD /*OEM_MINUS*/:
    case 0x6D /*SUBTRACT*/:
      chord.key = "-";
      break;
    case 0xBC /*OEM_COMMA*/:
      chord.key = ",";
      break;
    default:
      chord.key = ToStdString(evt.key_identifier);
      break;
    }
  }
  return chord;
}

void UltralightContentView::DispatchKeyEvent(const ultralight::KeyEvent &evt)
{
  if (evt.type == KeyEvent::kType_RawKeyDown)
  {
    suppress_char_ = false;
    if (listener_ && listener_->OnBeforeKeyEvent(id_, ToKeyChord(evt)))
    {
      suppress_char_ = true;
      return;
    }
  }
  else if (evt.type == KeyEvent::kType_Char && suppress_char_)
  {
    suppress_char_ = false;
    return;
  }
  view()->FireKeyEvent(evt);
}

void UltralightContentView::LoadURL(const std::string &url)
{
  view()->LoadURL(String(url.c_str()));
}

void UltralightContentView::Reload()
{
  view()->Reload();
}

bool UltralightContentView::CanGoBack() const
{
  return overlay_->view()->CanGoBack();
}

bool UltralightContentView::CanGoForward() const
{
  return overlay_->view()->CanGoForward();
}

void UltralightContentView::GoBack()
{
  view()->GoBack();
}

void UltralightContentView::GoForward()
{
  view()->GoForward();
}

std::string UltralightContentView::url() const
{
  return ToStdString(overlay_->view()->url());
}

void UltralightContentView::SetBounds(const ViewBounds &bounds)
{
  overlay_->MoveTo(bounds.x, bounds.y);
  overlay_->Resize(static_cast<uint32_t>(std::max(bounds.width, 1)), static_cast<uint32_t>(std::max(bounds.height, 1)));
}

void UltralightContentView::Focus()
{
  overlay_->Focus();
}

bool UltralightContentView::EvaluateScript(const std::string &script, std::string *result, std::string *exception)
{
  String exc;
  String value = view()->EvaluateScript(String(script.c_str()), &exc);
  if (!exc.empty())
  {
    if (exception)
      *exception = ToStdString(exc);
    return false;
  }
  if (result)
    *result = ToStdString(value);
  return true;
}

void UltralightContentView::PostMessage(const std::string &channel, const std::string &json_payload)
{
  // Delivered as a DOM event so page scripts can listen with addEventListener
  std::string script = "window.dispatchEvent(new CustomEvent('appdock:" + channel + "', { detail: " + json_payload +
                       " }));";
  std::string exception;
  if (!EvaluateScript(script, nullptr, &exception))
    throw std::runtime_error("message '" + channel + "' rejected: " + exception);
}

void UltralightContentView::OnChangeURL(ultralight::View *caller, const String &url)
{
  if (listener_)
    listener_->OnNavigate(id_, ToStdString(url));
}

void UltralightContentView::OnChangeCursor(ultralight::View *caller, Cursor cursor)
{
  ui_->OnContentCursor(id_, cursor);
}

RefPtr<ultralight::View> UltralightContentView::OnCreateChildView(ultralight::View *caller, const String &opener_url,
                                                                  const String &target_url, bool is_popup,
                                                                  const IntRect &popup_rect)
{
  // Pages never get a child view; the host decides where the URL goes
  if (listener_)
    listener_->OnNewWindowRequested(id_, ToStdString(target_url));
  return nullptr;
}

void UltralightContentView::OnBeginLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                                           const String &url)
{
  if (is_main_frame && listener_)
    listener_->OnBeginLoading(id_);
}

void UltralightContentView::OnFinishLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                                            const String &url)
{
  if (is_main_frame && listener_)
    listener_->OnFinishLoading(id_, ToStdString(url));
}

void UltralightContentView::OnFailLoading(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                                          const String &url, const String &description, const String &error_domain,
                                          int error_code)
{
  if (!listener_)
    return;
  LoadFailure failure;
  failure.code = error_code;
  failure.description = ToStdString(description);
  failure.url = ToStdString(url);
  failure.is_main_frame = is_main_frame;
  listener_->OnFailLoading(id_, failure);
}

void UltralightContentView::OnDOMReady(ultralight::View *caller, uint64_t frame_id, bool is_main_frame,
                                       const String &url)
{
  if (!is_main_frame)
    return;

  RefPtr<JSContext> ctx = caller->LockJSContext();
  SetJSContext(ctx->ctx());
  JSObject global = JSGlobalObject();
  global["NativeOpenContextMenu"] = BindJSCallback(&UltralightContentView::OnOpenContextMenu);

  // Only selections are reported; the page keeps its own menu otherwise
  const char *script = R"JS(
    (function(){
      try {
        if (window.__appdock_ctxmenu_installed) return;
        window.__appdock_ctxmenu_installed = true;
        document.addEventListener('contextmenu', function(e){
          var sel = '';
          try { sel = String(window.getSelection ? window.getSelection() : ''); } catch(_) {}
          if (sel && window.NativeOpenContextMenu) {
            e.preventDefault();
            window.NativeOpenContextMenu(e.clientX, e.clientY, sel);
          }
        }, true);
      } catch (err) {
      }
    })();
  )JS";
  caller->EvaluateScript(script, nullptr);
}

void UltralightContentView::OnOpenContextMenu(const JSObject &obj, const JSArgs &args)
{
  if (args.size() < 3 || !listener_)
    return;

  int view_x = (int)args[0];
  int view_y = (int)args[1];
  ultralight::String selection = args[2];

  // Client coords are CSS pixels; offset by the overlay position in the window
  double scale = ui_->window()->scale();
  int win_x = (int)std::lround(((double)overlay_->x() / scale)) + view_x;
  int win_y = (int)std::lround(((double)overlay_->y() / scale)) + view_y;
  listener_->OnContextMenu(id_, ToStdString(selection), win_x, win_y);
}
