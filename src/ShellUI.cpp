#include "ShellUI.h"
#include "JsonText.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace
{
std::string ArgString(const JSArgs &args, size_t index)
{
  if (args.size() <= index || !args[index].IsString())
    return std::string();
  ultralight::String s = args[index].ToString();
  return ToStdString(s);
}

bool ArgBool(const JSArgs &args, size_t index)
{
  return args.size() > index && args[index].IsBoolean() && args[index].ToBoolean();
}

JSValue JsonValue(const std::string &json)
{
  return JSValue(ultralight::String(json.c_str()));
}
} // namespace

ShellUI::ShellUI(RefPtr<Window> window, TaskRunner &runner, CredentialStore &store, BackgroundExecutor &executor,
                 const ShellConfig &config)
    : window_(window), runner_(runner), config_(config)
{
  // Header and sidebar are specified in CSS pixels
  double scale = window_->scale();
  config_.header_height = (int)std::round(config.header_height * scale);
  config_.sidebar_width = (int)std::round(config.sidebar_width * scale);

  overlay_ = Overlay::Create(window_, window_->width(), window_->height(), 0, 0);

  // Every content view shares one persistent storage partition
  session_ = App::instance()->renderer()->CreateSession(true, "main");

  view_manager_.reset(new ViewManager(*this, *this, store, executor, runner_, *this, config_));

  view()->set_load_listener(this);
  view()->set_view_listener(this);
  view()->LoadURL("file:///ui.html");
  overlay_->Focus();
}

ShellUI::~ShellUI()
{
  ui_ready_ = false;
  view_manager_.reset();

  view()->set_load_listener(nullptr);
  view()->set_view_listener(nullptr);
}

UltralightContentView *ShellUI::active_content()
{
  if (!view_manager_)
    return nullptr;
  const std::string &id = view_manager_->active_view_id();
  if (id.empty())
    return nullptr;
  return dynamic_cast<UltralightContentView *>(view_manager_->FindContentView(id));
}

bool ShellUI::OnKeyEvent(const ultralight::KeyEvent &evt)
{
  UltralightContentView *content = active_content();
  if (content && content->has_focus())
  {
    content->DispatchKeyEvent(evt);
    return false; // Consume to avoid double-dispatch to the focused overlay
  }
  return true;
}

void ShellUI::OnClose(ultralight::Window *window)
{
  if (view_manager_)
    view_manager_->Cleanup();
  App::instance()->Quit();
}

void ShellUI::OnResize(ultralight::Window *window, uint32_t width, uint32_t height)
{
  overlay_->Resize(window->width(), window->height());
  if (view_manager_)
    view_manager_->OnWindowResized();
}

void ShellUI::SetCursor(Cursor cursor)
{
  if (App::instance())
    window_->SetCursor(cursor);
}

void ShellUI::OnContentCursor(const std::string &view_id, Cursor cursor)
{
  if (view_manager_ && view_manager_->active_view_id() == view_id)
    SetCursor(cursor);
}

ViewBounds ShellUI::content_bounds() const
{
  ViewBounds bounds;
  bounds.width = (int)window_->width();
  bounds.height = (int)window_->height();
  return bounds;
}

void ShellUI::AddChildView(ContentView &view)
{
  UltralightContentView *content = dynamic_cast<UltralightContentView *>(&view);
  if (!content)
    throw std::invalid_argument("view '" + view.id() + "' was not created by this window");
  content->Attach();
}

void ShellUI::RemoveChildView(ContentView &view)
{
  UltralightContentView *content = dynamic_cast<UltralightContentView *>(&view);
  if (!content)
    throw std::invalid_argument("view '" + view.id() + "' was not created by this window");
  content->Detach();
}

std::unique_ptr<ContentView> ShellUI::CreateContentView(const std::string &id, const ContentViewOptions &options,
                                                        ContentViewListener *listener)
{
  return std::unique_ptr<ContentView>(new UltralightContentView(this, session_, id, options, listener));
}

bool ShellUI::Deliver(const ShellEvent &event)
{
  if (!ui_ready_ || !onShellEvent)
    return false;

  RefPtr<JSContext> lock(view()->LockJSContext());
  onShellEvent({ultralight::String(event.ToJSON().c_str())});
  return true;
}

void ShellUI::OnDOMReady(View *caller, uint64_t frame_id, bool is_main_frame, const String &url)
{
  if (!is_main_frame)
    return;

  // Set the context for all subsequent JS* calls for THIS caller view
  RefPtr<JSContext> locked_context = caller->LockJSContext();
  SetJSContext(locked_context->ctx());

  JSObject global = JSGlobalObject();
  onShellEvent = global["onShellEvent"];

  global["AppDockCreateView"] = BindJSCallbackWithRetval(&ShellUI::OnCreateView);
  global["AppDockShowView"] = BindJSCallbackWithRetval(&ShellUI::OnShowView);
  global["AppDockHideView"] = BindJSCallback(&ShellUI::OnHideView);
  global["AppDockDestroyView"] = BindJSCallback(&ShellUI::OnDestroyView);
  global["AppDockNavigateView"] = BindJSCallbackWithRetval(&ShellUI::OnNavigateView);
  global["AppDockReloadView"] = BindJSCallbackWithRetval(&ShellUI::OnReloadView);
  global["AppDockExecuteScript"] = BindJSCallbackWithRetval(&ShellUI::OnExecuteScript);
  global["AppDockGetViewURL"] = BindJSCallbackWithRetval(&ShellUI::OnGetViewURL);
  global["AppDockSetSidebarState"] = BindJSCallback(&ShellUI::OnSetSidebarState);
  global["AppDockSetOverlayState"] = BindJSCallback(&ShellUI::OnSetOverlayState);
  global["AppDockGetSidebarState"] = BindJSCallbackWithRetval(&ShellUI::OnGetSidebarState);
  global["AppDockGetOverlayState"] = BindJSCallbackWithRetval(&ShellUI::OnGetOverlayState);
  global["AppDockInitializeStandardApps"] = BindJSCallbackWithRetval(&ShellUI::OnInitializeStandardApps);
  global["AppDockGetStats"] = BindJSCallbackWithRetval(&ShellUI::OnGetStats);
  global["AppDockTriggerCredentialInjection"] = BindJSCallbackWithRetval(&ShellUI::OnTriggerCredentialInjection);

  ui_ready_ = true;
  std::cout << "[ShellUI::OnDOMReady] bridge bound for " << ToStdString(url) << std::endl;

  caller->EvaluateScript("(function(){ if (window.onAppDockReady) window.onAppDockReady(); })();", nullptr);
}

JSValue ShellUI::OnCreateView(const JSObject &obj, const JSArgs &args)
{
  ContentViewOptions options;
  options.title = ArgString(args, 2);
  try
  {
    ViewManager::CreateResult result = view_manager_->CreateView(ArgString(args, 0), ArgString(args, 1), options);
    return JSValue(result.ok());
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ShellUI::OnCreateView] " << e.what() << std::endl;
    return JSValue(false);
  }
}

JSValue ShellUI::OnShowView(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->ShowView(ArgString(args, 0)));
}

void ShellUI::OnHideView(const JSObject &obj, const JSArgs &args)
{
  view_manager_->HideView();
}

void ShellUI::OnDestroyView(const JSObject &obj, const JSArgs &args)
{
  // Deferred: the request may arrive from inside one of the view's own callbacks
  std::string id = ArgString(args, 0);
  runner_.PostTask([this, id]() {
    if (view_manager_)
      view_manager_->DestroyView(id);
  });
}

JSValue ShellUI::OnNavigateView(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->NavigateView(ArgString(args, 0), ArgString(args, 1)));
}

JSValue ShellUI::OnReloadView(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->ReloadView(ArgString(args, 0)));
}

JSValue ShellUI::OnExecuteScript(const JSObject &obj, const JSArgs &args)
{
  ScriptResult result = view_manager_->ExecuteScript(ArgString(args, 0), ArgString(args, 1));
  std::string json = std::string("{\"ok\":") + (result.ok() ? "true" : "false") +
                     ",\"value\":" + QuoteJson(result.value) + ",\"error\":" + QuoteJson(ViewErrorName(result.error)) +
                     ",\"message\":" + QuoteJson(result.message) + "}";
  return JsonValue(json);
}

JSValue ShellUI::OnGetViewURL(const JSObject &obj, const JSArgs &args)
{
  return JSValue(ultralight::String(view_manager_->GetViewURL(ArgString(args, 0)).c_str()));
}

void ShellUI::OnSetSidebarState(const JSObject &obj, const JSArgs &args)
{
  view_manager_->SetSidebarState(ArgBool(args, 0));
}

void ShellUI::OnSetOverlayState(const JSObject &obj, const JSArgs &args)
{
  view_manager_->SetOverlayState(ArgBool(args, 0));
}

JSValue ShellUI::OnGetSidebarState(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->sidebar_open());
}

JSValue ShellUI::OnGetOverlayState(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->overlay_open());
}

JSValue ShellUI::OnInitializeStandardApps(const JSObject &obj, const JSArgs &args)
{
  // Optional JSON map from the host; the configured apps otherwise
  std::vector<StandardAppEntry> apps = config_.standard_apps;
  std::string json = ArgString(args, 0);
  if (!json.empty() && !ShellConfig::ParseStandardApps(json, apps))
    std::cerr << "[ShellUI::OnInitializeStandardApps] warning: ignoring malformed app map" << std::endl;

  return JSValue((double)view_manager_->InitializeStandardApps(apps));
}

JSValue ShellUI::OnGetStats(const JSObject &obj, const JSArgs &args)
{
  return JsonValue(view_manager_->GetStats().ToJSON());
}

JSValue ShellUI::OnTriggerCredentialInjection(const JSObject &obj, const JSArgs &args)
{
  return JSValue(view_manager_->TriggerCredentialInjection(ArgString(args, 0), ArgString(args, 1)));
}
