#include "ShortcutInterceptor.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace
{
std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void trim(std::string &s)
{
  size_t a = s.find_first_not_of(" \t\n\r");
  size_t b = s.find_last_not_of(" \t\n\r");
  if (a == std::string::npos)
  {
    s.clear();
    return;
  }
  s = s.substr(a, b - a + 1);
}

ShortcutBinding Bind(const char *key, bool ctrl, bool alt, bool shift, const char *action)
{
  ShortcutBinding b;
  b.key = ShortcutInterceptor::NormalizeKey(key);
  b.ctrl_or_meta = ctrl;
  b.alt = alt;
  b.shift = shift;
  b.action = action;
  return b;
}
} // namespace

ShortcutInterceptor::ShortcutInterceptor(ViewLookup lookup, ShellEventSink &sink, Diagnostics &diagnostics)
    : lookup_(std::move(lookup)), sink_(sink), diagnostics_(diagnostics), bindings_(DefaultBindings())
{
}

std::vector<ShortcutBinding> ShortcutInterceptor::DefaultBindings()
{
  std::vector<ShortcutBinding> table = {
      Bind("F5", false, false, false, "refresh"),
      Bind("ArrowLeft", false, true, false, "back"),
      Bind("ArrowRight", false, true, false, "forward"),
      Bind("r", true, false, false, "refresh"),
      Bind("p", true, false, false, "print"),
      Bind("f", true, false, false, "find"),
      Bind("+", true, false, false, "zoom-in"),
      Bind("=", true, false, false, "zoom-in"),
      Bind("-", true, false, false, "zoom-out"),
      Bind("0", true, false, false, "zoom-reset"),
      Bind("p", true, false, true, "command-palette"),
      Bind("t", true, false, true, "toggle-todo"),
      Bind("d", true, false, false, "toggle-secure-docs"),
      Bind(",", true, false, false, "open-settings"),
      Bind("Escape", false, false, false, "close-modal"),
      Bind("F5", true, false, false, "reload-current"),
      Bind("r", true, false, true, "reload-all"),
      Bind("F11", false, false, false, "toggle-fullscreen"),
  };
  for (char digit = '1'; digit <= '9'; ++digit)
  {
    std::string key(1, digit);
    std::string action = "nav-app-" + key;
    table.push_back(Bind(key.c_str(), true, false, false, action.c_str()));
  }
  return table;
}

std::string ShortcutInterceptor::NormalizeKey(const std::string &key)
{
  if (key.size() == 1)
    return ToLower(key);

  std::string lower = ToLower(key);
  if (lower == "left" || lower == "right" || lower == "up" || lower == "down")
    return "arrow" + lower;
  if (lower == "esc")
    return "escape";
  if (lower == "plus")
    return "+";
  if (lower == "minus")
    return "-";
  if (lower == "comma")
    return ",";
  return lower;
}

bool ShortcutInterceptor::ParseAccelerator(const std::string &accelerator, const std::string &action,
                                           ShortcutBinding &out)
{
  std::string text = accelerator;
  trim(text);
  if (text.empty() || action.empty())
    return false;

  ShortcutBinding binding;
  binding.action = action;

  // The key is whatever follows the last separator; "Ctrl++" means the '+' key
  std::string key;
  std::string modifiers;
  if (text.size() >= 2 && text.compare(text.size() - 2, 2, "++") == 0)
  {
    key = "+";
    modifiers = text.substr(0, text.size() - 2);
  }
  else
  {
    size_t sep = text.rfind('+');
    if (sep == std::string::npos)
    {
      key = text;
    }
    else
    {
      key = text.substr(sep + 1);
      modifiers = text.substr(0, sep);
    }
  }
  trim(key);
  if (key.empty())
    return false;

  size_t start = 0;
  while (start < modifiers.size())
  {
    size_t end = modifiers.find('+', start);
    if (end == std::string::npos)
      end = modifiers.size();
    std::string mod = ToLower(modifiers.substr(start, end - start));
    trim(mod);
    start = end + 1;

    if (mod.empty())
      continue;
    if (mod == "ctrl" || mod == "control" || mod == "cmd" || mod == "command" || mod == "meta" ||
        mod == "cmdorctrl" || mod == "commandorcontrol")
      binding.ctrl_or_meta = true;
    else if (mod == "alt" || mod == "option")
      binding.alt = true;
    else if (mod == "shift")
      binding.shift = true;
    else
      return false;
  }

  binding.key = NormalizeKey(key);
  out = binding;
  return true;
}

void ShortcutInterceptor::MergeBinding(std::vector<ShortcutBinding> &bindings, const ShortcutBinding &binding)
{
  for (auto &existing : bindings)
  {
    if (existing.SameChord(binding))
    {
      existing.action = binding.action;
      return;
    }
  }
  bindings.push_back(binding);
}

void ShortcutInterceptor::Attach(const std::string &view_id)
{
  attached_.insert(view_id);
}

void ShortcutInterceptor::Detach(const std::string &view_id)
{
  attached_.erase(view_id);
}

bool ShortcutInterceptor::IsAttached(const std::string &view_id) const
{
  return attached_.count(view_id) > 0;
}

const ShortcutBinding *ShortcutInterceptor::Match(const KeyChord &chord) const
{
  std::string key = NormalizeKey(chord.key);
  bool ctrl_or_meta = chord.ctrl || chord.meta;
  for (const auto &binding : bindings_)
  {
    if (binding.key == key && binding.ctrl_or_meta == ctrl_or_meta && binding.alt == chord.alt &&
        binding.shift == chord.shift)
      return &binding;
  }
  return nullptr;
}

bool ShortcutInterceptor::HandleKeyEvent(const std::string &view_id, const KeyChord &chord)
{
  if (!IsAttached(view_id))
    return false;

  const ShortcutBinding *binding = Match(chord);
  if (!binding)
    return false;

  // Copy: the action may reconfigure the table
  std::string action = binding->action;
  if (action == "refresh" || action == "back" || action == "forward")
    RunViewAction(view_id, action);
  else
    Forward(view_id, action);
  return true;
}

void ShortcutInterceptor::RunViewAction(const std::string &view_id, const std::string &action)
{
  ContentView *view = lookup_ ? lookup_(view_id) : nullptr;
  if (!view)
    return;

  try
  {
    if (action == "refresh")
      view->Reload();
    else if (action == "back" && view->CanGoBack())
      view->GoBack();
    else if (action == "forward" && view->CanGoForward())
      view->GoForward();
  }
  catch (const std::exception &e)
  {
    diagnostics_.Log(Severity::Warn, "ShortcutInterceptor", action + " on '" + view_id + "' failed: " + e.what());
  }
}

void ShortcutInterceptor::Forward(const std::string &view_id, const std::string &action)
{
  if (sink_.Deliver(ShellEvent::ShortcutForwarded(action, view_id)))
    return;

  diagnostics_.Report(Severity::Warn, "shortcut-undelivered", "ShortcutInterceptor",
                      "host unreachable for shortcut " + action, {{"action", action}, {"viewId", view_id}});
}
