#pragma once
#include "ContentView.h"
#include "Diagnostics.h"
#include "ShellEvent.h"
#include "ViewTypes.h"
#include <functional>
#include <set>
#include <string>
#include <vector>

// One entry of the shortcut table. key is normalized (see NormalizeKey).
struct ShortcutBinding
{
  std::string key;
  bool ctrl_or_meta = false;
  bool alt = false;
  bool shift = false;
  std::string action;

  bool SameChord(const ShortcutBinding &other) const
  {
    return key == other.key && ctrl_or_meta == other.ctrl_or_meta && alt == other.alt && shift == other.shift;
  }
};

/**
 * Sees every key-down of an attached view before the page does. A match is
 * consumed: refresh/back/forward run on the view itself, everything else is
 * forwarded to the host as shortcut-forwarded.
 */
class ShortcutInterceptor
{
public:
  using ViewLookup = std::function<ContentView *(const std::string &)>;

  ShortcutInterceptor(ViewLookup lookup, ShellEventSink &sink, Diagnostics &diagnostics);

  static std::vector<ShortcutBinding> DefaultBindings();

  // "P" -> "p", "Left" -> "arrowleft", "F5" -> "f5", "Esc" -> "escape"
  static std::string NormalizeKey(const std::string &key);

  // "Ctrl+Shift+P", "CmdOrCtrl+,", "Ctrl++", "Alt+Left", "F5"
  static bool ParseAccelerator(const std::string &accelerator, const std::string &action, ShortcutBinding &out);

  // Replaces the action of an existing chord or appends a new one.
  static void MergeBinding(std::vector<ShortcutBinding> &bindings, const ShortcutBinding &binding);

  void set_bindings(std::vector<ShortcutBinding> bindings) { bindings_ = std::move(bindings); }
  const std::vector<ShortcutBinding> &bindings() const { return bindings_; }

  void Attach(const std::string &view_id);
  void Detach(const std::string &view_id);
  bool IsAttached(const std::string &view_id) const;

  const ShortcutBinding *Match(const KeyChord &chord) const;

  // True when the key was consumed.
  bool HandleKeyEvent(const std::string &view_id, const KeyChord &chord);

private:
  void RunViewAction(const std::string &view_id, const std::string &action);
  void Forward(const std::string &view_id, const std::string &action);

  ViewLookup lookup_;
  ShellEventSink &sink_;
  Diagnostics &diagnostics_;
  std::vector<ShortcutBinding> bindings_;
  std::set<std::string> attached_;
};
