#pragma once
#include <string>

enum class ViewError
{
  None,
  NotFound,
  AlreadyExists,
  AttachFailure,
  DetachFailure,
  LoadFailure,
  InjectionFailure,
  ProbeFailure,
  ScriptFailure
};

const char *ViewErrorName(ViewError error);

// Creation options. The security related members are fixed defaults; callers
// only ever change title / is_standard_app.
struct ContentViewOptions
{
  std::string title;
  bool is_standard_app = false;

  bool isolated_script_context = true;
  bool os_integration = false;
  std::string storage_partition = "persist:main";
};

// A key-down as seen at the content boundary, before the page handles it.
// key uses DOM naming: "p", "P", "F5", "ArrowLeft", "Escape", ",".
struct KeyChord
{
  std::string key;
  bool ctrl = false;
  bool meta = false;
  bool alt = false;
  bool shift = false;
};

struct LoadFailure
{
  int code = 0;
  std::string description;
  std::string url;
  bool is_main_frame = true;
};

struct ScriptResult
{
  ViewError error = ViewError::None;
  std::string value;
  std::string message;

  bool ok() const { return error == ViewError::None; }
};
