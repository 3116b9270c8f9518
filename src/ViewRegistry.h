#pragma once
#include "ContentView.h"
#include "ViewTypes.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct ViewState
{
  bool is_loaded = false;
  std::string last_url;
  bool is_visible = false;
  bool has_load_start = false;
  std::chrono::steady_clock::time_point load_start;
};

struct ViewRecord
{
  std::string id;
  std::string title;
  bool is_standard_app = false;
  ViewState state;
  std::unique_ptr<ContentView> content;
};

/**
 * Owns every content view, keyed by its normalized id. Nothing else creates
 * or destroys a ContentView.
 */
class ViewRegistry
{
public:
  explicit ViewRegistry(ContentViewFactory &factory);
  ~ViewRegistry();

  ViewRegistry(const ViewRegistry &) = delete;
  ViewRegistry &operator=(const ViewRegistry &) = delete;

  static std::string NormalizeId(const std::string &id);

  // Returns the existing record with *created = false when id is taken.
  // Exceptions from the factory propagate; the registry is left unchanged.
  ViewRecord &Create(const std::string &id, const std::string &url, const ContentViewOptions &options,
                     ContentViewListener *listener, bool *created);

  // Releases the content view. Callers detach it from the window first.
  bool Destroy(const std::string &id);

  ViewRecord *Find(const std::string &id);
  const ViewRecord *Find(const std::string &id) const;
  ContentView *content(const std::string &id);

  std::vector<std::string> ListIds() const;
  size_t size() const { return views_.size(); }
  size_t standard_app_count() const;

  bool Navigate(const std::string &id, const std::string &url);
  bool Reload(const std::string &id);
  ScriptResult ExecuteScript(const std::string &id, const std::string &script);
  std::string url(const std::string &id) const;

  void Clear();

private:
  ContentViewFactory &factory_;
  std::map<std::string, ViewRecord> views_;
};
