#include "ViewRegistry.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <stdexcept>

ViewRegistry::ViewRegistry(ContentViewFactory &factory) : factory_(factory) {}

ViewRegistry::~ViewRegistry()
{
  Clear();
}

std::string ViewRegistry::NormalizeId(const std::string &id)
{
  std::string out = id;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

ViewRecord &ViewRegistry::Create(const std::string &id, const std::string &url, const ContentViewOptions &options,
                                 ContentViewListener *listener, bool *created)
{
  std::string key = NormalizeId(id);
  auto existing = views_.find(key);
  if (existing != views_.end())
  {
    if (created)
      *created = false;
    return existing->second;
  }

  ViewRecord record;
  record.id = key;
  record.title = options.title;
  record.is_standard_app = options.is_standard_app;
  record.content = factory_.CreateContentView(key, options, listener);
  if (!record.content)
    throw std::runtime_error("content view factory returned null for '" + key + "'");

  // Registered before the load starts so lifecycle callbacks can find it
  auto inserted = views_.emplace(key, std::move(record));
  ViewRecord &stored = inserted.first->second;
  if (created)
    *created = true;

  try
  {
    stored.content->LoadURL(url);
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ViewRegistry::Create] initial load of '" << key << "' failed: " << e.what() << std::endl;
  }
  return stored;
}

bool ViewRegistry::Destroy(const std::string &id)
{
  auto it = views_.find(NormalizeId(id));
  if (it == views_.end())
    return false;

  // Take the handle out first so listener callbacks fired during teardown
  // no longer see the record.
  std::unique_ptr<ContentView> content = std::move(it->second.content);
  views_.erase(it);
  content.reset();
  return true;
}

ViewRecord *ViewRegistry::Find(const std::string &id)
{
  auto it = views_.find(NormalizeId(id));
  return it == views_.end() ? nullptr : &it->second;
}

const ViewRecord *ViewRegistry::Find(const std::string &id) const
{
  auto it = views_.find(NormalizeId(id));
  return it == views_.end() ? nullptr : &it->second;
}

ContentView *ViewRegistry::content(const std::string &id)
{
  ViewRecord *record = Find(id);
  return record ? record->content.get() : nullptr;
}

std::vector<std::string> ViewRegistry::ListIds() const
{
  std::vector<std::string> ids;
  ids.reserve(views_.size());
  for (const auto &entry : views_)
    ids.push_back(entry.first);
  return ids;
}

size_t ViewRegistry::standard_app_count() const
{
  return static_cast<size_t>(std::count_if(views_.begin(), views_.end(),
                                           [](const std::pair<const std::string, ViewRecord> &entry) {
                                             return entry.second.is_standard_app;
                                           }));
}

bool ViewRegistry::Navigate(const std::string &id, const std::string &url)
{
  ContentView *view = content(id);
  if (!view)
    return false;
  try
  {
    view->LoadURL(url);
    return true;
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ViewRegistry::Navigate] " << id << ": " << e.what() << std::endl;
    return false;
  }
}

bool ViewRegistry::Reload(const std::string &id)
{
  ContentView *view = content(id);
  if (!view)
    return false;
  try
  {
    view->Reload();
    return true;
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ViewRegistry::Reload] " << id << ": " << e.what() << std::endl;
    return false;
  }
}

ScriptResult ViewRegistry::ExecuteScript(const std::string &id, const std::string &script)
{
  ScriptResult result;
  ContentView *view = content(id);
  if (!view)
  {
    result.error = ViewError::NotFound;
    result.message = "view '" + NormalizeId(id) + "' does not exist";
    return result;
  }

  try
  {
    std::string exception;
    if (!view->EvaluateScript(script, &result.value, &exception))
    {
      result.error = ViewError::ScriptFailure;
      result.message = exception.empty() ? "script evaluation failed" : exception;
      result.value.clear();
    }
  }
  catch (const std::exception &e)
  {
    result.error = ViewError::ScriptFailure;
    result.message = e.what();
    result.value.clear();
  }
  return result;
}

std::string ViewRegistry::url(const std::string &id) const
{
  const ViewRecord *record = Find(id);
  if (!record || !record->content)
    return std::string();
  try
  {
    return record->content->url();
  }
  catch (const std::exception &e)
  {
    std::cerr << "[ViewRegistry::url] " << id << ": " << e.what() << std::endl;
    return record->state.last_url;
  }
}

void ViewRegistry::Clear()
{
  while (!views_.empty())
    Destroy(views_.begin()->first);
}
