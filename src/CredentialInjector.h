#pragma once
#include "BackgroundExecutor.h"
#include "ContentView.h"
#include "CredentialStore.h"
#include "Diagnostics.h"
#include "TaskRunner.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Ordered host/path substring -> service name. First match wins.
struct ServicePattern
{
  std::string pattern;
  std::string service;
};

struct CredentialInjectionRecord
{
  std::string service;
  std::string origin;
  uint64_t load_generation = 0;
  uint64_t injected_generation = 0;
};

/**
 * Pushes stored credentials into a view after each main-frame load whose URL
 * belongs to a known service.
 *
 * Secrets are fetched on the background executor and handed back to the UI
 * thread through the task runner. Every load gets a new generation number; a
 * result is only delivered if its generation is still the view's latest and
 * has not been injected yet, so each load injects at most once.
 */
class CredentialInjector
{
public:
  using ViewLookup = std::function<ContentView *(const std::string &)>;

  CredentialInjector(ViewLookup lookup, CredentialStore &store, BackgroundExecutor &executor, TaskRunner &runner,
                     Diagnostics &diagnostics);
  ~CredentialInjector();

  CredentialInjector(const CredentialInjector &) = delete;
  CredentialInjector &operator=(const CredentialInjector &) = delete;

  static std::vector<ServicePattern> DefaultPatterns();
  // "https://host:port" of url, or empty.
  static std::string OriginOf(const std::string &url);

  void set_patterns(std::vector<ServicePattern> patterns) { patterns_ = std::move(patterns); }
  const std::vector<ServicePattern> &patterns() const { return patterns_; }
  void set_store_service(const std::string &service) { store_service_ = service; }
  const std::string &store_service() const { return store_service_; }

  // Empty when no pattern matches.
  std::string Classify(const std::string &url) const;

  void OnLoadFinished(const std::string &view_id, const std::string &url);
  void OnNavigated(const std::string &view_id, const std::string &url);

  // Manual injection for an explicitly named service. False for unknown views.
  bool Trigger(const std::string &view_id, const std::string &service);

  void Forget(const std::string &view_id);
  void Clear();

  const CredentialInjectionRecord *record(const std::string &view_id) const;
  size_t injection_count() const { return injection_count_; }

private:
  void StartFetch(const std::string &view_id, const std::string &service, uint64_t generation);
  void CompleteFetch(const std::string &view_id, const std::string &service, uint64_t generation,
                     const SecretBundle &bundle, int store_errors);

  ViewLookup lookup_;
  CredentialStore &store_;
  BackgroundExecutor &executor_;
  TaskRunner &runner_;
  Diagnostics &diagnostics_;

  std::vector<ServicePattern> patterns_;
  std::string store_service_ = "appdock";
  std::map<std::string, CredentialInjectionRecord> records_;
  uint64_t next_generation_ = 1;
  size_t injection_count_ = 0;
  std::shared_ptr<bool> alive_;
};
