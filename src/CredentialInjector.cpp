#include "CredentialInjector.h"
#include "JsonText.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

CredentialInjector::CredentialInjector(ViewLookup lookup, CredentialStore &store, BackgroundExecutor &executor,
                                       TaskRunner &runner, Diagnostics &diagnostics)
    : lookup_(std::move(lookup)), store_(store), executor_(executor), runner_(runner), diagnostics_(diagnostics),
      patterns_(DefaultPatterns()), alive_(std::make_shared<bool>(true))
{
}

CredentialInjector::~CredentialInjector()
{
  // Fetches still in flight find the token expired and drop their result
  alive_.reset();
}

std::vector<ServicePattern> CredentialInjector::DefaultPatterns()
{
  return {
      {"webuntis.com", "webuntis"},
      {"schul.cloud", "schulcloud"},
      {"portal.bbz-rd-eck.com", "moodle"},
      {"login.microsoftonline.com", "office"},
      {"m365.cloud.microsoft", "office"},
      {"exchange.bbz-rd-eck.de/owa", "outlook"},
      {"/adfs/ls", "outlook"},
      {"bbb.bbz-rd-eck.de/b/signin", "bbb"},
      {"viflow.bbz-rd-eck.de", "handbook"},
  };
}

std::string CredentialInjector::OriginOf(const std::string &url)
{
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    return std::string();
  size_t host_end = url.find_first_of("/?#", scheme_end + 3);
  std::string origin = url.substr(0, host_end);
  std::transform(origin.begin(), origin.end(), origin.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return origin;
}

std::string CredentialInjector::Classify(const std::string &url) const
{
  for (const auto &p : patterns_)
  {
    if (!p.pattern.empty() && url.find(p.pattern) != std::string::npos)
      return p.service;
  }
  return std::string();
}

void CredentialInjector::OnLoadFinished(const std::string &view_id, const std::string &url)
{
  CredentialInjectionRecord &rec = records_[view_id];
  uint64_t generation = next_generation_++;
  rec.load_generation = generation;
  rec.origin = OriginOf(url);
  rec.service = Classify(url);

  if (rec.service.empty())
  {
    diagnostics_.Log(Severity::Debug, "CredentialInjector", "no service for '" + view_id + "' at " + rec.origin);
    return;
  }
  StartFetch(view_id, rec.service, generation);
}

void CredentialInjector::OnNavigated(const std::string &view_id, const std::string &url)
{
  auto it = records_.find(view_id);
  if (it == records_.end())
    return;
  if (it->second.origin != OriginOf(url))
    records_.erase(it); // drops any fetch still pending for the old origin
}

bool CredentialInjector::Trigger(const std::string &view_id, const std::string &service)
{
  ContentView *view = lookup_ ? lookup_(view_id) : nullptr;
  if (!view || service.empty())
    return false;

  CredentialInjectionRecord &rec = records_[view_id];
  uint64_t generation = next_generation_++;
  rec.load_generation = generation;
  rec.service = service;
  try
  {
    rec.origin = OriginOf(view->url());
  }
  catch (const std::exception &e)
  {
    diagnostics_.Log(Severity::Warn, "CredentialInjector", std::string("could not read url: ") + e.what());
  }
  StartFetch(view_id, service, generation);
  return true;
}

void CredentialInjector::StartFetch(const std::string &view_id, const std::string &service, uint64_t generation)
{
  diagnostics_.Log(Severity::Debug, "CredentialInjector", "fetching credentials for " + service + " ('" + view_id + "')");

  std::weak_ptr<bool> alive = alive_;
  CredentialStore &store = store_;
  TaskRunner &runner = runner_;
  std::string store_service = store_service_;

  executor_.Submit([this, alive, &store, &runner, store_service, view_id, service, generation]() {
    int errors = 0;
    SecretBundle bundle = FetchSecretBundle(store, store_service, &errors);
    runner.PostTask([this, alive, view_id, service, generation, bundle, errors]() {
      if (alive.expired())
        return;
      CompleteFetch(view_id, service, generation, bundle, errors);
    });
  });
}

void CredentialInjector::CompleteFetch(const std::string &view_id, const std::string &service, uint64_t generation,
                                       const SecretBundle &bundle, int store_errors)
{
  auto it = records_.find(view_id);
  if (it == records_.end() || it->second.load_generation != generation)
  {
    diagnostics_.Log(Severity::Debug, "CredentialInjector", "superseded fetch for '" + view_id + "' dropped");
    return;
  }
  CredentialInjectionRecord &rec = it->second;
  if (rec.injected_generation == generation)
    return;

  if (store_errors > 0)
  {
    diagnostics_.Report(Severity::Warn, "credential-store-error", "CredentialInjector",
                        std::to_string(store_errors) + " secret lookups failed for " + service,
                        {{"service", service}, {"viewId", view_id}});
  }

  if (!bundle.HasLoginIdentifier(service))
  {
    diagnostics_.Report(Severity::Info, "credential-injection-skipped", "CredentialInjector",
                        "no login identifier stored for " + service, {{"service", service}, {"viewId", view_id}});
    return;
  }

  ContentView *view = lookup_ ? lookup_(view_id) : nullptr;
  if (!view)
    return;

  std::string payload = "{\"service\":" + QuoteJson(service) + ",\"viewId\":" + QuoteJson(view_id) +
                        ",\"credentials\":" + bundle.ToJSON() + "}";
  try
  {
    view->PostMessage("inject-credentials", payload);
  }
  catch (const std::exception &e)
  {
    diagnostics_.Report(Severity::Error, "injection-failure", "CredentialInjector",
                        "could not deliver credentials to '" + view_id + "': " + e.what(),
                        {{"service", service}, {"viewId", view_id}});
    return;
  }

  rec.injected_generation = generation;
  ++injection_count_;
  diagnostics_.Report(Severity::Info, "credential-injection", "CredentialInjector",
                      "credentials injected for " + service, {{"service", service}, {"viewId", view_id}});
}

void CredentialInjector::Forget(const std::string &view_id)
{
  records_.erase(view_id);
}

void CredentialInjector::Clear()
{
  records_.clear();
}

const CredentialInjectionRecord *CredentialInjector::record(const std::string &view_id) const
{
  auto it = records_.find(view_id);
  return it == records_.end() ? nullptr : &it->second;
}
