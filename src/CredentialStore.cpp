#include "CredentialStore.h"
#include "Env.h"
#include "JsonText.h"
#include <cctype>
#include <exception>
#include <future>
#include <iostream>
#include <vector>

std::string EnvCredentialStore::VariableName(const std::string &service, const std::string &account)
{
  std::string name = "APPDOCK_SECRET_";
  for (const std::string *part : {&service, &account})
  {
    for (unsigned char c : *part)
      name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
    if (part == &service)
      name.push_back('_');
  }
  return name;
}

SecretLookup EnvCredentialStore::Get(const std::string &service, const std::string &account)
{
  SecretLookup lookup;
  lookup.value = GetEnvVar(VariableName(service, account).c_str());
  lookup.status = lookup.value.empty() ? SecretStatus::Missing : SecretStatus::Ok;
  return lookup;
}

const char *const SecretBundle::kAccounts[5] = {"email", "password", "bbbPassword", "webuntisEmail",
                                                "webuntisPassword"};

std::string *SecretBundle::field(const std::string &account)
{
  if (account == "email")
    return &email;
  if (account == "password")
    return &password;
  if (account == "bbbPassword")
    return &bbb_password;
  if (account == "webuntisEmail")
    return &webuntis_email;
  if (account == "webuntisPassword")
    return &webuntis_password;
  return nullptr;
}

bool SecretBundle::HasLoginIdentifier(const std::string &service) const
{
  if (service == "webuntis")
    return !webuntis_email.empty() || !email.empty();
  return !email.empty();
}

std::string SecretBundle::ToJSON() const
{
  std::string out = "{";
  out += "\"email\":" + QuoteJson(email);
  out += ",\"password\":" + QuoteJson(password);
  out += ",\"bbbPassword\":" + QuoteJson(bbb_password);
  out += ",\"webuntisEmail\":" + QuoteJson(webuntis_email);
  out += ",\"webuntisPassword\":" + QuoteJson(webuntis_password);
  out += "}";
  return out;
}

SecretBundle FetchSecretBundle(CredentialStore &store, const std::string &service, int *store_errors)
{
  std::vector<std::future<SecretLookup>> pending;
  for (const char *account : SecretBundle::kAccounts)
  {
    std::string name = account;
    pending.push_back(std::async(std::launch::async, [&store, service, name]() { return store.Get(service, name); }));
  }

  SecretBundle bundle;
  int errors = 0;
  for (size_t i = 0; i < pending.size(); ++i)
  {
    SecretLookup lookup;
    try
    {
      lookup = pending[i].get();
    }
    catch (const std::exception &e)
    {
      std::cerr << "[FetchSecretBundle] lookup of " << SecretBundle::kAccounts[i] << " failed: " << e.what()
                << std::endl;
      lookup.status = SecretStatus::StoreError;
    }

    if (lookup.status == SecretStatus::StoreError)
      ++errors;
    else if (lookup.ok())
      *bundle.field(SecretBundle::kAccounts[i]) = lookup.value;
  }

  if (store_errors)
    *store_errors = errors;
  return bundle;
}
