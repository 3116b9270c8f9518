#pragma once
#include <string>

enum class SecretStatus
{
  Ok,
  Missing,
  StoreError
};

struct SecretLookup
{
  SecretStatus status = SecretStatus::Missing;
  std::string value;

  bool ok() const { return status == SecretStatus::Ok && !value.empty(); }
};

// Platform secret storage. Get never throws for a missing entry.
class CredentialStore
{
public:
  virtual ~CredentialStore() = default;

  virtual SecretLookup Get(const std::string &service, const std::string &account) = 0;
};

/**
 * Reads secrets from APPDOCK_SECRET_<SERVICE>_<ACCOUNT>, upper-cased with every
 * character outside [A-Z0-9] replaced by '_'. The account "bbbPassword" of the
 * service "appdock" is APPDOCK_SECRET_APPDOCK_BBBPASSWORD.
 */
class EnvCredentialStore : public CredentialStore
{
public:
  static std::string VariableName(const std::string &service, const std::string &account);

  SecretLookup Get(const std::string &service, const std::string &account) override;
};

// The named credentials pushed into a page. Values are empty when missing.
struct SecretBundle
{
  std::string email;
  std::string password;
  std::string bbb_password;
  std::string webuntis_email;
  std::string webuntis_password;

  // Account names in the store, in fetch order.
  static const char *const kAccounts[5];

  std::string *field(const std::string &account);

  // webuntis logs in with its own email when one is stored.
  bool HasLoginIdentifier(const std::string &service) const;

  // {"email":...,"password":...,"bbbPassword":...,"webuntisEmail":...,"webuntisPassword":...}
  std::string ToJSON() const;
};

// Queries every account concurrently and combines the results. Lookups that
// throw are treated as StoreError and count as missing.
SecretBundle FetchSecretBundle(CredentialStore &store, const std::string &service, int *store_errors = nullptr);
