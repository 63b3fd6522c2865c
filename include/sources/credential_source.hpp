#pragma once

#include <memory>
#include <string>

namespace quota_watch::sources {

class CredentialSource {
 public:
  // Bearer token, or FetchError(NOT_AUTHENTICATED).
  virtual std::string get_token() = 0;
  // Drops any cached token so the next get_token() re-reads the store.
  virtual void invalidate() = 0;
  virtual ~CredentialSource() = default;
};

// Extracts claudeAiOauth.accessToken from the CLI credential document.
std::string parse_credentials_token(const std::string& document);

std::unique_ptr<CredentialSource> make_file_credential_source(std::string path);

}  // namespace quota_watch::sources
