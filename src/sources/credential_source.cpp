#include "sources/credential_source.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "sources/fetch_error.hpp"

namespace quota_watch::sources {
namespace {

class FileCredentialSource final : public CredentialSource {
 public:
  explicit FileCredentialSource(std::string path) : path_(std::move(path)) {}

  std::string get_token() override {
    if (token_.has_value()) {
      return *token_;
    }

    std::ifstream input(path_);
    if (!input.is_open()) {
      throw FetchError(model::error_kind::NOT_AUTHENTICATED,
                       "no credentials at " + path_ + "; run 'claude' in a terminal to authenticate");
    }

    std::ostringstream contents;
    contents << input.rdbuf();
    token_ = parse_credentials_token(contents.str());
    std::cerr << "[credentials] loaded token from " << path_ << '\n';
    return *token_;
  }

  void invalidate() override {
    if (token_.has_value()) {
      std::cerr << "[credentials] cached token dropped\n";
    }
    token_.reset();
  }

 private:
  std::string path_;
  std::optional<std::string> token_{};
};

}  // namespace

std::string parse_credentials_token(const std::string& document) {
  const auto parsed = nlohmann::json::parse(document, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw FetchError(model::error_kind::NOT_AUTHENTICATED, "credential error: could not parse credentials");
  }

  const auto oauth_it = parsed.find("claudeAiOauth");
  if (oauth_it == parsed.end() || !oauth_it->is_object()) {
    throw FetchError(model::error_kind::NOT_AUTHENTICATED, "credential error: claudeAiOauth section missing");
  }

  const auto token_it = oauth_it->find("accessToken");
  if (token_it == oauth_it->end() || !token_it->is_string() || token_it->get<std::string>().empty()) {
    throw FetchError(model::error_kind::NOT_AUTHENTICATED, "credential error: accessToken missing");
  }

  return token_it->get<std::string>();
}

std::unique_ptr<CredentialSource> make_file_credential_source(std::string path) {
  return std::make_unique<FileCredentialSource>(std::move(path));
}

}  // namespace quota_watch::sources
