#pragma once

#include "berth/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace berth::creds {

enum class SecretsFormat {
  Env,
  Toml,
};

using SecretEntries = std::map<std::string, std::string>;

/// Random string over [A-Za-z0-9] drawn from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> generate_credential(std::size_t length = 32);

[[nodiscard]] std::string render_secrets(const SecretEntries &entries, SecretsFormat format);

class ICredentialWriter {
public:
  virtual ~ICredentialWriter() = default;

  /// Writes the file readable by its owner only.
  [[nodiscard]] virtual common::Status write_secrets(const std::filesystem::path &path,
                                                     const SecretEntries &entries,
                                                     SecretsFormat format) = 0;
  [[nodiscard]] virtual common::Status remove_secrets(const std::filesystem::path &dir) = 0;
};

class FileCredentialWriter final : public ICredentialWriter {
public:
  [[nodiscard]] common::Status write_secrets(const std::filesystem::path &path,
                                             const SecretEntries &entries,
                                             SecretsFormat format) override;
  [[nodiscard]] common::Status remove_secrets(const std::filesystem::path &dir) override;
};

} // namespace berth::creds
