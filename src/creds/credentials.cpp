#include "berth/creds/credentials.hpp"

#include "berth/common/fs.hpp"
#include "berth/common/toml.hpp"

#include <openssl/rand.h>

#include <array>
#include <string_view>

namespace berth::creds {

namespace {

constexpr std::string_view ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Largest multiple of the alphabet size that fits in a byte; bytes above it are
// rejected so every character is equally likely.
constexpr unsigned ACCEPT_LIMIT = 256 - (256 % ALPHABET.size());

} // namespace

common::Result<std::string> generate_credential(const std::size_t length) {
  std::string out;
  out.reserve(length);
  std::array<unsigned char, 64> buffer{};
  while (out.size() < length) {
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
      return common::Result<std::string>::failure("RAND_bytes failed to produce random data");
    }
    for (const unsigned char byte : buffer) {
      if (byte >= ACCEPT_LIMIT) {
        continue;
      }
      out.push_back(ALPHABET[byte % ALPHABET.size()]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return common::Result<std::string>::success(std::move(out));
}

std::string render_secrets(const SecretEntries &entries, const SecretsFormat format) {
  std::string out;
  for (const auto &[key, value] : entries) {
    if (format == SecretsFormat::Toml) {
      out += key + " = " + common::quote_toml_string(value) + "\n";
    } else {
      out += key + "=" + value + "\n";
    }
  }
  return out;
}

common::Status FileCredentialWriter::write_secrets(const std::filesystem::path &path,
                                                   const SecretEntries &entries,
                                                   const SecretsFormat format) {
  const auto dir = path.parent_path();
  if (!dir.empty()) {
    if (auto created = common::ensure_dir(dir); !created.ok()) {
      return common::Status::error(created.error());
    }
    std::error_code ec;
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
      return common::Status::error("chmod " + dir.string() + ": " + ec.message());
    }
  }

  return common::write_file_atomic(path, render_secrets(entries, format),
                                   std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_write)
      .with_context("writing secrets " + path.string());
}

common::Status FileCredentialWriter::remove_secrets(const std::filesystem::path &dir) {
  return common::remove_path(dir);
}

} // namespace berth::creds
