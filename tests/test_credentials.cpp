#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/creds/credentials.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

void register_credentials_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;
  namespace creds = berth::creds;

  tests.push_back({"credentials_generate_alphanumeric_of_requested_length", [] {
                     auto first = creds::generate_credential(32);
                     auto second = creds::generate_credential(32);
                     require(first.ok() && second.ok(), "generated");
                     require(first.value().size() == 32, "length");
                     require(std::all_of(first.value().begin(), first.value().end(),
                                         [](const char ch) {
                                           return std::isalnum(static_cast<unsigned char>(ch)) != 0;
                                         }),
                             "alphanumeric only");
                     require(first.value() != second.value(), "distinct values");

                     auto long_one = creds::generate_credential(200);
                     require(long_one.ok() && long_one.value().size() == 200, "spans buffers");
                     auto empty = creds::generate_credential(0);
                     require(empty.ok() && empty.value().empty(), "zero length");
                   }});

  tests.push_back({"credentials_render_env_and_toml", [] {
                     const creds::SecretEntries entries = {{"DB_PASSWORD", "p\"w"}, {"PORT", "3000"}};
                     require(creds::render_secrets(entries, creds::SecretsFormat::Env) ==
                                 "DB_PASSWORD=p\"w\nPORT=3000\n",
                             "env format");
                     require(creds::render_secrets(entries, creds::SecretsFormat::Toml) ==
                                 "DB_PASSWORD = \"p\\\"w\"\nPORT = \"3000\"\n",
                             "toml format escapes quotes");
                   }});

  tests.push_back({"credentials_file_is_owner_only", [] {
                     berth::testing::TempDir dir;
                     creds::FileCredentialWriter writer;
                     const auto service_dir = dir.path() / "etc" / "api";
                     const auto path = service_dir / "env";
                     require(writer.write_secrets(path, {{"PORT", "3000"}},
                                                  creds::SecretsFormat::Env)
                                 .ok(),
                             "write");
                     require(berth::testing::read_text(path) == "PORT=3000\n", "content");

                     namespace fs = std::filesystem;
                     const auto file_perms = fs::status(path).permissions();
                     require((file_perms & (fs::perms::group_all | fs::perms::others_all)) ==
                                 fs::perms::none,
                             "file 0600");
                     const auto dir_perms = fs::status(service_dir).permissions();
                     require((dir_perms & (fs::perms::group_all | fs::perms::others_all)) ==
                                 fs::perms::none,
                             "directory 0700");

                     require(writer.write_secrets(path, {{"PORT", "3001"}},
                                                  creds::SecretsFormat::Env)
                                 .ok(),
                             "rewrite");
                     require(berth::testing::read_text(path) == "PORT=3001\n", "replaced");

                     require(writer.remove_secrets(service_dir).ok(), "remove");
                     require(!fs::exists(service_dir), "directory gone");
                     require(writer.remove_secrets(service_dir).ok(), "remove is idempotent");
                   }});
}
