#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/artifact/store.hpp"
#include "berth/fetch/release_fetcher.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>

namespace {

namespace fetch = berth::fetch;
using berth::artifact::ArtifactStore;
using berth::testing::FakeHttpClient;

constexpr const char *API = "https://api.test";
constexpr const char *RELEASE_JSON =
    R"({"tag_name":"v1.2.0","name":"Release 1.2.0","assets":[)"
    R"({"id":11,"name":"api-linux-amd64","url":"https://api.test/assets/11",)"
    R"("browser_download_url":"https://github.test/api-linux-amd64"},)"
    R"({"id":12,"name":"api-darwin-arm64","url":"https://api.test/assets/12",)"
    R"("browser_download_url":"https://github.test/api-darwin-arm64"}]})";

fetch::HttpResponse respond_with(const std::uint16_t status, std::string body) {
  fetch::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  return response;
}

struct FetcherFixture {
  berth::testing::TempDir dir;
  ArtifactStore store{dir.path() / "bin"};
  std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
  fetch::GithubReleaseFetcher fetcher;

  explicit FetcherFixture(std::string pattern = "{name}-linux-amd64")
      : fetcher(fetch::GithubFetcherOptions{.api_url = API,
                                            .token = "test-token",
                                            .default_owner = "acme",
                                            .asset_pattern = std::move(pattern)},
                http, store) {}
};

void install_version(ArtifactStore &store, const berth::testing::TempDir &dir,
                     const std::string &version) {
  dir.create_file("download-" + version, "build " + version);
  if (auto status = store.install("api", version, dir.path() / ("download-" + version));
      !status.ok()) {
    throw std::runtime_error(status.error());
  }
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_artifacts_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;

  tests.push_back({"artifact_store_layout_and_current_symlink", [] {
                     berth::testing::TempDir dir;
                     ArtifactStore store(dir.path() / "bin");
                     require(store.versioned_path("api", "v1.0.0") ==
                                 dir.path() / "bin" / "api" / "api-v1.0.0",
                             "versioned path");
                     require(store.current_path("api") == dir.path() / "bin" / "api" / "api",
                             "current path");

                     auto none = store.current_version("api");
                     require(none.ok() && !none.value().has_value(), "nothing installed yet");
                     require(!store.point_current("api", "v1.0.0").ok(),
                             "cannot point at a missing version");

                     install_version(store, dir, "v1.0.0");
                     install_version(store, dir, "v1.1.0");
                     const auto perms =
                         std::filesystem::status(store.versioned_path("api", "v1.0.0"))
                             .permissions();
                     require((perms & std::filesystem::perms::owner_exec) !=
                                 std::filesystem::perms::none,
                             "installed executable");

                     require(store.point_current("api", "v1.0.0").ok(), "point at v1.0.0");
                     require(store.current_version("api").value() ==
                                 std::optional<std::string>("v1.0.0"),
                             "current v1.0.0");
                     require(store.point_current("api", "v1.1.0").ok(), "repoint");
                     require(store.current_version("api").value() ==
                                 std::optional<std::string>("v1.1.0"),
                             "current v1.1.0");
                     require(berth::testing::read_text(store.current_path("api")) == "build v1.1.0",
                             "symlink resolves to the build");
                   }});

  tests.push_back({"artifact_store_prune_keeps_listed_versions", [] {
                     berth::testing::TempDir dir;
                     ArtifactStore store(dir.path() / "bin");
                     for (const char *version : {"v1.0.0", "v1.1.0", "v1.2.0"}) {
                       install_version(store, dir, version);
                     }
                     require(store.point_current("api", "v1.2.0").ok(), "current");
                     require(store.prune("api", {"v1.2.0", "v1.1.0"}).ok(), "prune");
                     auto versions = store.installed_versions("api");
                     require(versions.ok() &&
                                 versions.value() == std::vector<std::string>({"v1.1.0", "v1.2.0"}),
                             "oldest removed, symlink not listed");
                     require(store.remove_all("api").ok(), "remove all");
                     require(!std::filesystem::exists(store.service_dir("api")), "dir gone");
                     require(!store.remove_all("").ok(), "empty name refused");
                   }});

  tests.push_back({"artifact_versions_must_be_path_safe", [] {
                     require(berth::artifact::validate_version("v1.0.0").ok(), "tag");
                     require(!berth::artifact::validate_version("").ok(), "empty");
                     require(!berth::artifact::validate_version("..").ok(), "dot dot");
                     require(!berth::artifact::validate_version("v1/../../etc").ok(), "slash");
                   }});

  tests.push_back({"release_repo_reference_parsing", [] {
                     auto full = fetch::parse_repo_ref("owner/api", "acme");
                     require(full.ok() && full.value().full() == "owner/api", "owner/repo");
                     auto bare = fetch::parse_repo_ref("api", "acme");
                     require(bare.ok() && bare.value().full() == "acme/api", "default owner");
                     require(!fetch::parse_repo_ref("api", "").ok(), "no owner anywhere");
                     require(!fetch::parse_repo_ref("owner/../x", "acme").ok(), "traversal");
                   }});

  tests.push_back({"release_asset_pattern_placeholders", [] {
                     require(fetch::resolve_asset_name("{name}-linux-amd64", "api", "v1") ==
                                 "api-linux-amd64",
                             "name");
                     require(fetch::resolve_asset_name("{repo}_{version}.bin", "svc", "v2",
                                                       "backend") == "backend_v2.bin",
                             "repo and version");
                     require(fetch::resolve_asset_name("{repo}", "svc", "v2") == "svc",
                             "repo falls back to name");
                   }});

  tests.push_back({"release_parse_lists_assets", [] {
                     auto release = fetch::parse_release(RELEASE_JSON);
                     require(release.ok(), "parses");
                     require(release.value().tag == "v1.2.0", "tag");
                     require(release.value().assets.size() == 2, "two assets");
                     require(release.value().assets.front().id == 11, "asset id");
                     require(release.value().assets.front().api_url == "https://api.test/assets/11",
                             "api url");
                     require(!fetch::parse_release(R"({"message":"Not Found"})").ok(),
                             "missing tag rejected");
                   }});

  tests.push_back({"release_fetcher_resolves_latest_with_auth", [] {
                     FetcherFixture fx;
                     fx.http->respond("https://api.test/repos/acme/api/releases/latest",
                                      respond_with(200, RELEASE_JSON));
                     auto version = fx.fetcher.resolve_version("api", "latest",
                                                               berth::common::CancellationToken{});
                     require(version.ok() && version.value() == "v1.2.0", "latest tag");
                     require(fx.http->last_headers.at("Authorization") == "Bearer test-token",
                             "token sent");

                     auto missing = fx.fetcher.resolve_version("acme/api", "v9.9.9",
                                                               berth::common::CancellationToken{});
                     require(!missing.ok(), "unknown tag");
                     require(contains(missing.error(), "not found in acme/api"), "404 message");
                   }});

  tests.push_back({"release_fetcher_downloads_installs_and_hashes", [] {
                     FetcherFixture fx;
                     fx.http->respond("https://api.test/repos/acme/api/releases/tags/v1.2.0",
                                      respond_with(200, RELEASE_JSON));
                     fx.http->respond("https://api.test/assets/11",
                                      respond_with(200, "binary-content"));
                     auto fetched = fx.fetcher.fetch_artifact("acme/api", "v1.2.0", "api",
                                                              berth::common::CancellationToken{});
                     require(fetched.ok(), "fetch succeeds");
                     require(fetched.value().path == fx.store.versioned_path("api", "v1.2.0"),
                             "versioned path");
                     require(fetched.value().sha256 ==
                                 "37456ce54a2ef39b6c9c1d96ddc978f2edc730744bd2c9872dc1cc9ac886b00e",
                             "sha256 of the download");
                     require(fx.http->last_headers.at("Accept") == "application/octet-stream",
                             "binary accept header");
                     require(fx.store.current_version("api").value() ==
                                 std::optional<std::string>("v1.2.0"),
                             "current points at the download");
                     require(berth::testing::read_text(fetched.value().path) == "binary-content",
                             "content");
                   }});

  tests.push_back({"release_fetcher_lists_available_assets_when_none_match", [] {
                     FetcherFixture fx("{name}-linux-riscv64");
                     fx.http->respond("https://api.test/repos/acme/api/releases/tags/v1.2.0",
                                      respond_with(200, RELEASE_JSON));
                     auto fetched = fx.fetcher.fetch_artifact("acme/api", "v1.2.0", "api",
                                                              berth::common::CancellationToken{});
                     require(!fetched.ok(), "no match");
                     require(contains(fetched.error(), "api-linux-riscv64"), "expected name");
                     require(contains(fetched.error(), "api-linux-amd64, api-darwin-arm64"),
                             "available names listed");
                     require(!std::filesystem::exists(fx.store.current_path("api")),
                             "nothing installed");
                   }});

  tests.push_back({"release_fetcher_failed_download_leaves_no_partial_file", [] {
                     FetcherFixture fx;
                     fx.http->respond("https://api.test/repos/acme/api/releases/tags/v1.2.0",
                                      respond_with(200, RELEASE_JSON));
                     fx.http->respond("https://api.test/assets/11",
                                      respond_with(502, "bad gateway"));
                     auto fetched = fx.fetcher.fetch_artifact("acme/api", "v1.2.0", "api",
                                                              berth::common::CancellationToken{});
                     require(!fetched.ok(), "fails");
                     require(contains(fetched.error(), "HTTP 502"), "status reported");
                     auto versions = fx.store.installed_versions("api");
                     require(versions.ok() && versions.value().empty(), "nothing installed");
                   }});
}
